#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace sdrbridge::data {

/// Runs a callback on its own thread every `interval` until stopped.
/// stop() wakes the thread immediately and joins it; it is safe to call
/// more than once and on a timer that was never started.
class PeriodicTimer {
  public:
    PeriodicTimer() = default;
    ~PeriodicTimer();

    PeriodicTimer(const PeriodicTimer &) = delete;
    PeriodicTimer &operator=(const PeriodicTimer &) = delete;

    /// Returns false if already running or the interval is not positive.
    bool start(std::chrono::milliseconds interval, std::function<void()> tick);
    void stop();

    [[nodiscard]] bool running() const;

  private:
    void run(std::chrono::milliseconds interval);

    mutable std::mutex mu_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::function<void()> tick_;
    std::thread thread_;
};

} // namespace sdrbridge::data
