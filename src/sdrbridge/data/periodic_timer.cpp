#include "sdrbridge/data/periodic_timer.hpp"

namespace sdrbridge::data {

PeriodicTimer::~PeriodicTimer() { stop(); }

bool PeriodicTimer::start(std::chrono::milliseconds interval, std::function<void()> tick) {
    if (interval.count() <= 0 || !tick) {
        return false;
    }

    std::lock_guard lock(mu_);
    if (thread_.joinable()) {
        return false;
    }
    stop_requested_ = false;
    tick_ = std::move(tick);
    thread_ = std::thread(&PeriodicTimer::run, this, interval);
    return true;
}

void PeriodicTimer::stop() {
    std::thread worker;
    {
        std::lock_guard lock(mu_);
        stop_requested_ = true;
        worker = std::move(thread_);
    }
    cv_.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
}

bool PeriodicTimer::running() const {
    std::lock_guard lock(mu_);
    return thread_.joinable() && !stop_requested_;
}

void PeriodicTimer::run(std::chrono::milliseconds interval) {
    auto next = std::chrono::steady_clock::now() + interval;
    std::unique_lock lock(mu_);
    while (!stop_requested_) {
        if (cv_.wait_until(lock, next, [this] { return stop_requested_; })) {
            break;
        }
        next += interval;

        lock.unlock();
        tick_();
        lock.lock();
    }
}

} // namespace sdrbridge::data
