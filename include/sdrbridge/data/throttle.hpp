#pragma once

#include <chrono>
#include <cstdint>
#include <unordered_map>

namespace sdrbridge::data {

/// Per-key minimum-interval gate.
/// A sample is admitted only if at least `interval` has elapsed since the
/// last admitted sample for the same key. Rejected samples leave no trace.
/// Thread safety: none; owned by a single reader thread.
template <typename Key, typename Clock = std::chrono::steady_clock> class ThrottleGate {
  public:
    using TimePoint = typename Clock::time_point;
    using Duration = typename Clock::duration;

    explicit ThrottleGate(Duration interval) : interval_(interval) {}

    [[nodiscard]] bool admit(const Key &key, TimePoint at) {
        auto it = last_admitted_.find(key);
        if (it != last_admitted_.end() && at - it->second < interval_) {
            return false;
        }
        last_admitted_[key] = at;
        return true;
    }

    void reset() { last_admitted_.clear(); }

    [[nodiscard]] Duration interval() const { return interval_; }

  private:
    Duration interval_;
    std::unordered_map<Key, TimePoint> last_admitted_;
};

/// Telemetry is throttled per meter id.
using MeterThrottle = ThrottleGate<uint16_t>;

} // namespace sdrbridge::data
