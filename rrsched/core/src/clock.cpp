#include <rrsched/core/clock.hpp>

#include <thread>

namespace rrsched::core {

SystemClock::SystemClock()
    : origin_(std::chrono::steady_clock::now()) {}

TimePoint SystemClock::now() const {
    return time_from_epoch(duration_from_chrono(std::chrono::steady_clock::now() - origin_));
}

void SystemClock::sleep_for(Duration d) {
    if (d <= Duration::zero()) {
        return;
    }
    std::this_thread::sleep_for(to_chrono(d));
}

VirtualClock::VirtualClock(TimePoint start) noexcept
    : now_ns_(duration_to_nanoseconds(start.time_since_epoch())) {}

TimePoint VirtualClock::now() const {
    return time_from_epoch(duration_from_nanoseconds(now_ns_.load()));
}

void VirtualClock::sleep_for(Duration d) {
    if (d <= Duration::zero()) {
        return;
    }
    advance(d);
}

void VirtualClock::advance(Duration d) noexcept {
    now_ns_.fetch_add(duration_to_nanoseconds(d));
}

Clock& system_clock() {
    static SystemClock clock;
    return clock;
}

double unix_time_seconds() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since_epoch).count();
}

} // namespace rrsched::core
