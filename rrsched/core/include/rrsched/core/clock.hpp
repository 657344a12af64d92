#pragma once

#include <rrsched/core/types.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>

namespace rrsched::core {

/// @brief Time source and work-simulation primitive used by the Engine.
/// @ingroup core
///
/// The engine never reads a system clock directly. It asks its Clock for
/// the current monotonic time and for a blocking wait equal to the work a
/// slice represents. Two implementations are provided:
///   - SystemClock couples simulated work to real elapsed time;
///   - VirtualClock advances instantly, so scheduling order and every
///     derived metric can be checked deterministically.
///
/// Implementations must be safe to call from several threads at once.
///
/// @see SystemClock, VirtualClock, Engine
class Clock {
public:
    virtual ~Clock() = default;

    /// @brief Current monotonic time, relative to an implementation origin.
    [[nodiscard]] virtual TimePoint now() const = 0;

    /// @brief Block for the given amount of simulated work.
    /// @param d Work duration; non-positive values return immediately.
    virtual void sleep_for(Duration d) = 0;

protected:
    Clock() = default;
    Clock(const Clock&) = default;
    Clock& operator=(const Clock&) = default;
    Clock(Clock&&) = default;
    Clock& operator=(Clock&&) = default;
};

/// @brief Real-time clock backed by `std::chrono::steady_clock`.
/// @ingroup core
class SystemClock : public Clock {
public:
    SystemClock();

    [[nodiscard]] TimePoint now() const override;
    void sleep_for(Duration d) override;

private:
    std::chrono::steady_clock::time_point origin_;
};

/// @brief Clock whose time only moves when work is simulated or advance() is called.
/// @ingroup core
///
/// sleep_for() returns immediately after moving the clock forward by the
/// requested duration, which makes a slice of any length cost nothing in
/// real time.
class VirtualClock : public Clock {
public:
    explicit VirtualClock(TimePoint start = TimePoint::epoch()) noexcept;

    [[nodiscard]] TimePoint now() const override;
    void sleep_for(Duration d) override;

    /// @brief Move the clock forward without simulating work.
    void advance(Duration d) noexcept;

private:
    std::atomic<int64_t> now_ns_;
};

/// @brief Process-wide SystemClock used when no clock is injected.
[[nodiscard]] Clock& system_clock();

/// @brief Wall-clock time in seconds since the Unix epoch.
///
/// Used for task creation timestamps, which are reported to clients as
/// absolute times rather than engine-relative ones.
[[nodiscard]] double unix_time_seconds();

} // namespace rrsched::core
