#pragma once

#include <chrono>
#include <compare>
#include <cstdint>

namespace rrsched::core {

/// @brief Time interval represented as an integer nanosecond count.
///
/// Duration wraps an `int64_t` nanosecond value with a private constructor.
/// All construction goes through named factories or bridge functions, so
/// every conversion between seconds (double), nanoseconds (int64_t) and
/// `std::chrono` durations is explicit at the call site.
///
/// Durations may be negative: a remaining-time value driven below zero by a
/// burst-time update is represented faithfully rather than clamped.
///
/// @see duration_from_seconds, duration_from_chrono, duration_to_seconds
/// @see TimePoint
/// @ingroup core_types
class Duration {
    int64_t ns_;

    explicit constexpr Duration(int64_t ns) noexcept : ns_(ns) {}

    // Round double seconds to nearest nanosecond
    static constexpr int64_t secs_to_ns(double s) noexcept {
        return static_cast<int64_t>(s * 1e9 + (s >= 0.0 ? 0.5 : -0.5));
    }

    friend constexpr Duration duration_from_seconds(double s) noexcept;
    friend constexpr Duration duration_from_nanoseconds(int64_t ns) noexcept;
    friend constexpr double duration_to_seconds(Duration d) noexcept;
    friend constexpr int64_t duration_to_nanoseconds(Duration d) noexcept;

public:
    /// @brief Default constructor: zero duration.
    constexpr Duration() noexcept : ns_(0) {}

    /// @brief Named factory returning a zero-length duration.
    static constexpr Duration zero() noexcept { return Duration{0}; }

    /// @brief Convert to seconds (double).
    [[nodiscard]] constexpr double seconds() const noexcept {
        return static_cast<double>(ns_) * 1e-9;
    }

    /// @brief Return the raw nanosecond count.
    [[nodiscard]] constexpr int64_t nanoseconds() const noexcept {
        return ns_;
    }

    constexpr Duration operator+(Duration rhs) const noexcept {
        return Duration{ns_ + rhs.ns_};
    }

    constexpr Duration operator-(Duration rhs) const noexcept {
        return Duration{ns_ - rhs.ns_};
    }

    constexpr Duration& operator+=(Duration rhs) noexcept {
        ns_ += rhs.ns_;
        return *this;
    }

    constexpr Duration& operator-=(Duration rhs) noexcept {
        ns_ -= rhs.ns_;
        return *this;
    }

    constexpr Duration operator-() const noexcept {
        return Duration{-ns_};
    }

    constexpr auto operator<=>(const Duration& rhs) const noexcept = default;
    constexpr bool operator==(const Duration& rhs) const noexcept = default;
};

/// @brief Engine-relative time as a Duration offset from the engine origin.
///
/// The origin is the engine's start time: arrival times, slice bounds and
/// completion times are all expressed as TimePoints so they can be compared
/// and differenced without referring back to the clock that produced them.
///
/// TimePoint +/- Duration yields a TimePoint and TimePoint - TimePoint yields
/// a Duration. Two TimePoints cannot be added.
///
/// @see time_from_seconds, time_to_seconds, Duration
/// @ingroup core_types
class TimePoint {
    Duration since_epoch_;

    explicit constexpr TimePoint(Duration d) noexcept : since_epoch_(d) {}

    friend constexpr TimePoint time_from_seconds(double s) noexcept;
    friend constexpr TimePoint time_from_epoch(Duration d) noexcept;

public:
    /// @brief Default constructor: the origin (time zero).
    constexpr TimePoint() noexcept : since_epoch_(Duration::zero()) {}

    /// @brief Named factory returning the origin.
    static constexpr TimePoint epoch() noexcept {
        return TimePoint{Duration::zero()};
    }

    /// @brief Return the duration elapsed since the origin.
    [[nodiscard]] constexpr Duration time_since_epoch() const noexcept {
        return since_epoch_;
    }

    constexpr TimePoint operator+(Duration d) const noexcept {
        return TimePoint{since_epoch_ + d};
    }

    constexpr TimePoint operator-(Duration d) const noexcept {
        return TimePoint{since_epoch_ - d};
    }

    constexpr TimePoint& operator+=(Duration d) noexcept {
        since_epoch_ += d;
        return *this;
    }

    /// @brief Compute the duration between two time points.
    constexpr Duration operator-(TimePoint rhs) const noexcept {
        return since_epoch_ - rhs.since_epoch_;
    }

    constexpr auto operator<=>(const TimePoint& rhs) const noexcept = default;
    constexpr bool operator==(const TimePoint& rhs) const noexcept = default;
};

// ============================================================================
// Bridge functions: canonical Duration/TimePoint conversions
// ============================================================================

/// @brief Create a Duration from a value in seconds (round to nearest ns).
[[nodiscard]] constexpr Duration duration_from_seconds(double s) noexcept {
    return Duration{Duration::secs_to_ns(s)};
}

/// @brief Convert a Duration to seconds (double).
[[nodiscard]] constexpr double duration_to_seconds(Duration d) noexcept {
    return d.seconds();
}

/// @brief Create a Duration from a raw nanosecond count.
[[nodiscard]] constexpr Duration duration_from_nanoseconds(int64_t ns) noexcept {
    return Duration{ns};
}

/// @brief Extract the raw nanosecond count from a Duration.
[[nodiscard]] constexpr int64_t duration_to_nanoseconds(Duration d) noexcept {
    return d.nanoseconds();
}

/// @brief Create a Duration from any `std::chrono::duration`.
///
/// Sub-nanosecond precision is truncated toward zero.
template<typename Rep, typename Period>
[[nodiscard]] constexpr Duration duration_from_chrono(std::chrono::duration<Rep, Period> d) noexcept {
    return duration_from_nanoseconds(
        std::chrono::duration_cast<std::chrono::nanoseconds>(d).count());
}

/// @brief Convert a Duration to `std::chrono::nanoseconds`.
///
/// Used wherever a Duration has to drive a real wait (sleeps, condition
/// variable timeouts, thread joins).
[[nodiscard]] constexpr std::chrono::nanoseconds to_chrono(Duration d) noexcept {
    return std::chrono::nanoseconds{d.nanoseconds()};
}

/// @brief Create a TimePoint from a value in seconds since the origin.
[[nodiscard]] constexpr TimePoint time_from_seconds(double s) noexcept {
    return TimePoint{duration_from_seconds(s)};
}

/// @brief Create a TimePoint at a given offset from the origin.
[[nodiscard]] constexpr TimePoint time_from_epoch(Duration d) noexcept {
    return TimePoint{d};
}

/// @brief Convert a TimePoint to seconds since the origin (double).
[[nodiscard]] constexpr double time_to_seconds(TimePoint tp) noexcept {
    return tp.time_since_epoch().seconds();
}

} // namespace rrsched::core
