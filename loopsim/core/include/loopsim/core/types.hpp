#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <limits>

namespace loopsim::core {

/// @brief Time interval represented as an integer millisecond count.
///
/// Duration wraps an `int64_t` millisecond value with a private constructor.
/// All construction goes through named factories or bridge functions, so
/// conversions between seconds (double), `std::chrono` durations and
/// milliseconds are always explicit.
///
/// Millisecond resolution matches the platform clock the loops simulate;
/// anything finer is truncated toward zero by the `std::chrono` bridge.
///
/// @see duration_from_millis, duration_from_seconds, duration_to_millis
/// @see TimePoint
/// @ingroup core_types
class Duration {
    int64_t ms_;

    explicit constexpr Duration(int64_t ms) noexcept : ms_(ms) {}

    // Round double seconds to nearest millisecond
    static constexpr int64_t secs_to_ms(double s) noexcept {
        return static_cast<int64_t>(s * 1e3 + (s >= 0.0 ? 0.5 : -0.5));
    }

    friend constexpr Duration duration_from_millis(int64_t ms) noexcept;
    friend constexpr Duration duration_from_seconds(double s) noexcept;
    friend constexpr int64_t duration_to_millis(Duration d) noexcept;
    friend constexpr double duration_to_seconds(Duration d) noexcept;

public:
    /// @brief Default constructor: zero duration.
    constexpr Duration() noexcept : ms_(0) {}

    /// @brief Named factory returning a zero-length duration.
    static constexpr Duration zero() noexcept { return Duration{0}; }

    /// @brief Return the raw millisecond count.
    [[nodiscard]] constexpr int64_t millis() const noexcept { return ms_; }

    /// @brief Convert to seconds (double).
    [[nodiscard]] constexpr double seconds() const noexcept {
        return static_cast<double>(ms_) * 1e-3;
    }

    constexpr Duration operator+(Duration rhs) const noexcept {
        return Duration{ms_ + rhs.ms_};
    }

    constexpr Duration operator-(Duration rhs) const noexcept {
        return Duration{ms_ - rhs.ms_};
    }

    constexpr Duration& operator+=(Duration rhs) noexcept {
        ms_ += rhs.ms_;
        return *this;
    }

    constexpr Duration& operator-=(Duration rhs) noexcept {
        ms_ -= rhs.ms_;
        return *this;
    }

    constexpr Duration operator-() const noexcept {
        return Duration{-ms_};
    }

    constexpr auto operator<=>(const Duration& rhs) const noexcept = default;
    constexpr bool operator==(const Duration& rhs) const noexcept = default;
};

/// @brief Absolute virtual time as a Duration offset from epoch (time zero).
///
/// TimePoint supports arithmetic with Duration (TimePoint +/- Duration yields
/// TimePoint) and differencing (TimePoint - TimePoint yields Duration). Two
/// TimePoints cannot be added.
///
/// @see time_from_millis, time_to_millis, Duration
/// @ingroup core_types
class TimePoint {
    Duration since_epoch_;

    explicit constexpr TimePoint(Duration d) noexcept : since_epoch_(d) {}

    friend constexpr TimePoint time_from_millis(int64_t ms) noexcept;

public:
    /// @brief Default constructor: epoch (time zero).
    constexpr TimePoint() noexcept : since_epoch_(Duration::zero()) {}

    /// @brief Named factory returning the epoch (time zero).
    static constexpr TimePoint epoch() noexcept {
        return TimePoint{Duration::zero()};
    }

    /// @brief Return the duration elapsed since epoch.
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

    constexpr TimePoint& operator-=(Duration d) noexcept {
        since_epoch_ -= d;
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
// Bridge functions: the canonical API for Duration/TimePoint conversion
// ============================================================================

/// @brief Create a Duration from a raw millisecond count.
[[nodiscard]] constexpr Duration duration_from_millis(int64_t ms) noexcept {
    return Duration{ms};
}

/// @brief Create a Duration from a value in seconds (round to nearest ms).
[[nodiscard]] constexpr Duration duration_from_seconds(double s) noexcept {
    return Duration{Duration::secs_to_ms(s)};
}

/// @brief Extract the raw millisecond count from a Duration.
[[nodiscard]] constexpr int64_t duration_to_millis(Duration d) noexcept {
    return d.ms_;
}

/// @brief Convert a Duration to seconds (double).
[[nodiscard]] constexpr double duration_to_seconds(Duration d) noexcept {
    return d.seconds();
}

/// @brief Create a Duration from any `std::chrono` duration.
///
/// Sub-millisecond parts are truncated toward zero.
///
/// @tparam Rep    Arithmetic representation of the chrono duration.
/// @tparam Period Tick period of the chrono duration.
/// @param d       Interval to convert.
/// @return Duration holding the whole milliseconds of @p d.
template<typename Rep, typename Period>
[[nodiscard]] constexpr Duration duration_from_chrono(std::chrono::duration<Rep, Period> d) noexcept {
    return duration_from_millis(
        static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(d).count()));
}

/// @brief Create a TimePoint from milliseconds since epoch.
[[nodiscard]] constexpr TimePoint time_from_millis(int64_t ms) noexcept {
    return TimePoint{duration_from_millis(ms)};
}

/// @brief Convert a TimePoint to milliseconds since epoch.
[[nodiscard]] constexpr int64_t time_to_millis(TimePoint tp) noexcept {
    return duration_to_millis(tp.time_since_epoch());
}

/// @brief Convert a TimePoint to seconds since epoch (double).
[[nodiscard]] constexpr double time_to_seconds(TimePoint tp) noexcept {
    return tp.time_since_epoch().seconds();
}

/// @brief Add @p d to @p tp, clamping to the representable range.
///
/// Used wherever a caller-supplied interval is added to the current time,
/// so a huge delay lands at the latest instant instead of wrapping around.
[[nodiscard]] constexpr TimePoint saturating_add(TimePoint tp, Duration d) noexcept {
    constexpr int64_t MAX_MS = std::numeric_limits<int64_t>::max();
    constexpr int64_t MIN_MS = std::numeric_limits<int64_t>::min();
    const int64_t base = time_to_millis(tp);
    const int64_t delta = duration_to_millis(d);
    if (delta > 0 && base > MAX_MS - delta) {
        return time_from_millis(MAX_MS);
    }
    if (delta < 0 && base < MIN_MS - delta) {
        return time_from_millis(MIN_MS);
    }
    return time_from_millis(base + delta);
}

} // namespace loopsim::core
