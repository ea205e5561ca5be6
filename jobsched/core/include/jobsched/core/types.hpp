#pragma once

#include <compare>
#include <cstdint>
#include <limits>
#include <string>

namespace jobsched::core {

/// @brief Caller-assigned job identifier.
/// @ingroup core_types
using JobId = std::uint64_t;

/// @brief Machine identifier (machine name).
/// @ingroup core_types
using MachineId = std::string;

/// @brief Length of a time interval, counted in integer time units.
///
/// Duration wraps an `int64_t` tick count. Processing times are Durations;
/// arithmetic between two Durations yields a Duration. There is no implicit
/// conversion from integers: construction is explicit so that a start time
/// can never be passed where a processing time is expected.
///
/// @see TimePoint
/// @ingroup core_types
class Duration {
    int64_t ticks_;

public:
    /// @brief Default constructor: zero duration.
    constexpr Duration() noexcept : ticks_(0) {}

    /// @brief Construct a duration of @p ticks time units.
    /// @param ticks Tick count.
    explicit constexpr Duration(int64_t ticks) noexcept : ticks_(ticks) {}

    /// @brief Named factory returning a zero-length duration.
    /// @return Duration with value 0.
    static constexpr Duration zero() noexcept { return Duration{0}; }

    /// @brief Largest representable duration.
    /// @return Duration holding the maximum tick count.
    static constexpr Duration max() noexcept {
        return Duration{std::numeric_limits<int64_t>::max()};
    }

    /// @brief Return the raw tick count.
    /// @return Duration value in time units.
    [[nodiscard]] constexpr int64_t count() const noexcept { return ticks_; }

    constexpr Duration operator+(Duration rhs) const noexcept {
        return Duration{ticks_ + rhs.ticks_};
    }

    constexpr Duration operator-(Duration rhs) const noexcept {
        return Duration{ticks_ - rhs.ticks_};
    }

    constexpr Duration& operator+=(Duration rhs) noexcept {
        ticks_ += rhs.ticks_;
        return *this;
    }

    constexpr Duration& operator-=(Duration rhs) noexcept {
        ticks_ -= rhs.ticks_;
        return *this;
    }

    /// @brief Three-way comparison (defaulted).
    constexpr auto operator<=>(const Duration& rhs) const noexcept = default;

    /// @brief Equality comparison (defaulted).
    constexpr bool operator==(const Duration& rhs) const noexcept = default;
};

/// @brief Absolute schedule time as a Duration offset from the origin.
///
/// TimePoint supports arithmetic with Duration (TimePoint +/- Duration yields
/// TimePoint) and differencing (TimePoint - TimePoint yields Duration). Two
/// TimePoints cannot be added.
///
/// @see Duration
/// @ingroup core_types
class TimePoint {
    Duration since_origin_;

public:
    /// @brief Default constructor: the schedule origin (time zero).
    constexpr TimePoint() noexcept : since_origin_(Duration::zero()) {}

    /// @brief Construct the time point @p d after the origin.
    /// @param d Offset from the origin.
    explicit constexpr TimePoint(Duration d) noexcept : since_origin_(d) {}

    /// @brief Construct the time point @p ticks time units after the origin.
    /// @param ticks Offset from the origin in time units.
    explicit constexpr TimePoint(int64_t ticks) noexcept : since_origin_(ticks) {}

    /// @brief Named factory returning the schedule origin.
    /// @return TimePoint at time zero.
    static constexpr TimePoint origin() noexcept { return TimePoint{Duration::zero()}; }

    /// @brief Return the duration elapsed since the origin.
    /// @return Duration from the origin to this time point.
    [[nodiscard]] constexpr Duration time_since_origin() const noexcept {
        return since_origin_;
    }

    /// @brief Raw tick count since the origin.
    /// @return Time units since time zero.
    [[nodiscard]] constexpr int64_t count() const noexcept { return since_origin_.count(); }

    constexpr TimePoint operator+(Duration d) const noexcept {
        return TimePoint{since_origin_ + d};
    }

    constexpr TimePoint operator-(Duration d) const noexcept {
        return TimePoint{since_origin_ - d};
    }

    constexpr TimePoint& operator+=(Duration d) noexcept {
        since_origin_ += d;
        return *this;
    }

    /// @brief Compute the duration between two time points.
    /// @param rhs Time point to subtract.
    /// @return Duration from @p rhs to this time point.
    constexpr Duration operator-(TimePoint rhs) const noexcept {
        return since_origin_ - rhs.since_origin_;
    }

    /// @brief Three-way comparison (defaulted).
    constexpr auto operator<=>(const TimePoint& rhs) const noexcept = default;

    /// @brief Equality comparison (defaulted).
    constexpr bool operator==(const TimePoint& rhs) const noexcept = default;
};

/// @brief Half-open interval [start, end) of booked machine time.
/// @ingroup core_types
struct Interval {
    TimePoint start; ///< First instant of the interval.
    TimePoint end;   ///< First instant after the interval.

    /// @brief Length of the interval.
    /// @return end - start.
    [[nodiscard]] constexpr Duration length() const noexcept { return end - start; }

    /// @brief Check whether two half-open intervals share any instant.
    /// @param other Interval to test against.
    /// @return True unless one interval ends before the other starts.
    [[nodiscard]] constexpr bool overlaps(const Interval& other) const noexcept {
        return !(end <= other.start || start >= other.end);
    }

    constexpr bool operator==(const Interval&) const noexcept = default;
};

} // namespace jobsched::core
