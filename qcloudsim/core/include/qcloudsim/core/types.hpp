#pragma once

#include <compare>
#include <cstdint>

namespace qcloudsim::core {

/// @brief Time interval represented as an integer tick count.
///
/// One tick is 1e-9 simulated time units. Duration wraps an `int64_t`
/// tick value with a private constructor; all construction goes through
/// named factories or bridge functions so conversions between floating
/// units and ticks are always explicit.
///
/// Polling steps and formula-derived service times are added exactly in
/// ticks, which keeps event order reproducible across runs.
///
/// @see duration_from_units, duration_to_units
/// @see TimePoint
/// @ingroup core_types
class Duration {
    int64_t ticks_;

    explicit constexpr Duration(int64_t ticks) noexcept : ticks_(ticks) {}

    // Round double units to nearest tick
    static constexpr int64_t units_to_ticks(double u) noexcept {
        return static_cast<int64_t>(u * 1e9 + (u >= 0.0 ? 0.5 : -0.5));
    }

    friend constexpr Duration duration_from_units(double u) noexcept;
    friend constexpr Duration duration_from_ticks(int64_t ticks) noexcept;
    friend constexpr double duration_to_units(Duration d) noexcept;

public:
    /// @brief Default constructor: zero duration.
    constexpr Duration() noexcept : ticks_(0) {}

    /// @brief Named factory returning a zero-length duration.
    static constexpr Duration zero() noexcept { return Duration{0}; }

    /// @brief Convert to simulated time units (double).
    [[nodiscard]] constexpr double units() const noexcept {
        return static_cast<double>(ticks_) * 1e-9;
    }

    /// @brief Return the raw tick count.
    [[nodiscard]] constexpr int64_t ticks() const noexcept { return ticks_; }

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

    constexpr Duration operator-() const noexcept { return Duration{-ticks_}; }

    /// @brief Three-way comparison (defaulted).
    constexpr auto operator<=>(const Duration& rhs) const noexcept = default;

    /// @brief Equality comparison (defaulted).
    constexpr bool operator==(const Duration& rhs) const noexcept = default;
};

/// @brief Absolute simulation time as a Duration offset from time zero.
///
/// TimePoint +/- Duration yields a TimePoint; TimePoint - TimePoint yields
/// a Duration. Two TimePoints cannot be added.
///
/// @see time_from_units, time_to_units, Duration
/// @ingroup core_types
class TimePoint {
    Duration since_epoch_;

    explicit constexpr TimePoint(Duration d) noexcept : since_epoch_(d) {}

    friend constexpr TimePoint time_from_units(double u) noexcept;

public:
    /// @brief Default constructor: time zero.
    constexpr TimePoint() noexcept : since_epoch_(Duration::zero()) {}

    /// @brief Named factory returning time zero.
    static constexpr TimePoint epoch() noexcept { return TimePoint{Duration::zero()}; }

    /// @brief Return the duration elapsed since time zero.
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

    constexpr Duration operator-(TimePoint rhs) const noexcept {
        return since_epoch_ - rhs.since_epoch_;
    }

    /// @brief Three-way comparison (defaulted).
    constexpr auto operator<=>(const TimePoint& rhs) const noexcept = default;

    /// @brief Equality comparison (defaulted).
    constexpr bool operator==(const TimePoint& rhs) const noexcept = default;
};

/// @brief Identifier of a job, unique within one simulation.
/// @ingroup core_types
using JobId = uint64_t;

// ============================================================================
// Bridge functions: the canonical API for Duration/TimePoint conversion
// ============================================================================

/// @brief Create a Duration from simulated time units (round to nearest tick).
/// @param u Time interval in units.
/// @return Duration rounded to the nearest tick.
[[nodiscard]] constexpr Duration duration_from_units(double u) noexcept {
    return Duration{Duration::units_to_ticks(u)};
}

/// @brief Create a Duration from a raw tick count.
[[nodiscard]] constexpr Duration duration_from_ticks(int64_t ticks) noexcept {
    return Duration{ticks};
}

/// @brief Convert a Duration to simulated time units (double).
[[nodiscard]] constexpr double duration_to_units(Duration d) noexcept {
    return d.units();
}

/// @brief Create a TimePoint from simulated time units since time zero.
[[nodiscard]] constexpr TimePoint time_from_units(double u) noexcept {
    return TimePoint{duration_from_units(u)};
}

/// @brief Convert a TimePoint to simulated time units since time zero.
[[nodiscard]] constexpr double time_to_units(TimePoint tp) noexcept {
    return tp.time_since_epoch().units();
}

} // namespace qcloudsim::core
