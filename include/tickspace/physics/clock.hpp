/// @file clock.hpp
/// @brief Destructive elapsed-time clock for tick_physics

#pragma once

#include "fwd.hpp"

#include <chrono>
#include <cstdint>
#include <functional>

namespace tick_physics {

/// Tracks time since it was last consumed.
///
/// consume() is a destructive read and is not re-entrant: callers must
/// serialize access. The Space only touches its clock from inside the
/// advance job, of which at most one exists at a time.
class Clock {
public:
    using SteadyClock = std::chrono::steady_clock;
    using Duration = SteadyClock::duration;
    using TimePoint = SteadyClock::time_point;
    using TimeSource = std::function<TimePoint()>;

    /// Clock reading std::chrono::steady_clock
    Clock();

    /// Clock reading a custom time source (tests, replay)
    explicit Clock(TimeSource source);

    /// Elapsed time since the previous consume(), reset() or construction.
    /// Moves the sample point to now.
    Duration consume();

    /// Elapsed time since the sample point, without moving it
    [[nodiscard]] Duration peek() const;

    /// Move the sample point to now, discarding accumulated time
    void reset();

    /// Number of consume() calls so far
    [[nodiscard]] std::uint64_t consume_count() const noexcept { return m_consume_count; }

    /// Convert a duration to seconds
    [[nodiscard]] static float to_seconds(Duration d) noexcept {
        return std::chrono::duration<float>(d).count();
    }

private:
    TimeSource m_source;
    TimePoint m_last;
    std::uint64_t m_consume_count = 0;
};

} // namespace tick_physics
