/// @file clock.cpp
/// @brief Clock implementation

#include <tickspace/physics/clock.hpp>

#include <utility>

namespace tick_physics {

Clock::Clock()
    : Clock([] { return SteadyClock::now(); })
{
}

Clock::Clock(TimeSource source)
    : m_source(std::move(source))
    , m_last(m_source())
{
}

Clock::Duration Clock::consume() {
    TimePoint now = m_source();
    Duration elapsed = now - m_last;
    m_last = now;
    ++m_consume_count;
    return elapsed;
}

Clock::Duration Clock::peek() const {
    return m_source() - m_last;
}

void Clock::reset() {
    m_last = m_source();
}

} // namespace tick_physics
