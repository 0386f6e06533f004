#include "planner/core/SessionContext.hpp"

namespace planner {
namespace core {

SessionContext::SessionContext(const QDate &today, Clock clock)
    : m_window(today)
    , m_clock(std::move(clock))
{
    if (!m_clock) {
        m_clock = []() { return QDateTime::currentDateTimeUtc(); };
    }
}

const RollingWindow &SessionContext::window() const
{
    return m_window;
}

void SessionContext::setToday(const QDate &today)
{
    m_window = RollingWindow(today);
}

SessionPhase SessionContext::phase() const
{
    return m_phase;
}

void SessionContext::setPhase(SessionPhase phase)
{
    m_phase = phase;
}

QDateTime SessionContext::now() const
{
    return m_clock();
}

Clock SessionContext::clock() const
{
    return m_clock;
}

} // namespace core
} // namespace planner
