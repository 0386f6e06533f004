#pragma once

#include <functional>

#include <QDateTime>

#include "planner/core/RollingWindow.hpp"

namespace planner {
namespace core {

enum class SessionPhase
{
    Cold,
    Warm,
};

using Clock = std::function<QDateTime()>;

class SessionContext
{
public:
    explicit SessionContext(const QDate &today = QDate::currentDate(), Clock clock = {});

    const RollingWindow &window() const;
    void setToday(const QDate &today);

    SessionPhase phase() const;
    void setPhase(SessionPhase phase);

    QDateTime now() const;
    Clock clock() const;

private:
    RollingWindow m_window;
    SessionPhase m_phase = SessionPhase::Cold;
    Clock m_clock;
};

} // namespace core
} // namespace planner
