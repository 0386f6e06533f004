#include "planner/core/RollingWindow.hpp"

namespace planner {
namespace core {

bool DateRange::isValid() const
{
    return start.isValid() && end.isValid() && start <= end;
}

bool DateRange::contains(const QDate &date) const
{
    return isValid() && date.isValid() && date >= start && date <= end;
}

std::vector<QDate> DateRange::dates() const
{
    std::vector<QDate> result;
    if (!isValid()) {
        return result;
    }
    result.reserve(static_cast<size_t>(start.daysTo(end) + 1));
    for (QDate date = start; date <= end; date = date.addDays(1)) {
        result.push_back(date);
    }
    return result;
}

bool DateRange::operator==(const DateRange &other) const
{
    return start == other.start && end == other.end;
}

RollingWindow::RollingWindow(const QDate &today)
    : m_today(today.isValid() ? today : QDate::currentDate())
{
}

QDate RollingWindow::today() const
{
    return m_today;
}

QDate RollingWindow::start() const
{
    return m_today.addDays(-kDaysEachSide);
}

QDate RollingWindow::end() const
{
    return m_today.addDays(kDaysEachSide);
}

DateRange RollingWindow::range() const
{
    return DateRange{ start(), end() };
}

bool RollingWindow::contains(const QDate &date) const
{
    return range().contains(date);
}

std::vector<QDate> RollingWindow::dates() const
{
    return range().dates();
}

} // namespace core
} // namespace planner
