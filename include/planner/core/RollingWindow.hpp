#pragma once

#include <vector>

#include <QDate>

namespace planner {
namespace core {

struct DateRange
{
    QDate start;
    QDate end;

    bool isValid() const;
    bool contains(const QDate &date) const;
    std::vector<QDate> dates() const;
    bool operator==(const DateRange &other) const;
};

// [today - 7d, today + 7d]; gaps and cache entries outside it are eligible for deletion.
class RollingWindow
{
public:
    static constexpr int kDaysEachSide = 7;

    explicit RollingWindow(const QDate &today = QDate::currentDate());

    QDate today() const;
    QDate start() const;
    QDate end() const;
    DateRange range() const;

    bool contains(const QDate &date) const;
    std::vector<QDate> dates() const;

private:
    QDate m_today;
};

} // namespace core
} // namespace planner
