#pragma once

#include <optional>
#include <vector>

#include <QDateTime>
#include <QString>
#include <QStringList>

#include "planner/calendar/BusyBlock.hpp"
#include "planner/core/RollingWindow.hpp"

namespace planner {
namespace calendar {

struct RawEvent
{
    QString id;
    QString calendarId;
    QString title;
    QDateTime start;
    QDateTime end;
    bool isAllDay = false;
    Transparency transparency = Transparency::Busy;
    EventStatus status = EventStatus::Confirmed;
    QString location;
    QString notes;
    QString url;
};

class CalendarProvider
{
public:
    virtual ~CalendarProvider() = default;

    virtual CalendarSource source() const = 0;
    virtual bool requestPermission() = 0;
    virtual std::optional<QStringList> listCalendars() = 0;
    virtual std::optional<std::vector<RawEvent>> listEvents(const core::DateRange &range,
                                                            const QStringList &calendarIds) = 0;
};

} // namespace calendar
} // namespace planner
