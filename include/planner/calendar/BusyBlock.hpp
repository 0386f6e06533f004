#pragma once

#include <optional>
#include <vector>

#include <QDate>
#include <QDateTime>
#include <QString>

namespace planner {
namespace calendar {

enum class CalendarSource
{
    Device,
    Google,
};

enum class Transparency
{
    Busy,
    Free,
    Oof,
    Tentative,
};

enum class EventStatus
{
    Confirmed,
    Tentative,
    Cancelled,
};

struct BusyBlock
{
    QDate date;
    int start = 0; // minutes since midnight
    int end = 0;
    CalendarSource source = CalendarSource::Device;
    QString calendarId;
    QString title;
    Transparency transparency = Transparency::Busy;
    EventStatus status = EventStatus::Confirmed;
    bool isAllDay = false;
    QString uid;
    QDateTime lastSyncedAt;
};

QString toString(CalendarSource source);
QString toString(Transparency transparency);
QString toString(EventStatus status);
std::optional<CalendarSource> calendarSourceFromString(const QString &value);
std::optional<Transparency> transparencyFromString(const QString &value);
std::optional<EventStatus> eventStatusFromString(const QString &value);

} // namespace calendar
} // namespace planner
