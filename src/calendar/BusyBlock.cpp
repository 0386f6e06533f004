#include "planner/calendar/BusyBlock.hpp"

namespace planner {
namespace calendar {

QString toString(CalendarSource source)
{
    return source == CalendarSource::Google ? QStringLiteral("google") : QStringLiteral("device");
}

QString toString(Transparency transparency)
{
    switch (transparency) {
    case Transparency::Free:
        return QStringLiteral("free");
    case Transparency::Oof:
        return QStringLiteral("oof");
    case Transparency::Tentative:
        return QStringLiteral("tentative");
    case Transparency::Busy:
    default:
        return QStringLiteral("busy");
    }
}

QString toString(EventStatus status)
{
    switch (status) {
    case EventStatus::Tentative:
        return QStringLiteral("tentative");
    case EventStatus::Cancelled:
        return QStringLiteral("cancelled");
    case EventStatus::Confirmed:
    default:
        return QStringLiteral("confirmed");
    }
}

std::optional<CalendarSource> calendarSourceFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("device")) {
        return CalendarSource::Device;
    }
    if (normalized == QLatin1String("google")) {
        return CalendarSource::Google;
    }
    return std::nullopt;
}

std::optional<Transparency> transparencyFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("busy") || normalized == QLatin1String("opaque")) {
        return Transparency::Busy;
    }
    if (normalized == QLatin1String("free") || normalized == QLatin1String("transparent")) {
        return Transparency::Free;
    }
    if (normalized == QLatin1String("oof")) {
        return Transparency::Oof;
    }
    if (normalized == QLatin1String("tentative")) {
        return Transparency::Tentative;
    }
    return std::nullopt;
}

std::optional<EventStatus> eventStatusFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("confirmed")) {
        return EventStatus::Confirmed;
    }
    if (normalized == QLatin1String("tentative")) {
        return EventStatus::Tentative;
    }
    if (normalized == QLatin1String("cancelled") || normalized == QLatin1String("canceled")) {
        return EventStatus::Cancelled;
    }
    return std::nullopt;
}

} // namespace calendar
} // namespace planner
