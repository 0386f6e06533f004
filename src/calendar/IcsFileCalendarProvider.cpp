#include "planner/calendar/IcsFileCalendarProvider.hpp"

#include "planner/core/Logging.hpp"

#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include <QTime>

#include <algorithm>

namespace planner {
namespace calendar {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";
constexpr auto DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss";

bool overlapsRange(const RawEvent &event, const core::DateRange &range)
{
    if (event.isAllDay) {
        const QDate first = event.start.date();
        QDate last = event.end.isValid() ? event.end.date().addDays(-1) : first;
        if (last < first) {
            last = first;
        }
        return first <= range.end && last >= range.start;
    }
    const QDateTime start = event.start.toLocalTime();
    const QDateTime end = event.end.isValid() ? event.end.toLocalTime() : start;
    return start.date() <= range.end && end > range.start.startOfDay();
}
} // namespace

IcsFileCalendarProvider::IcsFileCalendarProvider(QStringList filePaths, CalendarSource source)
    : m_filePaths(std::move(filePaths))
    , m_source(source)
{
}

CalendarSource IcsFileCalendarProvider::source() const
{
    return m_source;
}

bool IcsFileCalendarProvider::requestPermission()
{
    for (const QString &path : m_filePaths) {
        if (QFileInfo(path).isReadable()) {
            return true;
        }
    }
    return false;
}

std::optional<QStringList> IcsFileCalendarProvider::listCalendars()
{
    QStringList ids;
    for (const QString &path : m_filePaths) {
        if (QFileInfo(path).isReadable()) {
            ids << calendarIdFor(path);
        }
    }
    return ids;
}

std::optional<std::vector<RawEvent>> IcsFileCalendarProvider::listEvents(const core::DateRange &range,
                                                                         const QStringList &calendarIds)
{
    std::vector<RawEvent> result;
    bool anyRead = false;
    for (const QString &path : m_filePaths) {
        if (!calendarIds.isEmpty() && !calendarIds.contains(calendarIdFor(path))) {
            continue;
        }
        const auto events = parseFile(path);
        if (!events) {
            continue;
        }
        anyRead = true;
        for (const auto &event : *events) {
            if (overlapsRange(event, range)) {
                result.push_back(event);
            }
        }
    }
    if (!anyRead && !m_filePaths.isEmpty() && !calendarIds.isEmpty()) {
        return std::nullopt;
    }
    return result;
}

QString IcsFileCalendarProvider::calendarIdFor(const QString &filePath)
{
    return QFileInfo(filePath).completeBaseName();
}

std::optional<std::vector<RawEvent>> IcsFileCalendarProvider::parseFile(const QString &filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcPlannerCalendar) << "Cannot open calendar file" << filePath << file.errorString();
        return std::nullopt;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    const QString calendarId = calendarIdFor(filePath);
    std::vector<RawEvent> events;
    bool inEvent = false;
    int nestedDepth = 0;
    RawEvent current;

    auto finalizeEvent = [&]() {
        if (!current.start.isValid()) {
            qCWarning(lcPlannerCalendar) << "Skipping VEVENT without DTSTART in" << filePath;
            return;
        }
        if (!current.end.isValid() || current.end <= current.start) {
            current.end = current.isAllDay ? current.start.addDays(1) : current.start;
        }
        if (current.id.isEmpty()) {
            current.id = QStringLiteral("%1-%2").arg(calendarId).arg(events.size());
        }
        events.push_back(current);
    };

    auto handleLine = [&](const QString &line) {
        if (line == QLatin1String("BEGIN:VEVENT")) {
            inEvent = true;
            nestedDepth = 0;
            current = RawEvent{};
            current.calendarId = calendarId;
            return;
        }
        if (line == QLatin1String("END:VEVENT")) {
            if (inEvent) {
                finalizeEvent();
            }
            inEvent = false;
            return;
        }
        if (!inEvent) {
            return;
        }
        // VALARM and friends carry their own DTSTART/STATUS.
        if (line.startsWith(QLatin1String("BEGIN:"))) {
            ++nestedDepth;
            return;
        }
        if (line.startsWith(QLatin1String("END:"))) {
            nestedDepth = std::max(0, nestedDepth - 1);
            return;
        }
        if (nestedDepth > 0) {
            return;
        }

        const int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            return;
        }

        const QString property = line.left(colonIndex);
        const QString rawValue = line.mid(colonIndex + 1);
        const QString name = property.section(';', 0, 0).toUpper();
        const QString parameters = property.contains(';') ? property.section(';', 1) : QString();
        const QString value = decodeText(rawValue);
        const bool dateOnlyParam = parameters.contains(QLatin1String("VALUE=DATE"), Qt::CaseInsensitive);

        if (name == QLatin1String("UID")) {
            current.id = value;
        } else if (name == QLatin1String("SUMMARY")) {
            current.title = value;
        } else if (name == QLatin1String("DESCRIPTION")) {
            current.notes = value;
        } else if (name == QLatin1String("LOCATION")) {
            current.location = value;
        } else if (name == QLatin1String("URL")) {
            current.url = value;
        } else if (name == QLatin1String("DTSTART")) {
            bool dateOnly = false;
            current.start = parseDateTime(rawValue.trimmed(), &dateOnly);
            current.isAllDay = dateOnlyParam || dateOnly;
        } else if (name == QLatin1String("DTEND")) {
            bool dateOnly = false;
            current.end = parseDateTime(rawValue.trimmed(), &dateOnly);
        } else if (name == QLatin1String("TRANSP")) {
            if (rawValue.trimmed().compare(QLatin1String("TRANSPARENT"), Qt::CaseInsensitive) == 0) {
                current.transparency = Transparency::Free;
            }
        } else if (name == QLatin1String("X-MICROSOFT-CDO-BUSYSTATUS")) {
            const QString status = rawValue.trimmed().toUpper();
            if (status == QLatin1String("OOF")) {
                current.transparency = Transparency::Oof;
            } else if (status == QLatin1String("TENTATIVE")) {
                current.transparency = Transparency::Tentative;
            } else if (status == QLatin1String("FREE")) {
                current.transparency = Transparency::Free;
            }
        } else if (name == QLatin1String("STATUS")) {
            current.status = eventStatusFromString(rawValue).value_or(EventStatus::Confirmed);
        }
    };

    QString accumulator;
    bool hasAccumulator = false;
    while (!stream.atEnd()) {
        QString line = stream.readLine();
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                handleLine(accumulator);
            }
            accumulator = line;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        handleLine(accumulator);
    }

    qCDebug(lcPlannerCalendar) << "Read" << events.size() << "events from" << filePath;
    return events;
}

QString IcsFileCalendarProvider::decodeText(const QString &text)
{
    QString decoded = text;
    decoded.replace("\\n", "\n", Qt::CaseInsensitive);
    decoded.replace("\\,", ",");
    decoded.replace("\\;", ";");
    decoded.replace("\\\\", "\\");
    return decoded;
}

QDateTime IcsFileCalendarProvider::parseDateTime(const QString &value, bool *dateOnly)
{
    if (value.length() == 8) {
        *dateOnly = true;
        const QDate date = QDate::fromString(value, DATE_FORMAT);
        return date.isValid() ? date.startOfDay() : QDateTime();
    }
    *dateOnly = false;
    if (value.endsWith('Z')) {
        QDateTime dt = QDateTime::fromString(value.left(value.size() - 1), DATE_TIME_FORMAT);
        dt.setTimeSpec(Qt::UTC);
        return dt;
    }
    QDateTime dt = QDateTime::fromString(value, DATE_TIME_FORMAT);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(value, Qt::ISODate);
    }
    return dt;
}

} // namespace calendar
} // namespace planner
