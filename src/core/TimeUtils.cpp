#include "planner/core/TimeUtils.hpp"

#include <QRegularExpression>

namespace planner {
namespace core {

namespace {
const QRegularExpression &clockPattern()
{
    static const QRegularExpression pattern(QStringLiteral("^(\\d{1,2}):(\\d{2})(?::(\\d{2}))?$"));
    return pattern;
}

const QRegularExpression &unitPattern()
{
    static const QRegularExpression pattern(
        QStringLiteral("^(?:(\\d+)\\s*h(?:ours?|rs?)?)?\\s*(?:(\\d+)\\s*m(?:in(?:utes?|s)?)?)?$"),
        QRegularExpression::CaseInsensitiveOption);
    return pattern;
}
} // namespace

std::optional<int> parseTimeOfDay(const QString &value)
{
    const auto match = clockPattern().match(value.trimmed());
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    const int hours = match.captured(1).toInt();
    const int minutes = match.captured(2).toInt();
    const int seconds = match.captured(3).isEmpty() ? 0 : match.captured(3).toInt();
    if (minutes > 59 || seconds > 59) {
        return std::nullopt;
    }
    if (hours == 24 && minutes == 0 && seconds == 0) {
        return kMinutesPerDay;
    }
    if (hours > 23) {
        return std::nullopt;
    }
    return hours * kMinutesPerHour + minutes;
}

std::optional<int> parseDurationMinutes(const QString &value)
{
    const QString trimmed = value.trimmed();
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }

    bool isNumber = false;
    const int plain = trimmed.toInt(&isNumber);
    if (isNumber) {
        if (plain < 0) {
            return std::nullopt;
        }
        return plain;
    }

    const auto clock = clockPattern().match(trimmed);
    if (clock.hasMatch()) {
        const int minutes = clock.captured(2).toInt();
        if (minutes > 59) {
            return std::nullopt;
        }
        return clock.captured(1).toInt() * kMinutesPerHour + minutes;
    }

    const auto units = unitPattern().match(trimmed);
    if (!units.hasMatch() || (units.captured(1).isEmpty() && units.captured(2).isEmpty())) {
        return std::nullopt;
    }
    return units.captured(1).toInt() * kMinutesPerHour + units.captured(2).toInt();
}

QString formatTimeOfDay(int minutes)
{
    return QStringLiteral("%1:%2")
        .arg(minutes / kMinutesPerHour, 2, 10, QLatin1Char('0'))
        .arg(minutes % kMinutesPerHour, 2, 10, QLatin1Char('0'));
}

int minutesSinceMidnight(const QTime &time)
{
    if (!time.isValid()) {
        return 0;
    }
    return time.hour() * kMinutesPerHour + time.minute();
}

} // namespace core
} // namespace planner
