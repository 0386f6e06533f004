#include "planner/data/Preferences.hpp"

#include "planner/core/TimeUtils.hpp"

#include <array>

namespace planner {
namespace data {

namespace {
const std::array<const char *, 7> kDayNames = {
    "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday",
};

bool isValidDay(int dayOfWeek)
{
    return dayOfWeek >= Qt::Monday && dayOfWeek <= Qt::Sunday;
}
} // namespace

WeekdaySet WeekdaySet::workWeek()
{
    return fromDays({ Qt::Monday, Qt::Tuesday, Qt::Wednesday, Qt::Thursday, Qt::Friday });
}

WeekdaySet WeekdaySet::fromDays(std::initializer_list<int> days)
{
    WeekdaySet set;
    for (int day : days) {
        set.insert(day);
    }
    return set;
}

bool WeekdaySet::contains(int dayOfWeek) const
{
    if (!isValidDay(dayOfWeek)) {
        return false;
    }
    return (m_bits & (1u << (dayOfWeek - 1))) != 0;
}

bool WeekdaySet::contains(const QDate &date) const
{
    return date.isValid() && contains(date.dayOfWeek());
}

void WeekdaySet::insert(int dayOfWeek)
{
    if (isValidDay(dayOfWeek)) {
        m_bits = static_cast<quint8>(m_bits | (1u << (dayOfWeek - 1)));
    }
}

void WeekdaySet::remove(int dayOfWeek)
{
    if (isValidDay(dayOfWeek)) {
        m_bits = static_cast<quint8>(m_bits & ~(1u << (dayOfWeek - 1)));
    }
}

bool WeekdaySet::isEmpty() const
{
    return m_bits == 0;
}

int WeekdaySet::count() const
{
    int result = 0;
    for (int day = Qt::Monday; day <= Qt::Sunday; ++day) {
        if (contains(day)) {
            ++result;
        }
    }
    return result;
}

quint8 WeekdaySet::bits() const
{
    return m_bits;
}

QStringList WeekdaySet::names() const
{
    QStringList result;
    for (int day = Qt::Monday; day <= Qt::Sunday; ++day) {
        if (contains(day)) {
            result << QString::fromLatin1(kDayNames[static_cast<size_t>(day - 1)]);
        }
    }
    return result;
}

bool WeekdaySet::operator==(const WeekdaySet &other) const
{
    return m_bits == other.m_bits;
}

bool WeekdaySet::operator!=(const WeekdaySet &other) const
{
    return !(*this == other);
}

QString toString(AllDayBlockMode mode)
{
    switch (mode) {
    case AllDayBlockMode::Ignore:
        return QStringLiteral("ignore");
    case AllDayBlockMode::Window:
        return QStringLiteral("window");
    case AllDayBlockMode::Workday:
    default:
        return QStringLiteral("workday");
    }
}

QString toString(AllDayBlockPosition position)
{
    switch (position) {
    case AllDayBlockPosition::Middle:
        return QStringLiteral("middle");
    case AllDayBlockPosition::End:
        return QStringLiteral("end");
    case AllDayBlockPosition::Start:
    default:
        return QStringLiteral("start");
    }
}

QString toString(DedupeStrategy strategy)
{
    switch (strategy) {
    case DedupeStrategy::PreferGoogle:
        return QStringLiteral("prefer_google");
    case DedupeStrategy::PreferDevice:
        return QStringLiteral("prefer_device");
    case DedupeStrategy::None:
        return QStringLiteral("none");
    case DedupeStrategy::Auto:
    default:
        return QStringLiteral("auto");
    }
}

std::optional<AllDayBlockMode> allDayBlockModeFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("ignore")) {
        return AllDayBlockMode::Ignore;
    }
    if (normalized == QLatin1String("workday")) {
        return AllDayBlockMode::Workday;
    }
    if (normalized == QLatin1String("window")) {
        return AllDayBlockMode::Window;
    }
    return std::nullopt;
}

std::optional<AllDayBlockPosition> allDayBlockPositionFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("start")) {
        return AllDayBlockPosition::Start;
    }
    if (normalized == QLatin1String("middle")) {
        return AllDayBlockPosition::Middle;
    }
    if (normalized == QLatin1String("end")) {
        return AllDayBlockPosition::End;
    }
    return std::nullopt;
}

std::optional<DedupeStrategy> dedupeStrategyFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("auto")) {
        return DedupeStrategy::Auto;
    }
    if (normalized == QLatin1String("prefer_google")) {
        return DedupeStrategy::PreferGoogle;
    }
    if (normalized == QLatin1String("prefer_device")) {
        return DedupeStrategy::PreferDevice;
    }
    if (normalized == QLatin1String("none")) {
        return DedupeStrategy::None;
    }
    return std::nullopt;
}

std::optional<WorkInterval> WorkPreferences::workInterval() const
{
    if (!workStart || !workEnd) {
        return std::nullopt;
    }
    const int start = *workStart;
    if (start < 0 || start >= core::kMinutesPerDay) {
        return std::nullopt;
    }
    int end = *workEnd;
    if (end <= start || end > core::kMinutesPerDay) {
        end = core::kMinutesPerDay;
    }
    return WorkInterval{ start, end };
}

} // namespace data
} // namespace planner
