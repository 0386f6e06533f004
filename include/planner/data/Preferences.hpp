#pragma once

#include <initializer_list>
#include <optional>

#include <QDate>
#include <QDateTime>
#include <QStringList>
#include <QtGlobal>

namespace planner {
namespace data {

class WeekdaySet
{
public:
    WeekdaySet() = default;

    static WeekdaySet workWeek();
    static WeekdaySet fromDays(std::initializer_list<int> days);

    bool contains(int dayOfWeek) const;
    bool contains(const QDate &date) const;
    void insert(int dayOfWeek);
    void remove(int dayOfWeek);

    bool isEmpty() const;
    int count() const;
    quint8 bits() const;

    QStringList names() const;

    bool operator==(const WeekdaySet &other) const;
    bool operator!=(const WeekdaySet &other) const;

private:
    quint8 m_bits = 0;
};

enum class AllDayBlockMode
{
    Ignore,
    Workday,
    Window,
};

enum class AllDayBlockPosition
{
    Start,
    Middle,
    End,
};

enum class DedupeStrategy
{
    Auto,
    PreferGoogle,
    PreferDevice,
    None,
};

QString toString(AllDayBlockMode mode);
QString toString(AllDayBlockPosition position);
QString toString(DedupeStrategy strategy);
std::optional<AllDayBlockMode> allDayBlockModeFromString(const QString &value);
std::optional<AllDayBlockPosition> allDayBlockPositionFromString(const QString &value);
std::optional<DedupeStrategy> dedupeStrategyFromString(const QString &value);

constexpr int kDefaultWorkStart = 9 * 60;
constexpr int kDefaultWorkEnd = 18 * 60;
constexpr int kDefaultMinGapMinutes = 15;
constexpr int kDefaultBufferMinutes = 5;
constexpr int kDefaultAllDayBlockMinutes = 30;
constexpr int kDefaultGapSyncFrequencyMinutes = 30;

struct WorkInterval
{
    int start = 0;
    int end = 0;

    int length() const { return end - start; }
};

struct WorkPreferences
{
    std::optional<int> workStart;
    std::optional<int> workEnd;
    WeekdaySet workingDays = WeekdaySet::workWeek();
    int minGapMinutes = kDefaultMinGapMinutes;
    int bufferMinutes = kDefaultBufferMinutes;
    bool subtractCalendarBusy = false;
    QStringList includedCalendarIds;
    AllDayBlockMode allDayBlockMode = AllDayBlockMode::Workday;
    int allDayBlockMinutes = kDefaultAllDayBlockMinutes;
    AllDayBlockPosition allDayBlockPosition = AllDayBlockPosition::Start;
    bool blockTentative = false;
    DedupeStrategy dedupeStrategy = DedupeStrategy::Auto;
    bool showCalendarTitles = false;
    int gapSyncFrequencyMinutes = kDefaultGapSyncFrequencyMinutes;
    QDateTime updatedAt;

    // Reconciled working interval; empty when the hours are missing or malformed.
    std::optional<WorkInterval> workInterval() const;
};

} // namespace data
} // namespace planner
