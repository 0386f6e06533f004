#include "planner/core/ChangeImpactClassifier.hpp"

#include "planner/core/TimeUtils.hpp"

#include <QStringList>

#include <algorithm>

namespace planner {
namespace core {

namespace {
QString boolString(bool value)
{
    return value ? QStringLiteral("on") : QStringLiteral("off");
}

QString daysString(const data::WeekdaySet &days)
{
    return days.isEmpty() ? QStringLiteral("none") : days.names().join(QStringLiteral(", "));
}

QStringList canonicalIds(QStringList ids)
{
    for (auto &id : ids) {
        id = id.trimmed();
    }
    ids.removeAll(QString());
    ids.sort();
    ids.removeDuplicates();
    return ids;
}

QString idsString(const QStringList &ids)
{
    return ids.isEmpty() ? QStringLiteral("all calendars") : ids.join(QStringLiteral(", "));
}

QString pluralized(int count, const QString &noun)
{
    return QStringLiteral("%1 %2%3").arg(count).arg(noun, count > 1 ? QStringLiteral("s") : QString());
}
} // namespace

QString toString(PreferenceField field)
{
    switch (field) {
    case PreferenceField::WorkStart:
        return QStringLiteral("calendar_work_start");
    case PreferenceField::WorkEnd:
        return QStringLiteral("calendar_work_end");
    case PreferenceField::WorkingDays:
        return QStringLiteral("calendar_working_days");
    case PreferenceField::MinGap:
        return QStringLiteral("calendar_min_gap");
    case PreferenceField::BufferTime:
        return QStringLiteral("calendar_buffer_time");
    case PreferenceField::SubtractCalendarBusy:
        return QStringLiteral("show_device_calendar_busy");
    case PreferenceField::IncludedCalendarIds:
        return QStringLiteral("device_calendar_included_ids");
    case PreferenceField::BlockTentative:
        return QStringLiteral("calendar_block_tentative");
    case PreferenceField::DedupeStrategy:
        return QStringLiteral("calendar_dedupe_strategy");
    case PreferenceField::AllDayBlockMode:
        return QStringLiteral("calendar_all_day_block_mode");
    case PreferenceField::AllDayBlockMinutes:
        return QStringLiteral("calendar_all_day_fixed_block_minutes");
    case PreferenceField::AllDayBlockPosition:
        return QStringLiteral("calendar_all_day_fixed_block_start");
    case PreferenceField::ShowCalendarTitles:
        return QStringLiteral("show_device_calendar_titles");
    case PreferenceField::GapSyncFrequency:
        return QStringLiteral("gap_sync_frequency");
    }
    return QString();
}

QString toString(ChangeImpact impact)
{
    switch (impact) {
    case ChangeImpact::High:
        return QStringLiteral("high");
    case ChangeImpact::Medium:
        return QStringLiteral("medium");
    case ChangeImpact::Low:
    default:
        return QStringLiteral("low");
    }
}

bool ChangeDetectionResult::hasHighImpact() const
{
    return std::any_of(changes.begin(), changes.end(),
                       [](const PreferenceChangeEvent &change) { return change.impact == ChangeImpact::High; });
}

ChangeImpactClassifier::ChangeImpactClassifier(RollingWindow window)
    : m_window(std::move(window))
{
}

ChangeImpact ChangeImpactClassifier::impactOf(PreferenceField field)
{
    switch (field) {
    case PreferenceField::WorkStart:
    case PreferenceField::WorkEnd:
    case PreferenceField::WorkingDays:
        return ChangeImpact::High;
    case PreferenceField::MinGap:
    case PreferenceField::BufferTime:
    case PreferenceField::SubtractCalendarBusy:
    case PreferenceField::IncludedCalendarIds:
    case PreferenceField::BlockTentative:
    case PreferenceField::DedupeStrategy:
        return ChangeImpact::Medium;
    default:
        return ChangeImpact::Low;
    }
}

ChangeDetectionResult ChangeImpactClassifier::classify(const data::WorkPreferences &oldPrefs,
                                                       const data::WorkPreferences &newPrefs) const
{
    ChangeDetectionResult result;
    auto &changes = result.changes;

    // Unset work hours behave exactly like the defaults.
    const int oldStart = oldPrefs.workStart.value_or(data::kDefaultWorkStart);
    const int newStart = newPrefs.workStart.value_or(data::kDefaultWorkStart);
    if (oldStart != newStart) {
        changes.push_back(makeEvent(PreferenceField::WorkStart, formatTimeOfDay(oldStart), formatTimeOfDay(newStart)));
    }
    const int oldEnd = oldPrefs.workEnd.value_or(data::kDefaultWorkEnd);
    const int newEnd = newPrefs.workEnd.value_or(data::kDefaultWorkEnd);
    if (oldEnd != newEnd) {
        changes.push_back(makeEvent(PreferenceField::WorkEnd, formatTimeOfDay(oldEnd), formatTimeOfDay(newEnd)));
    }
    if (oldPrefs.workingDays != newPrefs.workingDays) {
        changes.push_back(makeEvent(PreferenceField::WorkingDays, daysString(oldPrefs.workingDays),
                                    daysString(newPrefs.workingDays)));
    }
    if (oldPrefs.minGapMinutes != newPrefs.minGapMinutes) {
        changes.push_back(makeEvent(PreferenceField::MinGap, QString::number(oldPrefs.minGapMinutes),
                                    QString::number(newPrefs.minGapMinutes)));
    }
    if (oldPrefs.bufferMinutes != newPrefs.bufferMinutes) {
        changes.push_back(makeEvent(PreferenceField::BufferTime, QString::number(oldPrefs.bufferMinutes),
                                    QString::number(newPrefs.bufferMinutes)));
    }
    if (oldPrefs.subtractCalendarBusy != newPrefs.subtractCalendarBusy) {
        changes.push_back(makeEvent(PreferenceField::SubtractCalendarBusy, boolString(oldPrefs.subtractCalendarBusy),
                                    boolString(newPrefs.subtractCalendarBusy)));
    }
    const QStringList oldIds = canonicalIds(oldPrefs.includedCalendarIds);
    const QStringList newIds = canonicalIds(newPrefs.includedCalendarIds);
    if (oldIds != newIds) {
        changes.push_back(makeEvent(PreferenceField::IncludedCalendarIds, idsString(oldIds), idsString(newIds)));
    }
    if (oldPrefs.blockTentative != newPrefs.blockTentative) {
        changes.push_back(makeEvent(PreferenceField::BlockTentative, boolString(oldPrefs.blockTentative),
                                    boolString(newPrefs.blockTentative)));
    }
    if (oldPrefs.dedupeStrategy != newPrefs.dedupeStrategy) {
        changes.push_back(makeEvent(PreferenceField::DedupeStrategy, data::toString(oldPrefs.dedupeStrategy),
                                    data::toString(newPrefs.dedupeStrategy)));
    }
    if (oldPrefs.allDayBlockMode != newPrefs.allDayBlockMode) {
        changes.push_back(makeEvent(PreferenceField::AllDayBlockMode, data::toString(oldPrefs.allDayBlockMode),
                                    data::toString(newPrefs.allDayBlockMode)));
    }
    if (oldPrefs.allDayBlockMinutes != newPrefs.allDayBlockMinutes) {
        changes.push_back(makeEvent(PreferenceField::AllDayBlockMinutes, QString::number(oldPrefs.allDayBlockMinutes),
                                    QString::number(newPrefs.allDayBlockMinutes)));
    }
    if (oldPrefs.allDayBlockPosition != newPrefs.allDayBlockPosition) {
        changes.push_back(makeEvent(PreferenceField::AllDayBlockPosition,
                                    data::toString(oldPrefs.allDayBlockPosition),
                                    data::toString(newPrefs.allDayBlockPosition)));
    }
    if (oldPrefs.showCalendarTitles != newPrefs.showCalendarTitles) {
        changes.push_back(makeEvent(PreferenceField::ShowCalendarTitles, boolString(oldPrefs.showCalendarTitles),
                                    boolString(newPrefs.showCalendarTitles)));
    }
    if (oldPrefs.gapSyncFrequencyMinutes != newPrefs.gapSyncFrequencyMinutes) {
        changes.push_back(makeEvent(PreferenceField::GapSyncFrequency,
                                    QString::number(oldPrefs.gapSyncFrequencyMinutes),
                                    QString::number(newPrefs.gapSyncFrequencyMinutes)));
    }

    result.hasChanges = !changes.empty();
    int high = 0;
    int medium = 0;
    int low = 0;
    for (const auto &change : changes) {
        result.requiresRecalculation = result.requiresRecalculation || change.requiresRecalculation;
        result.requiresImmediateUpdate = result.requiresImmediateUpdate || change.requiresImmediateUpdate;
        switch (change.impact) {
        case ChangeImpact::High:
            ++high;
            break;
        case ChangeImpact::Medium:
            ++medium;
            break;
        case ChangeImpact::Low:
            ++low;
            break;
        }
    }

    if (high > 0) {
        result.affectedRange = m_window.range();
    } else if (medium > 0) {
        result.affectedRange = DateRange{ m_window.today(), m_window.end() };
    }

    if (!result.hasChanges) {
        result.summary = QStringLiteral("No changes detected");
    } else {
        QStringList parts;
        if (high > 0) {
            parts << pluralized(high, QStringLiteral("critical change"));
        }
        if (medium > 0) {
            parts << pluralized(medium, QStringLiteral("medium change"));
        }
        if (low > 0) {
            parts << pluralized(low, QStringLiteral("minor change"));
        }
        result.summary = parts.join(QStringLiteral(", "));
    }
    return result;
}

PreferenceChangeEvent ChangeImpactClassifier::makeEvent(PreferenceField field,
                                                        const QString &oldValue,
                                                        const QString &newValue) const
{
    PreferenceChangeEvent event;
    event.field = field;
    event.oldValue = oldValue;
    event.newValue = newValue;
    event.impact = impactOf(field);
    event.requiresRecalculation = event.impact != ChangeImpact::Low;
    event.requiresImmediateUpdate = event.impact == ChangeImpact::High;
    event.affectedDates = affectedDates(event.impact);

    switch (field) {
    case PreferenceField::WorkStart:
        event.description = QStringLiteral("Work start time changed from %1 to %2").arg(oldValue, newValue);
        break;
    case PreferenceField::WorkEnd:
        event.description = QStringLiteral("Work end time changed from %1 to %2").arg(oldValue, newValue);
        break;
    case PreferenceField::WorkingDays:
        event.description = QStringLiteral("Working days changed from %1 to %2").arg(oldValue, newValue);
        break;
    case PreferenceField::MinGap:
        event.description = QStringLiteral("Minimum gap changed from %1 to %2 minutes").arg(oldValue, newValue);
        break;
    case PreferenceField::BufferTime:
        event.description = QStringLiteral("Buffer time changed from %1 to %2 minutes").arg(oldValue, newValue);
        break;
    default:
        event.description = QStringLiteral("%1 changed from %2 to %3").arg(toString(field), oldValue, newValue);
        break;
    }
    return event;
}

std::vector<QDate> ChangeImpactClassifier::affectedDates(ChangeImpact impact) const
{
    switch (impact) {
    case ChangeImpact::High:
        return m_window.dates();
    case ChangeImpact::Medium:
        return DateRange{ m_window.today(), m_window.end() }.dates();
    case ChangeImpact::Low:
    default:
        return {};
    }
}

} // namespace core
} // namespace planner
