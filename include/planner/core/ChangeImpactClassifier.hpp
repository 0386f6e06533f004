#pragma once

#include <optional>
#include <vector>

#include <QDate>
#include <QMetaType>
#include <QString>

#include "planner/core/RollingWindow.hpp"
#include "planner/data/Preferences.hpp"

namespace planner {
namespace core {

enum class PreferenceField
{
    WorkStart,
    WorkEnd,
    WorkingDays,
    MinGap,
    BufferTime,
    SubtractCalendarBusy,
    IncludedCalendarIds,
    BlockTentative,
    DedupeStrategy,
    AllDayBlockMode,
    AllDayBlockMinutes,
    AllDayBlockPosition,
    ShowCalendarTitles,
    GapSyncFrequency,
};

enum class ChangeImpact
{
    Low,
    Medium,
    High,
};

QString toString(PreferenceField field);
QString toString(ChangeImpact impact);

struct PreferenceChangeEvent
{
    PreferenceField field = PreferenceField::WorkStart;
    QString oldValue;
    QString newValue;
    ChangeImpact impact = ChangeImpact::Low;
    bool requiresRecalculation = false;
    bool requiresImmediateUpdate = false;
    std::vector<QDate> affectedDates;
    QString description;
};

struct ChangeDetectionResult
{
    bool hasChanges = false;
    std::vector<PreferenceChangeEvent> changes;
    bool requiresRecalculation = false;
    bool requiresImmediateUpdate = false;
    QString summary;
    std::optional<DateRange> affectedRange;

    bool hasHighImpact() const;
};

class ChangeImpactClassifier
{
public:
    explicit ChangeImpactClassifier(RollingWindow window);

    ChangeDetectionResult classify(const data::WorkPreferences &oldPrefs,
                                   const data::WorkPreferences &newPrefs) const;

    static ChangeImpact impactOf(PreferenceField field);

private:
    PreferenceChangeEvent makeEvent(PreferenceField field, const QString &oldValue, const QString &newValue) const;
    std::vector<QDate> affectedDates(ChangeImpact impact) const;

    RollingWindow m_window;
};

} // namespace core
} // namespace planner

Q_DECLARE_METATYPE(planner::core::ChangeDetectionResult)
