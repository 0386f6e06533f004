#pragma once

#include <vector>

#include <QStringList>

#include "planner/calendar/BusyBlock.hpp"
#include "planner/core/RollingWindow.hpp"
#include "planner/core/SessionContext.hpp"
#include "planner/data/Gap.hpp"
#include "planner/data/Preferences.hpp"
#include "planner/data/Task.hpp"

namespace planner {
namespace core {

struct GapChangeSet
{
    std::vector<data::Gap> toCreate;
    std::vector<data::Gap> toUpdate;
    std::vector<data::Gap> toDelete;

    bool isEmpty() const;
    GapChangeSet forDate(const QDate &date) const;
    std::vector<QDate> dates() const;
};

struct GapValidation
{
    bool valid = true;
    QStringList errors;
    QStringList warnings;
};

class GapEngine
{
public:
    explicit GapEngine(RollingWindow window, Clock clock = {});

    const RollingWindow &window() const;

    std::vector<data::Gap> computeBaseGaps(const QDate &date, const data::WorkPreferences &prefs) const;

    std::vector<data::Gap> reconcile(const QDate &date,
                                     const std::vector<data::Task> &tasks,
                                     const std::vector<calendar::BusyBlock> &busyBlocks,
                                     const data::WorkPreferences &prefs) const;

    std::vector<data::Gap> optimize(std::vector<data::Gap> gaps, const data::WorkPreferences &prefs) const;

    GapChangeSet handlePreferenceChange(const std::vector<data::Gap> &existingGaps,
                                        const data::WorkPreferences &oldPrefs,
                                        const data::WorkPreferences &newPrefs) const;

    static std::vector<data::Gap> applyChangeSet(std::vector<data::Gap> gaps, const GapChangeSet &changes);

    GapValidation validate(const std::vector<data::Gap> &gaps, const data::WorkPreferences &prefs) const;

private:
    std::vector<data::Gap> hourlyGaps(const QDate &date, int from, int to, int minimumMinutes) const;
    std::vector<data::Gap> subtract(const std::vector<data::Gap> &gaps,
                                    int start,
                                    int end,
                                    data::GapModifier modifier) const;
    data::Gap fragment(const data::Gap &parent, int start, int end, data::GapModifier modifier) const;
    QDateTime now() const;

    RollingWindow m_window;
    Clock m_clock;
};

} // namespace core
} // namespace planner
