#include "planner/core/GapEngine.hpp"

#include "planner/core/Logging.hpp"
#include "planner/core/TimeUtils.hpp"

#include <QSet>

#include <algorithm>
#include <map>

namespace planner {
namespace core {

namespace {
bool overlaps(int start, int end, const data::Gap &gap)
{
    return start < gap.end && end > gap.start;
}

bool byDateAndStart(const data::Gap &lhs, const data::Gap &rhs)
{
    if (lhs.date == rhs.date) {
        if (lhs.start == rhs.start) {
            return lhs.end < rhs.end;
        }
        return lhs.start < rhs.start;
    }
    return lhs.date < rhs.date;
}

bool isWorkingDay(const QDate &date, const data::WorkPreferences &prefs)
{
    return prefs.workingDays.contains(date) && prefs.workInterval().has_value();
}
} // namespace

bool GapChangeSet::isEmpty() const
{
    return toCreate.empty() && toUpdate.empty() && toDelete.empty();
}

GapChangeSet GapChangeSet::forDate(const QDate &date) const
{
    GapChangeSet result;
    auto onDate = [&date](const data::Gap &gap) { return gap.date == date; };
    std::copy_if(toCreate.begin(), toCreate.end(), std::back_inserter(result.toCreate), onDate);
    std::copy_if(toUpdate.begin(), toUpdate.end(), std::back_inserter(result.toUpdate), onDate);
    std::copy_if(toDelete.begin(), toDelete.end(), std::back_inserter(result.toDelete), onDate);
    return result;
}

std::vector<QDate> GapChangeSet::dates() const
{
    std::vector<QDate> result;
    auto collect = [&result](const std::vector<data::Gap> &gaps) {
        for (const auto &gap : gaps) {
            if (std::find(result.begin(), result.end(), gap.date) == result.end()) {
                result.push_back(gap.date);
            }
        }
    };
    collect(toCreate);
    collect(toUpdate);
    collect(toDelete);
    std::sort(result.begin(), result.end());
    return result;
}

GapEngine::GapEngine(RollingWindow window, Clock clock)
    : m_window(std::move(window))
    , m_clock(std::move(clock))
{
}

const RollingWindow &GapEngine::window() const
{
    return m_window;
}

std::vector<data::Gap> GapEngine::computeBaseGaps(const QDate &date, const data::WorkPreferences &prefs) const
{
    if (!m_window.contains(date)) {
        return {};
    }
    if (!prefs.workingDays.contains(date)) {
        return {};
    }
    const auto interval = prefs.workInterval();
    if (!interval) {
        qCDebug(lcPlannerEngine) << "No usable work hours for" << date;
        return {};
    }
    return hourlyGaps(date, interval->start, interval->end, 0);
}

std::vector<data::Gap> GapEngine::reconcile(const QDate &date,
                                            const std::vector<data::Task> &tasks,
                                            const std::vector<calendar::BusyBlock> &busyBlocks,
                                            const data::WorkPreferences &prefs) const
{
    std::vector<data::Gap> gaps = computeBaseGaps(date, prefs);
    if (gaps.empty()) {
        return gaps;
    }

    for (const auto &task : tasks) {
        if (task.dueDate != date || task.status == data::TaskStatus::Completed) {
            continue;
        }
        if (!task.dueTime || !task.durationMinutes) {
            continue;
        }
        const int start = *task.dueTime;
        const int duration = *task.durationMinutes;
        if (start < 0 || start >= kMinutesPerDay || duration <= 0) {
            qCWarning(lcPlannerEngine) << "Skipping malformed task" << task.id << "start" << start
                                       << "duration" << duration;
            continue;
        }
        gaps = subtract(gaps, start, std::min(start + duration, kMinutesPerDay), data::GapModifier::System);
    }

    if (!prefs.subtractCalendarBusy) {
        return gaps;
    }

    for (const auto &block : busyBlocks) {
        if (block.date != date) {
            continue;
        }
        if (block.start < 0 || block.end > kMinutesPerDay || block.start >= block.end) {
            qCWarning(lcPlannerEngine) << "Skipping malformed busy block" << block.uid << block.start
                                       << block.end;
            continue;
        }
        gaps = subtract(gaps, block.start, block.end, data::GapModifier::CalendarSync);
    }
    return gaps;
}

std::vector<data::Gap> GapEngine::optimize(std::vector<data::Gap> gaps, const data::WorkPreferences &prefs) const
{
    const int minimum = std::max(0, prefs.minGapMinutes);
    gaps.erase(std::remove_if(gaps.begin(), gaps.end(),
                              [minimum](const data::Gap &gap) { return gap.durationMinutes < minimum; }),
               gaps.end());
    return gaps;
}

GapChangeSet GapEngine::handlePreferenceChange(const std::vector<data::Gap> &existingGaps,
                                               const data::WorkPreferences &oldPrefs,
                                               const data::WorkPreferences &newPrefs) const
{
    GapChangeSet changes;

    std::map<QDate, std::vector<data::Gap>> gapsByDate;
    for (const auto &gap : existingGaps) {
        gapsByDate[gap.date].push_back(gap);
    }
    // Days that just became working days have nothing stored yet.
    for (const QDate &date : m_window.dates()) {
        if (!isWorkingDay(date, oldPrefs) && isWorkingDay(date, newPrefs)) {
            gapsByDate[date];
        }
    }

    const auto oldInterval = oldPrefs.workInterval();
    const auto newInterval = newPrefs.workInterval();
    const int minimum = std::max(0, newPrefs.minGapMinutes);

    for (auto it = gapsByDate.cbegin(); it != gapsByDate.cend(); ++it) {
        const QDate &date = it->first;
        const auto &gaps = it->second;
        const bool wasWorking = isWorkingDay(date, oldPrefs);
        const bool isWorking = isWorkingDay(date, newPrefs);

        if (wasWorking && !isWorking) {
            changes.toDelete.insert(changes.toDelete.end(), gaps.begin(), gaps.end());
            continue;
        }
        if (!wasWorking && isWorking) {
            changes.toDelete.insert(changes.toDelete.end(), gaps.begin(), gaps.end());
            const auto created = computeBaseGaps(date, newPrefs);
            changes.toCreate.insert(changes.toCreate.end(), created.begin(), created.end());
            continue;
        }
        if (!isWorking) {
            continue;
        }

        const int newStart = newInterval->start;
        const int newEnd = newInterval->end;
        for (const auto &gap : gaps) {
            if (gap.end <= newStart || gap.start >= newEnd) {
                changes.toDelete.push_back(gap);
                continue;
            }
            if (gap.start >= newStart && gap.end <= newEnd) {
                continue;
            }
            data::Gap trimmed = gap;
            trimmed.start = std::max(gap.start, newStart);
            trimmed.end = std::min(gap.end, newEnd);
            trimmed.durationMinutes = trimmed.end - trimmed.start;
            trimmed.modifiedBy = data::GapModifier::System;
            trimmed.updatedAt = now();
            if (trimmed.durationMinutes < minimum) {
                changes.toDelete.push_back(gap);
            } else {
                changes.toUpdate.push_back(trimmed);
            }
        }

        if (!m_window.contains(date)) {
            continue;
        }
        if (newStart < oldInterval->start) {
            const auto early = hourlyGaps(date, newStart, std::min(oldInterval->start, newEnd), minimum);
            changes.toCreate.insert(changes.toCreate.end(), early.begin(), early.end());
        }
        if (newEnd > oldInterval->end) {
            const auto late = hourlyGaps(date, std::max(oldInterval->end, newStart), newEnd, minimum);
            changes.toCreate.insert(changes.toCreate.end(), late.begin(), late.end());
        }
    }

    qCDebug(lcPlannerEngine) << "Preference change:" << changes.toCreate.size() << "to create,"
                             << changes.toUpdate.size() << "to update," << changes.toDelete.size()
                             << "to delete";
    return changes;
}

std::vector<data::Gap> GapEngine::applyChangeSet(std::vector<data::Gap> gaps, const GapChangeSet &changes)
{
    QSet<QUuid> deleted;
    for (const auto &gap : changes.toDelete) {
        deleted.insert(gap.id);
    }
    gaps.erase(std::remove_if(gaps.begin(), gaps.end(),
                              [&deleted](const data::Gap &gap) { return deleted.contains(gap.id); }),
               gaps.end());

    for (const auto &updated : changes.toUpdate) {
        auto it = std::find_if(gaps.begin(), gaps.end(),
                               [&updated](const data::Gap &gap) { return gap.id == updated.id; });
        if (it != gaps.end()) {
            *it = updated;
        }
    }

    // Hours already covered, e.g. by a recompute under the new preferences, are not created twice.
    const size_t kept = gaps.size();
    for (const auto &created : changes.toCreate) {
        const bool covered = std::any_of(gaps.begin(), gaps.begin() + kept, [&created](const data::Gap &gap) {
            return gap.date == created.date && overlaps(created.start, created.end, gap);
        });
        if (!covered) {
            gaps.push_back(created);
        }
    }
    std::sort(gaps.begin(), gaps.end(), byDateAndStart);
    return gaps;
}

GapValidation GapEngine::validate(const std::vector<data::Gap> &gaps, const data::WorkPreferences &prefs) const
{
    GapValidation result;
    std::vector<data::Gap> sorted = gaps;
    std::sort(sorted.begin(), sorted.end(), byDateAndStart);

    for (size_t i = 0; i < sorted.size(); ++i) {
        const auto &gap = sorted[i];
        if (gap.durationMinutes != gap.end - gap.start || gap.start >= gap.end) {
            result.errors << QStringLiteral("Gap %1 has inconsistent duration").arg(gap.id.toString());
        }
        if (i > 0 && sorted[i - 1].date == gap.date && overlaps(sorted[i - 1].start, sorted[i - 1].end, gap)) {
            result.errors << QStringLiteral("Gap overlap detected: %1 and %2")
                                 .arg(sorted[i - 1].id.toString(), gap.id.toString());
        }
    }

    const auto interval = prefs.workInterval();
    if (interval) {
        for (const auto &gap : sorted) {
            if (gap.start < interval->start || gap.end > interval->end) {
                result.warnings << QStringLiteral("Gap outside work hours: %1 (%2-%3)")
                                       .arg(gap.id.toString(), formatTimeOfDay(gap.start),
                                            formatTimeOfDay(gap.end));
            }
        }
    }

    result.valid = result.errors.isEmpty();
    return result;
}

std::vector<data::Gap> GapEngine::hourlyGaps(const QDate &date, int from, int to, int minimumMinutes) const
{
    std::vector<data::Gap> gaps;
    const QDateTime timestamp = now();
    for (int hour = from; hour < to; hour += kMinutesPerHour) {
        const int end = std::min(hour + kMinutesPerHour, to);
        if (end - hour < minimumMinutes) {
            continue;
        }
        data::Gap gap;
        gap.date = date;
        gap.start = hour;
        gap.end = end;
        gap.durationMinutes = end - hour;
        gap.modifiedBy = data::GapModifier::System;
        gap.createdAt = timestamp;
        gap.updatedAt = timestamp;
        gaps.push_back(gap);
    }
    return gaps;
}

std::vector<data::Gap> GapEngine::subtract(const std::vector<data::Gap> &gaps,
                                           int start,
                                           int end,
                                           data::GapModifier modifier) const
{
    std::vector<data::Gap> result;
    result.reserve(gaps.size() + 1);
    for (const auto &gap : gaps) {
        if (!overlaps(start, end, gap)) {
            result.push_back(gap);
            continue;
        }
        if (start > gap.start) {
            result.push_back(fragment(gap, gap.start, start, modifier));
        }
        if (end < gap.end) {
            result.push_back(fragment(gap, end, gap.end, modifier));
        }
    }
    return result;
}

data::Gap GapEngine::fragment(const data::Gap &parent, int start, int end, data::GapModifier modifier) const
{
    data::Gap piece;
    piece.date = parent.date;
    piece.start = start;
    piece.end = end;
    piece.durationMinutes = end - start;
    piece.parentGapId = parent.id;
    piece.originGapId = parent.originGapId.isNull() ? parent.id : parent.originGapId;
    piece.modifiedBy = modifier;
    piece.createdAt = parent.createdAt;
    piece.updatedAt = now();
    return piece;
}

QDateTime GapEngine::now() const
{
    return m_clock ? m_clock() : QDateTime::currentDateTimeUtc();
}

} // namespace core
} // namespace planner
