#include "planner/calendar/CalendarNormalizer.hpp"

#include "planner/core/Logging.hpp"
#include "planner/core/TimeUtils.hpp"

#include <algorithm>
#include <tuple>

namespace planner {
namespace calendar {

namespace {
data::WorkInterval allDayWindow(const data::WorkPreferences &prefs)
{
    if (const auto interval = prefs.workInterval()) {
        return *interval;
    }
    return { data::kDefaultWorkStart, data::kDefaultWorkEnd };
}

bool blockOrder(const BusyBlock &lhs, const BusyBlock &rhs)
{
    return std::make_tuple(lhs.date, lhs.start, lhs.end, lhs.uid, lhs.calendarId, static_cast<int>(lhs.source))
           < std::make_tuple(rhs.date, rhs.start, rhs.end, rhs.uid, rhs.calendarId, static_cast<int>(rhs.source));
}
} // namespace

std::vector<BusyBlock> CalendarNormalizer::toBusyBlocks(const RawEvent &event,
                                                        CalendarSource source,
                                                        const data::WorkPreferences &prefs,
                                                        const QDateTime &syncedAt)
{
    std::vector<BusyBlock> result;
    if (!event.start.isValid()) {
        qCWarning(lcPlannerCalendar) << "Skipping event without start" << event.id;
        return result;
    }

    BusyBlock prototype;
    prototype.source = source;
    prototype.calendarId = event.calendarId;
    prototype.title = prefs.showCalendarTitles ? event.title : QString();
    prototype.transparency = event.transparency;
    prototype.status = event.status;
    prototype.isAllDay = event.isAllDay;
    prototype.uid = event.id;
    prototype.lastSyncedAt = syncedAt;

    if (event.isAllDay) {
        const QDate first = event.start.date();
        QDate last = event.end.isValid() ? event.end.date().addDays(-1) : first;
        if (last < first) {
            last = first;
        }
        for (QDate date = first; date <= last; date = date.addDays(1)) {
            BusyBlock day = prototype;
            day.date = date;
            day.start = 0;
            day.end = core::kMinutesPerDay;
            const auto expanded = expandAllDay(day, prefs);
            result.insert(result.end(), expanded.begin(), expanded.end());
        }
        return result;
    }

    const QDateTime start = event.start.toLocalTime();
    const QDateTime end = event.end.isValid() ? event.end.toLocalTime() : start;
    if (end <= start) {
        qCWarning(lcPlannerCalendar) << "Skipping event with empty duration" << event.id;
        return result;
    }

    for (QDate date = start.date(); date <= end.date(); date = date.addDays(1)) {
        const int from = date == start.date() ? core::minutesSinceMidnight(start.time()) : 0;
        const int to = date == end.date() ? core::minutesSinceMidnight(end.time()) : core::kMinutesPerDay;
        if (from >= to) {
            continue;
        }
        BusyBlock piece = prototype;
        piece.date = date;
        piece.start = from;
        piece.end = to;
        result.push_back(piece);
    }
    return result;
}

std::vector<BusyBlock> CalendarNormalizer::expandAllDay(const BusyBlock &block, const data::WorkPreferences &prefs)
{
    if (!block.isAllDay) {
        return { block };
    }

    const data::WorkInterval window = allDayWindow(prefs);
    BusyBlock derived = block;

    switch (prefs.allDayBlockMode) {
    case data::AllDayBlockMode::Ignore:
        return {};
    case data::AllDayBlockMode::Workday:
        derived.start = window.start;
        derived.end = window.end;
        break;
    case data::AllDayBlockMode::Window: {
        const int length = std::max(0, window.length());
        const int duration = std::min(prefs.allDayBlockMinutes, length);
        if (duration <= 0) {
            return {};
        }
        int start = window.start;
        if (prefs.allDayBlockPosition == data::AllDayBlockPosition::Middle) {
            start = window.start + (length - duration) / 2;
        } else if (prefs.allDayBlockPosition == data::AllDayBlockPosition::End) {
            start = std::max(window.start, window.end - duration);
        }
        derived.start = start;
        derived.end = start + duration;
        break;
    }
    }

    if (derived.start >= derived.end) {
        return {};
    }
    return { derived };
}

std::vector<BusyBlock> CalendarNormalizer::filterByTransparency(const std::vector<BusyBlock> &blocks,
                                                                const data::WorkPreferences &prefs)
{
    std::vector<BusyBlock> filtered;
    filtered.reserve(blocks.size());
    for (const auto &block : blocks) {
        if (block.status == EventStatus::Cancelled) {
            continue;
        }
        if (block.transparency == Transparency::Free) {
            continue;
        }
        if (block.transparency == Transparency::Tentative && !prefs.blockTentative) {
            continue;
        }
        filtered.push_back(block);
    }
    return filtered;
}

std::vector<BusyBlock> CalendarNormalizer::mergeOverlaps(std::vector<BusyBlock> blocks)
{
    std::sort(blocks.begin(), blocks.end(), blockOrder);

    std::vector<BusyBlock> merged;
    merged.reserve(blocks.size());
    for (const auto &block : blocks) {
        if (merged.empty() || merged.back().date != block.date || block.start > merged.back().end) {
            merged.push_back(block);
            continue;
        }
        // Touching or overlapping: extend the running block, keep its provenance.
        merged.back().end = std::max(merged.back().end, block.end);
    }
    return merged;
}

} // namespace calendar
} // namespace planner
