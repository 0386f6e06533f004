#pragma once

#include <vector>

#include <QDateTime>

#include "planner/calendar/BusyBlock.hpp"
#include "planner/calendar/CalendarProvider.hpp"
#include "planner/data/Preferences.hpp"

namespace planner {
namespace calendar {

class CalendarNormalizer
{
public:
    static std::vector<BusyBlock> toBusyBlocks(const RawEvent &event,
                                               CalendarSource source,
                                               const data::WorkPreferences &prefs,
                                               const QDateTime &syncedAt = {});

    static std::vector<BusyBlock> expandAllDay(const BusyBlock &block, const data::WorkPreferences &prefs);
    static std::vector<BusyBlock> filterByTransparency(const std::vector<BusyBlock> &blocks,
                                                       const data::WorkPreferences &prefs);

    // Output is sorted by (date, start) and does not depend on the input order.
    static std::vector<BusyBlock> mergeOverlaps(std::vector<BusyBlock> blocks);
};

} // namespace calendar
} // namespace planner
