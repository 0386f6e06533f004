#pragma once

#include <vector>

#include <QString>
#include <QStringList>

#include "planner/calendar/BusyBlock.hpp"
#include "planner/data/Preferences.hpp"

namespace planner {
namespace calendar {

struct DedupDecision
{
    QString keptUid;
    QStringList droppedUids;
    QString reason;
};

struct DedupResult
{
    std::vector<BusyBlock> kept;
    std::vector<DedupDecision> decisions;

    int droppedCount() const;
};

// Collapses blocks mirrored across calendars. Identity is the exact (date, start, end) triple.
class Deduplicator
{
public:
    static DedupResult deduplicateEvents(const std::vector<BusyBlock> &blocks, data::DedupeStrategy strategy);
};

} // namespace calendar
} // namespace planner
