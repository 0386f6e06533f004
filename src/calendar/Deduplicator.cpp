#include "planner/calendar/Deduplicator.hpp"

#include "planner/core/Logging.hpp"
#include "planner/core/TimeUtils.hpp"

#include <QHash>

#include <algorithm>

namespace planner {
namespace calendar {

namespace {
QString groupKey(const BusyBlock &block)
{
    return QStringLiteral("%1_%2_%3")
        .arg(block.date.toString(Qt::ISODate), core::formatTimeOfDay(block.start), core::formatTimeOfDay(block.end));
}

size_t choose(const std::vector<BusyBlock> &group, data::DedupeStrategy strategy)
{
    auto pick = [&group](auto predicate) -> size_t {
        const auto it = std::find_if(group.begin(), group.end(), predicate);
        return it == group.end() ? 0 : static_cast<size_t>(it - group.begin());
    };

    switch (strategy) {
    case data::DedupeStrategy::PreferGoogle:
        return pick([](const BusyBlock &block) { return block.source == CalendarSource::Google; });
    case data::DedupeStrategy::PreferDevice:
        return pick([](const BusyBlock &block) { return block.source == CalendarSource::Device; });
    case data::DedupeStrategy::Auto:
    default:
        return pick([](const BusyBlock &block) {
            return block.transparency != Transparency::Free && block.status != EventStatus::Tentative;
        });
    }
}
} // namespace

int DedupResult::droppedCount() const
{
    int count = 0;
    for (const auto &decision : decisions) {
        count += decision.droppedUids.size();
    }
    return count;
}

DedupResult Deduplicator::deduplicateEvents(const std::vector<BusyBlock> &blocks, data::DedupeStrategy strategy)
{
    DedupResult result;
    if (strategy == data::DedupeStrategy::None) {
        result.kept = blocks;
        return result;
    }

    QHash<QString, size_t> groupIndex;
    std::vector<QString> keys;
    std::vector<std::vector<BusyBlock>> groups;
    for (const auto &block : blocks) {
        const QString key = groupKey(block);
        auto it = groupIndex.constFind(key);
        if (it == groupIndex.constEnd()) {
            groupIndex.insert(key, groups.size());
            keys.push_back(key);
            groups.push_back({ block });
        } else {
            groups[it.value()].push_back(block);
        }
    }

    const QString reason = data::toString(strategy);
    for (size_t g = 0; g < groups.size(); ++g) {
        const auto &group = groups[g];
        if (group.size() == 1) {
            result.kept.push_back(group.front());
            continue;
        }

        const size_t chosen = choose(group, strategy);
        result.kept.push_back(group[chosen]);

        DedupDecision decision;
        decision.keptUid = group[chosen].uid;
        decision.reason = reason;
        for (size_t i = 0; i < group.size(); ++i) {
            if (i == chosen) {
                continue;
            }
            const BusyBlock &dropped = group[i];
            decision.droppedUids << (dropped.uid.isEmpty()
                                         ? QStringLiteral("%1_%2").arg(keys[g], toString(dropped.source))
                                         : dropped.uid);
        }
        result.decisions.push_back(decision);
    }

    if (!result.decisions.empty()) {
        qCDebug(lcPlannerCalendar) << "Deduplicated" << result.droppedCount() << "mirrored blocks using" << reason;
    }
    return result;
}

} // namespace calendar
} // namespace planner
