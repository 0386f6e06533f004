#pragma once

#include <atomic>
#include <memory>
#include <vector>

#include <QDate>
#include <QMutex>

#include "planner/calendar/BusyBlock.hpp"
#include "planner/calendar/BusyBlockCache.hpp"
#include "planner/calendar/CalendarProvider.hpp"
#include "planner/calendar/Deduplicator.hpp"
#include "planner/data/Preferences.hpp"

namespace planner {
namespace calendar {

class BusyBlockService
{
public:
    static constexpr int kDefaultTodayTimeoutMs = 3000;
    static constexpr int kDefaultOtherTimeoutMs = 10000;

    BusyBlockService(std::shared_ptr<CalendarProvider> provider, std::shared_ptr<BusyBlockCache> cache);
    ~BusyBlockService();

    void setTimeouts(int todayMs, int otherMs);
    void setClock(core::Clock clock);

    std::vector<BusyBlock> busyBlocksFor(const QDate &date, const QDate &today, const data::WorkPreferences &prefs);
    // Cache-only lookup, used while the session is still cold.
    std::vector<BusyBlock> cachedBusyBlocksFor(const QDate &date) const;
    std::vector<BusyBlock> refresh(const QDate &date, const QDate &today, const data::WorkPreferences &prefs);

    bool calendarAvailable() const;
    std::vector<DedupDecision> lastDecisions() const;
    std::shared_ptr<BusyBlockCache> cache() const;

    static std::vector<BusyBlock> normalize(const std::vector<RawEvent> &events,
                                            CalendarSource source,
                                            const QDate &date,
                                            const data::WorkPreferences &prefs,
                                            const QDateTime &syncedAt,
                                            std::vector<DedupDecision> *decisions = nullptr);

private:
    std::optional<std::vector<RawEvent>> fetch(const QDate &date, int timeoutMs, const QStringList &calendarIds);
    std::vector<BusyBlock> fallback(const QDate &date) const;
    QDateTime now() const;

    std::shared_ptr<CalendarProvider> m_provider;
    std::shared_ptr<BusyBlockCache> m_cache;
    core::Clock m_clock;
    int m_todayTimeoutMs = kDefaultTodayTimeoutMs;
    int m_otherTimeoutMs = kDefaultOtherTimeoutMs;
    std::atomic_bool m_available{ true };
    mutable QMutex m_decisionMutex;
    std::vector<DedupDecision> m_lastDecisions;
};

} // namespace calendar
} // namespace planner
