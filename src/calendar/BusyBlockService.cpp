#include "planner/calendar/BusyBlockService.hpp"

#include "planner/calendar/CalendarNormalizer.hpp"
#include "planner/core/Logging.hpp"

#include <QMutexLocker>
#include <QSemaphore>
#include <QThreadPool>

#include <exception>

namespace planner {
namespace calendar {

namespace {
struct FetchState
{
    QSemaphore done;
    std::optional<std::vector<RawEvent>> events;
    QString error;
};

// Shared by every service and never waited on, so a provider call that never
// returns cannot block shutdown.
QThreadPool *fetchPool()
{
    static QThreadPool *pool = [] {
        auto *threads = new QThreadPool;
        threads->setMaxThreadCount(16);
        return threads;
    }();
    return pool;
}
} // namespace

BusyBlockService::BusyBlockService(std::shared_ptr<CalendarProvider> provider, std::shared_ptr<BusyBlockCache> cache)
    : m_provider(std::move(provider))
    , m_cache(cache ? std::move(cache) : std::make_shared<BusyBlockCache>())
{
}

BusyBlockService::~BusyBlockService() = default;

void BusyBlockService::setTimeouts(int todayMs, int otherMs)
{
    m_todayTimeoutMs = todayMs > 0 ? todayMs : kDefaultTodayTimeoutMs;
    m_otherTimeoutMs = otherMs > 0 ? otherMs : kDefaultOtherTimeoutMs;
}

void BusyBlockService::setClock(core::Clock clock)
{
    m_clock = clock;
    m_cache->setClock(std::move(clock));
}

std::vector<BusyBlock> BusyBlockService::busyBlocksFor(const QDate &date,
                                                       const QDate &today,
                                                       const data::WorkPreferences &prefs)
{
    if (auto cached = m_cache->get(date)) {
        return *cached;
    }
    if (!m_provider) {
        m_available = false;
        return fallback(date);
    }

    const int timeout = date == today ? m_todayTimeoutMs : m_otherTimeoutMs;
    const auto events = fetch(date, timeout, prefs.includedCalendarIds);
    if (!events) {
        m_available = false;
        return fallback(date);
    }

    std::vector<DedupDecision> decisions;
    auto blocks = normalize(*events, m_provider->source(), date, prefs, now(), &decisions);
    {
        QMutexLocker locker(&m_decisionMutex);
        m_lastDecisions = std::move(decisions);
    }
    m_cache->set(date, blocks);
    m_available = true;
    qCDebug(lcPlannerCalendar) << "Fetched" << blocks.size() << "busy blocks for" << date;
    return blocks;
}

std::vector<BusyBlock> BusyBlockService::cachedBusyBlocksFor(const QDate &date) const
{
    return fallback(date);
}

std::vector<BusyBlock> BusyBlockService::refresh(const QDate &date,
                                                 const QDate &today,
                                                 const data::WorkPreferences &prefs)
{
    m_cache->invalidate(date);
    return busyBlocksFor(date, today, prefs);
}

bool BusyBlockService::calendarAvailable() const
{
    return m_available;
}

std::vector<DedupDecision> BusyBlockService::lastDecisions() const
{
    QMutexLocker locker(&m_decisionMutex);
    return m_lastDecisions;
}

std::shared_ptr<BusyBlockCache> BusyBlockService::cache() const
{
    return m_cache;
}

std::vector<BusyBlock> BusyBlockService::normalize(const std::vector<RawEvent> &events,
                                                   CalendarSource source,
                                                   const QDate &date,
                                                   const data::WorkPreferences &prefs,
                                                   const QDateTime &syncedAt,
                                                   std::vector<DedupDecision> *decisions)
{
    std::vector<BusyBlock> expanded;
    for (const auto &event : events) {
        const auto blocks = CalendarNormalizer::toBusyBlocks(event, source, prefs, syncedAt);
        for (const auto &block : blocks) {
            if (block.date == date) {
                expanded.push_back(block);
            }
        }
    }

    const auto visible = CalendarNormalizer::filterByTransparency(expanded, prefs);
    auto deduplicated = Deduplicator::deduplicateEvents(visible, prefs.dedupeStrategy);
    if (decisions) {
        *decisions = deduplicated.decisions;
    }
    return CalendarNormalizer::mergeOverlaps(std::move(deduplicated.kept));
}

std::optional<std::vector<RawEvent>> BusyBlockService::fetch(const QDate &date,
                                                            int timeoutMs,
                                                            const QStringList &calendarIds)
{
    auto state = std::make_shared<FetchState>();
    auto provider = m_provider;

    const bool started = fetchPool()->tryStart([state, provider, date, calendarIds]() {
        try {
            if (!provider->requestPermission()) {
                state->error = QStringLiteral("calendar permission denied");
            } else {
                QStringList calendars = calendarIds;
                if (calendars.isEmpty()) {
                    const auto listed = provider->listCalendars();
                    if (listed) {
                        calendars = *listed;
                    } else {
                        state->error = QStringLiteral("calendar list unavailable");
                    }
                }
                if (state->error.isEmpty()) {
                    state->events = provider->listEvents(core::DateRange{ date, date }, calendars);
                    if (!state->events) {
                        state->error = QStringLiteral("event query failed");
                    }
                }
            }
        } catch (const std::exception &e) {
            state->events.reset();
            state->error = QString::fromUtf8(e.what());
        } catch (...) {
            state->events.reset();
            state->error = QStringLiteral("unknown provider error");
        }
        state->done.release();
    });
    if (!started) {
        qCWarning(lcPlannerCalendar) << "No free calendar worker for" << date;
        return std::nullopt;
    }

    if (!state->done.tryAcquire(1, timeoutMs)) {
        qCWarning(lcPlannerCalendar) << "Calendar provider timed out after" << timeoutMs << "ms for" << date;
        return std::nullopt;
    }
    if (!state->error.isEmpty()) {
        qCWarning(lcPlannerCalendar) << "Calendar provider failed for" << date << ":" << state->error;
        return std::nullopt;
    }
    return state->events;
}

std::vector<BusyBlock> BusyBlockService::fallback(const QDate &date) const
{
    if (auto known = m_cache->lastKnown(date)) {
        return *known;
    }
    return {};
}

QDateTime BusyBlockService::now() const
{
    return m_clock ? m_clock() : QDateTime::currentDateTimeUtc();
}

} // namespace calendar
} // namespace planner
