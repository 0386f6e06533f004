#include "planner/core/GapScheduler.hpp"

#include "planner/calendar/BusyBlockCache.hpp"
#include "planner/calendar/BusyBlockService.hpp"
#include "planner/core/CacheLimitGuard.hpp"
#include "planner/core/Logging.hpp"
#include "planner/data/GapRepository.hpp"
#include "planner/data/JsonCodec.hpp"
#include "planner/data/PreferenceRepository.hpp"
#include "planner/data/TaskRepository.hpp"

#include <QJsonDocument>
#include <QMutexLocker>

#include <algorithm>
#include <set>

namespace planner {
namespace core {

namespace {
qint64 encodedSize(const QJsonArray &array)
{
    return QJsonDocument(array).toJson(QJsonDocument::Compact).size();
}

// Today first, then the days ahead, then the days behind.
std::vector<QDate> progressiveOrder(const RollingWindow &window)
{
    std::vector<QDate> order;
    order.push_back(window.today());
    for (QDate date = window.today().addDays(1); date <= window.end(); date = date.addDays(1)) {
        order.push_back(date);
    }
    for (QDate date = window.today().addDays(-1); date >= window.start(); date = date.addDays(-1)) {
        order.push_back(date);
    }
    return order;
}
} // namespace

GapScheduler::GapScheduler(data::TaskRepository &tasks,
                           data::GapRepository &gaps,
                           data::PreferenceRepository &preferences,
                           std::shared_ptr<calendar::BusyBlockService> busyBlocks,
                           CacheLimitGuard *guard,
                           SessionContext session,
                           QObject *parent)
    : QObject(parent)
    , m_tasks(tasks)
    , m_gaps(gaps)
    , m_preferences(preferences)
    , m_busyBlocks(std::move(busyBlocks))
    , m_guard(guard)
    , m_session(std::move(session))
{
    qRegisterMetaType<std::vector<planner::data::Gap>>("std::vector<planner::data::Gap>");
    qRegisterMetaType<planner::core::ChangeDetectionResult>("planner::core::ChangeDetectionResult");

    m_debounce.setSingleShot(true);
    m_debounce.setInterval(kDefaultDebounceMs);
    connect(&m_debounce, &QTimer::timeout, this, &GapScheduler::flushPending);
}

GapScheduler::~GapScheduler()
{
    m_debounce.stop();
    m_pool.waitForDone();
}

RollingWindow GapScheduler::window() const
{
    QMutexLocker locker(&m_sessionMutex);
    return m_session.window();
}

SessionPhase GapScheduler::phase() const
{
    QMutexLocker locker(&m_sessionMutex);
    return m_session.phase();
}

void GapScheduler::setDebounceInterval(int msecs)
{
    m_debounce.setInterval(std::max(0, msecs));
}

std::vector<data::Gap> GapScheduler::recalculate(const QDate &date)
{
    const auto lock = dateLock(date);
    QMutexLocker locker(lock.get());

    const RollingWindow currentWindow = window();
    if (!currentWindow.contains(date)) {
        if (!m_gaps.gapsForDate(date).empty() && !m_gaps.replaceGapsForDate(date, {})) {
            qCWarning(lcPlannerEngine) << "Could not clear gaps for" << date;
        }
        return {};
    }

    const data::WorkPreferences prefs = currentPreferences();
    const std::vector<data::Task> tasks = m_tasks.tasksDueOn(date);

    std::vector<calendar::BusyBlock> busy;
    if (prefs.subtractCalendarBusy && m_busyBlocks) {
        if (phase() == SessionPhase::Cold) {
            busy = m_busyBlocks->cachedBusyBlocksFor(date);
        } else {
            busy = m_busyBlocks->busyBlocksFor(date, currentWindow.today(), prefs);
        }
    }

    const GapEngine engine = makeEngine();
    std::vector<data::Gap> gaps = engine.optimize(engine.reconcile(date, tasks, busy, prefs), prefs);

    const GapValidation validation = engine.validate(gaps, prefs);
    if (!validation.valid) {
        qCWarning(lcPlannerEngine) << "Validation failed for" << date << validation.errors;
    }
    {
        QMutexLocker validationLocker(&m_validationMutex);
        m_validations.insert(date, validation);
    }

    if (!m_gaps.replaceGapsForDate(date, gaps)) {
        qCWarning(lcPlannerEngine) << "Could not store gaps for" << date;
    }
    qCDebug(lcPlannerEngine) << "Recalculated" << date << ":" << gaps.size() << "gaps";
    emit gapsUpdated(date, gaps);
    return gaps;
}

void GapScheduler::recalculateAsync(const std::vector<QDate> &dates)
{
    for (const QDate &date : dates) {
        m_pool.start([this, date]() { recalculate(date); });
    }
}

ChangeDetectionResult GapScheduler::applyPreferences(const data::WorkPreferences &newPrefs)
{
    const data::WorkPreferences oldPrefs = currentPreferences();
    const RollingWindow currentWindow = window();
    const ChangeDetectionResult result = ChangeImpactClassifier(currentWindow).classify(oldPrefs, newPrefs);

    if (!m_preferences.savePreferences(newPrefs)) {
        qCWarning(lcPlannerEngine) << "Could not store preferences";
    }
    if (!result.hasChanges) {
        // Unset hours classify like the defaults but produce no gaps at all.
        if (oldPrefs.workInterval().has_value() != newPrefs.workInterval().has_value()) {
            recalculateAsync(currentWindow.dates());
        }
        return result;
    }

    qCInfo(lcPlannerEngine) << "Preferences changed:" << result.summary;
    emit preferenceChangeSummary(result);

    if (!result.requiresRecalculation || !result.affectedRange) {
        return result;
    }

    const std::vector<QDate> affected = result.affectedRange->dates();
    if (result.requiresImmediateUpdate) {
        applyPreferenceChange(oldPrefs, newPrefs);
        recalculateAsync(affected);
        return result;
    }

    for (const QDate &date : affected) {
        m_pending.insert(date);
    }
    m_debounce.start();
    return result;
}

void GapScheduler::preloadWindow()
{
    const RollingWindow currentWindow = window();
    {
        QMutexLocker locker(&m_sessionMutex);
        m_session.setPhase(SessionPhase::Cold);
    }
    for (const QDate &date : currentWindow.dates()) {
        recalculate(date);
    }
    {
        QMutexLocker locker(&m_sessionMutex);
        m_session.setPhase(SessionPhase::Warm);
    }
    qCInfo(lcPlannerEngine) << "Window" << currentWindow.start() << "-" << currentWindow.end() << "preloaded";

    if (m_busyBlocks && currentPreferences().subtractCalendarBusy) {
        recalculateAsync(progressiveOrder(currentWindow));
    }
}

void GapScheduler::slideWindow(const QDate &today)
{
    {
        QMutexLocker locker(&m_sessionMutex);
        if (m_session.window().today() == today) {
            return;
        }
        m_session.setToday(today);
    }
    const RollingWindow currentWindow = window();
    emit windowMoved(currentWindow.range());

    const int removed = m_gaps.removeOutside(currentWindow.range());
    if (m_busyBlocks) {
        m_busyBlocks->cache()->cleanup(currentWindow.range());
    }
    {
        QMutexLocker locker(&m_validationMutex);
        for (auto it = m_validations.begin(); it != m_validations.end();) {
            it = currentWindow.contains(it.key()) ? std::next(it) : m_validations.erase(it);
        }
    }
    {
        // A lock still held by a running recompute stays until the next slide.
        QMutexLocker locker(&m_lockMapMutex);
        for (auto it = m_dateLocks.begin(); it != m_dateLocks.end();) {
            const bool idle = it.value().use_count() == 1;
            it = (currentWindow.contains(it.key()) || !idle) ? std::next(it) : m_dateLocks.erase(it);
        }
    }
    qCInfo(lcPlannerEngine) << "Window moved to" << today << "," << removed << "gaps dropped";

    const std::vector<QDate> stored = m_gaps.dates();
    std::vector<QDate> missing;
    for (const QDate &date : currentWindow.dates()) {
        if (std::find(stored.begin(), stored.end(), date) == stored.end()) {
            missing.push_back(date);
        }
    }
    recalculateAsync(missing);
}

void GapScheduler::enforceLimits()
{
    if (!m_guard) {
        return;
    }
    const RollingWindow currentWindow = window();

    const auto tasks = m_tasks.fetchTasks();
    m_guard->updateUsage(CacheCollection::Tasks, static_cast<qint64>(tasks.size()),
                         encodedSize(data::json::tasksToJson(tasks)));

    const auto gaps = m_gaps.allGaps();
    m_guard->updateUsage(CacheCollection::Gaps, static_cast<qint64>(gaps.size()),
                         encodedSize(data::json::gapsToJson(gaps)));
    if (m_guard->exceedsHardCeiling(CacheCollection::Gaps)) {
        const int removed = m_gaps.removeOutside(currentWindow.range());
        qCWarning(lcPlannerCache) << "Gap store over its ceiling, purged" << removed << "gaps outside the window";
        const auto remaining = m_gaps.allGaps();
        m_guard->updateUsage(CacheCollection::Gaps, static_cast<qint64>(remaining.size()),
                             encodedSize(data::json::gapsToJson(remaining)));
    }

    {
        QMutexLocker locker(&m_validationMutex);
        if (m_guard->exceedsHardCeiling(CacheCollection::ValidationResults)) {
            m_validations.clear();
        }
        m_guard->updateUsage(CacheCollection::ValidationResults, m_validations.size(), 0);
    }

    if (!m_busyBlocks) {
        return;
    }
    const auto cache = m_busyBlocks->cache();
    m_guard->updateUsage(CacheCollection::BusyBlocks, cache->entryCount(), cache->byteSize());
    if (!m_guard->exceedsHardCeiling(CacheCollection::BusyBlocks)) {
        return;
    }
    cache->cleanup(currentWindow.range());
    m_guard->updateUsage(CacheCollection::BusyBlocks, cache->entryCount(), cache->byteSize());
    if (m_guard->needsCleanup(CacheCollection::BusyBlocks)) {
        const QStringList victims = m_guard->selectEvictionCandidates(CacheCollection::BusyBlocks, cache->entryStats());
        const int evicted = cache->evict(victims);
        qCWarning(lcPlannerCache) << "Busy-block cache over its ceiling, evicted" << evicted << "entries";
        m_guard->updateUsage(CacheCollection::BusyBlocks, cache->entryCount(), cache->byteSize());
    }
}

int GapScheduler::dateLockCount() const
{
    QMutexLocker locker(&m_lockMapMutex);
    return m_dateLocks.size();
}

bool GapScheduler::waitForDone(int msecs)
{
    return m_pool.waitForDone(msecs);
}

std::optional<GapValidation> GapScheduler::lastValidation(const QDate &date) const
{
    QMutexLocker locker(&m_validationMutex);
    const auto it = m_validations.constFind(date);
    if (it == m_validations.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

void GapScheduler::flushPending()
{
    std::vector<QDate> dates(m_pending.begin(), m_pending.end());
    m_pending.clear();
    std::sort(dates.begin(), dates.end());
    qCDebug(lcPlannerEngine) << "Recalculating" << dates.size() << "dates after debounce";
    recalculateAsync(dates);
}

std::shared_ptr<QMutex> GapScheduler::dateLock(const QDate &date)
{
    QMutexLocker locker(&m_lockMapMutex);
    auto &lock = m_dateLocks[date];
    if (!lock) {
        lock = std::make_shared<QMutex>();
    }
    return lock;
}

void GapScheduler::applyPreferenceChange(const data::WorkPreferences &oldPrefs, const data::WorkPreferences &newPrefs)
{
    const GapEngine engine = makeEngine();
    std::set<QDate> dates;
    for (const QDate &date : m_gaps.dates()) {
        dates.insert(date);
    }
    for (const QDate &date : engine.window().dates()) {
        dates.insert(date);
    }

    for (const QDate &date : dates) {
        const auto lock = dateLock(date);
        QMutexLocker locker(lock.get());
        const auto current = m_gaps.gapsForDate(date);
        const GapChangeSet changes = engine.handlePreferenceChange(current, oldPrefs, newPrefs).forDate(date);
        if (changes.isEmpty()) {
            continue;
        }
        const auto updated = GapEngine::applyChangeSet(current, changes);
        if (!m_gaps.replaceGapsForDate(date, updated)) {
            qCWarning(lcPlannerEngine) << "Could not store adjusted gaps for" << date;
            continue;
        }
        emit gapsUpdated(date, updated);
    }
}

GapEngine GapScheduler::makeEngine() const
{
    QMutexLocker locker(&m_sessionMutex);
    return GapEngine(m_session.window(), m_session.clock());
}

data::WorkPreferences GapScheduler::currentPreferences() const
{
    return m_preferences.preferences().value_or(data::WorkPreferences{});
}

} // namespace core
} // namespace planner
