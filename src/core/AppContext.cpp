#include "planner/core/AppContext.hpp"

#include "planner/calendar/BusyBlockCache.hpp"
#include "planner/calendar/BusyBlockService.hpp"
#include "planner/core/CacheLimitGuard.hpp"
#include "planner/core/GapScheduler.hpp"
#include "planner/data/DataProvider.hpp"
#include "planner/sync/ReconciliationStore.hpp"

#include <QDir>

namespace planner {
namespace core {

AppContext::AppContext(const EngineConfig &config,
                       std::shared_ptr<calendar::CalendarProvider> calendarProvider,
                       std::shared_ptr<data::RemoteStore> remoteStore,
                       const QDate &today)
    : m_config(config)
    , m_dataProvider(std::make_unique<data::DataProvider>(config.storageDirectory))
    , m_busyBlockCache(std::make_shared<calendar::BusyBlockCache>(
          config.busyBlockTtlMinutes, QDir(m_dataProvider->directory()).filePath(QStringLiteral("busy_blocks"))))
    , m_busyBlockService(std::make_shared<calendar::BusyBlockService>(std::move(calendarProvider), m_busyBlockCache))
    , m_cacheLimitGuard(std::make_unique<CacheLimitGuard>())
{
    m_busyBlockService->setTimeouts(config.todayTimeoutMs, config.otherTimeoutMs);
    config.applyTo(*m_cacheLimitGuard);

    m_scheduler = std::make_unique<GapScheduler>(m_dataProvider->taskRepository(),
                                                 m_dataProvider->gapRepository(),
                                                 m_dataProvider->preferenceRepository(),
                                                 m_busyBlockService,
                                                 m_cacheLimitGuard.get(),
                                                 SessionContext(today));
    m_scheduler->setDebounceInterval(config.debounceMs);

    m_reconciliationStore = std::make_unique<sync::ReconciliationStore>(m_dataProvider->taskRepository(),
                                                                        m_dataProvider->gapRepository(),
                                                                        m_dataProvider->preferenceRepository(),
                                                                        std::move(remoteStore));
    m_reconciliationStore->setWindow(m_scheduler->window().range());
    QObject::connect(m_scheduler.get(), &GapScheduler::windowMoved, m_reconciliationStore.get(),
                     &sync::ReconciliationStore::setWindow, Qt::DirectConnection);

    QObject::connect(m_cacheLimitGuard.get(), &CacheLimitGuard::cleanupRecommended, m_scheduler.get(),
                     &GapScheduler::enforceLimits, Qt::QueuedConnection);
}

AppContext::~AppContext() = default;

const EngineConfig &AppContext::config() const
{
    return m_config;
}

data::TaskRepository &AppContext::taskRepository()
{
    return m_dataProvider->taskRepository();
}

data::GapRepository &AppContext::gapRepository()
{
    return m_dataProvider->gapRepository();
}

data::PreferenceRepository &AppContext::preferenceRepository()
{
    return m_dataProvider->preferenceRepository();
}

calendar::BusyBlockService &AppContext::busyBlockService()
{
    return *m_busyBlockService;
}

CacheLimitGuard &AppContext::cacheLimitGuard()
{
    return *m_cacheLimitGuard;
}

GapScheduler &AppContext::scheduler()
{
    return *m_scheduler;
}

sync::ReconciliationStore &AppContext::reconciliationStore()
{
    return *m_reconciliationStore;
}

} // namespace core
} // namespace planner
