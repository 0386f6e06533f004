#pragma once

#include <memory>

#include <QDate>

#include "planner/core/EngineConfig.hpp"

namespace planner {
namespace calendar {
class BusyBlockCache;
class BusyBlockService;
class CalendarProvider;
}
namespace data {
class DataProvider;
class TaskRepository;
class GapRepository;
class PreferenceRepository;
class RemoteStore;
}
namespace sync {
class ReconciliationStore;
}

namespace core {

class CacheLimitGuard;
class GapScheduler;

class AppContext
{
public:
    explicit AppContext(const EngineConfig &config = EngineConfig(),
                        std::shared_ptr<calendar::CalendarProvider> calendarProvider = {},
                        std::shared_ptr<data::RemoteStore> remoteStore = {},
                        const QDate &today = QDate::currentDate());
    ~AppContext();

    const EngineConfig &config() const;

    data::TaskRepository &taskRepository();
    data::GapRepository &gapRepository();
    data::PreferenceRepository &preferenceRepository();
    calendar::BusyBlockService &busyBlockService();
    CacheLimitGuard &cacheLimitGuard();
    GapScheduler &scheduler();
    sync::ReconciliationStore &reconciliationStore();

private:
    EngineConfig m_config;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::shared_ptr<calendar::BusyBlockCache> m_busyBlockCache;
    std::shared_ptr<calendar::BusyBlockService> m_busyBlockService;
    std::unique_ptr<CacheLimitGuard> m_cacheLimitGuard;
    std::unique_ptr<GapScheduler> m_scheduler;
    std::unique_ptr<sync::ReconciliationStore> m_reconciliationStore;
};

} // namespace core
} // namespace planner
