#pragma once

#include <map>
#include <memory>
#include <optional>
#include <vector>

#include <QDate>
#include <QMetaType>
#include <QMutex>
#include <QObject>
#include <QStringList>
#include <QThreadPool>

#include "planner/core/RollingWindow.hpp"
#include "planner/data/Gap.hpp"
#include "planner/data/Task.hpp"

namespace planner {
namespace data {
class TaskRepository;
class GapRepository;
class PreferenceRepository;
class RemoteStore;
}

namespace sync {

struct SyncResult
{
    bool remoteAvailable = false;
    int tasksSynced = 0;
    int gapsSynced = 0;
    int conflictsResolved = 0;
    bool preferencesUpdated = false;
    QStringList errors;
};

class ReconciliationStore : public QObject
{
    Q_OBJECT

public:
    ReconciliationStore(data::TaskRepository &tasks,
                        data::GapRepository &gaps,
                        data::PreferenceRepository &preferences,
                        std::shared_ptr<data::RemoteStore> remote,
                        QObject *parent = nullptr);
    ~ReconciliationStore() override;

    void setWindow(const core::DateRange &window);
    std::optional<core::DateRange> window() const;

    SyncResult synchronize();
    void synchronizeAsync();
    SyncResult pushLocal();
    bool waitForDone(int msecs = -1);

    static std::vector<data::Task> mergeTasks(const std::vector<data::Task> &local,
                                              const std::vector<data::Task> &remote,
                                              int *conflicts = nullptr);
    static std::map<QDate, std::vector<data::Gap>> mergeGaps(const std::vector<data::Gap> &local,
                                                             const std::vector<data::Gap> &remote);

signals:
    void synchronized(const planner::sync::SyncResult &result);

private:
    data::TaskRepository &m_tasks;
    data::GapRepository &m_gaps;
    data::PreferenceRepository &m_preferences;
    std::shared_ptr<data::RemoteStore> m_remote;
    mutable QMutex m_windowMutex;
    std::optional<core::DateRange> m_window;
    QThreadPool m_pool;
};

} // namespace sync
} // namespace planner

Q_DECLARE_METATYPE(planner::sync::SyncResult)
