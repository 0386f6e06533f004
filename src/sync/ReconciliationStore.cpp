#include "planner/sync/ReconciliationStore.hpp"

#include "planner/core/Logging.hpp"
#include "planner/data/GapRepository.hpp"
#include "planner/data/JsonCodec.hpp"
#include "planner/data/PreferenceRepository.hpp"
#include "planner/data/RemoteStore.hpp"
#include "planner/data/TaskRepository.hpp"

#include <QHash>
#include <QMutexLocker>

#include <algorithm>

namespace planner {
namespace sync {

namespace {
QString describe(const QString &what, data::RemoteError error)
{
    switch (error) {
    case data::RemoteError::Network:
        return QStringLiteral("%1: network error").arg(what);
    case data::RemoteError::Auth:
        return QStringLiteral("%1: not authenticated").arg(what);
    case data::RemoteError::None:
        break;
    }
    return what;
}

bool isNewer(const QDateTime &candidate, const QDateTime &current)
{
    if (!candidate.isValid()) {
        return false;
    }
    return !current.isValid() || candidate > current;
}

bool sameTask(const data::Task &a, const data::Task &b)
{
    return data::json::toJson(a) == data::json::toJson(b);
}
} // namespace

ReconciliationStore::ReconciliationStore(data::TaskRepository &tasks,
                                         data::GapRepository &gaps,
                                         data::PreferenceRepository &preferences,
                                         std::shared_ptr<data::RemoteStore> remote,
                                         QObject *parent)
    : QObject(parent)
    , m_tasks(tasks)
    , m_gaps(gaps)
    , m_preferences(preferences)
    , m_remote(std::move(remote))
{
    qRegisterMetaType<planner::sync::SyncResult>("planner::sync::SyncResult");
    m_pool.setMaxThreadCount(1);
}

ReconciliationStore::~ReconciliationStore()
{
    m_pool.waitForDone();
}

void ReconciliationStore::setWindow(const core::DateRange &window)
{
    QMutexLocker locker(&m_windowMutex);
    m_window = window;
}

std::optional<core::DateRange> ReconciliationStore::window() const
{
    QMutexLocker locker(&m_windowMutex);
    return m_window;
}

SyncResult ReconciliationStore::synchronize()
{
    SyncResult result;
    if (!m_remote) {
        result.errors << QStringLiteral("no remote store configured");
        return result;
    }
    result.remoteAvailable = true;

    const auto remoteTasks = m_remote->getTasks();
    if (remoteTasks.ok()) {
        const auto local = m_tasks.fetchTasks();
        int conflicts = 0;
        const auto merged = mergeTasks(local, remoteTasks.value, &conflicts);
        result.conflictsResolved = conflicts;

        bool changed = merged.size() != local.size();
        for (size_t i = 0; !changed && i < merged.size(); ++i) {
            changed = !sameTask(merged[i], local[i]);
        }
        if (changed) {
            if (m_tasks.replaceAll(merged)) {
                result.tasksSynced = static_cast<int>(merged.size());
            } else {
                result.errors << QStringLiteral("tasks: local store rejected the merge");
            }
        }
    } else {
        result.remoteAvailable = false;
        result.errors << describe(QStringLiteral("tasks"), remoteTasks.error);
    }

    const auto remoteGaps = m_remote->getAllGaps();
    if (remoteGaps.ok()) {
        const auto range = window();
        std::vector<data::Gap> incoming;
        for (const auto &gap : remoteGaps.value) {
            if (!range || range->contains(gap.date)) {
                incoming.push_back(gap);
            }
        }
        const auto toFill = mergeGaps(m_gaps.allGaps(), incoming);
        for (const auto &entry : toFill) {
            if (m_gaps.replaceGapsForDate(entry.first, entry.second)) {
                result.gapsSynced += static_cast<int>(entry.second.size());
            } else {
                result.errors << QStringLiteral("gaps: could not store %1").arg(entry.first.toString(Qt::ISODate));
            }
        }
    } else {
        result.remoteAvailable = false;
        result.errors << describe(QStringLiteral("gaps"), remoteGaps.error);
    }

    const auto remotePrefs = m_remote->getPreferences();
    if (remotePrefs.ok()) {
        if (remotePrefs.value) {
            const auto local = m_preferences.preferences();
            if (!local || data::json::toJson(*local) != data::json::toJson(*remotePrefs.value)) {
                result.preferencesUpdated = m_preferences.savePreferences(*remotePrefs.value);
                if (!result.preferencesUpdated) {
                    result.errors << QStringLiteral("preferences: local store rejected the update");
                }
            }
        }
    } else {
        result.remoteAvailable = false;
        result.errors << describe(QStringLiteral("preferences"), remotePrefs.error);
    }

    if (result.remoteAvailable) {
        qCInfo(lcPlannerSync) << "Synchronized:" << result.tasksSynced << "tasks," << result.gapsSynced
                              << "gaps," << result.conflictsResolved << "conflicts";
    } else {
        qCWarning(lcPlannerSync) << "Synchronization degraded to local data:" << result.errors;
    }
    return result;
}

void ReconciliationStore::synchronizeAsync()
{
    m_pool.start([this]() {
        const SyncResult result = synchronize();
        emit synchronized(result);
    });
}

SyncResult ReconciliationStore::pushLocal()
{
    SyncResult result;
    if (!m_remote) {
        result.errors << QStringLiteral("no remote store configured");
        return result;
    }
    result.remoteAvailable = true;

    const auto tasks = m_tasks.fetchTasks();
    const auto taskReply = m_remote->saveTasks(tasks, true);
    if (taskReply.ok() && taskReply.value) {
        result.tasksSynced = static_cast<int>(tasks.size());
    } else {
        result.remoteAvailable = taskReply.ok();
        result.errors << describe(QStringLiteral("tasks"), taskReply.error);
    }

    for (const QDate &date : m_gaps.dates()) {
        const auto gaps = m_gaps.gapsForDate(date);
        const auto gapReply = m_remote->saveGaps(gaps, date);
        if (gapReply.ok() && gapReply.value) {
            result.gapsSynced += static_cast<int>(gaps.size());
        } else {
            result.remoteAvailable = result.remoteAvailable && gapReply.ok();
            result.errors << describe(QStringLiteral("gaps %1").arg(date.toString(Qt::ISODate)), gapReply.error);
        }
    }

    if (const auto prefs = m_preferences.preferences()) {
        const auto prefReply = m_remote->savePreferences(*prefs);
        result.preferencesUpdated = prefReply.ok() && prefReply.value;
        if (!result.preferencesUpdated) {
            result.remoteAvailable = result.remoteAvailable && prefReply.ok();
            result.errors << describe(QStringLiteral("preferences"), prefReply.error);
        }
    }

    if (!result.errors.isEmpty()) {
        qCWarning(lcPlannerSync) << "Upload incomplete:" << result.errors;
    }
    return result;
}

bool ReconciliationStore::waitForDone(int msecs)
{
    return m_pool.waitForDone(msecs);
}

std::vector<data::Task> ReconciliationStore::mergeTasks(const std::vector<data::Task> &local,
                                                        const std::vector<data::Task> &remote,
                                                        int *conflicts)
{
    std::vector<data::Task> merged = local;
    QHash<QUuid, size_t> index;
    for (size_t i = 0; i < merged.size(); ++i) {
        index.insert(merged[i].id, i);
    }

    int resolved = 0;
    for (const auto &task : remote) {
        const auto it = index.constFind(task.id);
        if (it == index.constEnd()) {
            index.insert(task.id, merged.size());
            merged.push_back(task);
            continue;
        }
        data::Task &current = merged[it.value()];
        if (sameTask(current, task)) {
            continue;
        }
        ++resolved;
        if (isNewer(task.updatedAt, current.updatedAt)) {
            current = task;
        }
    }

    if (conflicts) {
        *conflicts = resolved;
    }
    return merged;
}

std::map<QDate, std::vector<data::Gap>> ReconciliationStore::mergeGaps(const std::vector<data::Gap> &local,
                                                                       const std::vector<data::Gap> &remote)
{
    std::map<QDate, std::vector<data::Gap>> toFill;
    for (const auto &gap : remote) {
        const bool known = std::any_of(local.begin(), local.end(),
                                       [&gap](const data::Gap &existing) { return existing.date == gap.date; });
        if (!known) {
            toFill[gap.date].push_back(gap);
        }
    }
    for (auto &entry : toFill) {
        std::sort(entry.second.begin(), entry.second.end(),
                  [](const data::Gap &a, const data::Gap &b) { return a.start < b.start; });
    }
    return toFill;
}

} // namespace sync
} // namespace planner
