#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <QDate>
#include <QHash>
#include <QMutex>
#include <QObject>
#include <QSet>
#include <QThreadPool>
#include <QTimer>

#include "planner/core/ChangeImpactClassifier.hpp"
#include "planner/core/GapEngine.hpp"
#include "planner/core/SessionContext.hpp"
#include "planner/data/Gap.hpp"

namespace planner {
namespace calendar {
class BusyBlockService;
}
namespace data {
class TaskRepository;
class GapRepository;
class PreferenceRepository;
}

namespace core {

class CacheLimitGuard;

// Recomputes of one date are serialized; different dates run on the pool.
class GapScheduler : public QObject
{
    Q_OBJECT

public:
    static constexpr int kDefaultDebounceMs = 500;

    GapScheduler(data::TaskRepository &tasks,
                 data::GapRepository &gaps,
                 data::PreferenceRepository &preferences,
                 std::shared_ptr<calendar::BusyBlockService> busyBlocks,
                 CacheLimitGuard *guard,
                 SessionContext session = SessionContext(),
                 QObject *parent = nullptr);
    ~GapScheduler() override;

    RollingWindow window() const;
    SessionPhase phase() const;
    void setDebounceInterval(int msecs);

    std::vector<data::Gap> recalculate(const QDate &date);
    void recalculateAsync(const std::vector<QDate> &dates);

    ChangeDetectionResult applyPreferences(const data::WorkPreferences &newPrefs);

    void preloadWindow();
    void slideWindow(const QDate &today);
    void enforceLimits();

    bool waitForDone(int msecs = -1);
    std::optional<GapValidation> lastValidation(const QDate &date) const;
    int dateLockCount() const;

signals:
    void gapsUpdated(const QDate &date, const std::vector<planner::data::Gap> &gaps);
    void preferenceChangeSummary(const planner::core::ChangeDetectionResult &result);
    void windowMoved(const planner::core::DateRange &range);

private:
    void flushPending();
    std::shared_ptr<QMutex> dateLock(const QDate &date);
    void applyPreferenceChange(const data::WorkPreferences &oldPrefs, const data::WorkPreferences &newPrefs);
    GapEngine makeEngine() const;
    data::WorkPreferences currentPreferences() const;

    data::TaskRepository &m_tasks;
    data::GapRepository &m_gaps;
    data::PreferenceRepository &m_preferences;
    std::shared_ptr<calendar::BusyBlockService> m_busyBlocks;
    CacheLimitGuard *m_guard = nullptr;

    mutable QMutex m_sessionMutex;
    SessionContext m_session;

    mutable QMutex m_lockMapMutex;
    QHash<QDate, std::shared_ptr<QMutex>> m_dateLocks;

    mutable QMutex m_validationMutex;
    QHash<QDate, GapValidation> m_validations;

    QTimer m_debounce;
    QSet<QDate> m_pending;
    QThreadPool m_pool;
};

} // namespace core
} // namespace planner
