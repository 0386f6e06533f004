#pragma once

#include <QDateTime>
#include <QHash>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QStringList>

#include <vector>

namespace planner {
namespace core {

enum class CacheCollection
{
    Tasks,
    Gaps,
    BusyBlocks,
    ValidationResults,
};

QString toString(CacheCollection collection);

struct CacheLimit
{
    qint64 maxEntries = 0;
    qint64 maxBytes = 0;
};

struct CacheUsage
{
    qint64 entries = 0;
    qint64 bytes = 0;
};

enum class LimitKind
{
    Count,
    Size,
};

struct LimitViolation
{
    CacheCollection collection = CacheCollection::Tasks;
    LimitKind kind = LimitKind::Count;
    qint64 current = 0;
    qint64 limit = 0;
    double percentage = 0.0;
    QString recommendation;
};

enum class StorageHealth
{
    Healthy,
    Warning,
    Critical,
};

struct CacheEntryStats
{
    QString key;
    int accessCount = 0;
    QDateTime lastAccess;
};

class CacheLimitGuard : public QObject
{
    Q_OBJECT

public:
    static constexpr double kDefaultCleanupThreshold = 0.8;
    static constexpr double kDefaultEvictionFraction = 0.1;

    explicit CacheLimitGuard(QObject *parent = nullptr);

    static CacheLimit defaultLimit(CacheCollection collection);

    void setLimit(CacheCollection collection, const CacheLimit &limit);
    CacheLimit limit(CacheCollection collection) const;

    void setCleanupThreshold(double threshold);
    double cleanupThreshold() const;
    void setEvictionFraction(double fraction);
    double evictionFraction() const;

    void updateUsage(CacheCollection collection, qint64 entries, qint64 bytes);
    CacheUsage usage(CacheCollection collection) const;

    std::vector<LimitViolation> checkViolations() const;
    bool needsCleanup() const;
    bool needsCleanup(CacheCollection collection) const;
    bool exceedsHardCeiling(CacheCollection collection) const;
    StorageHealth healthStatus() const;

    QStringList selectEvictionCandidates(CacheCollection collection, std::vector<CacheEntryStats> stats) const;

signals:
    void cleanupRecommended(planner::core::CacheCollection collection);

private:
    double fillRatio(CacheCollection collection) const;
    static double ratio(qint64 current, qint64 limit);

    mutable QMutex m_mutex;
    QHash<int, CacheLimit> m_limits;
    QHash<int, CacheUsage> m_usage;
    double m_cleanupThreshold = kDefaultCleanupThreshold;
    double m_evictionFraction = kDefaultEvictionFraction;
};

} // namespace core
} // namespace planner

Q_DECLARE_METATYPE(planner::core::CacheCollection)
