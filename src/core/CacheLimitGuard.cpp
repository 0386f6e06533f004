#include "planner/core/CacheLimitGuard.hpp"

#include "planner/core/Logging.hpp"

#include <QMutexLocker>

#include <algorithm>
#include <cmath>

namespace planner {
namespace core {

namespace {
constexpr CacheCollection kCollections[] = {
    CacheCollection::Tasks,
    CacheCollection::Gaps,
    CacheCollection::BusyBlocks,
    CacheCollection::ValidationResults,
};

int keyOf(CacheCollection collection)
{
    return static_cast<int>(collection);
}

QString recommendationFor(CacheCollection collection)
{
    switch (collection) {
    case CacheCollection::Tasks:
        return QStringLiteral("Archive completed tasks or remove old tasks");
    case CacheCollection::Gaps:
        return QStringLiteral("Purge gaps outside the rolling window");
    case CacheCollection::BusyBlocks:
        return QStringLiteral("Evict least recently used busy-block entries");
    case CacheCollection::ValidationResults:
        return QStringLiteral("Drop stale validation results");
    }
    return QString();
}
} // namespace

QString toString(CacheCollection collection)
{
    switch (collection) {
    case CacheCollection::Tasks:
        return QStringLiteral("tasks");
    case CacheCollection::Gaps:
        return QStringLiteral("gaps");
    case CacheCollection::BusyBlocks:
        return QStringLiteral("busy_blocks");
    case CacheCollection::ValidationResults:
        return QStringLiteral("validation_results");
    }
    return QString();
}

CacheLimitGuard::CacheLimitGuard(QObject *parent)
    : QObject(parent)
{
    qRegisterMetaType<planner::core::CacheCollection>("planner::core::CacheCollection");
    for (CacheCollection collection : kCollections) {
        m_limits.insert(keyOf(collection), defaultLimit(collection));
        m_usage.insert(keyOf(collection), CacheUsage{});
    }
}

CacheLimit CacheLimitGuard::defaultLimit(CacheCollection collection)
{
    switch (collection) {
    case CacheCollection::Tasks:
        return { 1000, 5 * 1024 * 1024 };
    case CacheCollection::Gaps:
        return { 5000, 10 * 1024 * 1024 };
    case CacheCollection::BusyBlocks:
        return { 64, 5 * 1024 * 1024 };
    case CacheCollection::ValidationResults:
        return { 1000, 1024 * 1024 };
    }
    return {};
}

void CacheLimitGuard::setLimit(CacheCollection collection, const CacheLimit &limit)
{
    QMutexLocker locker(&m_mutex);
    m_limits.insert(keyOf(collection), limit);
}

CacheLimit CacheLimitGuard::limit(CacheCollection collection) const
{
    QMutexLocker locker(&m_mutex);
    return m_limits.value(keyOf(collection));
}

void CacheLimitGuard::setCleanupThreshold(double threshold)
{
    QMutexLocker locker(&m_mutex);
    m_cleanupThreshold = std::clamp(threshold, 0.0, 1.0);
}

double CacheLimitGuard::cleanupThreshold() const
{
    QMutexLocker locker(&m_mutex);
    return m_cleanupThreshold;
}

void CacheLimitGuard::setEvictionFraction(double fraction)
{
    QMutexLocker locker(&m_mutex);
    m_evictionFraction = std::clamp(fraction, 0.01, 1.0);
}

double CacheLimitGuard::evictionFraction() const
{
    QMutexLocker locker(&m_mutex);
    return m_evictionFraction;
}

void CacheLimitGuard::updateUsage(CacheCollection collection, qint64 entries, qint64 bytes)
{
    bool crossed = false;
    {
        QMutexLocker locker(&m_mutex);
        const double before = fillRatio(collection);
        m_usage.insert(keyOf(collection), CacheUsage{ std::max<qint64>(0, entries), std::max<qint64>(0, bytes) });
        const double after = fillRatio(collection);
        crossed = before <= m_cleanupThreshold && after > m_cleanupThreshold;
    }
    if (crossed) {
        qCInfo(lcPlannerCache) << "Cleanup recommended for" << toString(collection);
        emit cleanupRecommended(collection);
    }
}

CacheUsage CacheLimitGuard::usage(CacheCollection collection) const
{
    QMutexLocker locker(&m_mutex);
    return m_usage.value(keyOf(collection));
}

std::vector<LimitViolation> CacheLimitGuard::checkViolations() const
{
    QMutexLocker locker(&m_mutex);
    std::vector<LimitViolation> violations;
    for (CacheCollection collection : kCollections) {
        const CacheLimit limit = m_limits.value(keyOf(collection));
        const CacheUsage usage = m_usage.value(keyOf(collection));

        const double countRatio = ratio(usage.entries, limit.maxEntries);
        if (countRatio > m_cleanupThreshold) {
            violations.push_back({ collection, LimitKind::Count, usage.entries, limit.maxEntries, countRatio,
                                   recommendationFor(collection) });
        }
        const double sizeRatio = ratio(usage.bytes, limit.maxBytes);
        if (sizeRatio > m_cleanupThreshold) {
            violations.push_back({ collection, LimitKind::Size, usage.bytes, limit.maxBytes, sizeRatio,
                                   recommendationFor(collection) });
        }
    }
    return violations;
}

bool CacheLimitGuard::needsCleanup() const
{
    QMutexLocker locker(&m_mutex);
    for (CacheCollection collection : kCollections) {
        if (fillRatio(collection) > m_cleanupThreshold) {
            return true;
        }
    }
    return false;
}

bool CacheLimitGuard::needsCleanup(CacheCollection collection) const
{
    QMutexLocker locker(&m_mutex);
    return fillRatio(collection) > m_cleanupThreshold;
}

bool CacheLimitGuard::exceedsHardCeiling(CacheCollection collection) const
{
    QMutexLocker locker(&m_mutex);
    return fillRatio(collection) > 1.0;
}

StorageHealth CacheLimitGuard::healthStatus() const
{
    QMutexLocker locker(&m_mutex);
    StorageHealth health = StorageHealth::Healthy;
    for (CacheCollection collection : kCollections) {
        const double fill = fillRatio(collection);
        if (fill > 1.0) {
            return StorageHealth::Critical;
        }
        if (fill > m_cleanupThreshold) {
            health = StorageHealth::Warning;
        }
    }
    return health;
}

QStringList CacheLimitGuard::selectEvictionCandidates(CacheCollection collection,
                                                      std::vector<CacheEntryStats> stats) const
{
    QMutexLocker locker(&m_mutex);
    QStringList candidates;
    if (stats.empty()) {
        return candidates;
    }

    std::sort(stats.begin(), stats.end(), [](const CacheEntryStats &lhs, const CacheEntryStats &rhs) {
        if (lhs.accessCount == rhs.accessCount) {
            if (lhs.lastAccess == rhs.lastAccess) {
                return lhs.key < rhs.key;
            }
            return lhs.lastAccess < rhs.lastAccess;
        }
        return lhs.accessCount < rhs.accessCount;
    });

    const CacheLimit limit = m_limits.value(keyOf(collection));
    const CacheUsage usage = m_usage.value(keyOf(collection));
    qint64 entries = std::max<qint64>(usage.entries, static_cast<qint64>(stats.size()));
    qint64 bytes = usage.bytes;
    const qint64 bytesPerEntry = entries > 0 ? bytes / entries : 0;
    const size_t batch = std::max<size_t>(1, static_cast<size_t>(std::ceil(m_evictionFraction * stats.size())));

    auto overThreshold = [&]() {
        return ratio(entries, limit.maxEntries) > m_cleanupThreshold
               || ratio(bytes, limit.maxBytes) > m_cleanupThreshold;
    };

    size_t next = 0;
    while (overThreshold() && next < stats.size()) {
        const size_t stop = std::min(stats.size(), next + batch);
        for (; next < stop; ++next) {
            candidates << stats[next].key;
            --entries;
            bytes -= bytesPerEntry;
        }
    }

    if (!candidates.isEmpty()) {
        qCDebug(lcPlannerCache) << "Selected" << candidates.size() << "eviction candidates for"
                                << toString(collection);
    }
    return candidates;
}

double CacheLimitGuard::fillRatio(CacheCollection collection) const
{
    const CacheLimit limit = m_limits.value(keyOf(collection));
    const CacheUsage usage = m_usage.value(keyOf(collection));
    return std::max(ratio(usage.entries, limit.maxEntries), ratio(usage.bytes, limit.maxBytes));
}

double CacheLimitGuard::ratio(qint64 current, qint64 limit)
{
    if (limit <= 0) {
        return 0.0;
    }
    return static_cast<double>(current) / static_cast<double>(limit);
}

} // namespace core
} // namespace planner
