#pragma once

#include <QHash>
#include <QString>

#include "planner/core/CacheLimitGuard.hpp"

class QSettings;

namespace planner {
namespace core {

struct EngineConfig
{
    int busyBlockTtlMinutes = 60;
    int todayTimeoutMs = 3000;
    int otherTimeoutMs = 10000;
    int debounceMs = 500;
    double cleanupThreshold = CacheLimitGuard::kDefaultCleanupThreshold;
    double evictionFraction = CacheLimitGuard::kDefaultEvictionFraction;
    QHash<int, CacheLimit> limits;
    QString storageDirectory;

    CacheLimit limitFor(CacheCollection collection) const;
    void applyTo(CacheLimitGuard &guard) const;

    static EngineConfig fromSettings(QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace core
} // namespace planner
