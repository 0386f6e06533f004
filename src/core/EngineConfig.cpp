#include "planner/core/EngineConfig.hpp"

#include <QSettings>

namespace planner {
namespace core {

namespace {
constexpr CacheCollection kCollections[] = {
    CacheCollection::Tasks,
    CacheCollection::Gaps,
    CacheCollection::BusyBlocks,
    CacheCollection::ValidationResults,
};

QString entriesKey(CacheCollection collection)
{
    return QStringLiteral("limits/%1/maxEntries").arg(toString(collection));
}

QString bytesKey(CacheCollection collection)
{
    return QStringLiteral("limits/%1/maxBytes").arg(toString(collection));
}

int positiveInt(const QSettings &settings, const QString &key, int fallback)
{
    bool ok = false;
    const int value = settings.value(key, fallback).toInt(&ok);
    return ok && value > 0 ? value : fallback;
}
} // namespace

CacheLimit EngineConfig::limitFor(CacheCollection collection) const
{
    return limits.value(static_cast<int>(collection), CacheLimitGuard::defaultLimit(collection));
}

void EngineConfig::applyTo(CacheLimitGuard &guard) const
{
    guard.setCleanupThreshold(cleanupThreshold);
    guard.setEvictionFraction(evictionFraction);
    for (CacheCollection collection : kCollections) {
        guard.setLimit(collection, limitFor(collection));
    }
}

EngineConfig EngineConfig::fromSettings(QSettings &settings)
{
    EngineConfig config;
    config.busyBlockTtlMinutes = positiveInt(settings, QStringLiteral("cache/busyBlockTtlMinutes"),
                                             config.busyBlockTtlMinutes);
    config.todayTimeoutMs = positiveInt(settings, QStringLiteral("calendar/todayTimeoutMs"), config.todayTimeoutMs);
    config.otherTimeoutMs = positiveInt(settings, QStringLiteral("calendar/otherTimeoutMs"), config.otherTimeoutMs);
    config.debounceMs = positiveInt(settings, QStringLiteral("scheduler/debounceMs"), config.debounceMs);

    bool ok = false;
    const double threshold = settings.value(QStringLiteral("limits/cleanupThreshold"), config.cleanupThreshold)
                                 .toDouble(&ok);
    if (ok && threshold > 0.0 && threshold <= 1.0) {
        config.cleanupThreshold = threshold;
    }
    const double fraction = settings.value(QStringLiteral("limits/evictionFraction"), config.evictionFraction)
                                .toDouble(&ok);
    if (ok && fraction > 0.0 && fraction <= 1.0) {
        config.evictionFraction = fraction;
    }

    for (CacheCollection collection : kCollections) {
        const CacheLimit fallback = CacheLimitGuard::defaultLimit(collection);
        CacheLimit limit;
        limit.maxEntries = settings.value(entriesKey(collection), fallback.maxEntries).toLongLong();
        limit.maxBytes = settings.value(bytesKey(collection), fallback.maxBytes).toLongLong();
        if (limit.maxEntries <= 0) {
            limit.maxEntries = fallback.maxEntries;
        }
        if (limit.maxBytes <= 0) {
            limit.maxBytes = fallback.maxBytes;
        }
        config.limits.insert(static_cast<int>(collection), limit);
    }

    config.storageDirectory = settings.value(QStringLiteral("storage/directory")).toString();
    return config;
}

void EngineConfig::save(QSettings &settings) const
{
    settings.setValue(QStringLiteral("cache/busyBlockTtlMinutes"), busyBlockTtlMinutes);
    settings.setValue(QStringLiteral("calendar/todayTimeoutMs"), todayTimeoutMs);
    settings.setValue(QStringLiteral("calendar/otherTimeoutMs"), otherTimeoutMs);
    settings.setValue(QStringLiteral("scheduler/debounceMs"), debounceMs);
    settings.setValue(QStringLiteral("limits/cleanupThreshold"), cleanupThreshold);
    settings.setValue(QStringLiteral("limits/evictionFraction"), evictionFraction);
    for (CacheCollection collection : kCollections) {
        const CacheLimit limit = limitFor(collection);
        settings.setValue(entriesKey(collection), limit.maxEntries);
        settings.setValue(bytesKey(collection), limit.maxBytes);
    }
    if (!storageDirectory.isEmpty()) {
        settings.setValue(QStringLiteral("storage/directory"), storageDirectory);
    }
}

} // namespace core
} // namespace planner
