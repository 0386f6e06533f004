#pragma once

#include <optional>
#include <vector>

#include <QByteArray>
#include <QDate>
#include <QDateTime>
#include <QHash>
#include <QMutex>
#include <QString>
#include <QStringList>

#include "planner/calendar/BusyBlock.hpp"
#include "planner/core/CacheLimitGuard.hpp"
#include "planner/core/RollingWindow.hpp"
#include "planner/core/SessionContext.hpp"

namespace planner {
namespace calendar {

class BusyBlockCache
{
public:
    static constexpr int kDefaultTtlMinutes = 60;

    explicit BusyBlockCache(int ttlMinutes = kDefaultTtlMinutes, QString directory = {});

    void setClock(core::Clock clock);
    int ttlMinutes() const;

    std::optional<std::vector<BusyBlock>> get(const QDate &date);
    // Most recent entry regardless of age.
    std::optional<std::vector<BusyBlock>> lastKnown(const QDate &date) const;
    void set(const QDate &date, const std::vector<BusyBlock> &blocks);
    void invalidate(const QDate &date);

    int cleanup(const core::DateRange &window);
    int evict(const QStringList &keys);

    std::vector<core::CacheEntryStats> entryStats() const;
    int entryCount() const;
    qint64 byteSize() const;

private:
    struct Entry
    {
        QByteArray payload;
        int accessCount = 0;
        QDateTime lastAccess;
    };

    struct Decoded
    {
        QDateTime updatedAt;
        std::vector<BusyBlock> blocks;
    };

    static std::optional<Decoded> decode(const QByteArray &payload);
    QString filePath(const QDate &date) const;
    void loadDirectory();
    void writeFile(const QDate &date, const QByteArray &payload) const;
    void removeFile(const QDate &date) const;
    void removeLocked(const QDate &date);
    QDateTime now() const;

    mutable QMutex m_mutex;
    int m_ttlMinutes;
    QString m_directory;
    core::Clock m_clock;
    QHash<QDate, Entry> m_entries;
};

} // namespace calendar
} // namespace planner
