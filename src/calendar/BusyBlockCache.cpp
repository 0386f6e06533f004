#include "planner/calendar/BusyBlockCache.hpp"

#include "planner/core/Logging.hpp"
#include "planner/data/JsonCodec.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QSaveFile>

namespace planner {
namespace calendar {

namespace {
const QString kFilePrefix = QStringLiteral("busy_");
const QString kFileSuffix = QStringLiteral(".json");
} // namespace

BusyBlockCache::BusyBlockCache(int ttlMinutes, QString directory)
    : m_ttlMinutes(ttlMinutes > 0 ? ttlMinutes : kDefaultTtlMinutes)
    , m_directory(std::move(directory))
{
    loadDirectory();
}

void BusyBlockCache::setClock(core::Clock clock)
{
    QMutexLocker locker(&m_mutex);
    m_clock = std::move(clock);
}

int BusyBlockCache::ttlMinutes() const
{
    return m_ttlMinutes;
}

std::optional<std::vector<BusyBlock>> BusyBlockCache::get(const QDate &date)
{
    QMutexLocker locker(&m_mutex);
    auto it = m_entries.find(date);
    if (it == m_entries.end()) {
        return std::nullopt;
    }

    const auto decoded = decode(it->payload);
    if (!decoded) {
        qCWarning(lcPlannerCache) << "Unreadable busy-block entry for" << date;
        return std::nullopt;
    }
    const QDateTime current = now();
    if (!decoded->updatedAt.isValid() || decoded->updatedAt.addSecs(m_ttlMinutes * 60) <= current) {
        qCDebug(lcPlannerCache) << "Busy-block entry for" << date << "expired";
        return std::nullopt;
    }

    ++it->accessCount;
    it->lastAccess = current;
    return decoded->blocks;
}

std::optional<std::vector<BusyBlock>> BusyBlockCache::lastKnown(const QDate &date) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_entries.constFind(date);
    if (it == m_entries.constEnd()) {
        return std::nullopt;
    }
    const auto decoded = decode(it->payload);
    if (!decoded) {
        return std::nullopt;
    }
    return decoded->blocks;
}

void BusyBlockCache::set(const QDate &date, const std::vector<BusyBlock> &blocks)
{
    QMutexLocker locker(&m_mutex);
    const QDateTime current = now();

    QJsonObject object;
    object.insert(QStringLiteral("updatedAt"), current.toUTC().toString(Qt::ISODateWithMs));
    object.insert(QStringLiteral("blocks"), data::json::busyBlocksToJson(blocks));

    Entry &entry = m_entries[date];
    entry.payload = QJsonDocument(object).toJson(QJsonDocument::Compact);
    entry.lastAccess = current;
    writeFile(date, entry.payload);
}

void BusyBlockCache::invalidate(const QDate &date)
{
    QMutexLocker locker(&m_mutex);
    removeLocked(date);
}

int BusyBlockCache::cleanup(const core::DateRange &window)
{
    QMutexLocker locker(&m_mutex);
    QList<QDate> stale;
    for (auto it = m_entries.constBegin(); it != m_entries.constEnd(); ++it) {
        if (!window.contains(it.key())) {
            stale << it.key();
        }
    }
    for (const QDate &date : stale) {
        removeLocked(date);
    }
    if (!stale.isEmpty()) {
        qCDebug(lcPlannerCache) << "Removed" << stale.size() << "busy-block entries outside the window";
    }
    return stale.size();
}

int BusyBlockCache::evict(const QStringList &keys)
{
    QMutexLocker locker(&m_mutex);
    int removed = 0;
    for (const QString &key : keys) {
        const QDate date = QDate::fromString(key, Qt::ISODate);
        if (m_entries.contains(date)) {
            removeLocked(date);
            ++removed;
        }
    }
    return removed;
}

std::vector<core::CacheEntryStats> BusyBlockCache::entryStats() const
{
    QMutexLocker locker(&m_mutex);
    std::vector<core::CacheEntryStats> stats;
    stats.reserve(static_cast<size_t>(m_entries.size()));
    for (auto it = m_entries.constBegin(); it != m_entries.constEnd(); ++it) {
        stats.push_back({ it.key().toString(Qt::ISODate), it->accessCount, it->lastAccess });
    }
    return stats;
}

int BusyBlockCache::entryCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_entries.size();
}

qint64 BusyBlockCache::byteSize() const
{
    QMutexLocker locker(&m_mutex);
    qint64 total = 0;
    for (const auto &entry : m_entries) {
        total += entry.payload.size();
    }
    return total;
}

std::optional<BusyBlockCache::Decoded> BusyBlockCache::decode(const QByteArray &payload)
{
    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(payload, &error);
    if (error.error != QJsonParseError::NoError || !document.isObject()) {
        return std::nullopt;
    }
    const QJsonObject object = document.object();
    const QJsonValue blocks = object.value(QStringLiteral("blocks"));
    if (!blocks.isArray()) {
        return std::nullopt;
    }
    auto decodedBlocks = data::json::busyBlocksFromJson(blocks.toArray());
    if (!decodedBlocks) {
        return std::nullopt;
    }
    Decoded decoded;
    decoded.updatedAt = QDateTime::fromString(object.value(QStringLiteral("updatedAt")).toString(), Qt::ISODateWithMs);
    decoded.blocks = std::move(*decodedBlocks);
    return decoded;
}

QString BusyBlockCache::filePath(const QDate &date) const
{
    return QDir(m_directory).filePath(kFilePrefix + date.toString(Qt::ISODate) + kFileSuffix);
}

void BusyBlockCache::loadDirectory()
{
    if (m_directory.isEmpty()) {
        return;
    }
    QDir dir(m_directory);
    if (!dir.exists()) {
        return;
    }
    const QStringList files = dir.entryList({ kFilePrefix + QStringLiteral("*") + kFileSuffix }, QDir::Files);
    for (const QString &name : files) {
        const QString key = name.mid(kFilePrefix.size(), name.size() - kFilePrefix.size() - kFileSuffix.size());
        const QDate date = QDate::fromString(key, Qt::ISODate);
        if (!date.isValid()) {
            continue;
        }
        QFile file(dir.filePath(name));
        if (!file.open(QIODevice::ReadOnly)) {
            qCWarning(lcPlannerCache) << "Cannot read" << file.fileName() << file.errorString();
            continue;
        }
        // Stored raw; decoding happens on access so a damaged file is just a miss.
        m_entries[date].payload = file.readAll();
    }
    qCDebug(lcPlannerCache) << "Loaded" << m_entries.size() << "busy-block entries from" << m_directory;
}

void BusyBlockCache::writeFile(const QDate &date, const QByteArray &payload) const
{
    if (m_directory.isEmpty()) {
        return;
    }
    QDir dir(m_directory);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcPlannerCache) << "Cannot create" << m_directory;
        return;
    }
    QSaveFile file(filePath(date));
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcPlannerCache) << "Cannot write" << file.fileName() << file.errorString();
        return;
    }
    file.write(payload);
    if (!file.commit()) {
        qCWarning(lcPlannerCache) << "Failed to commit" << file.fileName() << file.errorString();
    }
}

void BusyBlockCache::removeFile(const QDate &date) const
{
    if (m_directory.isEmpty()) {
        return;
    }
    const QString path = filePath(date);
    if (QFile::exists(path) && !QFile::remove(path)) {
        qCWarning(lcPlannerCache) << "Cannot remove" << path;
    }
}

void BusyBlockCache::removeLocked(const QDate &date)
{
    m_entries.remove(date);
    removeFile(date);
}

QDateTime BusyBlockCache::now() const
{
    return m_clock ? m_clock() : QDateTime::currentDateTimeUtc();
}

} // namespace calendar
} // namespace planner
