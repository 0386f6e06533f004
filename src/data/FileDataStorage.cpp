#include "planner/data/FileDataStorage.hpp"

#include "planner/core/Logging.hpp"
#include "planner/data/JsonCodec.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QSaveFile>

#include <algorithm>

namespace planner {
namespace data {

namespace {
constexpr int kFormatVersion = 1;

void sortByStart(std::vector<Gap> &gaps)
{
    std::sort(gaps.begin(), gaps.end(), [](const Gap &lhs, const Gap &rhs) { return lhs.start < rhs.start; });
}
} // namespace

FileDataStorage::FileDataStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
    load();
}

QString FileDataStorage::filePath() const
{
    return m_filePath;
}

std::vector<Task> FileDataStorage::tasks() const
{
    QMutexLocker locker(&m_mutex);
    std::vector<Task> result;
    result.reserve(static_cast<size_t>(m_tasks.size()));
    for (auto it = m_tasks.constBegin(); it != m_tasks.constEnd(); ++it) {
        result.push_back(it.value());
    }
    return result;
}

std::optional<Task> FileDataStorage::task(const QUuid &id) const
{
    QMutexLocker locker(&m_mutex);
    if (m_tasks.contains(id)) {
        return m_tasks.value(id);
    }
    return std::nullopt;
}

Task FileDataStorage::addOrUpdateTask(Task task)
{
    QMutexLocker locker(&m_mutex);
    if (task.id.isNull()) {
        task.id = QUuid::createUuid();
    }
    m_tasks.insert(task.id, task);
    if (!save()) {
        qCWarning(lcPlannerData) << "Task" << task.id << "kept in memory only";
    }
    return task;
}

bool FileDataStorage::removeTask(const QUuid &id)
{
    QMutexLocker locker(&m_mutex);
    if (m_tasks.remove(id) == 0) {
        return false;
    }
    return save();
}

bool FileDataStorage::replaceTasks(const std::vector<Task> &tasks)
{
    QMutexLocker locker(&m_mutex);
    m_tasks.clear();
    for (const auto &task : tasks) {
        m_tasks.insert(task.id, task);
    }
    return save();
}

std::vector<Gap> FileDataStorage::gaps(const QDate &date) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_gaps.find(date);
    return it == m_gaps.end() ? std::vector<Gap>{} : it->second;
}

std::vector<Gap> FileDataStorage::allGaps() const
{
    QMutexLocker locker(&m_mutex);
    std::vector<Gap> result;
    for (const auto &entry : m_gaps) {
        result.insert(result.end(), entry.second.begin(), entry.second.end());
    }
    return result;
}

std::vector<QDate> FileDataStorage::gapDates() const
{
    QMutexLocker locker(&m_mutex);
    std::vector<QDate> result;
    for (const auto &entry : m_gaps) {
        result.push_back(entry.first);
    }
    return result;
}

bool FileDataStorage::replaceGaps(const QDate &date, std::vector<Gap> gaps)
{
    QMutexLocker locker(&m_mutex);
    if (gaps.empty()) {
        m_gaps.erase(date);
    } else {
        sortByStart(gaps);
        m_gaps[date] = std::move(gaps);
    }
    return save();
}

int FileDataStorage::removeGapsOutside(const core::DateRange &window)
{
    QMutexLocker locker(&m_mutex);
    int removed = 0;
    for (auto it = m_gaps.begin(); it != m_gaps.end();) {
        if (window.contains(it->first)) {
            ++it;
            continue;
        }
        removed += static_cast<int>(it->second.size());
        it = m_gaps.erase(it);
    }
    if (removed > 0 && !save()) {
        qCWarning(lcPlannerData) << "Purged gaps kept in memory only";
    }
    return removed;
}

std::optional<WorkPreferences> FileDataStorage::preferences() const
{
    QMutexLocker locker(&m_mutex);
    return m_preferences;
}

bool FileDataStorage::setPreferences(const WorkPreferences &prefs)
{
    QMutexLocker locker(&m_mutex);
    m_preferences = prefs;
    return save();
}

void FileDataStorage::load()
{
    m_tasks.clear();
    m_gaps.clear();
    m_preferences.reset();

    if (m_filePath.isEmpty()) {
        return;
    }
    QFile file(m_filePath);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcPlannerData) << "Cannot open" << m_filePath << file.errorString();
        return;
    }

    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !document.isObject()) {
        qCWarning(lcPlannerData) << "Ignoring unreadable store" << m_filePath << error.errorString();
        return;
    }
    const QJsonObject root = document.object();

    for (const auto &task : json::tasksFromJson(root.value(QStringLiteral("tasks")).toArray())) {
        m_tasks.insert(task.id, task);
    }
    for (const auto &gap : json::gapsFromJson(root.value(QStringLiteral("gaps")).toArray())) {
        m_gaps[gap.date].push_back(gap);
    }
    for (auto &entry : m_gaps) {
        sortByStart(entry.second);
    }
    const QJsonValue prefs = root.value(QStringLiteral("preferences"));
    if (prefs.isObject()) {
        m_preferences = json::preferencesFromJson(prefs.toObject());
    }
    qCDebug(lcPlannerData) << "Loaded" << m_tasks.size() << "tasks and" << m_gaps.size() << "gap dates from"
                           << m_filePath;
}

bool FileDataStorage::save() const
{
    if (m_filePath.isEmpty()) {
        return true;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcPlannerData) << "Cannot create" << dir.path();
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcPlannerData) << "Cannot write" << m_filePath << file.errorString();
        return false;
    }

    std::vector<Task> tasks;
    tasks.reserve(static_cast<size_t>(m_tasks.size()));
    for (const auto &task : m_tasks) {
        tasks.push_back(task);
    }
    std::sort(tasks.begin(), tasks.end(), [](const Task &lhs, const Task &rhs) { return lhs.id < rhs.id; });

    QJsonArray gaps;
    for (const auto &entry : m_gaps) {
        for (const auto &gap : entry.second) {
            gaps.append(json::toJson(gap));
        }
    }

    QJsonObject root;
    root.insert(QStringLiteral("version"), kFormatVersion);
    root.insert(QStringLiteral("tasks"), json::tasksToJson(tasks));
    root.insert(QStringLiteral("gaps"), gaps);
    if (m_preferences) {
        root.insert(QStringLiteral("preferences"), json::toJson(*m_preferences));
    }

    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qCWarning(lcPlannerData) << "Failed to commit" << m_filePath << file.errorString();
        return false;
    }
    return true;
}

} // namespace data
} // namespace planner
