#include "planner/data/InMemoryTaskRepository.hpp"

#include <QMutexLocker>

#include <algorithm>

namespace planner {
namespace data {

namespace {
bool byDue(const Task &lhs, const Task &rhs)
{
    if (lhs.dueDate != rhs.dueDate) {
        return lhs.dueDate < rhs.dueDate;
    }
    if (lhs.dueTime != rhs.dueTime) {
        return lhs.dueTime < rhs.dueTime;
    }
    return lhs.title.toLower() < rhs.title.toLower();
}
} // namespace

InMemoryTaskRepository::InMemoryTaskRepository() = default;
InMemoryTaskRepository::~InMemoryTaskRepository() = default;

std::vector<Task> InMemoryTaskRepository::fetchTasks() const
{
    QMutexLocker locker(&m_mutex);
    std::vector<Task> tasks;
    tasks.reserve(static_cast<size_t>(m_items.size()));
    for (const auto &item : m_items) {
        tasks.push_back(item);
    }
    std::sort(tasks.begin(), tasks.end(), byDue);
    return tasks;
}

std::vector<Task> InMemoryTaskRepository::tasksDueOn(const QDate &date) const
{
    QMutexLocker locker(&m_mutex);
    std::vector<Task> tasks;
    for (const auto &item : m_items) {
        if (item.dueDate == date) {
            tasks.push_back(item);
        }
    }
    std::sort(tasks.begin(), tasks.end(), byDue);
    return tasks;
}

std::optional<Task> InMemoryTaskRepository::findById(const QUuid &id) const
{
    QMutexLocker locker(&m_mutex);
    if (m_items.contains(id)) {
        return m_items.value(id);
    }
    return std::nullopt;
}

Task InMemoryTaskRepository::addTask(Task task)
{
    QMutexLocker locker(&m_mutex);
    if (task.id.isNull()) {
        task.id = QUuid::createUuid();
    }
    m_items.insert(task.id, task);
    return task;
}

bool InMemoryTaskRepository::updateTask(const Task &task)
{
    QMutexLocker locker(&m_mutex);
    if (!m_items.contains(task.id)) {
        return false;
    }
    m_items.insert(task.id, task);
    return true;
}

bool InMemoryTaskRepository::removeTask(const QUuid &id)
{
    QMutexLocker locker(&m_mutex);
    return m_items.remove(id) > 0;
}

bool InMemoryTaskRepository::replaceAll(const std::vector<Task> &tasks)
{
    QMutexLocker locker(&m_mutex);
    m_items.clear();
    for (const auto &task : tasks) {
        m_items.insert(task.id, task);
    }
    return true;
}

} // namespace data
} // namespace planner
