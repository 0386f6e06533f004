#include "planner/data/FileTaskRepository.hpp"

#include <algorithm>

namespace planner {
namespace data {

FileTaskRepository::FileTaskRepository(std::shared_ptr<FileDataStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<Task> FileTaskRepository::fetchTasks() const
{
    if (!m_storage) {
        return {};
    }
    auto result = m_storage->tasks();
    std::sort(result.begin(), result.end(), [](const Task &lhs, const Task &rhs) {
        if (lhs.dueDate == rhs.dueDate) {
            if (lhs.dueTime == rhs.dueTime) {
                return lhs.title.toLower() < rhs.title.toLower();
            }
            return lhs.dueTime < rhs.dueTime;
        }
        return lhs.dueDate < rhs.dueDate;
    });
    return result;
}

std::vector<Task> FileTaskRepository::tasksDueOn(const QDate &date) const
{
    auto result = fetchTasks();
    result.erase(std::remove_if(result.begin(), result.end(), [&date](const Task &task) { return task.dueDate != date; }),
                 result.end());
    return result;
}

std::optional<Task> FileTaskRepository::findById(const QUuid &id) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    return m_storage->task(id);
}

Task FileTaskRepository::addTask(Task task)
{
    if (!m_storage) {
        return task;
    }
    return m_storage->addOrUpdateTask(std::move(task));
}

bool FileTaskRepository::updateTask(const Task &task)
{
    if (!m_storage || !m_storage->task(task.id)) {
        return false;
    }
    m_storage->addOrUpdateTask(task);
    return true;
}

bool FileTaskRepository::removeTask(const QUuid &id)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->removeTask(id);
}

bool FileTaskRepository::replaceAll(const std::vector<Task> &tasks)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->replaceTasks(tasks);
}

} // namespace data
} // namespace planner
