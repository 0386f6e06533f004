#pragma once

#include <QHash>
#include <QMutex>

#include "planner/data/TaskRepository.hpp"

namespace planner {
namespace data {

class InMemoryTaskRepository : public TaskRepository
{
public:
    InMemoryTaskRepository();
    ~InMemoryTaskRepository() override;

    std::vector<Task> fetchTasks() const override;
    std::vector<Task> tasksDueOn(const QDate &date) const override;
    std::optional<Task> findById(const QUuid &id) const override;
    Task addTask(Task task) override;
    bool updateTask(const Task &task) override;
    bool removeTask(const QUuid &id) override;
    bool replaceAll(const std::vector<Task> &tasks) override;

private:
    mutable QMutex m_mutex;
    QHash<QUuid, Task> m_items;
};

} // namespace data
} // namespace planner
