#pragma once

#include <optional>
#include <vector>

#include <QDate>

#include "planner/data/Task.hpp"

namespace planner {
namespace data {

class TaskRepository
{
public:
    virtual ~TaskRepository() = default;

    virtual std::vector<Task> fetchTasks() const = 0;
    virtual std::vector<Task> tasksDueOn(const QDate &date) const = 0;
    virtual std::optional<Task> findById(const QUuid &id) const = 0;
    virtual Task addTask(Task task) = 0;
    virtual bool updateTask(const Task &task) = 0;
    virtual bool removeTask(const QUuid &id) = 0;
    virtual bool replaceAll(const std::vector<Task> &tasks) = 0;
};

} // namespace data
} // namespace planner
