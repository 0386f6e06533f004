#pragma once

#include "planner/data/FileDataStorage.hpp"
#include "planner/data/TaskRepository.hpp"

#include <memory>

namespace planner {
namespace data {

class FileTaskRepository : public TaskRepository
{
public:
    explicit FileTaskRepository(std::shared_ptr<FileDataStorage> storage);
    ~FileTaskRepository() override = default;

    std::vector<Task> fetchTasks() const override;
    std::vector<Task> tasksDueOn(const QDate &date) const override;
    std::optional<Task> findById(const QUuid &id) const override;
    Task addTask(Task task) override;
    bool updateTask(const Task &task) override;
    bool removeTask(const QUuid &id) override;
    bool replaceAll(const std::vector<Task> &tasks) override;

private:
    std::shared_ptr<FileDataStorage> m_storage;
};

} // namespace data
} // namespace planner
