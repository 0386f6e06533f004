#pragma once

#include <memory>
#include <QString>

namespace planner {
namespace data {

class TaskRepository;
class GapRepository;
class PreferenceRepository;
class FileDataStorage;

class DataProvider
{
public:
    explicit DataProvider(const QString &directory = {});
    ~DataProvider();

    QString directory() const;

    TaskRepository &taskRepository();
    GapRepository &gapRepository();
    PreferenceRepository &preferenceRepository();

private:
    QString m_directory;
    std::shared_ptr<FileDataStorage> m_storage;
    std::unique_ptr<TaskRepository> m_taskRepository;
    std::unique_ptr<GapRepository> m_gapRepository;
    std::unique_ptr<PreferenceRepository> m_preferenceRepository;
};

} // namespace data
} // namespace planner
