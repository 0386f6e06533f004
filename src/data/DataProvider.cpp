#include "planner/data/DataProvider.hpp"

#include "planner/core/Logging.hpp"
#include "planner/data/FileDataStorage.hpp"
#include "planner/data/FileGapRepository.hpp"
#include "planner/data/FilePreferenceRepository.hpp"
#include "planner/data/FileTaskRepository.hpp"

#include <QDir>
#include <QStandardPaths>

namespace planner {
namespace data {

DataProvider::DataProvider(const QString &directory)
    : m_directory(directory)
{
    if (m_directory.isEmpty()) {
        m_directory = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    }
    if (m_directory.isEmpty()) {
        m_directory = QDir::homePath() + QStringLiteral("/.local/share/gapplanner");
    }
    QDir dir(m_directory);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcPlannerData) << "Cannot create data directory" << m_directory;
    }
    const QString filePath = dir.filePath(QStringLiteral("planner.json"));

    m_storage = std::make_shared<FileDataStorage>(filePath);
    m_taskRepository = std::make_unique<FileTaskRepository>(m_storage);
    m_gapRepository = std::make_unique<FileGapRepository>(m_storage);
    m_preferenceRepository = std::make_unique<FilePreferenceRepository>(m_storage);
}

DataProvider::~DataProvider() = default;

QString DataProvider::directory() const
{
    return m_directory;
}

TaskRepository &DataProvider::taskRepository()
{
    return *m_taskRepository;
}

GapRepository &DataProvider::gapRepository()
{
    return *m_gapRepository;
}

PreferenceRepository &DataProvider::preferenceRepository()
{
    return *m_preferenceRepository;
}

} // namespace data
} // namespace planner
