#include "planner/data/FilePreferenceRepository.hpp"

namespace planner {
namespace data {

FilePreferenceRepository::FilePreferenceRepository(std::shared_ptr<FileDataStorage> storage)
    : m_storage(std::move(storage))
{
}

std::optional<WorkPreferences> FilePreferenceRepository::preferences() const
{
    if (!m_storage) {
        return std::nullopt;
    }
    return m_storage->preferences();
}

bool FilePreferenceRepository::savePreferences(const WorkPreferences &prefs)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->setPreferences(prefs);
}

} // namespace data
} // namespace planner
