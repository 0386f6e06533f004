#pragma once

#include "planner/data/FileDataStorage.hpp"
#include "planner/data/PreferenceRepository.hpp"

#include <memory>

namespace planner {
namespace data {

class FilePreferenceRepository : public PreferenceRepository
{
public:
    explicit FilePreferenceRepository(std::shared_ptr<FileDataStorage> storage);
    ~FilePreferenceRepository() override = default;

    std::optional<WorkPreferences> preferences() const override;
    bool savePreferences(const WorkPreferences &prefs) override;

private:
    std::shared_ptr<FileDataStorage> m_storage;
};

} // namespace data
} // namespace planner
