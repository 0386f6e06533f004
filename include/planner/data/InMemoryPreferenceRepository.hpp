#pragma once

#include <QMutex>

#include "planner/data/PreferenceRepository.hpp"

namespace planner {
namespace data {

class InMemoryPreferenceRepository : public PreferenceRepository
{
public:
    InMemoryPreferenceRepository();
    explicit InMemoryPreferenceRepository(WorkPreferences prefs);
    ~InMemoryPreferenceRepository() override;

    std::optional<WorkPreferences> preferences() const override;
    bool savePreferences(const WorkPreferences &prefs) override;

private:
    mutable QMutex m_mutex;
    std::optional<WorkPreferences> m_prefs;
};

} // namespace data
} // namespace planner
