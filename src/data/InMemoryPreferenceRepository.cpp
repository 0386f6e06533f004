#include "planner/data/InMemoryPreferenceRepository.hpp"

#include <QMutexLocker>

namespace planner {
namespace data {

InMemoryPreferenceRepository::InMemoryPreferenceRepository() = default;

InMemoryPreferenceRepository::InMemoryPreferenceRepository(WorkPreferences prefs)
    : m_prefs(std::move(prefs))
{
}

InMemoryPreferenceRepository::~InMemoryPreferenceRepository() = default;

std::optional<WorkPreferences> InMemoryPreferenceRepository::preferences() const
{
    QMutexLocker locker(&m_mutex);
    return m_prefs;
}

bool InMemoryPreferenceRepository::savePreferences(const WorkPreferences &prefs)
{
    QMutexLocker locker(&m_mutex);
    m_prefs = prefs;
    return true;
}

} // namespace data
} // namespace planner
