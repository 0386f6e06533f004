#pragma once

#include <optional>

#include "planner/data/Preferences.hpp"

namespace planner {
namespace data {

class PreferenceRepository
{
public:
    virtual ~PreferenceRepository() = default;

    virtual std::optional<WorkPreferences> preferences() const = 0;
    virtual bool savePreferences(const WorkPreferences &prefs) = 0;
};

} // namespace data
} // namespace planner
