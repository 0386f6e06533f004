#pragma once

#include <optional>
#include <vector>

#include <QDate>

#include "planner/data/Gap.hpp"
#include "planner/data/Preferences.hpp"
#include "planner/data/Task.hpp"

namespace planner {
namespace data {

enum class RemoteError
{
    None,
    Network,
    Auth,
};

template <typename T>
struct RemoteReply
{
    RemoteError error = RemoteError::None;
    T value{};

    bool ok() const { return error == RemoteError::None; }

    static RemoteReply success(T result) { return RemoteReply{ RemoteError::None, std::move(result) }; }
    static RemoteReply failure(RemoteError code) { return RemoteReply{ code, T{} }; }
};

class RemoteStore
{
public:
    virtual ~RemoteStore() = default;

    virtual RemoteReply<std::vector<Task>> getTasks() = 0;
    virtual RemoteReply<bool> saveTasks(const std::vector<Task> &tasks, bool replaceAll) = 0;
    virtual RemoteReply<std::vector<Gap>> getGaps(const QDate &date) = 0;
    virtual RemoteReply<std::vector<Gap>> getAllGaps() = 0;
    virtual RemoteReply<bool> saveGaps(const std::vector<Gap> &gaps, const QDate &date) = 0;
    virtual RemoteReply<std::optional<WorkPreferences>> getPreferences() = 0;
    virtual RemoteReply<bool> savePreferences(const WorkPreferences &prefs) = 0;
};

} // namespace data
} // namespace planner
