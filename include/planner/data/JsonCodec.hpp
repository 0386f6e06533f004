#pragma once

#include <optional>
#include <vector>

#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>

#include "planner/calendar/BusyBlock.hpp"
#include "planner/data/Gap.hpp"
#include "planner/data/Preferences.hpp"
#include "planner/data/Task.hpp"

namespace planner {
namespace data {

QString toString(TaskStatus status);
std::optional<TaskStatus> taskStatusFromString(const QString &value);
QString toString(GapModifier modifier);
std::optional<GapModifier> gapModifierFromString(const QString &value);

namespace json {

QJsonObject toJson(const Task &task);
std::optional<Task> taskFromJson(const QJsonObject &object);

QJsonObject toJson(const Gap &gap);
std::optional<Gap> gapFromJson(const QJsonObject &object);

QJsonObject toJson(const WorkPreferences &prefs);
WorkPreferences preferencesFromJson(const QJsonObject &object);

QJsonObject toJson(const calendar::BusyBlock &block);
std::optional<calendar::BusyBlock> busyBlockFromJson(const QJsonObject &object);

WeekdaySet weekdaysFromJson(const QJsonValue &value);
QJsonArray toJson(const WeekdaySet &days);

QJsonArray tasksToJson(const std::vector<Task> &tasks);
std::vector<Task> tasksFromJson(const QJsonArray &array);
QJsonArray gapsToJson(const std::vector<Gap> &gaps);
std::vector<Gap> gapsFromJson(const QJsonArray &array);
QJsonArray busyBlocksToJson(const std::vector<calendar::BusyBlock> &blocks);
std::optional<std::vector<calendar::BusyBlock>> busyBlocksFromJson(const QJsonArray &array);

} // namespace json
} // namespace data
} // namespace planner
