#pragma once

#include <optional>

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QUuid>

namespace planner {
namespace data {

enum class TaskStatus
{
    Draft,
    Scheduled,
    Overdue,
    Completed,
};

struct Task
{
    QUuid id = QUuid::createUuid();
    QString title;
    QDate dueDate;
    std::optional<int> dueTime;        // minutes since midnight
    std::optional<int> durationMinutes;
    TaskStatus status = TaskStatus::Scheduled;
    QDateTime updatedAt;
};

} // namespace data
} // namespace planner
