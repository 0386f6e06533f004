#pragma once

#include <map>
#include <optional>
#include <vector>

#include <QDate>
#include <QHash>
#include <QMutex>
#include <QString>
#include <QUuid>

#include "planner/core/RollingWindow.hpp"
#include "planner/data/Gap.hpp"
#include "planner/data/Preferences.hpp"
#include "planner/data/Task.hpp"

namespace planner {
namespace data {

class FileDataStorage
{
public:
    explicit FileDataStorage(QString filePath);
    ~FileDataStorage() = default;

    QString filePath() const;

    std::vector<Task> tasks() const;
    std::optional<Task> task(const QUuid &id) const;
    Task addOrUpdateTask(Task task);
    bool removeTask(const QUuid &id);
    bool replaceTasks(const std::vector<Task> &tasks);

    std::vector<Gap> gaps(const QDate &date) const;
    std::vector<Gap> allGaps() const;
    std::vector<QDate> gapDates() const;
    bool replaceGaps(const QDate &date, std::vector<Gap> gaps);
    int removeGapsOutside(const core::DateRange &window);

    std::optional<WorkPreferences> preferences() const;
    bool setPreferences(const WorkPreferences &prefs);

private:
    void load();
    bool save() const;

    QString m_filePath;
    mutable QMutex m_mutex;
    QHash<QUuid, Task> m_tasks;
    std::map<QDate, std::vector<Gap>> m_gaps;
    std::optional<WorkPreferences> m_preferences;
};

} // namespace data
} // namespace planner
