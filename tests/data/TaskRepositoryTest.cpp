#include <QtTest/QtTest>
#include <QTemporaryDir>

#include "planner/data/FileDataStorage.hpp"
#include "planner/data/FileTaskRepository.hpp"
#include "planner/data/InMemoryTaskRepository.hpp"

using namespace planner::data;

namespace {
Task makeTask(const QString &title, const QDate &date, int dueTime)
{
    Task task;
    task.title = title;
    task.dueDate = date;
    task.dueTime = dueTime;
    task.durationMinutes = 30;
    return task;
}
} // namespace

class TaskRepositoryTest : public QObject
{
    Q_OBJECT

private slots:
    void addAndFetch();
    void updateAndRemove();
    void tasksDueOnSortsByTime();
    void replaceAllSwapsContents();
    void fileRepositorySurvivesReload();
};

void TaskRepositoryTest::addAndFetch()
{
    InMemoryTaskRepository repo;
    Task task;
    task.title = "Write report";
    task.durationMinutes = 45;
    const auto stored = repo.addTask(task);

    QVERIFY(!stored.id.isNull());

    const auto list = repo.fetchTasks();
    QCOMPARE(list.size(), static_cast<size_t>(1));
    QCOMPARE(list.front().title, QStringLiteral("Write report"));
    QCOMPARE(list.front().durationMinutes, std::optional<int>(45));

    const auto fetched = repo.findById(stored.id);
    QVERIFY(fetched.has_value());
    QCOMPARE(fetched->title, QStringLiteral("Write report"));
}

void TaskRepositoryTest::updateAndRemove()
{
    InMemoryTaskRepository repo;
    Task task;
    task.title = "Initial";
    const auto stored = repo.addTask(task);

    Task toUpdate = stored;
    toUpdate.title = "Updated";
    QVERIFY(repo.updateTask(toUpdate));

    const auto fetched = repo.findById(stored.id);
    QVERIFY(fetched.has_value());
    QCOMPARE(fetched->title, QStringLiteral("Updated"));

    QVERIFY(repo.removeTask(stored.id));
    QVERIFY(!repo.findById(stored.id).has_value());
    QVERIFY(!repo.removeTask(stored.id));

    Task unknown;
    QVERIFY(!repo.updateTask(unknown));
}

void TaskRepositoryTest::tasksDueOnSortsByTime()
{
    InMemoryTaskRepository repo;
    const QDate day(2024, 5, 1);
    repo.addTask(makeTask("Late", day, 15 * 60));
    repo.addTask(makeTask("Early", day, 9 * 60));
    repo.addTask(makeTask("Tomorrow", day.addDays(1), 8 * 60));

    const auto due = repo.tasksDueOn(day);
    QCOMPARE(due.size(), static_cast<size_t>(2));
    QCOMPARE(due.front().title, QStringLiteral("Early"));
    QCOMPARE(due.back().title, QStringLiteral("Late"));
}

void TaskRepositoryTest::replaceAllSwapsContents()
{
    InMemoryTaskRepository repo;
    repo.addTask(makeTask("Old", QDate(2024, 5, 1), 9 * 60));

    const std::vector<Task> incoming = { makeTask("A", QDate(2024, 5, 2), 10 * 60),
                                         makeTask("B", QDate(2024, 5, 3), 11 * 60) };
    QVERIFY(repo.replaceAll(incoming));

    const auto tasks = repo.fetchTasks();
    QCOMPARE(tasks.size(), static_cast<size_t>(2));
    QCOMPARE(tasks.front().title, QStringLiteral("A"));
    QVERIFY(repo.findById(incoming.back().id).has_value());
}

void TaskRepositoryTest::fileRepositorySurvivesReload()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("planner.json"));

    Task stored;
    {
        FileTaskRepository repo(std::make_shared<FileDataStorage>(path));
        auto task = makeTask("Persisted", QDate(2024, 5, 1), 13 * 60 + 30);
        task.status = TaskStatus::Overdue;
        stored = repo.addTask(task);
    }

    FileTaskRepository reloaded(std::make_shared<FileDataStorage>(path));
    const auto fetched = reloaded.findById(stored.id);
    QVERIFY(fetched.has_value());
    QCOMPARE(fetched->title, QStringLiteral("Persisted"));
    QCOMPARE(fetched->dueDate, QDate(2024, 5, 1));
    QCOMPARE(fetched->dueTime, std::optional<int>(13 * 60 + 30));
    QCOMPARE(fetched->durationMinutes, std::optional<int>(30));
    QCOMPARE(fetched->status, TaskStatus::Overdue);

    QVERIFY(reloaded.removeTask(stored.id));
    QVERIFY(FileTaskRepository(std::make_shared<FileDataStorage>(path)).fetchTasks().empty());
}

QTEST_GUILESS_MAIN(TaskRepositoryTest)
#include "TaskRepositoryTest.moc"
