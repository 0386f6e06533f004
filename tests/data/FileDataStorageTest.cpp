#include <QtTest/QtTest>
#include <QTemporaryDir>

#include "planner/core/RollingWindow.hpp"
#include "planner/data/DataProvider.hpp"
#include "planner/data/FileDataStorage.hpp"
#include "planner/data/FileGapRepository.hpp"
#include "planner/data/GapRepository.hpp"
#include "planner/data/PreferenceRepository.hpp"
#include "planner/data/TaskRepository.hpp"

using namespace planner;
using namespace planner::data;

namespace {
Gap makeGap(const QDate &date, int start, int end)
{
    Gap gap;
    gap.date = date;
    gap.start = start;
    gap.end = end;
    gap.durationMinutes = end - start;
    return gap;
}
} // namespace

class FileDataStorageTest : public QObject
{
    Q_OBJECT

private slots:
    void gapsPersistSortedPerDate();
    void emptyReplacementClearsDate();
    void removesGapsOutsideWindow();
    void preferencesPersist();
    void corruptFileStartsEmpty();
    void emptyPathKeepsDataInMemory();
    void dataProviderUsesDirectory();
};

void FileDataStorageTest::gapsPersistSortedPerDate()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("planner.json"));
    const QDate day(2024, 5, 1);

    {
        FileDataStorage storage(path);
        QVERIFY(storage.replaceGaps(day, { makeGap(day, 11 * 60, 12 * 60), makeGap(day, 9 * 60, 10 * 60) }));
        QVERIFY(storage.replaceGaps(day.addDays(1), { makeGap(day.addDays(1), 9 * 60, 9 * 60 + 30) }));
    }

    FileDataStorage reloaded(path);
    const auto gaps = reloaded.gaps(day);
    QCOMPARE(gaps.size(), static_cast<size_t>(2));
    QCOMPARE(gaps.front().start, 9 * 60);
    QCOMPARE(gaps.back().start, 11 * 60);
    QCOMPARE(reloaded.allGaps().size(), static_cast<size_t>(3));
    QCOMPARE(reloaded.gapDates(), (std::vector<QDate>{ day, day.addDays(1) }));
}

void FileDataStorageTest::emptyReplacementClearsDate()
{
    QTemporaryDir dir;
    const QDate day(2024, 5, 1);
    auto storage = std::make_shared<FileDataStorage>(dir.filePath(QStringLiteral("planner.json")));
    FileGapRepository repo(storage);

    QVERIFY(repo.replaceGapsForDate(day, { makeGap(day, 9 * 60, 10 * 60) }));
    QCOMPARE(repo.dates().size(), static_cast<size_t>(1));
    QVERIFY(repo.replaceGapsForDate(day, {}));
    QVERIFY(repo.gapsForDate(day).empty());
    QVERIFY(repo.dates().empty());
}

void FileDataStorageTest::removesGapsOutsideWindow()
{
    QTemporaryDir dir;
    FileDataStorage storage(dir.filePath(QStringLiteral("planner.json")));
    const QDate today(2024, 5, 1);
    const core::RollingWindow window(today);

    QVERIFY(storage.replaceGaps(today, { makeGap(today, 9 * 60, 10 * 60) }));
    QVERIFY(storage.replaceGaps(window.start().addDays(-1), { makeGap(window.start().addDays(-1), 9 * 60, 10 * 60),
                                                             makeGap(window.start().addDays(-1), 10 * 60, 11 * 60) }));
    QVERIFY(storage.replaceGaps(window.end().addDays(1), { makeGap(window.end().addDays(1), 9 * 60, 10 * 60) }));

    QCOMPARE(storage.removeGapsOutside(window.range()), 3);
    QCOMPARE(storage.gapDates(), std::vector<QDate>{ today });
    QCOMPARE(storage.removeGapsOutside(window.range()), 0);
}

void FileDataStorageTest::preferencesPersist()
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("planner.json"));

    {
        FileDataStorage storage(path);
        QVERIFY(!storage.preferences().has_value());
        WorkPreferences prefs;
        prefs.workStart = 8 * 60;
        prefs.workEnd = 16 * 60;
        prefs.workingDays = WeekdaySet::fromDays({ Qt::Monday, Qt::Wednesday });
        prefs.dedupeStrategy = DedupeStrategy::PreferDevice;
        QVERIFY(storage.setPreferences(prefs));
    }

    FileDataStorage reloaded(path);
    const auto prefs = reloaded.preferences();
    QVERIFY(prefs.has_value());
    QCOMPARE(prefs->workStart, std::optional<int>(8 * 60));
    QCOMPARE(prefs->workEnd, std::optional<int>(16 * 60));
    QCOMPARE(prefs->workingDays, WeekdaySet::fromDays({ Qt::Monday, Qt::Wednesday }));
    QCOMPARE(prefs->dedupeStrategy, DedupeStrategy::PreferDevice);
}

void FileDataStorageTest::corruptFileStartsEmpty()
{
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("planner.json"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();

    FileDataStorage storage(path);
    QVERIFY(storage.tasks().empty());
    QVERIFY(storage.allGaps().empty());
    QVERIFY(!storage.preferences().has_value());
}

void FileDataStorageTest::emptyPathKeepsDataInMemory()
{
    FileDataStorage storage{ QString() };
    const QDate day(2024, 5, 1);
    QVERIFY(storage.replaceGaps(day, { makeGap(day, 9 * 60, 10 * 60) }));
    QCOMPARE(storage.gaps(day).size(), static_cast<size_t>(1));
}

void FileDataStorageTest::dataProviderUsesDirectory()
{
    QTemporaryDir dir;
    const QString directory = dir.filePath(QStringLiteral("nested/store"));
    {
        DataProvider provider(directory);
        QCOMPARE(provider.directory(), directory);
        Task task;
        task.title = QStringLiteral("From provider");
        provider.taskRepository().addTask(task);
        WorkPreferences prefs;
        QVERIFY(provider.preferenceRepository().savePreferences(prefs));
    }
    QVERIFY(QFile::exists(QDir(directory).filePath(QStringLiteral("planner.json"))));

    DataProvider reopened(directory);
    QCOMPARE(reopened.taskRepository().fetchTasks().size(), static_cast<size_t>(1));
    QVERIFY(reopened.gapRepository().allGaps().empty());
    QVERIFY(reopened.preferenceRepository().preferences().has_value());
}

QTEST_GUILESS_MAIN(FileDataStorageTest)
#include "FileDataStorageTest.moc"
