#include <QtTest/QtTest>

#include <algorithm>
#include <array>

#include "planner/core/GapEngine.hpp"

using namespace planner;
using namespace planner::core;

namespace {
const QDate kMonday(2024, 4, 29);
const QDate kSaturday(2024, 5, 4);

data::WorkPreferences nineToFive()
{
    data::WorkPreferences prefs;
    prefs.workStart = 9 * 60;
    prefs.workEnd = 17 * 60;
    return prefs;
}

data::Task taskAt(const QDate &date, int start, int duration)
{
    data::Task task;
    task.title = QStringLiteral("Task");
    task.dueDate = date;
    task.dueTime = start;
    task.durationMinutes = duration;
    return task;
}

calendar::BusyBlock busyAt(const QDate &date, int start, int end)
{
    calendar::BusyBlock block;
    block.date = date;
    block.start = start;
    block.end = end;
    block.uid = QStringLiteral("evt-%1").arg(start);
    return block;
}

std::vector<std::pair<int, int>> geometry(const std::vector<data::Gap> &gaps)
{
    std::vector<std::pair<int, int>> result;
    for (const auto &gap : gaps) {
        result.emplace_back(gap.start, gap.end);
    }
    std::sort(result.begin(), result.end());
    return result;
}
} // namespace

class GapEngineTest : public QObject
{
    Q_OBJECT

private slots:
    void baseGapsCoverWorkHours();
    void baseGapsEmptyOutsideWindow();
    void baseGapsEmptyOnDaysOff();
    void baseGapsEmptyWithoutWorkHours();
    void endBeforeStartClampsToEndOfDay();
    void lastHourKeepsRemainder();
    void taskRemovesWholeHour();
    void taskSplitsGapWithLineage();
    void completedAndMalformedTasksIgnored();
    void busyBlocksSubtractedOnlyWhenEnabled();
    void partitionCoversWorkWindow();
    void reconcileIsIdempotent();
    void optimizeDropsShortGaps();
    void narrowedHoursTrimAndDelete();
    void widenedHoursCreateGaps();
    void removedWorkingDayDeletesGaps();
    void addedWorkingDayCreatesBaseGaps();
    void applyChangeSetKeepsOrder();
    void applyChangeSetSkipsCoveredHours();
    void validateReportsOverlaps();
};

void GapEngineTest::baseGapsCoverWorkHours()
{
    GapEngine engine{ RollingWindow(kMonday) };
    const auto gaps = engine.computeBaseGaps(kMonday, nineToFive());

    QCOMPARE(gaps.size(), static_cast<size_t>(8));
    QCOMPARE(gaps.front().start, 9 * 60);
    QCOMPARE(gaps.back().end, 17 * 60);
    for (size_t i = 0; i < gaps.size(); ++i) {
        QCOMPARE(gaps[i].durationMinutes, 60);
        QCOMPARE(gaps[i].date, kMonday);
        QCOMPARE(gaps[i].modifiedBy, data::GapModifier::System);
        if (i > 0) {
            QCOMPARE(gaps[i].start, gaps[i - 1].end);
        }
    }
}

void GapEngineTest::baseGapsEmptyOutsideWindow()
{
    GapEngine engine{ RollingWindow(kMonday) };
    QVERIFY(engine.computeBaseGaps(kMonday.addDays(8), nineToFive()).empty());
    QVERIFY(engine.computeBaseGaps(kMonday.addDays(-8), nineToFive()).empty());
    QVERIFY(!engine.computeBaseGaps(kMonday.addDays(7), nineToFive()).empty());
    QVERIFY(!engine.computeBaseGaps(kMonday.addDays(-7), nineToFive()).empty());
}

void GapEngineTest::baseGapsEmptyOnDaysOff()
{
    GapEngine engine{ RollingWindow(kMonday) };
    QVERIFY(engine.computeBaseGaps(kSaturday, nineToFive()).empty());
}

void GapEngineTest::baseGapsEmptyWithoutWorkHours()
{
    GapEngine engine{ RollingWindow(kMonday) };
    data::WorkPreferences prefs;
    QVERIFY(engine.computeBaseGaps(kMonday, prefs).empty());

    prefs.workStart = 9 * 60;
    QVERIFY(engine.computeBaseGaps(kMonday, prefs).empty());
}

void GapEngineTest::endBeforeStartClampsToEndOfDay()
{
    GapEngine engine{ RollingWindow(kMonday) };
    data::WorkPreferences prefs;
    prefs.workStart = 22 * 60;
    prefs.workEnd = 6 * 60;

    const auto gaps = engine.computeBaseGaps(kMonday, prefs);
    QCOMPARE(gaps.size(), static_cast<size_t>(2));
    QCOMPARE(gaps.back().end, 24 * 60);
}

void GapEngineTest::lastHourKeepsRemainder()
{
    GapEngine engine{ RollingWindow(kMonday) };
    auto prefs = nineToFive();
    prefs.workEnd = 17 * 60 + 30;

    const auto gaps = engine.computeBaseGaps(kMonday, prefs);
    QCOMPARE(gaps.size(), static_cast<size_t>(9));
    QCOMPARE(gaps.back().start, 17 * 60);
    QCOMPARE(gaps.back().durationMinutes, 30);
}

void GapEngineTest::taskRemovesWholeHour()
{
    GapEngine engine{ RollingWindow(kMonday) };
    const auto gaps = engine.reconcile(kMonday, { taskAt(kMonday, 10 * 60, 60) }, {}, nineToFive());

    QCOMPARE(gaps.size(), static_cast<size_t>(7));
    for (const auto &gap : gaps) {
        QVERIFY(gap.end <= 10 * 60 || gap.start >= 11 * 60);
    }
}

void GapEngineTest::taskSplitsGapWithLineage()
{
    GapEngine engine{ RollingWindow(kMonday) };
    const auto prefs = nineToFive();
    const auto gaps = engine.reconcile(kMonday, { taskAt(kMonday, 10 * 60 + 15, 30) }, {}, prefs);

    QCOMPARE(gaps.size(), static_cast<size_t>(9));
    const auto before = std::find_if(gaps.begin(), gaps.end(), [](const data::Gap &g) { return g.end == 10 * 60 + 15; });
    const auto after = std::find_if(gaps.begin(), gaps.end(), [](const data::Gap &g) { return g.start == 10 * 60 + 45; });
    QVERIFY(before != gaps.end());
    QVERIFY(after != gaps.end());
    QCOMPARE(before->start, 10 * 60);
    QCOMPARE(before->durationMinutes, 15);
    QCOMPARE(after->end, 11 * 60);
    QVERIFY(!before->parentGapId.isNull());
    QCOMPARE(before->parentGapId, before->originGapId);
    QCOMPARE(after->parentGapId, before->parentGapId);
    QCOMPARE(before->modifiedBy, data::GapModifier::System);
}

void GapEngineTest::completedAndMalformedTasksIgnored()
{
    GapEngine engine{ RollingWindow(kMonday) };
    auto done = taskAt(kMonday, 10 * 60, 60);
    done.status = data::TaskStatus::Completed;
    auto untimed = taskAt(kMonday, 11 * 60, 60);
    untimed.dueTime.reset();
    const auto broken = taskAt(kMonday, 3000, 60);
    const auto empty = taskAt(kMonday, 12 * 60, 0);
    const auto otherDay = taskAt(kMonday.addDays(1), 13 * 60, 60);

    const auto gaps = engine.reconcile(kMonday, { done, untimed, broken, empty, otherDay }, {}, nineToFive());
    QCOMPARE(gaps.size(), static_cast<size_t>(8));
}

void GapEngineTest::busyBlocksSubtractedOnlyWhenEnabled()
{
    GapEngine engine{ RollingWindow(kMonday) };
    auto prefs = nineToFive();
    const std::vector<calendar::BusyBlock> busy = { busyAt(kMonday, 13 * 60, 14 * 60 + 30) };

    QCOMPARE(engine.reconcile(kMonday, {}, busy, prefs).size(), static_cast<size_t>(8));

    prefs.subtractCalendarBusy = true;
    const auto gaps = engine.reconcile(kMonday, {}, busy, prefs);
    QCOMPARE(gaps.size(), static_cast<size_t>(7));
    const auto tail = std::find_if(gaps.begin(), gaps.end(), [](const data::Gap &g) { return g.start == 14 * 60 + 30; });
    QVERIFY(tail != gaps.end());
    QCOMPARE(tail->end, 15 * 60);
    QCOMPARE(tail->modifiedBy, data::GapModifier::CalendarSync);
}

void GapEngineTest::partitionCoversWorkWindow()
{
    GapEngine engine{ RollingWindow(kMonday) };
    auto prefs = nineToFive();
    prefs.subtractCalendarBusy = true;
    const std::vector<data::Task> tasks = { taskAt(kMonday, 9 * 60 + 20, 25), taskAt(kMonday, 12 * 60 + 50, 40) };
    const std::vector<calendar::BusyBlock> busy = { busyAt(kMonday, 8 * 60, 9 * 60 + 10),
                                                    busyAt(kMonday, 13 * 60, 13 * 60 + 45),
                                                    busyAt(kMonday, 16 * 60 + 40, 18 * 60) };

    const auto gaps = engine.reconcile(kMonday, tasks, busy, prefs);

    std::array<int, 24 * 60> gapCover{};
    std::array<bool, 24 * 60> occupied{};
    for (const auto &gap : gaps) {
        for (int m = gap.start; m < gap.end; ++m) {
            ++gapCover[static_cast<size_t>(m)];
        }
    }
    for (const auto &task : tasks) {
        for (int m = *task.dueTime; m < *task.dueTime + *task.durationMinutes; ++m) {
            occupied[static_cast<size_t>(m)] = true;
        }
    }
    for (const auto &block : busy) {
        for (int m = block.start; m < block.end; ++m) {
            occupied[static_cast<size_t>(m)] = true;
        }
    }

    for (int m = 9 * 60; m < 17 * 60; ++m) {
        const auto index = static_cast<size_t>(m);
        QVERIFY2(gapCover[index] <= 1, qPrintable(QStringLiteral("minute %1 double covered").arg(m)));
        QVERIFY2((gapCover[index] == 1) != occupied[index], qPrintable(QStringLiteral("minute %1").arg(m)));
    }
    for (const auto &gap : gaps) {
        QVERIFY(gap.start >= 9 * 60);
        QVERIFY(gap.end <= 17 * 60);
        QCOMPARE(gap.durationMinutes, gap.end - gap.start);
    }
}

void GapEngineTest::reconcileIsIdempotent()
{
    GapEngine engine{ RollingWindow(kMonday) };
    auto prefs = nineToFive();
    prefs.subtractCalendarBusy = true;
    const std::vector<data::Task> tasks = { taskAt(kMonday, 11 * 60 + 5, 50) };
    const std::vector<calendar::BusyBlock> busy = { busyAt(kMonday, 15 * 60 + 30, 16 * 60) };

    const auto first = engine.reconcile(kMonday, tasks, busy, prefs);
    const auto second = engine.reconcile(kMonday, tasks, busy, prefs);
    QVERIFY(geometry(first) == geometry(second));
}

void GapEngineTest::optimizeDropsShortGaps()
{
    GapEngine engine{ RollingWindow(kMonday) };
    const auto prefs = nineToFive();
    const auto reconciled = engine.reconcile(kMonday, { taskAt(kMonday, 10 * 60 + 10, 45) }, {}, prefs);
    const auto optimized = engine.optimize(reconciled, prefs);

    QCOMPARE(reconciled.size(), static_cast<size_t>(9));
    QCOMPARE(optimized.size(), static_cast<size_t>(7));
    for (const auto &gap : optimized) {
        QVERIFY(gap.durationMinutes >= prefs.minGapMinutes);
    }
}

void GapEngineTest::narrowedHoursTrimAndDelete()
{
    GapEngine engine{ RollingWindow(kMonday) };
    const auto oldPrefs = nineToFive();
    const auto existing = engine.computeBaseGaps(kMonday, oldPrefs);

    auto newPrefs = oldPrefs;
    newPrefs.workStart = 9 * 60 + 30;
    newPrefs.workEnd = 16 * 60 + 50;

    const auto changes = engine.handlePreferenceChange(existing, oldPrefs, newPrefs);
    QVERIFY(changes.toCreate.empty());
    QVERIFY(changes.toDelete.empty());
    QCOMPARE(changes.toUpdate.size(), static_cast<size_t>(2));
    QCOMPARE(changes.toUpdate.front().start, 9 * 60 + 30);
    QCOMPARE(changes.toUpdate.front().durationMinutes, 30);
    QCOMPARE(changes.toUpdate.front().id, existing.front().id);
    QCOMPARE(changes.toUpdate.back().end, 16 * 60 + 50);

    newPrefs.workEnd = 16 * 60 + 10;
    const auto tighter = engine.handlePreferenceChange(existing, oldPrefs, newPrefs);
    QCOMPARE(tighter.toDelete.size(), static_cast<size_t>(1));
    QCOMPARE(tighter.toDelete.front().start, 16 * 60);
}

void GapEngineTest::widenedHoursCreateGaps()
{
    GapEngine engine{ RollingWindow(kMonday) };
    const auto oldPrefs = nineToFive();
    const auto existing = engine.computeBaseGaps(kMonday, oldPrefs);

    auto newPrefs = oldPrefs;
    newPrefs.workStart = 8 * 60;
    newPrefs.workEnd = 18 * 60 + 10;

    const auto changes = engine.handlePreferenceChange(existing, oldPrefs, newPrefs);
    QVERIFY(changes.toDelete.empty());
    QVERIFY(changes.toUpdate.empty());
    // 18:00-18:10 is shorter than the minimum gap and is not created.
    QCOMPARE(changes.toCreate.size(), static_cast<size_t>(2));
    QCOMPARE(geometry(changes.toCreate), (std::vector<std::pair<int, int>>{ { 480, 540 }, { 1020, 1080 } }));
}

void GapEngineTest::removedWorkingDayDeletesGaps()
{
    GapEngine engine{ RollingWindow(kMonday) };
    const auto oldPrefs = nineToFive();
    const auto existing = engine.computeBaseGaps(kMonday, oldPrefs);

    auto newPrefs = oldPrefs;
    newPrefs.workingDays.remove(Qt::Monday);

    const auto changes = engine.handlePreferenceChange(existing, oldPrefs, newPrefs);
    QCOMPARE(changes.toDelete.size(), existing.size());
    QVERIFY(changes.toCreate.empty());
    QVERIFY(GapEngine::applyChangeSet(existing, changes).empty());
}

void GapEngineTest::addedWorkingDayCreatesBaseGaps()
{
    GapEngine engine{ RollingWindow(kMonday) };
    const auto oldPrefs = nineToFive();
    auto newPrefs = oldPrefs;
    newPrefs.workingDays.insert(Qt::Saturday);

    const auto changes = engine.handlePreferenceChange({}, oldPrefs, newPrefs);
    // Two Saturdays fall inside the window around 2024-04-29.
    QCOMPARE(changes.toCreate.size(), static_cast<size_t>(16));
    const auto dates = changes.dates();
    QCOMPARE(dates, (std::vector<QDate>{ QDate(2024, 4, 27), kSaturday }));
    QCOMPARE(changes.forDate(kSaturday).toCreate.size(), static_cast<size_t>(8));
}

void GapEngineTest::applyChangeSetKeepsOrder()
{
    GapEngine engine{ RollingWindow(kMonday) };
    const auto oldPrefs = nineToFive();
    const auto existing = engine.computeBaseGaps(kMonday, oldPrefs);
    auto newPrefs = oldPrefs;
    newPrefs.workStart = 7 * 60;

    const auto updated = GapEngine::applyChangeSet(existing, engine.handlePreferenceChange(existing, oldPrefs, newPrefs));
    QCOMPARE(updated.size(), static_cast<size_t>(10));
    QCOMPARE(updated.front().start, 7 * 60);
    QVERIFY(std::is_sorted(updated.begin(), updated.end(),
                           [](const data::Gap &a, const data::Gap &b) { return a.start < b.start; }));
    QVERIFY(engine.validate(updated, newPrefs).valid);
}

void GapEngineTest::applyChangeSetSkipsCoveredHours()
{
    GapEngine engine{ RollingWindow(kMonday) };
    const auto oldPrefs = nineToFive();
    auto newPrefs = oldPrefs;
    newPrefs.workEnd = 18 * 60;
    // Already recomputed under the wider hours.
    const auto current = engine.computeBaseGaps(kMonday, newPrefs);

    const auto changes = engine.handlePreferenceChange(current, oldPrefs, newPrefs);
    QCOMPARE(changes.toCreate.size(), static_cast<size_t>(1));
    const auto updated = GapEngine::applyChangeSet(current, changes);
    QCOMPARE(updated.size(), static_cast<size_t>(9));
    QVERIFY(engine.validate(updated, newPrefs).valid);
}

void GapEngineTest::validateReportsOverlaps()
{
    GapEngine engine{ RollingWindow(kMonday) };
    const auto prefs = nineToFive();
    auto gaps = engine.computeBaseGaps(kMonday, prefs);
    QVERIFY(engine.validate(gaps, prefs).valid);

    data::Gap stray = gaps.front();
    stray.id = QUuid::createUuid();
    stray.start = 9 * 60 + 30;
    stray.end = 10 * 60 + 30;
    gaps.push_back(stray);

    data::Gap early = gaps.front();
    early.id = QUuid::createUuid();
    early.start = 7 * 60;
    early.end = 8 * 60;
    gaps.push_back(early);

    const auto result = engine.validate(gaps, prefs);
    QVERIFY(!result.valid);
    QVERIFY(!result.errors.isEmpty());
    QCOMPARE(result.warnings.size(), 1);
}

QTEST_GUILESS_MAIN(GapEngineTest)
#include "GapEngineTest.moc"
