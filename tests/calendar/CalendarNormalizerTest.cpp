#include <QtTest/QtTest>

#include "planner/calendar/CalendarNormalizer.hpp"

using namespace planner;
using namespace planner::calendar;

namespace {
const QDate kDay(2024, 5, 1);

BusyBlock makeBlock(int start, int end, const QString &uid = QString())
{
    BusyBlock block;
    block.date = kDay;
    block.start = start;
    block.end = end;
    block.uid = uid;
    return block;
}

BusyBlock allDay(const QString &uid = QStringLiteral("holiday"))
{
    BusyBlock block = makeBlock(0, 24 * 60, uid);
    block.isAllDay = true;
    block.source = CalendarSource::Google;
    block.calendarId = QStringLiteral("team");
    return block;
}

data::WorkPreferences nineToFive()
{
    data::WorkPreferences prefs;
    prefs.workStart = 9 * 60;
    prefs.workEnd = 17 * 60;
    return prefs;
}
} // namespace

class CalendarNormalizerTest : public QObject
{
    Q_OBJECT

private slots:
    void timedEventsPassThrough();
    void ignoreModeDropsAllDay();
    void workdayModeSpansWorkWindow();
    void windowModePositions();
    void windowModeCapsToWorkWindow();
    void derivedBlocksKeepIdentity();
    void filterDropsFreeCancelledAndTentative();
    void mergeIsOrderIndependentAndIdempotent();
    void mergeJoinsTouchingBlocks();
    void eventAcrossMidnightIsSplit();
    void multiDayAllDayEventExpandsPerDay();
};

void CalendarNormalizerTest::timedEventsPassThrough()
{
    const BusyBlock block = makeBlock(600, 660, QStringLiteral("a"));
    const auto result = CalendarNormalizer::expandAllDay(block, nineToFive());
    QCOMPARE(result.size(), static_cast<size_t>(1));
    QCOMPARE(result.front().start, 600);
    QCOMPARE(result.front().end, 660);
}

void CalendarNormalizerTest::ignoreModeDropsAllDay()
{
    data::WorkPreferences prefs = nineToFive();
    prefs.allDayBlockMode = data::AllDayBlockMode::Ignore;
    QVERIFY(CalendarNormalizer::expandAllDay(allDay(), prefs).empty());
}

void CalendarNormalizerTest::workdayModeSpansWorkWindow()
{
    data::WorkPreferences prefs = nineToFive();
    prefs.allDayBlockMode = data::AllDayBlockMode::Workday;
    const auto result = CalendarNormalizer::expandAllDay(allDay(), prefs);
    QCOMPARE(result.size(), static_cast<size_t>(1));
    QCOMPARE(result.front().start, 9 * 60);
    QCOMPARE(result.front().end, 17 * 60);
}

void CalendarNormalizerTest::windowModePositions()
{
    data::WorkPreferences prefs = nineToFive();
    prefs.allDayBlockMode = data::AllDayBlockMode::Window;
    prefs.allDayBlockMinutes = 30;

    prefs.allDayBlockPosition = data::AllDayBlockPosition::Middle;
    auto result = CalendarNormalizer::expandAllDay(allDay(), prefs);
    QCOMPARE(result.size(), static_cast<size_t>(1));
    QCOMPARE(result.front().start, 12 * 60 + 45);
    QCOMPARE(result.front().end, 13 * 60 + 15);

    prefs.allDayBlockPosition = data::AllDayBlockPosition::Start;
    result = CalendarNormalizer::expandAllDay(allDay(), prefs);
    QCOMPARE(result.front().start, 9 * 60);
    QCOMPARE(result.front().end, 9 * 60 + 30);

    prefs.allDayBlockPosition = data::AllDayBlockPosition::End;
    result = CalendarNormalizer::expandAllDay(allDay(), prefs);
    QCOMPARE(result.front().start, 16 * 60 + 30);
    QCOMPARE(result.front().end, 17 * 60);
}

void CalendarNormalizerTest::windowModeCapsToWorkWindow()
{
    data::WorkPreferences prefs;
    prefs.workStart = 9 * 60;
    prefs.workEnd = 10 * 60;
    prefs.allDayBlockMode = data::AllDayBlockMode::Window;
    prefs.allDayBlockMinutes = 240;
    prefs.allDayBlockPosition = data::AllDayBlockPosition::Middle;

    const auto result = CalendarNormalizer::expandAllDay(allDay(), prefs);
    QCOMPARE(result.size(), static_cast<size_t>(1));
    QCOMPARE(result.front().start, 9 * 60);
    QCOMPARE(result.front().end, 10 * 60);
}

void CalendarNormalizerTest::derivedBlocksKeepIdentity()
{
    data::WorkPreferences prefs = nineToFive();
    prefs.allDayBlockMode = data::AllDayBlockMode::Window;
    BusyBlock source = allDay(QStringLiteral("offsite"));
    source.transparency = Transparency::Oof;
    source.status = EventStatus::Tentative;

    const auto result = CalendarNormalizer::expandAllDay(source, prefs);
    QCOMPARE(result.size(), static_cast<size_t>(1));
    QCOMPARE(result.front().uid, QStringLiteral("offsite"));
    QCOMPARE(result.front().source, CalendarSource::Google);
    QCOMPARE(result.front().calendarId, QStringLiteral("team"));
    QCOMPARE(result.front().transparency, Transparency::Oof);
    QCOMPARE(result.front().status, EventStatus::Tentative);
}

void CalendarNormalizerTest::filterDropsFreeCancelledAndTentative()
{
    BusyBlock busy = makeBlock(600, 660, QStringLiteral("busy"));
    BusyBlock free = makeBlock(600, 660, QStringLiteral("free"));
    free.transparency = Transparency::Free;
    BusyBlock cancelled = makeBlock(600, 660, QStringLiteral("cancelled"));
    cancelled.status = EventStatus::Cancelled;
    BusyBlock tentative = makeBlock(600, 660, QStringLiteral("tentative"));
    tentative.transparency = Transparency::Tentative;
    BusyBlock away = makeBlock(600, 660, QStringLiteral("away"));
    away.transparency = Transparency::Oof;

    const std::vector<BusyBlock> blocks{ busy, free, cancelled, tentative, away };
    data::WorkPreferences prefs = nineToFive();

    auto filtered = CalendarNormalizer::filterByTransparency(blocks, prefs);
    QCOMPARE(filtered.size(), static_cast<size_t>(2));
    QCOMPARE(filtered[0].uid, QStringLiteral("busy"));
    QCOMPARE(filtered[1].uid, QStringLiteral("away"));

    prefs.blockTentative = true;
    filtered = CalendarNormalizer::filterByTransparency(blocks, prefs);
    QCOMPARE(filtered.size(), static_cast<size_t>(3));
    QCOMPARE(filtered[1].uid, QStringLiteral("tentative"));
}

void CalendarNormalizerTest::mergeIsOrderIndependentAndIdempotent()
{
    std::vector<BusyBlock> blocks{
        makeBlock(14 * 60, 15 * 60, QStringLiteral("c")),
        makeBlock(9 * 60, 10 * 60, QStringLiteral("a")),
        makeBlock(9 * 60 + 30, 11 * 60, QStringLiteral("b")),
    };
    BusyBlock nextDay = makeBlock(9 * 60, 10 * 60, QStringLiteral("d"));
    nextDay.date = kDay.addDays(1);
    blocks.push_back(nextDay);

    const auto merged = CalendarNormalizer::mergeOverlaps(blocks);
    QCOMPARE(merged.size(), static_cast<size_t>(3));
    QCOMPARE(merged[0].start, 9 * 60);
    QCOMPARE(merged[0].end, 11 * 60);
    QCOMPARE(merged[0].uid, QStringLiteral("a"));
    QCOMPARE(merged[1].start, 14 * 60);
    QCOMPARE(merged[2].date, kDay.addDays(1));

    std::reverse(blocks.begin(), blocks.end());
    const auto reversed = CalendarNormalizer::mergeOverlaps(blocks);
    QCOMPARE(reversed.size(), merged.size());
    for (size_t i = 0; i < merged.size(); ++i) {
        QCOMPARE(reversed[i].date, merged[i].date);
        QCOMPARE(reversed[i].start, merged[i].start);
        QCOMPARE(reversed[i].end, merged[i].end);
        QCOMPARE(reversed[i].uid, merged[i].uid);
    }

    const auto again = CalendarNormalizer::mergeOverlaps(merged);
    QCOMPARE(again.size(), merged.size());
    for (size_t i = 0; i < merged.size(); ++i) {
        QCOMPARE(again[i].start, merged[i].start);
        QCOMPARE(again[i].end, merged[i].end);
    }
}

void CalendarNormalizerTest::mergeJoinsTouchingBlocks()
{
    const auto merged = CalendarNormalizer::mergeOverlaps(
        { makeBlock(9 * 60, 10 * 60), makeBlock(10 * 60, 10 * 60 + 30), makeBlock(11 * 60, 12 * 60) });
    QCOMPARE(merged.size(), static_cast<size_t>(2));
    QCOMPARE(merged[0].end, 10 * 60 + 30);
    QCOMPARE(merged[1].start, 11 * 60);
}

void CalendarNormalizerTest::eventAcrossMidnightIsSplit()
{
    RawEvent event;
    event.id = QStringLiteral("night-shift");
    event.calendarId = QStringLiteral("work");
    event.title = QStringLiteral("Deploy");
    event.start = QDateTime(kDay, QTime(22, 0), Qt::LocalTime);
    event.end = QDateTime(kDay.addDays(1), QTime(2, 0), Qt::LocalTime);

    data::WorkPreferences prefs = nineToFive();
    auto blocks = CalendarNormalizer::toBusyBlocks(event, CalendarSource::Device, prefs);
    QCOMPARE(blocks.size(), static_cast<size_t>(2));
    QCOMPARE(blocks[0].date, kDay);
    QCOMPARE(blocks[0].start, 22 * 60);
    QCOMPARE(blocks[0].end, 24 * 60);
    QCOMPARE(blocks[1].date, kDay.addDays(1));
    QCOMPARE(blocks[1].start, 0);
    QCOMPARE(blocks[1].end, 2 * 60);
    QCOMPARE(blocks[0].uid, QStringLiteral("night-shift"));
    QVERIFY(blocks[0].title.isEmpty());

    prefs.showCalendarTitles = true;
    blocks = CalendarNormalizer::toBusyBlocks(event, CalendarSource::Device, prefs);
    QCOMPARE(blocks[1].title, QStringLiteral("Deploy"));
}

void CalendarNormalizerTest::multiDayAllDayEventExpandsPerDay()
{
    RawEvent event;
    event.id = QStringLiteral("conference");
    event.isAllDay = true;
    event.start = QDateTime(kDay, QTime(0, 0), Qt::LocalTime);
    event.end = QDateTime(kDay.addDays(3), QTime(0, 0), Qt::LocalTime);

    data::WorkPreferences prefs = nineToFive();
    prefs.allDayBlockMode = data::AllDayBlockMode::Workday;
    const auto blocks = CalendarNormalizer::toBusyBlocks(event, CalendarSource::Google, prefs);
    QCOMPARE(blocks.size(), static_cast<size_t>(3));
    for (size_t i = 0; i < blocks.size(); ++i) {
        QCOMPARE(blocks[i].date, kDay.addDays(static_cast<int>(i)));
        QCOMPARE(blocks[i].start, 9 * 60);
        QCOMPARE(blocks[i].end, 17 * 60);
        QVERIFY(blocks[i].isAllDay);
    }
}

QTEST_GUILESS_MAIN(CalendarNormalizerTest)
#include "CalendarNormalizerTest.moc"
