#include <QtTest/QtTest>

#include "planner/core/TimeUtils.hpp"

using namespace planner::core;

class TimeUtilsTest : public QObject
{
    Q_OBJECT

private slots:
    void parsesClockTimes();
    void rejectsMalformedClockTimes();
    void parsesDurations();
    void formatsMinutes();
};

void TimeUtilsTest::parsesClockTimes()
{
    QCOMPARE(parseTimeOfDay(QStringLiteral("09:00")), std::optional<int>(540));
    QCOMPARE(parseTimeOfDay(QStringLiteral("9:30")), std::optional<int>(570));
    QCOMPARE(parseTimeOfDay(QStringLiteral("17:45:59")), std::optional<int>(1065));
    QCOMPARE(parseTimeOfDay(QStringLiteral("24:00")), std::optional<int>(kMinutesPerDay));
}

void TimeUtilsTest::rejectsMalformedClockTimes()
{
    QVERIFY(!parseTimeOfDay(QString()).has_value());
    QVERIFY(!parseTimeOfDay(QStringLiteral("25:00")).has_value());
    QVERIFY(!parseTimeOfDay(QStringLiteral("10:75")).has_value());
    QVERIFY(!parseTimeOfDay(QStringLiteral("noon")).has_value());
    QVERIFY(!parseTimeOfDay(QStringLiteral("24:30")).has_value());
}

void TimeUtilsTest::parsesDurations()
{
    QCOMPARE(parseDurationMinutes(QStringLiteral("90")), std::optional<int>(90));
    QCOMPARE(parseDurationMinutes(QStringLiteral("30 min")), std::optional<int>(30));
    QCOMPARE(parseDurationMinutes(QStringLiteral("45m")), std::optional<int>(45));
    QCOMPARE(parseDurationMinutes(QStringLiteral("1h")), std::optional<int>(60));
    QCOMPARE(parseDurationMinutes(QStringLiteral("1h 30m")), std::optional<int>(90));
    QCOMPARE(parseDurationMinutes(QStringLiteral("01:30")), std::optional<int>(90));
    QCOMPARE(parseDurationMinutes(QStringLiteral("00:30:00")), std::optional<int>(30));
    QVERIFY(!parseDurationMinutes(QStringLiteral("-5")).has_value());
    QVERIFY(!parseDurationMinutes(QStringLiteral("soon")).has_value());
    QVERIFY(!parseDurationMinutes(QString()).has_value());
}

void TimeUtilsTest::formatsMinutes()
{
    QCOMPARE(formatTimeOfDay(0), QStringLiteral("00:00"));
    QCOMPARE(formatTimeOfDay(765), QStringLiteral("12:45"));
    QCOMPARE(formatTimeOfDay(kMinutesPerDay), QStringLiteral("24:00"));
    QCOMPARE(minutesSinceMidnight(QTime(13, 15, 40)), 795);
}

QTEST_GUILESS_MAIN(TimeUtilsTest)
#include "TimeUtilsTest.moc"
