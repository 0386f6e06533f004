#include <QtTest/QtTest>

#include "planner/calendar/Deduplicator.hpp"

using namespace planner;
using namespace planner::calendar;

namespace {
const QDate kDay(2024, 5, 1);

BusyBlock mirror(const QString &uid, CalendarSource source, int start = 13 * 60, int end = 13 * 60 + 30)
{
    BusyBlock block;
    block.date = kDay;
    block.start = start;
    block.end = end;
    block.uid = uid;
    block.source = source;
    return block;
}
} // namespace

class DeduplicatorTest : public QObject
{
    Q_OBJECT

private slots:
    void autoKeepsOneOfIdenticalPair();
    void autoSkipsTentativeMembers();
    void noneKeepsEverything();
    void preferSourceSelectsMatchingMember();
    void preferSourceFallsBackToFirst();
    void keptPlusDroppedMatchesInput();
    void differentTimesAreNotDuplicates();
    void missingUidGetsSyntheticKey();
};

void DeduplicatorTest::autoKeepsOneOfIdenticalPair()
{
    const auto result = Deduplicator::deduplicateEvents(
        { mirror(QStringLiteral("a"), CalendarSource::Device), mirror(QStringLiteral("b"), CalendarSource::Device) },
        data::DedupeStrategy::Auto);

    QCOMPARE(result.kept.size(), static_cast<size_t>(1));
    QCOMPARE(result.kept.front().uid, QStringLiteral("a"));
    QCOMPARE(result.decisions.size(), static_cast<size_t>(1));
    QCOMPARE(result.decisions.front().keptUid, QStringLiteral("a"));
    QCOMPARE(result.decisions.front().droppedUids, QStringList{ QStringLiteral("b") });
    QCOMPARE(result.decisions.front().reason, QStringLiteral("auto"));
    QCOMPARE(result.droppedCount(), 1);
}

void DeduplicatorTest::autoSkipsTentativeMembers()
{
    BusyBlock tentative = mirror(QStringLiteral("maybe"), CalendarSource::Google);
    tentative.status = EventStatus::Tentative;
    BusyBlock free = mirror(QStringLiteral("free"), CalendarSource::Google);
    free.transparency = Transparency::Free;

    const auto result = Deduplicator::deduplicateEvents(
        { tentative, free, mirror(QStringLiteral("firm"), CalendarSource::Device) }, data::DedupeStrategy::Auto);
    QCOMPARE(result.kept.size(), static_cast<size_t>(1));
    QCOMPARE(result.kept.front().uid, QStringLiteral("firm"));
    QCOMPARE(result.decisions.front().droppedUids, (QStringList{ QStringLiteral("maybe"), QStringLiteral("free") }));
}

void DeduplicatorTest::noneKeepsEverything()
{
    const std::vector<BusyBlock> blocks{ mirror(QStringLiteral("a"), CalendarSource::Device),
                                         mirror(QStringLiteral("b"), CalendarSource::Google) };
    const auto result = Deduplicator::deduplicateEvents(blocks, data::DedupeStrategy::None);
    QCOMPARE(result.kept.size(), blocks.size());
    QVERIFY(result.decisions.empty());
    QCOMPARE(result.droppedCount(), 0);
}

void DeduplicatorTest::preferSourceSelectsMatchingMember()
{
    const std::vector<BusyBlock> blocks{ mirror(QStringLiteral("device"), CalendarSource::Device),
                                         mirror(QStringLiteral("google"), CalendarSource::Google) };

    auto result = Deduplicator::deduplicateEvents(blocks, data::DedupeStrategy::PreferGoogle);
    QCOMPARE(result.kept.front().uid, QStringLiteral("google"));
    QCOMPARE(result.decisions.front().reason, QStringLiteral("prefer_google"));

    result = Deduplicator::deduplicateEvents(blocks, data::DedupeStrategy::PreferDevice);
    QCOMPARE(result.kept.front().uid, QStringLiteral("device"));
    QCOMPARE(result.decisions.front().reason, QStringLiteral("prefer_device"));
}

void DeduplicatorTest::preferSourceFallsBackToFirst()
{
    const auto result = Deduplicator::deduplicateEvents(
        { mirror(QStringLiteral("one"), CalendarSource::Device), mirror(QStringLiteral("two"), CalendarSource::Device) },
        data::DedupeStrategy::PreferGoogle);
    QCOMPARE(result.kept.front().uid, QStringLiteral("one"));
}

void DeduplicatorTest::keptPlusDroppedMatchesInput()
{
    const std::vector<BusyBlock> blocks{
        mirror(QStringLiteral("a"), CalendarSource::Device),
        mirror(QStringLiteral("b"), CalendarSource::Google),
        mirror(QStringLiteral("c"), CalendarSource::Google),
        mirror(QStringLiteral("d"), CalendarSource::Device, 9 * 60, 10 * 60),
        mirror(QStringLiteral("e"), CalendarSource::Google, 9 * 60, 10 * 60),
        mirror(QStringLiteral("f"), CalendarSource::Device, 15 * 60, 16 * 60),
    };
    for (const auto strategy : { data::DedupeStrategy::Auto, data::DedupeStrategy::PreferGoogle,
                                 data::DedupeStrategy::PreferDevice }) {
        const auto result = Deduplicator::deduplicateEvents(blocks, strategy);
        QCOMPARE(result.kept.size(), static_cast<size_t>(3));
        QCOMPARE(static_cast<size_t>(result.droppedCount()) + result.kept.size(), blocks.size());
    }
}

void DeduplicatorTest::differentTimesAreNotDuplicates()
{
    const auto result = Deduplicator::deduplicateEvents(
        { mirror(QStringLiteral("a"), CalendarSource::Device, 13 * 60, 13 * 60 + 30),
          mirror(QStringLiteral("b"), CalendarSource::Google, 13 * 60, 13 * 60 + 31) },
        data::DedupeStrategy::Auto);
    QCOMPARE(result.kept.size(), static_cast<size_t>(2));
    QVERIFY(result.decisions.empty());
}

void DeduplicatorTest::missingUidGetsSyntheticKey()
{
    const auto result = Deduplicator::deduplicateEvents(
        { mirror(QStringLiteral("a"), CalendarSource::Device), mirror(QString(), CalendarSource::Google) },
        data::DedupeStrategy::Auto);
    QCOMPARE(result.decisions.front().droppedUids,
             QStringList{ QStringLiteral("2024-05-01_13:00_13:30_google") });
}

QTEST_GUILESS_MAIN(DeduplicatorTest)
#include "DeduplicatorTest.moc"
