#include <QtTest/QtTest>

#include "timeblock/data/ScheduleCache.hpp"
#include "timeblock/scheduling/ConflictDetector.hpp"

using namespace timeblock;

namespace {

const QDate kDay(2025, 6, 2);

data::TimeBlockInfo makeBlock(const QString &id, const QString &taskId, const QTime &start, const QTime &end)
{
    data::TimeBlockInfo block;
    block.id = id;
    block.taskId = taskId;
    block.start = QDateTime(kDay, start);
    block.end = QDateTime(kDay, end);
    block.duration = static_cast<int>(block.start.secsTo(block.end) / 60);
    block.timeWindowId = QStringLiteral("work");
    return block;
}

} // namespace

class ConflictDetectorTest : public QObject
{
    Q_OBJECT

private slots:
    void blocksOverlap_data();
    void blocksOverlap();
    void taskWithoutBlocksHasNoConflicts();
    void ownBlocksNeverConflict();
    void overlapWithOtherTaskConflicts();
    void conflictingTaskIdsListsEachOnce();
};

void ConflictDetectorTest::blocksOverlap_data()
{
    QTest::addColumn<QTime>("firstStart");
    QTest::addColumn<QTime>("firstEnd");
    QTest::addColumn<bool>("overlapping");

    // Second block is always 10:00-11:00.
    QTest::newRow("starts inside") << QTime(10, 30) << QTime(11, 30) << true;
    QTest::newRow("ends inside") << QTime(9, 30) << QTime(10, 30) << true;
    QTest::newRow("contains") << QTime(9, 0) << QTime(12, 0) << true;
    QTest::newRow("contained") << QTime(10, 15) << QTime(10, 45) << true;
    QTest::newRow("identical") << QTime(10, 0) << QTime(11, 0) << true;
    QTest::newRow("adjacent before") << QTime(9, 0) << QTime(10, 0) << false;
    QTest::newRow("adjacent after") << QTime(11, 0) << QTime(12, 0) << false;
    QTest::newRow("disjoint") << QTime(13, 0) << QTime(14, 0) << false;
}

void ConflictDetectorTest::blocksOverlap()
{
    QFETCH(QTime, firstStart);
    QFETCH(QTime, firstEnd);
    QFETCH(bool, overlapping);

    const auto first = makeBlock(QStringLiteral("a"), QStringLiteral("t1"), firstStart, firstEnd);
    const auto second = makeBlock(QStringLiteral("b"), QStringLiteral("t2"), QTime(10, 0), QTime(11, 0));
    QCOMPARE(scheduling::ConflictDetector::blocksOverlap(first, second), overlapping);
    QCOMPARE(scheduling::ConflictDetector::blocksOverlap(second, first), overlapping);
}

void ConflictDetectorTest::taskWithoutBlocksHasNoConflicts()
{
    data::ScheduleCache cache;
    cache.add(makeBlock(QStringLiteral("a"), QStringLiteral("t1"), QTime(9, 0), QTime(10, 0)));
    scheduling::ConflictDetector detector(cache);
    QVERIFY(!detector.hasConflicts(QStringLiteral("missing")));
}

void ConflictDetectorTest::ownBlocksNeverConflict()
{
    data::ScheduleCache cache;
    cache.add(makeBlock(QStringLiteral("a"), QStringLiteral("t1"), QTime(9, 0), QTime(10, 30)));
    cache.add(makeBlock(QStringLiteral("b"), QStringLiteral("t1"), QTime(10, 0), QTime(11, 0)));
    scheduling::ConflictDetector detector(cache);
    QVERIFY(!detector.hasConflicts(QStringLiteral("t1")));
    QVERIFY(detector.conflictingTaskIds().isEmpty());
}

void ConflictDetectorTest::overlapWithOtherTaskConflicts()
{
    data::ScheduleCache cache;
    cache.add(makeBlock(QStringLiteral("a"), QStringLiteral("t1"), QTime(9, 0), QTime(10, 30)));
    cache.add(makeBlock(QStringLiteral("b"), QStringLiteral("t2"), QTime(10, 0), QTime(11, 0)));
    cache.add(makeBlock(QStringLiteral("c"), QStringLiteral("t3"), QTime(11, 0), QTime(12, 0)));
    scheduling::ConflictDetector detector(cache);

    QVERIFY(detector.hasConflicts(QStringLiteral("t1")));
    QVERIFY(detector.hasConflicts(QStringLiteral("t2")));
    QVERIFY(!detector.hasConflicts(QStringLiteral("t3")));
}

void ConflictDetectorTest::conflictingTaskIdsListsEachOnce()
{
    data::ScheduleCache cache;
    cache.add(makeBlock(QStringLiteral("a"), QStringLiteral("t1"), QTime(9, 0), QTime(12, 0)));
    cache.add(makeBlock(QStringLiteral("b"), QStringLiteral("t2"), QTime(9, 30), QTime(10, 0)));
    cache.add(makeBlock(QStringLiteral("c"), QStringLiteral("t2"), QTime(11, 0), QTime(11, 30)));
    cache.add(makeBlock(QStringLiteral("d"), QStringLiteral("t3"), QTime(13, 0), QTime(14, 0)));
    scheduling::ConflictDetector detector(cache);

    QStringList ids = detector.conflictingTaskIds();
    ids.sort();
    QCOMPARE(ids, QStringList({ QStringLiteral("t1"), QStringLiteral("t2") }));
}

QTEST_GUILESS_MAIN(ConflictDetectorTest)
#include "ConflictDetectorTest.moc"
