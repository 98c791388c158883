#include <QtTest>
#include <QTemporaryDir>
#include "../src/capacity_planner.h"

class TestCapacityPlanner : public QObject {
    Q_OBJECT
private slots:
    void testAvailableCapacityOfTempDir();
    void testPlanUsesVolume();
    void testFits_data();
    void testFits();
};

void TestCapacityPlanner::testAvailableCapacityOfTempDir()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    TransferError err;
    const qint64 free = CapacityPlanner::availableCapacity(tmp.path(), &err);
    QVERIFY(free >= 0);
    QVERIFY(!err.isError());
}

void TestCapacityPlanner::testPlanUsesVolume()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const CapacityPlan plan = CapacityPlanner::plan(tmp.path(), 3, 1024);
    QCOMPARE(plan.fileCount, 3);
    QCOMPARE(plan.totalBytes, qint64(1024));
    QVERIFY(plan.capacityKnown);
    QVERIFY(plan.availableBytes >= 0);
    QCOMPARE(plan.fits(), plan.availableBytes >= 1024);
}

void TestCapacityPlanner::testFits_data()
{
    QTest::addColumn<qint64>("total");
    QTest::addColumn<qint64>("available");
    QTest::addColumn<bool>("known");
    QTest::addColumn<bool>("expected");

    QTest::newRow("plenty") << qint64(100) << qint64(1000) << true << true;
    QTest::newRow("exact") << qint64(1000) << qint64(1000) << true << true;
    QTest::newRow("short") << qint64(1001) << qint64(1000) << true << false;
    QTest::newRow("unknown is unlimited") << qint64(1) << qint64(1) << false << true;
    QTest::newRow("unknown with -1") << qint64(1) << qint64(-1) << false << true;
}

void TestCapacityPlanner::testFits()
{
    QFETCH(qint64, total);
    QFETCH(qint64, available);
    QFETCH(bool, known);
    QFETCH(bool, expected);

    CapacityPlan plan;
    plan.totalBytes = total;
    plan.availableBytes = available;
    plan.capacityKnown = known;
    QCOMPARE(plan.fits(), expected);
}

QTEST_APPLESS_MAIN(TestCapacityPlanner)
#include "test_capacity_planner.moc"
