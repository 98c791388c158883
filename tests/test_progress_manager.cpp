#include <QtTest>
#include <QSignalSpy>
#include "../src/progress_manager.h"
#include "../src/log_manager.h"

class TestProgressManager : public QObject {
    Q_OBJECT
private slots:
    void initTestCase();
    void testCountedPhase();
    void testOpenEndedPhase();
    void testFinishWhenIdle();
};

void TestProgressManager::initTestCase()
{
    LogManager::instance().setEchoToStderr(false);
    LogManager::instance().setLogFile(QString());
}

void TestProgressManager::testCountedPhase()
{
    auto& progress = ProgressManager::instance();
    QSignalSpy spy(&progress, &ProgressManager::currentChanged);

    progress.start("Copying", 4);
    QVERIFY(progress.isActive());
    QCOMPARE(progress.message(), QString("Copying"));
    QCOMPARE(progress.total(), 4);
    QCOMPARE(progress.increment(), 1);
    QCOMPARE(progress.increment(), 2);
    QCOMPARE(progress.percentage(), 50);
    QCOMPARE(progress.increment(), 3);
    QCOMPARE(progress.current(), 3);
    QCOMPARE(progress.percentage(), 75);

    // start + three increments
    QCOMPARE(spy.count(), 4);
    QCOMPARE(spy.last().at(0).toInt(), 3);
    QCOMPARE(spy.last().at(1).toInt(), 4);

    progress.finish();
    QVERIFY(!progress.isActive());
    QCOMPARE(progress.current(), 0);
    QCOMPARE(progress.total(), 0);
    // finish() always logs the final count
    QVERIFY(LogManager::instance().logs().last().endsWith("Copying: 3/4"));
}

void TestProgressManager::testOpenEndedPhase()
{
    auto& progress = ProgressManager::instance();
    progress.setLogInterval(0);
    LogManager::instance().clear();

    progress.start("Files found");
    progress.update(10);
    progress.update(25);
    QCOMPARE(progress.current(), 25);
    QCOMPARE(progress.percentage(), 0);
    progress.finish();

    const QString logs = LogManager::instance().logs().join('\n');
    QVERIFY(logs.contains("Files found: 10"));
    QVERIFY(logs.contains("Files found: 25"));
    progress.setLogInterval(250);
}

void TestProgressManager::testFinishWhenIdle()
{
    auto& progress = ProgressManager::instance();
    QSignalSpy spy(&progress, &ProgressManager::isActiveChanged);
    progress.finish();
    QCOMPARE(spy.count(), 0);
}

QTEST_GUILESS_MAIN(TestProgressManager)
#include "test_progress_manager.moc"
