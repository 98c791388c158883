#include <QtTest>
#include <QTemporaryDir>
#include <QSignalSpy>
#include <QFile>
#include <QDir>
#include <QThread>

#include <atomic>
#include "../src/transfer_engine.h"
#include "../src/directory_walker.h"

class TestTransferEngine : public QObject {
    Q_OBJECT
private slots:
    void initTestCase();
    void testCopyMirrorsTree();
    void testCopyCollisionKeepsExisting();
    void testCopyEmptyListLeavesDestinationAlone();
    void testCopyIntoDotDotPrefixedFolder();
    void testPartialFailureIsIsolated();
    void testCopyMissingSourceIsNotFound();
    void testDeleteOriginalsAndPrune();
    void testDeleteOriginalsSkipsNestedDestination();
    void testThreadCount();
};

static QByteArray payload(int seed, int size)
{
    QByteArray data(size, Qt::Uninitialized);
    for (int i = 0; i < size; ++i) data[i] = char((seed * 31 + i * 7) & 0xff);
    return data;
}

static void writeFile(const QString& path, const QByteArray& data)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly));
    QCOMPARE(f.write(data), qint64(data.size()));
}

static QByteArray readFile(const QString& path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return QByteArray();
    return f.readAll();
}

static QStringList scan(const QString& root)
{
    QStringList paths = DirectoryWalker::relativePaths(DirectoryWalker::walk(root, DirectoryWalker::Options()));
    paths.sort();
    return paths;
}

void TestTransferEngine::initTestCase()
{
    qRegisterMetaType<TransferError>("TransferError");
}

void TestTransferEngine::testCopyMirrorsTree()
{
    QTemporaryDir src, dst;
    QVERIFY(src.isValid() && dst.isValid());

    const QStringList rels{"a.jpg", "2024/b.png", "2024/06/c.mov", "2024/06/deep/d.nef", "x/y/z/e.mp4"};
    for (int i = 0; i < rels.size(); ++i) {
        writeFile(QDir(src.path()).filePath(rels[i]), payload(i, 1000 + i * 4096));
    }
    // Larger than one copy buffer
    writeFile(QDir(src.path()).filePath("big/clip.mkv"), payload(99, 9 * 1024 * 1024 + 17));

    TransferEngine engine;
    engine.setMaxThreads(4);
    // Emitted from worker threads
    std::atomic<int> copiedSignals{0};
    connect(&engine, &TransferEngine::fileCopied, this,
            [&copiedSignals](const QString&, const QString&, int, int) { ++copiedSignals; }, Qt::DirectConnection);

    const QStringList files = scan(src.path());
    QCOMPARE(files.size(), 6);
    const TransferSummary summary = engine.copyFiles(src.path(), dst.path(), files);

    QCOMPARE(summary.total, 6);
    QCOMPARE(summary.succeeded, 6);
    QCOMPARE(summary.failed, 0);
    QVERIFY(summary.allSucceeded());
    QCOMPARE(copiedSignals.load(), 6);

    QCOMPARE(scan(dst.path()), files);
    for (const QString& rel : files) {
        QCOMPARE(readFile(QDir(dst.path()).filePath(rel)), readFile(QDir(src.path()).filePath(rel)));
    }
    // Copies, not moves
    QCOMPARE(scan(src.path()), files);
}

void TestTransferEngine::testCopyCollisionKeepsExisting()
{
    QTemporaryDir src, dst;
    QVERIFY(src.isValid() && dst.isValid());

    writeFile(QDir(src.path()).filePath("album/pic.jpg"), "new content");
    writeFile(QDir(dst.path()).filePath("album/pic.jpg"), "old content");

    TransferEngine engine;
    const TransferSummary summary = engine.copyFiles(src.path(), dst.path(), {"album/pic.jpg"});
    QCOMPARE(summary.succeeded, 1);

    QCOMPARE(readFile(QDir(dst.path()).filePath("album/pic.jpg")), QByteArray("old content"));
    QCOMPARE(readFile(QDir(dst.path()).filePath("album/pic_1.jpg")), QByteArray("new content"));
    // The existing directory was reused
    QCOMPARE(QDir(dst.path()).entryList(QDir::Dirs | QDir::NoDotAndDotDot), QStringList({"album"}));

    // A second run over the same destination takes the next suffix
    const TransferSummary again = engine.copyFiles(src.path(), dst.path(), {"album/pic.jpg"});
    QCOMPARE(again.succeeded, 1);
    QCOMPARE(readFile(QDir(dst.path()).filePath("album/pic_2.jpg")), QByteArray("new content"));
}

void TestTransferEngine::testCopyEmptyListLeavesDestinationAlone()
{
    QTemporaryDir src, dst;
    QVERIFY(src.isValid() && dst.isValid());
    const QString missingDest = QDir(dst.path()).filePath("not-created");

    TransferEngine engine;
    const TransferSummary summary = engine.copyFiles(src.path(), missingDest, QStringList());
    QCOMPARE(summary.total, 0);
    QCOMPARE(summary.succeeded, 0);
    QVERIFY(summary.allSucceeded());
    QVERIFY(!QFileInfo::exists(missingDest));
}

void TestTransferEngine::testCopyIntoDotDotPrefixedFolder()
{
    QTemporaryDir src, dst;
    QVERIFY(src.isValid() && dst.isValid());
    writeFile(QDir(src.path()).filePath("..photos/a.jpg"), "a");
    writeFile(QDir(src.path()).filePath("..photos/b.jpg"), "b");

    const QStringList files = scan(src.path());
    QCOMPARE(files, QStringList({"..photos/a.jpg", "..photos/b.jpg"}));

    TransferEngine engine;
    engine.setMaxThreads(1);
    TransferSummary summary = engine.copyFiles(src.path(), dst.path(), files);
    QCOMPARE(summary.succeeded, 2);
    QCOMPARE(summary.failed, 0);

    // Folder already present on the second run
    summary = engine.copyFiles(src.path(), dst.path(), files);
    QCOMPARE(summary.succeeded, 2);
    QCOMPARE(readFile(QDir(dst.path()).filePath("..photos/a_1.jpg")), QByteArray("a"));
    QCOMPARE(readFile(QDir(dst.path()).filePath("..photos/b_1.jpg")), QByteArray("b"));
}

void TestTransferEngine::testPartialFailureIsIsolated()
{
    QTemporaryDir src, dst;
    QVERIFY(src.isValid() && dst.isValid());

    for (int i = 0; i < 10; ++i) {
        writeFile(QDir(src.path()).filePath(QString("set/img_%1.jpg").arg(i)), payload(i, 512));
    }
    const QStringList files = scan(src.path());
    QCOMPARE(files.size(), 10);

    // Make one file unreadable after discovery. When permission bits are not
    // enforced for this user, remove it instead so the read still fails.
    const QString victim = QDir(src.path()).filePath("set/img_3.jpg");
    QVERIFY(QFile::setPermissions(victim, QFileDevice::Permissions()));
    bool stillReadable = false;
    {
        QFile probe(victim);
        stillReadable = probe.open(QIODevice::ReadOnly);
    }
    if (stillReadable) {
        QVERIFY(QFile::remove(victim));
    }

    TransferEngine engine;
    QSignalSpy failedSpy(&engine, &TransferEngine::fileFailed);
    const TransferSummary summary = engine.copyFiles(src.path(), dst.path(), files);

    if (!stillReadable) {
        QFile::setPermissions(victim, QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    }

    QCOMPARE(summary.total, 10);
    QCOMPARE(summary.succeeded, 9);
    QCOMPARE(summary.failed, 1);
    QCOMPARE(summary.failures.size(), 1);
    QCOMPARE(summary.failures.first().path, victim);
    QCOMPARE(summary.failures.first().error.kind,
             stillReadable ? TransferError::Kind::NotFound : TransferError::Kind::PermissionDenied);
    QCOMPARE(failedSpy.count(), 1);
    QCOMPARE(scan(dst.path()).size(), 9);
    QVERIFY(!QFileInfo::exists(QDir(dst.path()).filePath("set/img_3.jpg")));
}

void TestTransferEngine::testCopyMissingSourceIsNotFound()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());

    TransferError err;
    QVERIFY(!TransferEngine::copyOneFile(tmp.filePath("gone.jpg"), tmp.filePath("out.jpg"), &err));
    QCOMPARE(err.kind, TransferError::Kind::NotFound);
    QVERIFY(!QFileInfo::exists(tmp.filePath("out.jpg")));

    // Never writes over an existing file
    writeFile(tmp.filePath("in.jpg"), "in");
    writeFile(tmp.filePath("taken.jpg"), "taken");
    QVERIFY(!TransferEngine::copyOneFile(tmp.filePath("in.jpg"), tmp.filePath("taken.jpg"), &err));
    QCOMPARE(readFile(tmp.filePath("taken.jpg")), QByteArray("taken"));
}

void TestTransferEngine::testDeleteOriginalsAndPrune()
{
    QTemporaryDir src;
    QVERIFY(src.isValid());
    QDir base(src.path());

    writeFile(base.filePath("a.jpg"), "a");
    writeFile(base.filePath("trip/day1/b.mov"), "b");
    writeFile(base.filePath("trip/day1/deeper/c.png"), "c");
    writeFile(base.filePath("trip/day2/d.heic"), "d");
    writeFile(base.filePath("docs/notes.txt"), "not media");
    base.mkpath("was-empty/already");

    TransferEngine engine;
    QSignalSpy pruneSpy(&engine, &TransferEngine::pruningStarted);
    const TransferSummary summary = engine.deleteOriginals(src.path());

    QCOMPARE(summary.total, 4);
    QCOMPARE(summary.succeeded, 4);
    QCOMPARE(summary.failed, 0);
    QCOMPARE(pruneSpy.count(), 1);
    QVERIFY(scan(src.path()).isEmpty());

    // Emptied directories are gone, transitively; the non-media file keeps its folder
    QVERIFY(!QFileInfo::exists(base.filePath("trip")));
    QVERIFY(!QFileInfo::exists(base.filePath("was-empty")));
    QVERIFY(QFileInfo::exists(base.filePath("docs/notes.txt")));
    QVERIFY(QFileInfo(src.path()).isDir());
    QCOMPARE(summary.prunedDirectories, 6);
}

void TestTransferEngine::testDeleteOriginalsSkipsNestedDestination()
{
    QTemporaryDir src;
    QVERIFY(src.isValid());
    QDir base(src.path());

    writeFile(base.filePath("pic.jpg"), "pic");
    writeFile(base.filePath("backup/pic.jpg"), "pic");

    TransferEngine engine;
    const TransferSummary summary = engine.deleteOriginals(src.path(), base.filePath("backup"));
    QCOMPARE(summary.succeeded, 1);
    QVERIFY(!QFileInfo::exists(base.filePath("pic.jpg")));
    QVERIFY(QFileInfo::exists(base.filePath("backup/pic.jpg")));
}

void TestTransferEngine::testThreadCount()
{
    TransferEngine engine;
    QCOMPARE(engine.maxThreads(), qMax(1, QThread::idealThreadCount()));
    engine.setMaxThreads(3);
    QCOMPARE(engine.maxThreads(), 3);
    engine.setMaxThreads(0);
    QCOMPARE(engine.maxThreads(), qMax(1, QThread::idealThreadCount()));
}

QTEST_GUILESS_MAIN(TestTransferEngine)
#include "test_transfer_engine.moc"
