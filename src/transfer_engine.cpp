#include "transfer_engine.h"
#include "directory_walker.h"
#include "directory_pruner.h"
#include "unique_path.h"
#include "log_manager.h"
#include "progress_manager.h"

#include <QtConcurrent>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>
#include <QDateTime>
#include <QDebug>

#include <atomic>

namespace {

constexpr qint64 kCopyBufferSize = 4 * 1024 * 1024;
// A leaf name allocated as free can be taken before we open it; re-allocate a few times
constexpr int kAllocationRounds = 3;

TransferError destinationError(const QFile& out, const QString& destFile)
{
    if (QFileInfo::exists(destFile)) {
        return TransferError(TransferError::Kind::Other,
                             QString("Destination '%1' already exists").arg(destFile));
    }
    const QFileInfo parent(QFileInfo(destFile).absolutePath());
    if (out.error() == QFileDevice::PermissionsError || (parent.exists() && !parent.isWritable())) {
        return TransferError(TransferError::Kind::PermissionDenied,
                             QString("Cannot write '%1': %2").arg(destFile, out.errorString()));
    }
    if (!parent.exists()) {
        return TransferError(TransferError::Kind::NotFound,
                             QString("Destination folder '%1' does not exist").arg(parent.filePath()));
    }
    return TransferError(TransferError::Kind::Other,
                         QString("Cannot write '%1': %2").arg(destFile, out.errorString()));
}

} // namespace

TransferEngine::TransferEngine(QObject* parent) : QObject(parent)
{
    qRegisterMetaType<TransferError>("TransferError");
    setMaxThreads(0);
}

TransferEngine::~TransferEngine()
{
    m_pool.waitForDone();
}

void TransferEngine::setMaxThreads(int threads)
{
    const int n = threads > 0 ? threads : QThread::idealThreadCount();
    m_pool.setMaxThreadCount(qMax(1, n));
}

int TransferEngine::maxThreads() const
{
    return m_pool.maxThreadCount();
}

bool TransferEngine::copyOneFile(const QString& sourceFile, const QString& destFile, TransferError* errorOut)
{
    QFile in(sourceFile);
    if (!in.open(QIODevice::ReadOnly)) {
        setError(errorOut, TransferError::fromFile(in, sourceFile, "Cannot open"));
        return false;
    }

    QFile out(destFile);
    // NewOnly: an existing file is never truncated, even if it appeared after the name check
    if (!out.open(QIODevice::WriteOnly | QIODevice::NewOnly)) {
        setError(errorOut, destinationError(out, destFile));
        return false;
    }

    QByteArray buf;
    buf.resize(int(kCopyBufferSize));
    while (!in.atEnd()) {
        const qint64 r = in.read(buf.data(), buf.size());
        if (r < 0) {
            setError(errorOut, TransferError::fromFile(in, sourceFile, "Read error in"));
            out.close();
            out.remove();
            return false;
        }
        if (r == 0) break;
        const qint64 w = out.write(buf.constData(), r);
        if (w != r) {
            setError(errorOut, TransferError(TransferError::Kind::Other,
                                             QString("Write error %1: %2").arg(destFile, out.errorString())));
            out.close();
            out.remove();
            return false;
        }
    }

    if (!out.flush()) {
        setError(errorOut, TransferError(TransferError::Kind::Other,
                                         QString("Write error %1: %2").arg(destFile, out.errorString())));
        out.close();
        out.remove();
        return false;
    }
    // Keep the original timestamp and permissions; failures here do not fail the copy
    const QDateTime modified = in.fileTime(QFileDevice::FileModificationTime);
    if (modified.isValid() && !out.setFileTime(modified, QFileDevice::FileModificationTime)) {
        qDebug() << "TransferEngine: cannot set modification time on" << destFile;
    }
    out.close();
    in.close();
    if (!QFile::setPermissions(destFile, QFile::permissions(sourceFile))) {
        qDebug() << "TransferEngine: cannot copy permissions to" << destFile;
    }
    return true;
}

template <typename Task>
TransferSummary TransferEngine::summarize(const QVector<Task>& tasks, const QString& root)
{
    TransferSummary summary;
    summary.total = tasks.size();
    for (const Task& t : tasks) {
        if (t.ok) {
            ++summary.succeeded;
        } else {
            ++summary.failed;
            summary.failures.push_back({QDir(root).filePath(t.relativePath), t.error});
        }
    }
    return summary;
}

TransferSummary TransferEngine::copyFiles(const QString& source, const QString& destination, const QStringList& relativePaths)
{
    if (relativePaths.isEmpty()) {
        LogManager::instance().addLog("No media files found in the source directory.");
        return TransferSummary();
    }

    const QDir srcDir(source);
    const QDir dstDir(destination);
    const QString destRoot = dstDir.absolutePath();
    const int total = relativePaths.size();

    QVector<CopyTask> tasks;
    tasks.reserve(total);
    for (const QString& rel : relativePaths) {
        CopyTask t;
        t.relativePath = rel;
        tasks.push_back(t);
    }

    LogManager::instance().addLog(QString("Found %1 media files. Starting parallel copy with %2 workers...")
                                  .arg(total).arg(maxThreads()));
    ProgressManager::instance().start("Copying", total);

    std::atomic<int> copied{0};

    // Each task writes only its own slot; the counter is the only shared state
    QtConcurrent::blockingMap(&m_pool, tasks, [&](CopyTask& task) {
        const QString sourceFile = srcDir.absoluteFilePath(task.relativePath);
        const QString mirrored = dstDir.absoluteFilePath(task.relativePath);
        const QString destFolder = QFileInfo(mirrored).absolutePath();

        if (!UniquePath::ensureDirectoryPath(destRoot, destFolder, &task.error)) {
            LogManager::instance().addLog(QString("Warning: Cannot create directory structure for '%1': %2")
                                          .arg(destFolder, task.error.message), "WARN");
            emit fileFailed(sourceFile, task.error);
            return;
        }

        for (int round = 0; round < kAllocationRounds; ++round) {
            task.destFile = UniquePath::uniqueFilePath(mirrored, &task.error);
            if (task.destFile.isEmpty()) break;
            task.error = TransferError();
            task.ok = copyOneFile(sourceFile, task.destFile, &task.error);
            // Only a name taken between check and open is worth another round
            if (task.ok || !QFileInfo::exists(task.destFile)) break;
        }

        if (!task.ok) {
            LogManager::instance().addLog(QString("Warning: Cannot copy file '%1' to '%2': %3")
                                          .arg(sourceFile, task.destFile, task.error.toString()), "WARN");
            emit fileFailed(sourceFile, task.error);
            return;
        }

        const int n = copied.fetch_add(1, std::memory_order_relaxed) + 1;
        ProgressManager::instance().increment();
        LogManager::instance().addLog(QString("(%1/%2) Copied: %3 -> %4").arg(n).arg(total).arg(sourceFile, task.destFile));
        emit fileCopied(sourceFile, task.destFile, n, total);
    });

    ProgressManager::instance().finish();

    TransferSummary summary = summarize(tasks, srcDir.absolutePath());
    summary.succeeded = copied.load(std::memory_order_relaxed);
    if (summary.failed > 0) {
        LogManager::instance().addLog(QString("Warning: %1 files could not be copied due to access issues").arg(summary.failed), "WARN");
    }
    return summary;
}

TransferSummary TransferEngine::deleteFiles(const QString& source, const QStringList& relativePaths)
{
    if (relativePaths.isEmpty()) return TransferSummary();

    const QDir srcDir(source);
    const int total = relativePaths.size();

    QVector<DeleteTask> tasks;
    tasks.reserve(total);
    for (const QString& rel : relativePaths) {
        DeleteTask t;
        t.relativePath = rel;
        tasks.push_back(t);
    }

    ProgressManager::instance().start("Deleting", total);
    std::atomic<int> deleted{0};

    QtConcurrent::blockingMap(&m_pool, tasks, [&](DeleteTask& task) {
        const QString path = srcDir.absoluteFilePath(task.relativePath);
        QFile f(path);
        if (!f.remove()) {
            const QFileInfo parent(QFileInfo(path).absolutePath());
            if (QFileInfo::exists(path) && !parent.isWritable()) {
                task.error = TransferError(TransferError::Kind::PermissionDenied,
                                           QString("Cannot delete '%1': %2").arg(path, f.errorString()));
            } else {
                task.error = TransferError::fromFile(f, path, "Cannot delete");
            }
            LogManager::instance().addLog(QString("Warning: Failed to delete '%1': %2").arg(path, task.error.toString()), "WARN");
            emit fileFailed(path, task.error);
            return;
        }
        task.ok = true;
        const int n = deleted.fetch_add(1, std::memory_order_relaxed) + 1;
        ProgressManager::instance().increment();
        LogManager::instance().addLog(QString("(%1/%2) Deleted: %3").arg(n).arg(total).arg(path));
        emit fileDeleted(path, n, total);
    });

    ProgressManager::instance().finish();

    TransferSummary summary = summarize(tasks, srcDir.absolutePath());
    summary.succeeded = deleted.load(std::memory_order_relaxed);
    if (summary.failed > 0) {
        LogManager::instance().addLog(QString("Warning: %1 files could not be deleted due to access issues").arg(summary.failed), "WARN");
    }
    return summary;
}

TransferSummary TransferEngine::deleteOriginals(const QString& source, const QString& excludePath)
{
    // Independent re-scan; the copy-phase list is not reused. Directory links are
    // not followed so nothing outside the source tree is deleted.
    DirectoryWalker::Options options;
    options.excludePath = excludePath;
    options.followSymlinks = false;
    const QVector<MediaEntry> entries = DirectoryWalker::walk(source, options);

    TransferSummary summary = deleteFiles(source, DirectoryWalker::relativePaths(entries));
    if (summary.total > 0) {
        emit pruningStarted();
        summary.prunedDirectories = DirectoryPruner::pruneEmptyDirectories(source, excludePath);
    }
    return summary;
}
