#pragma once
#include <QObject>
#include <QStringList>
#include <QVector>
#include <QThreadPool>

#include "transfer_error.h"

struct TransferFailure {
    QString path;          // source path (copy) or deleted path (delete)
    TransferError error;
};

// Aggregate outcome of one parallel phase. Per-file failures never abort the phase.
struct TransferSummary {
    int total = 0;
    int succeeded = 0;
    int failed = 0;
    int prunedDirectories = 0;  // delete phase only
    QVector<TransferFailure> failures;

    bool allSucceeded() const { return failed == 0; }
};

class TransferEngine : public QObject {
    Q_OBJECT
public:
    explicit TransferEngine(QObject* parent = nullptr);
    ~TransferEngine() override;

    // Worker count; 0 selects QThread::idealThreadCount()
    void setMaxThreads(int threads);
    int maxThreads() const;

    // Copy every `relativePaths` entry from `source` to the mirrored place under
    // `destination`, creating directories as needed and never overwriting: an
    // occupied leaf name gets a counter suffix. Runs on the worker pool and
    // returns after all files are done. An empty list does not touch `destination`.
    TransferSummary copyFiles(const QString& source, const QString& destination, const QStringList& relativePaths);

    // Remove `relativePaths` under `source` on the worker pool.
    TransferSummary deleteFiles(const QString& source, const QStringList& relativePaths);

    // Delete phase: re-scan `source` (skipping `excludePath`), delete every media
    // file found, then prune directories that became empty.
    TransferSummary deleteOriginals(const QString& source, const QString& excludePath = QString());

    // Byte copy of one file into a path that must not exist yet.
    static bool copyOneFile(const QString& sourceFile, const QString& destFile, TransferError* errorOut);

signals:
    void fileCopied(const QString& source, const QString& destination, int completed, int total);
    void fileDeleted(const QString& path, int completed, int total);
    void fileFailed(const QString& path, const TransferError& error);
    // Emitted by deleteOriginals() between the deletions and the directory sweep
    void pruningStarted();

private:
    struct CopyTask {
        QString relativePath;
        QString destFile;
        TransferError error;
        bool ok = false;
    };
    struct DeleteTask {
        QString relativePath;
        TransferError error;
        bool ok = false;
    };

    template <typename Task>
    static TransferSummary summarize(const QVector<Task>& tasks, const QString& root);

    QThreadPool m_pool;
};
