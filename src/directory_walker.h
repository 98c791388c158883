#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <QMetaType>
#include <atomic>
#include <functional>

#include "transfer_error.h"

// A media file discovered under a walk root. `relativePath` uses '/' separators.
struct MediaEntry {
    QString relativePath;
    qint64 size = -1;          // -1 when sizes were not requested or metadata could not be read

    bool hasSize() const { return size >= 0; }
};

// Running byte total and file count filled in while walking.
// Updated with relaxed fetch-and-add; only the final values are meaningful.
struct SizeTally {
    std::atomic<qint64> bytes{0};
    std::atomic<int> files{0};

    void reset() { bytes.store(0, std::memory_order_relaxed); files.store(0, std::memory_order_relaxed); }
};

class DirectoryWalker {
public:
    struct Options {
        // Absolute directory whose subtree is pruned from the walk (destination nested in source)
        QString excludePath;
        // Accumulate file sizes into the entries and the tally
        bool wantSize = false;
        // Descend into symlinked directories. Each canonical directory is entered at most once.
        bool followSymlinks = true;
        // Called after every discovered media file with the running count and byte total
        std::function<void(int files, qint64 bytes)> onProgress;
    };

    // Depth-first walk of `root` collecting media files. Unreadable directories and
    // entries are logged and skipped; `issues` (optional) receives one entry per skip.
    static QVector<MediaEntry> walk(const QString& root, const Options& options,
                                    SizeTally* tally = nullptr, QVector<TransferError>* issues = nullptr);

    // Every directory below `root` (root itself excluded), never following symlinks.
    static QStringList collectDirectories(const QString& root, const QString& excludePath = QString());

    static QStringList relativePaths(const QVector<MediaEntry>& entries);

private:
    static QString canonicalOrEmpty(const QString& path);
    static bool relativeTo(const QString& root, const QString& absolutePath, QString* relativeOut);
};

Q_DECLARE_METATYPE(MediaEntry)
