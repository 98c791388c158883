#include "directory_walker.h"
#include "media_classifier.h"
#include "log_manager.h"

#include <QDir>
#include <QFileInfo>
#include <QSet>
#include <QDebug>

namespace {

const QDir::Filters kEntryFilters = QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System;

void recordIssue(QVector<TransferError>* issues, const TransferError& err)
{
    qWarning().noquote() << "Warning:" << err.message;
    if (issues) issues->push_back(err);
}

} // namespace

QString DirectoryWalker::canonicalOrEmpty(const QString& path)
{
    if (path.isEmpty()) return QString();
    return QFileInfo(path).canonicalFilePath();
}

bool DirectoryWalker::relativeTo(const QString& root, const QString& absolutePath, QString* relativeOut)
{
    const QString rel = QDir(root).relativeFilePath(absolutePath);
    if (rel.isEmpty() || rel == "." || rel.startsWith("../") || rel == ".." || QDir::isAbsolutePath(rel)) {
        return false;
    }
    *relativeOut = rel;
    return true;
}

QVector<MediaEntry> DirectoryWalker::walk(const QString& root, const Options& options,
                                          SizeTally* tally, QVector<TransferError>* issues)
{
    QVector<MediaEntry> result;

    const QString rootPath = QDir(root).absolutePath();
    const QString rootCanonical = canonicalOrEmpty(rootPath);
    if (rootCanonical.isEmpty() || !QFileInfo(rootCanonical).isDir()) {
        recordIssue(issues, TransferError::fromPath(rootPath, "Cannot access directory"));
        return result;
    }
    const QString excludeCanonical = canonicalOrEmpty(options.excludePath);

    QSet<QString> visited;
    visited.insert(rootCanonical);

    // Explicit work stack instead of recursion; pathological trees must not grow the call stack
    QVector<QString> pending;
    pending.push_back(rootPath);

    while (!pending.isEmpty()) {
        const QString current = pending.takeLast();

        QFileInfo dirInfo(current);
        if (!dirInfo.isReadable() || !dirInfo.isExecutable()) {
            recordIssue(issues, TransferError(TransferError::Kind::PermissionDenied,
                                              QString("Cannot access directory '%1'").arg(current)));
            continue;
        }

        QDir dir(current);
        if (!dir.exists()) {
            // Removed between listing its parent and visiting it
            recordIssue(issues, TransferError(TransferError::Kind::NotFound,
                                              QString("Directory vanished during scan '%1'").arg(current)));
            continue;
        }

        const QFileInfoList entries = dir.entryInfoList(kEntryFilters, QDir::Name);
        QStringList subdirs;

        for (const QFileInfo& entry : entries) {
            const QString path = entry.absoluteFilePath();

            if (entry.isDir()) {
                if (entry.isSymLink() && !options.followSymlinks) continue;

                const QString canonical = entry.canonicalFilePath();
                if (canonical.isEmpty()) {
                    recordIssue(issues, TransferError::fromPath(path, "Cannot resolve directory"));
                    continue;
                }
                if (!excludeCanonical.isEmpty() && canonical == excludeCanonical) {
                    LogManager::instance().addLog(QString("Skipping destination directory: %1").arg(path));
                    continue;
                }
                if (visited.contains(canonical)) {
                    qDebug() << "DirectoryWalker: already visited" << path << "->" << canonical;
                    continue;
                }
                visited.insert(canonical);
                subdirs.append(path);
                continue;
            }

            if (!entry.isFile()) continue; // broken links, sockets, devices
            if (!MediaClassifier::isMediaFile(entry.fileName())) continue;

            MediaEntry media;
            if (!relativeTo(rootPath, path, &media.relativePath)) {
                // Only an internal inconsistency gets here; fail this entry alone
                const TransferError err(TransferError::Kind::Other,
                                        QString("Cannot compute relative path of '%1' under '%2'").arg(path, rootPath));
                qCritical().noquote() << err.message;
                if (issues) issues->push_back(err);
                continue;
            }

            if (options.wantSize) {
                QFileInfo meta(path);
                meta.refresh();
                if (meta.exists()) {
                    media.size = meta.size();
                } else {
                    recordIssue(issues, TransferError::fromPath(path, "Cannot get file size for"));
                }
            }

            result.push_back(media);

            if (tally) {
                if (media.hasSize()) tally->bytes.fetch_add(media.size, std::memory_order_relaxed);
                tally->files.fetch_add(1, std::memory_order_relaxed);
            }
            if (options.onProgress) {
                const qint64 bytes = tally ? tally->bytes.load(std::memory_order_relaxed) : 0;
                const int files = tally ? tally->files.load(std::memory_order_relaxed) : result.size();
                options.onProgress(files, bytes);
            }
        }

        // Reverse so the first sibling by name is visited first
        for (auto it = subdirs.crbegin(); it != subdirs.crend(); ++it) {
            pending.push_back(*it);
        }
    }

    return result;
}

QStringList DirectoryWalker::collectDirectories(const QString& root, const QString& excludePath)
{
    QStringList directories;
    const QString rootPath = QDir(root).absolutePath();
    const QString excludeCanonical = canonicalOrEmpty(excludePath);

    QVector<QString> pending;
    pending.push_back(rootPath);
    while (!pending.isEmpty()) {
        const QString current = pending.takeLast();
        QFileInfo dirInfo(current);
        if (!dirInfo.isReadable() || !dirInfo.isExecutable()) {
            qWarning().noquote() << "Warning: Cannot access directory" << current;
            continue;
        }

        const QFileInfoList entries = QDir(current).entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System, QDir::Name);
        for (const QFileInfo& entry : entries) {
            // Never follow links: pruning through one would remove directories outside the tree
            if (entry.isSymLink()) continue;
            const QString path = entry.absoluteFilePath();
            if (!excludeCanonical.isEmpty() && entry.canonicalFilePath() == excludeCanonical) continue;
            directories.append(path);
            pending.push_back(path);
        }
    }
    return directories;
}

QStringList DirectoryWalker::relativePaths(const QVector<MediaEntry>& entries)
{
    QStringList paths;
    paths.reserve(entries.size());
    for (const MediaEntry& e : entries) paths.append(e.relativePath);
    return paths;
}
