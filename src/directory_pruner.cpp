#include "directory_pruner.h"
#include "directory_walker.h"
#include "log_manager.h"
#include "utils.h"

#include <QDir>
#include <QDebug>

#include <algorithm>

int DirectoryPruner::pruneEmptyDirectories(const QString& root, const QString& excludePath)
{
    const QString rootPath = QDir(root).absolutePath();
    QStringList directories = DirectoryWalker::collectDirectories(rootPath, excludePath);

    // Deepest first: children are always attempted before their parents
    std::stable_sort(directories.begin(), directories.end(), [](const QString& a, const QString& b) {
        return Utils::pathDepth(a) > Utils::pathDepth(b);
    });

    int removed = 0;
    QDir fs;
    for (const QString& dir : directories) {
        if (dir == rootPath) continue;
        // rmdir only succeeds on empty directories; everything else stays
        if (fs.rmdir(dir)) {
            ++removed;
            LogManager::instance().addLog(QString("Removed empty directory: %1").arg(dir));
        } else {
            qDebug() << "DirectoryPruner: kept" << dir;
        }
    }
    return removed;
}
