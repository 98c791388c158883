#include "unique_path.h"

#include <QDir>
#include <QFileInfo>
#include <QDebug>

namespace {

inline bool occupied(const QString& path)
{
    // A dangling symlink still occupies the name
    QFileInfo fi(path);
    return fi.exists() || fi.isSymLink();
}

} // namespace

namespace UniquePath {

void splitFileName(const QString& fileName, QString* stem, QString* extension, bool* hasDot)
{
    const int dot = fileName.lastIndexOf('.');
    if (dot <= 0) {
        *stem = fileName;
        extension->clear();
        *hasDot = false;
        return;
    }
    *stem = fileName.left(dot);
    *extension = fileName.mid(dot + 1);
    *hasDot = true;
}

QString uniqueFilePath(const QString& candidate, TransferError* errorOut, int maxAttempts)
{
    if (!occupied(candidate)) {
        return candidate;
    }

    const QFileInfo fi(candidate);
    const QDir parent = fi.dir();
    QString stem, ext;
    bool hasDot = false;
    splitFileName(fi.fileName(), &stem, &ext, &hasDot);
    if (stem.isEmpty()) stem = QStringLiteral("file");

    for (int counter = 1; counter <= maxAttempts; ++counter) {
        const QString name = hasDot ? QString("%1_%2.%3").arg(stem).arg(counter).arg(ext)
                                    : QString("%1_%2").arg(stem).arg(counter);
        const QString path = parent.filePath(name);
        if (!occupied(path)) {
            return path;
        }
    }

    setError(errorOut, TransferError::Kind::Exhausted,
             QString("Could not find unique filename for '%1' after %2 attempts").arg(candidate).arg(maxAttempts));
    return QString();
}

bool ensureDirectoryPath(const QString& destRoot, const QString& targetDir, TransferError* errorOut)
{
    // Whole-component test: "..photos" is a folder name, "../photos" leaves the root
    const QString relative = QDir(destRoot).relativeFilePath(targetDir);
    if (relative == ".." || relative.startsWith("../") || QDir::isAbsolutePath(relative)) {
        setError(errorOut, TransferError::Kind::InvalidRelationship,
                 QString("'%1' is not inside '%2'").arg(targetDir, destRoot));
        return false;
    }

    if (!occupied(targetDir)) {
        if (!QDir().mkpath(targetDir)) {
            setError(errorOut, TransferError::fromPath(QFileInfo(targetDir).absolutePath(), "Cannot create directory under"));
            qWarning().noquote() << "Warning: Cannot create directory" << targetDir;
            return false;
        }
        return true;
    }

    if (relative == ".") {
        return true;
    }

    QString current = QDir(destRoot).absolutePath();
    const QStringList parts = relative.split('/', Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        const QString next = current + '/' + part;
        QFileInfo nfi(next);
        if (nfi.exists()) {
            if (!nfi.isDir()) {
                setError(errorOut, TransferError::Kind::Other,
                         QString("'%1' exists and is not a directory").arg(next));
                return false;
            }
            // Existing directories are shared, not renamed
            current = next;
            continue;
        }
        // Another worker may create the same segment in between; that is success too
        if (!QDir().mkdir(next) && !QFileInfo(next).isDir()) {
            setError(errorOut, TransferError::fromPath(current, "Cannot create directory in"));
            qWarning().noquote() << "Warning: Cannot create directory" << next;
            return false;
        }
        current = next;
    }
    return true;
}

} // namespace UniquePath
