#include "path_validator.h"
#include "log_manager.h"

#include <QFileInfo>
#include <QDir>
#include <QDebug>

namespace {

bool canonicalize(const QString& path, const QString& side, QString* out, TransferError* errorOut)
{
    const QFileInfo fi(path);
    const QString canonical = fi.canonicalFilePath();
    if (path.isEmpty() || canonical.isEmpty()) {
        qWarning().noquote() << QString("Warning: Cannot access %1 folder '%2'").arg(side, path);
        setError(errorOut, TransferError::Kind::NotFound, QString("Unable to access %1 folder").arg(side));
        return false;
    }
    if (!QFileInfo(canonical).isDir()) {
        setError(errorOut, TransferError::Kind::NotFound, QString("The %1 '%2' is not a folder").arg(side, path));
        return false;
    }
    *out = canonical;
    return true;
}

} // namespace

bool PathValidator::isSameOrAncestor(const QString& ancestor, const QString& path)
{
    if (ancestor == path) return true;
    // Compare whole components so "/data/photos" is not an ancestor of "/data/photos2"
    const QString prefix = ancestor.endsWith('/') ? ancestor : ancestor + '/';
    return path.startsWith(prefix);
}

bool PathValidator::validate(const QString& source, const QString& destination,
                             TransferRoots* rootsOut, TransferError* errorOut)
{
    TransferRoots roots;
    if (!canonicalize(source, "source", &roots.source, errorOut)) return false;
    if (!canonicalize(destination, "destination", &roots.destination, errorOut)) return false;

    if (roots.source == roots.destination) {
        setError(errorOut, TransferError::Kind::InvalidRelationship,
                 "Source and destination folders cannot be the same");
        return false;
    }

    if (isSameOrAncestor(roots.destination, roots.source)) {
        setError(errorOut, TransferError::Kind::InvalidRelationship,
                 "Source folder cannot be within the destination folder");
        return false;
    }

    if (isSameOrAncestor(roots.source, roots.destination)) {
        roots.destinationInsideSource = true;
        LogManager::instance().addLog("Warning: Destination folder is within the source folder.", "WARN");
        LogManager::instance().addLog("Files from the destination folder will be skipped to prevent infinite recursion.", "WARN");
    }

    if (rootsOut) *rootsOut = roots;
    return true;
}
