#include "transfer_error.h"

#include <QFileDevice>
#include <QFileInfo>

QString TransferError::kindToString(Kind kind)
{
    switch (kind) {
        case Kind::None: return "None";
        case Kind::NotFound: return "NotFound";
        case Kind::InvalidRelationship: return "InvalidRelationship";
        case Kind::PermissionDenied: return "PermissionDenied";
        case Kind::Exhausted: return "Exhausted";
        case Kind::CapacityUnknown: return "CapacityUnknown";
        case Kind::Other: return "Other";
    }
    return "";
}

QString TransferError::toString() const
{
    if (message.isEmpty()) return kindToString(kind);
    return QString("%1: %2").arg(kindToString(kind), message);
}

TransferError TransferError::fromFile(const QFileDevice& file, const QString& path, const QString& what)
{
    const QString detail = QString("%1 '%2': %3").arg(what, path, file.errorString());
    if (file.error() == QFileDevice::PermissionsError) {
        return TransferError(Kind::PermissionDenied, detail);
    }
    TransferError err = fromPath(path, what);
    err.message = detail;
    return err;
}

TransferError TransferError::fromPath(const QString& path, const QString& what)
{
    QFileInfo fi(path);
    if (!fi.exists() && !fi.isSymLink()) {
        return TransferError(Kind::NotFound, QString("%1 '%2': no such file or directory").arg(what, path));
    }
    // Existing entries that cannot be read are the common consumer-device case (locked files)
    if (!fi.isReadable()) {
        return TransferError(Kind::PermissionDenied, QString("%1 '%2': permission denied").arg(what, path));
    }
    return TransferError(Kind::Other, QString("%1 '%2' failed").arg(what, path));
}
