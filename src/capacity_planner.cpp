#include "capacity_planner.h"
#include "log_manager.h"
#include "utils.h"

#include <QStorageInfo>

qint64 CapacityPlanner::availableCapacity(const QString& path, TransferError* errorOut)
{
    QStorageInfo storage(path);
    if (!storage.isValid() || !storage.isReady()) {
        setError(errorOut, TransferError::Kind::CapacityUnknown,
                 QString("Cannot query free space for '%1'").arg(path));
        return -1;
    }
    const qint64 available = storage.bytesAvailable();
    if (available < 0) {
        setError(errorOut, TransferError::Kind::CapacityUnknown,
                 QString("Free space for '%1' is not reported by the file system").arg(path));
        return -1;
    }
    return available;
}

CapacityPlan CapacityPlanner::plan(const QString& destination, int fileCount, qint64 totalBytes)
{
    CapacityPlan p;
    p.fileCount = fileCount;
    p.totalBytes = totalBytes;

    TransferError err;
    p.availableBytes = availableCapacity(destination, &err);
    p.capacityKnown = p.availableBytes >= 0;

    if (!p.capacityKnown) {
        LogManager::instance().addLog(QString("Warning: %1; skipping the space check").arg(err.message), "WARN");
    } else if (!p.fits()) {
        LogManager::instance().addLog(QString("Warning: Not enough disk space available (%1 needed, %2 free)")
                                      .arg(Utils::formatBytes(quint64(p.totalBytes)), Utils::formatBytes(quint64(p.availableBytes))), "WARN");
    }
    return p;
}
