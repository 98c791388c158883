#pragma once
#include <QString>
#include <QtGlobal>

#include "transfer_error.h"

// Inputs for the go/no-go copy confirmation.
struct CapacityPlan {
    int fileCount = 0;
    qint64 totalBytes = 0;
    qint64 availableBytes = -1;   // -1 when the volume could not be queried
    bool capacityKnown = false;

    // Unknown capacity counts as unlimited
    bool fits() const { return !capacityKnown || totalBytes <= availableBytes; }
};

class CapacityPlanner {
public:
    // Free bytes available to this user on the volume holding `path`.
    // Returns -1 and fills CapacityUnknown when the platform query fails.
    static qint64 availableCapacity(const QString& path, TransferError* errorOut = nullptr);

    // Combine the scan totals with the destination volume's free space.
    // A failed capacity query is logged as a warning, never an error.
    static CapacityPlan plan(const QString& destination, int fileCount, qint64 totalBytes);
};
