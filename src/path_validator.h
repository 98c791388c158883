#pragma once
#include <QString>

#include "transfer_error.h"

// Canonical source/destination pair accepted by PathValidator.
struct TransferRoots {
    QString source;                      // canonical, symlinks resolved
    QString destination;                 // canonical, symlinks resolved
    bool destinationInsideSource = false; // the walk must exclude `destination`
};

class PathValidator {
public:
    // Reject relationships that would make a run read its own output:
    // equal folders, or a destination that contains the source.
    // A destination nested inside the source is accepted and flagged.
    static bool validate(const QString& source, const QString& destination,
                         TransferRoots* rootsOut = nullptr, TransferError* errorOut = nullptr);

    // True when `ancestor` equals `path` or is one of its parent directories.
    // Both must already be canonical.
    static bool isSameOrAncestor(const QString& ancestor, const QString& path);
};
