#pragma once
#include <QString>

// Best-effort removal of directories left empty after originals were deleted.
class DirectoryPruner {
public:
    // Remove every empty directory below `root`, deepest first, so a parent
    // emptied by its children's removal goes too. `root` itself always survives.
    // Non-empty or locked directories are skipped silently; nothing here fails
    // the enclosing run. Returns the number of directories removed.
    static int pruneEmptyDirectories(const QString& root, const QString& excludePath = QString());
};
