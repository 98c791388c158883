#pragma once
#include <QString>

#include "transfer_error.h"

/**
 * UniquePath - collision-safe destination paths
 *
 * Leaf files are never overwritten: an occupied name gets a counter suffix.
 * Directories are shared between runs and are reused, never renamed.
 *
 * The existence check is not atomic with the later create. Destination trees are
 * assumed private to this process during a run; a second writer to the same
 * names can still collide.
 */
namespace UniquePath {

constexpr int kMaxAttempts = 10000;

/**
 * Return `candidate` if nothing exists there, otherwise the first free
 * "stem_N.ext" (or "stem_N") in the same directory, N counting from 1.
 *
 * @param candidate   Desired destination file path
 * @param errorOut    Receives Exhausted when `maxAttempts` suffixes are all taken
 * @param maxAttempts Upper bound on the counter
 * @return The free path, or an empty string on exhaustion
 */
QString uniqueFilePath(const QString& candidate, TransferError* errorOut = nullptr, int maxAttempts = kMaxAttempts);

/**
 * Make sure `targetDir` exists below `destRoot`.
 *
 * A missing target is created with its whole chain in one step. For an existing
 * target the components relative to `destRoot` are walked one at a time, reusing
 * each existing segment and creating only the missing ones.
 *
 * @return false with `errorOut` filled when a segment cannot be created or
 *         `targetDir` is not below `destRoot`
 */
bool ensureDirectoryPath(const QString& destRoot, const QString& targetDir, TransferError* errorOut = nullptr);

// Split a file name into stem and extension the way the suffix counter needs it.
// ".hidden" has no extension; "a.tar.gz" -> ("a.tar", "gz").
void splitFileName(const QString& fileName, QString* stem, QString* extension, bool* hasDot);

} // namespace UniquePath
