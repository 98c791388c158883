#pragma once

#include <QString>

// Decides whether a file takes part in a transfer. The classification set
// covers raster/vector images, camera RAW formats and video containers.
namespace MediaClassifier {

// `ext` is compared case-insensitively, without the leading dot.
bool isMediaExtension(const QString& ext);

// Convenience overload: classify by the suffix of a file name or path.
bool isMediaFile(const QString& path);

} // namespace MediaClassifier
