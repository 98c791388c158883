#pragma once
#include <QtGlobal>
#include <QString>

namespace Utils {

// Human-readable byte count: 1024 per step over B, KB, MB, GB, TB.
// Whole bytes print without decimals ("512 B"), larger units with two ("1.50 MB").
inline QString formatBytes(quint64 bytes) {
    static const char* const units[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr int unitCount = int(sizeof(units) / sizeof(units[0]));
    if (bytes == 0) return QStringLiteral("0 B");

    int unit = 0;
    double size = double(bytes);
    while (size >= 1024.0 && unit < unitCount - 1) {
        size /= 1024.0;
        ++unit;
    }
    if (unit == 0) return QString("%1 B").arg(bytes);
    return QString("%1 %2").arg(size, 0, 'f', 2).arg(QLatin1String(units[unit]));
}

// Number of components in a path, used to order directories deepest first.
inline int pathDepth(const QString& path) {
    return path.split('/', Qt::SkipEmptyParts).size();
}

} // namespace Utils
