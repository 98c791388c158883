#include "media_classifier.h"

#include <QFileInfo>
#include <QSet>

namespace {

inline QString normalize(const QString& ext)
{
    QString e = ext.trimmed().toLower();
    if (e.startsWith('.')) e.remove(0, 1);
    return e;
}

const QSet<QString>& mediaExtensions()
{
    static const QSet<QString> exts = {
        // Standard image formats
        "jpg","jpeg","png","gif","bmp","tiff","tif","webp","svg","ico","heic","heif",
        // Generic RAW and Adobe DNG
        "raw","dng",
        // Canon
        "cr2","cr3","crw","1dx","1dc",
        // Nikon
        "nef","nrw",
        // Sony
        "arw","srf","sr2",
        // Olympus, Panasonic, Fujifilm
        "orf","rw2","raf",
        // Pentax
        "ptx","pef",
        // Leica
        "rwl","dcs",
        // Sigma, Mamiya
        "x3f","mef",
        // Phase One
        "iiq","cap",
        // Hasselblad
        "3fr","fff",
        // Kodak
        "dcr","k25","kdc",
        // Minolta, Samsung, Epson
        "mrw","srw","erf",
        // Other proprietary RAW formats
        "bay","bmq","cs1","dc2","drf","dsc","dxo","ia","kc2","mdc","mos",
        "mqv","ndd","obm","oti","pcd","pxn","qtk","ras","rdc","rwz","st4",
        "st5","st6","st7","st8","stx","wdp",
        // Video formats
        "mp4","avi","mkv","mov","wmv","flv","webm","m4v","3gp","3g2","f4v",
        "asf","rm","rmvb","vob","ogv","drc","mng","qt","yuv","m2v","m4p",
        "mpg","mp2","mpeg","mpe","mpv","m2ts","mts","ts",
        // Professional video formats
        "mxf","r3d","braw","prores","dnxhd","cine"
    };
    return exts;
}

} // namespace

namespace MediaClassifier {

bool isMediaExtension(const QString& ext)
{
    const QString e = normalize(ext);
    if (e.isEmpty()) return false;
    return mediaExtensions().contains(e);
}

bool isMediaFile(const QString& path)
{
    // suffix() is the part after the last dot; "archive.tar.mp4" -> "mp4"
    return isMediaExtension(QFileInfo(path).suffix());
}

} // namespace MediaClassifier
