#pragma once
#include <QString>
#include <QMetaType>

class QFileDevice;

// Classified failure reported by the transfer engine and its helpers.
// Functions return bool and fill an optional TransferError* out-parameter.
struct TransferError {
    enum class Kind { None, NotFound, InvalidRelationship, PermissionDenied, Exhausted, CapacityUnknown, Other };

    Kind kind = Kind::None;
    QString message;

    TransferError() = default;
    TransferError(Kind k, const QString& msg) : kind(k), message(msg) {}

    bool isError() const { return kind != Kind::None; }
    QString toString() const;

    static QString kindToString(Kind kind);

    // Map a failed QFile/QFileDevice operation on `path` to a Kind.
    static TransferError fromFile(const QFileDevice& file, const QString& path, const QString& what);

    // Map a failed operation on `path` without a device (rename, rmdir, mkdir).
    static TransferError fromPath(const QString& path, const QString& what);
};

// Convenience for the `if (errorOut) *errorOut = ...` pattern.
inline void setError(TransferError* out, TransferError::Kind kind, const QString& message)
{
    if (out) *out = TransferError(kind, message);
}

inline void setError(TransferError* out, const TransferError& err)
{
    if (out) *out = err;
}

Q_DECLARE_METATYPE(TransferError)
