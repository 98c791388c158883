#pragma once
#include <QString>
#include <QtGlobal>

// User decisions that gate the phase transitions of a transfer session.
// Called on the main thread only, never while a parallel phase is running.
class UiPrompts {
public:
    virtual ~UiPrompts() = default;

    // Empty string when the user cancelled.
    virtual QString pickFolder(const QString& title) = 0;
    // `availableBytes` is meaningless when `capacityKnown` is false.
    virtual bool confirmCopy(int fileCount, qint64 totalBytes, qint64 availableBytes, bool capacityKnown) = 0;
    virtual bool confirmDelete(int fileCount) = 0;
    virtual void notifyComplete() = 0;
};
