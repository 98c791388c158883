#pragma once
#include "ui_prompts.h"

class QWidget;

// Native folder pickers and message boxes.
class DialogPrompts : public UiPrompts {
public:
    explicit DialogPrompts(QWidget* parent = nullptr) : m_parent(parent) {}

    QString pickFolder(const QString& title) override;
    bool confirmCopy(int fileCount, qint64 totalBytes, qint64 availableBytes, bool capacityKnown) override;
    bool confirmDelete(int fileCount) override;
    void notifyComplete() override;

private:
    QWidget* m_parent;
};
