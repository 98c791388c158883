#pragma once
#include "ui_prompts.h"
#include "transfer_settings.h"

// Unattended answers taken from the command line (--no-gui).
class CommandLinePrompts : public UiPrompts {
public:
    explicit CommandLinePrompts(const TransferSettings& settings) : m_settings(settings) {}

    QString pickFolder(const QString& title) override;
    bool confirmCopy(int fileCount, qint64 totalBytes, qint64 availableBytes, bool capacityKnown) override;
    bool confirmDelete(int fileCount) override;
    void notifyComplete() override;

private:
    TransferSettings m_settings;
    int m_foldersPicked = 0;
};
