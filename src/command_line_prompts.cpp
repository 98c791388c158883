#include "command_line_prompts.h"
#include "log_manager.h"
#include "utils.h"

QString CommandLinePrompts::pickFolder(const QString& title)
{
    // Folders are requested source first, then destination
    const QString folder = (m_foldersPicked++ == 0) ? m_settings.source : m_settings.destination;
    LogManager::instance().addLog(QString("%1: %2").arg(title, folder));
    return folder;
}

bool CommandLinePrompts::confirmCopy(int fileCount, qint64 totalBytes, qint64 availableBytes, bool capacityKnown)
{
    LogManager::instance().addLog(QString("Ready to copy %1 media files (%2, %3 available)")
                                  .arg(fileCount)
                                  .arg(Utils::formatBytes(quint64(totalBytes)),
                                       capacityKnown ? Utils::formatBytes(quint64(availableBytes)) : QString("unknown")));
    // The session skips this prompt under --yes, so an unattended run has no answer here
    LogManager::instance().addLog("Copy not confirmed; pass --yes to copy without a dialog", "WARN");
    return false;
}

bool CommandLinePrompts::confirmDelete(int fileCount)
{
    LogManager::instance().addLog(m_settings.deleteOriginals
                                  ? QString("Deleting %1 originals as requested by --delete-originals").arg(fileCount)
                                  : QString("Keeping %1 originals").arg(fileCount));
    return m_settings.deleteOriginals;
}

void CommandLinePrompts::notifyComplete()
{
    LogManager::instance().addLog("Done! All operations completed.");
}
