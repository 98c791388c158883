#include "dialog_prompts.h"
#include "utils.h"

#include <QFileDialog>
#include <QMessageBox>
#include <QDir>

QString DialogPrompts::pickFolder(const QString& title)
{
    const QString dir = QFileDialog::getExistingDirectory(m_parent, title, QDir::homePath(),
                                                          QFileDialog::ShowDirsOnly | QFileDialog::DontResolveSymlinks);
    return dir;
}

bool DialogPrompts::confirmCopy(int fileCount, qint64 totalBytes, qint64 availableBytes, bool capacityKnown)
{
    const bool tooLarge = capacityKnown && totalBytes > availableBytes;
    const QString available = capacityKnown ? Utils::formatBytes(quint64(availableBytes)) : QObject::tr("unknown");

    QString text = QObject::tr("Ready to copy %1 media files\n\n"
                               "Total size to copy: %2\n"
                               "Available space on destination: %3")
                       .arg(fileCount)
                       .arg(Utils::formatBytes(quint64(totalBytes)), available);
    if (tooLarge) {
        text += QObject::tr("\n\nWARNING: Not enough disk space available!");
    }
    text += QObject::tr("\n\nDo you want to proceed with the copy operation?");

    QMessageBox box(tooLarge ? QMessageBox::Warning : QMessageBox::Question,
                    QObject::tr("Confirm Copy Operation"), text,
                    QMessageBox::Yes | QMessageBox::No, m_parent);
    box.setDefaultButton(tooLarge ? QMessageBox::No : QMessageBox::Yes);
    return box.exec() == QMessageBox::Yes;
}

bool DialogPrompts::confirmDelete(int fileCount)
{
    const QString text = QObject::tr("All %1 files have been successfully copied to the destination folder.\n\n"
                                     "Would you like to delete the original files from the source folder?\n\n"
                                     "Warning: This action cannot be undone!").arg(fileCount);
    // Default to "No" for safety
    const auto answer = QMessageBox::question(m_parent, QObject::tr("Delete Original Files"), text,
                                              QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
    return answer == QMessageBox::Yes;
}

void DialogPrompts::notifyComplete()
{
    QMessageBox::information(m_parent, QObject::tr("Process Complete"),
                             QObject::tr("Done! All operations completed successfully."));
}
