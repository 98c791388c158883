#include "transfer_session.h"
#include "ui_prompts.h"
#include "path_validator.h"
#include "directory_walker.h"
#include "capacity_planner.h"
#include "log_manager.h"
#include "progress_manager.h"
#include "utils.h"

#include <QMetaEnum>
#include <QDebug>

TransferSession::TransferSession(UiPrompts& prompts, const TransferSettings& settings, QObject* parent)
    : QObject(parent), m_prompts(prompts), m_settings(settings)
{
    m_engine.setMaxThreads(m_settings.threads);
    // Emitted from the calling thread inside deleteOriginals()
    connect(&m_engine, &TransferEngine::pruningStarted, this, [this]{ setPhase(Phase::Pruning); }, Qt::DirectConnection);
}

QString TransferSession::phaseName(Phase phase)
{
    return QString::fromLatin1(QMetaEnum::fromType<Phase>().valueToKey(int(phase)));
}

void TransferSession::setPhase(Phase phase)
{
    if (m_phase == phase) return;
    m_phase = phase;
    qDebug() << "TransferSession: phase" << phaseName(phase);
    emit phaseChanged(phase);
}

TransferSession::Result TransferSession::finish(Result& result, Phase phase)
{
    setPhase(phase);
    result.finalPhase = phase;
    return result;
}

TransferSession::Result TransferSession::fail(Result& result, const TransferError& error)
{
    LogManager::instance().addLog(QString("Error: %1").arg(error.message), "ERROR");
    result.error = error;
    return finish(result, Phase::Failed);
}

TransferSession::Result TransferSession::run()
{
    Result result;
    auto& log = LogManager::instance();

    QString source = m_settings.source;
    if (source.isEmpty()) {
        log.addLog("Select source folder:");
        source = m_prompts.pickFolder("Select Source Folder");
        if (source.isEmpty()) {
            log.addLog("No source selected.");
            return finish(result, Phase::Done);
        }
    }
    QString destination = m_settings.destination;
    if (destination.isEmpty()) {
        destination = m_prompts.pickFolder("Select Destination Folder");
        if (destination.isEmpty()) {
            log.addLog("No destination selected.");
            return finish(result, Phase::Done);
        }
    }
    log.addLog(QString("Source: %1").arg(source));
    log.addLog(QString("Destination: %1").arg(destination));

    TransferRoots roots;
    TransferError error;
    if (!PathValidator::validate(source, destination, &roots, &error)) {
        return fail(result, error);
    }
    result.source = roots.source;
    result.destination = roots.destination;
    const QString exclude = roots.destinationInsideSource ? roots.destination : QString();

    // Scan and size in one pass
    setPhase(Phase::Scanning);
    log.addLog("Scanning for media files and calculating total size...");
    SizeTally tally;
    DirectoryWalker::Options options;
    options.excludePath = exclude;
    options.wantSize = true;
    options.onProgress = [](int files, qint64) { ProgressManager::instance().update(files); };
    ProgressManager::instance().start("Files found");
    const QVector<MediaEntry> entries = DirectoryWalker::walk(roots.source, options, &tally);
    ProgressManager::instance().finish();

    result.discovered = entries.size();
    result.totalBytes = tally.bytes.load(std::memory_order_relaxed);
    if (entries.isEmpty()) {
        log.addLog("No media files found in the source directory.");
        return finish(result, Phase::Done);
    }
    log.addLog(QString("Found %1 media files, total %2").arg(result.discovered).arg(Utils::formatBytes(quint64(result.totalBytes))));

    const CapacityPlan plan = CapacityPlanner::plan(roots.destination, result.discovered, result.totalBytes);
    if (m_settings.assumeYes) {
        // --yes answers the copy confirmation in dialog and unattended runs alike
        log.addLog(QString("Copy confirmed by --yes: %1 files, %2")
                   .arg(plan.fileCount).arg(Utils::formatBytes(quint64(plan.totalBytes))));
        result.copyConfirmed = true;
    } else {
        result.copyConfirmed = m_prompts.confirmCopy(plan.fileCount, plan.totalBytes, plan.availableBytes, plan.capacityKnown);
    }
    if (!result.copyConfirmed) {
        log.addLog("Copy operation cancelled by user.");
        return finish(result, Phase::Done);
    }

    setPhase(Phase::Copying);
    log.addLog("Copying image and video files...");
    result.copy = m_engine.copyFiles(roots.source, roots.destination, DirectoryWalker::relativePaths(entries));
    log.addLog(QString("Successfully copied %1 files!").arg(result.copy.succeeded));

    if (result.copy.succeeded > 0) {
        if (!result.copy.allSucceeded()) {
            // The delete phase re-scans the source and would remove files that have no copy
            log.addLog(QString("Original files kept: %1 files could not be copied.").arg(result.copy.failed), "WARN");
        } else {
            setPhase(Phase::ConfirmDelete);
            result.deleteConfirmed = m_prompts.confirmDelete(result.copy.succeeded);
            if (result.deleteConfirmed) {
                setPhase(Phase::Deleting);
                log.addLog("Deleting original files...");
                result.removal = m_engine.deleteOriginals(roots.source, exclude);
                log.addLog(QString("Successfully deleted %1 original files!").arg(result.removal.succeeded));
                if (result.removal.prunedDirectories > 0) {
                    log.addLog(QString("Removed %1 empty directories.").arg(result.removal.prunedDirectories));
                }
            } else {
                log.addLog("Original files kept as requested.");
            }
        }
    }

    m_prompts.notifyComplete();
    return finish(result, Phase::Done);
}
