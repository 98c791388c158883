#include <QApplication>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <memory>
#include <cstdio>
#include "log_manager.h"
#include "platform_session.h"
#include "transfer_settings.h"
#include "transfer_session.h"
#include "dialog_prompts.h"
#include "command_line_prompts.h"

namespace {

bool wantsGui(int argc, char *argv[])
{
    for (int i = 1; i < argc; ++i) {
        if (qstrcmp(argv[i], "--no-gui") == 0) return false;
    }
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    // Platform state for the native dialogs; taken before any UI or file-system work
    // and held for the whole run
    PlatformSession platform;

    // Dialogs need a QApplication; unattended runs work without a display
    std::unique_ptr<QCoreApplication> app;
    if (wantsGui(argc, argv)) {
        app = std::make_unique<QApplication>(argc, argv);
    } else {
        app = std::make_unique<QCoreApplication>(argc, argv);
    }

    QCoreApplication::setOrganizationName("MediaMover");
    QCoreApplication::setOrganizationDomain("mediamover.local");
    QCoreApplication::setApplicationName("MediaMover");
    QCoreApplication::setApplicationVersion("0.1.0");

    TransferSettings settings = TransferSettings::loadDefaults();
    QString parseError;
    QString help;
    switch (TransferSettings::parse(QCoreApplication::arguments(), &settings, &parseError, &help)) {
        case TransferSettings::ParseResult::Ok:
            break;
        case TransferSettings::ParseResult::HelpRequested:
            fprintf(stdout, "%s\n", help.toLocal8Bit().constData());
            return 0;
        case TransferSettings::ParseResult::VersionRequested:
            fprintf(stdout, "%s %s\n", qPrintable(QCoreApplication::applicationName()),
                    qPrintable(QCoreApplication::applicationVersion()));
            return 0;
        case TransferSettings::ParseResult::Error:
            // Reported, not crashed on
            fprintf(stderr, "Error: %s\n\n%s\n", parseError.toLocal8Bit().constData(), help.toLocal8Bit().constData());
            return 0;
    }

    // Route qDebug/qWarning/qCritical through the LogManager (console + log file)
    if (!settings.logFile.isEmpty() && !LogManager::instance().setLogFile(settings.logFile)) {
        fprintf(stderr, "Warning: cannot write log file %s\n", settings.logFile.toLocal8Bit().constData());
    }
    qInstallMessageHandler(customMessageHandler);
    LogManager::instance().addLog("[MAIN] Application started; log=" + LogManager::instance().logFile());

    std::unique_ptr<UiPrompts> prompts;
    if (settings.interactive) {
        prompts = std::make_unique<DialogPrompts>();
    } else {
        prompts = std::make_unique<CommandLinePrompts>(settings);
    }

    TransferSession session(*prompts, settings);
    const TransferSession::Result result = session.run();

    LogManager::instance().addLog(QString("[MAIN] Finished in phase %1").arg(TransferSession::phaseName(result.finalPhase)));
    LogManager::instance().flush();

    // Failures are reported above; the process still ends normally
    return 0;
}
