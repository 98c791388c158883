#include "transfer_settings.h"

#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QSettings>
#include <QCoreApplication>

TransferSettings TransferSettings::loadDefaults()
{
    TransferSettings s;
    QSettings settings("MediaMover", "MediaMover");
    s.threads = qMax(0, settings.value("Transfer/Threads", 0).toInt());
    s.logFile = settings.value("Logging/File", QString()).toString();
    return s;
}

TransferSettings::ParseResult TransferSettings::parse(const QStringList& arguments, TransferSettings* settings,
                                                      QString* errorOut, QString* helpOut)
{
    QCommandLineParser parser;
    parser.setApplicationDescription("Copy image and video files from one folder tree to another, "
                                     "optionally deleting the originals afterwards.");
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();

    const QCommandLineOption sourceOption({"s", "source"}, "Folder to copy media files from.", "dir");
    const QCommandLineOption destinationOption({"d", "destination"}, "Folder to copy media files into.", "dir");
    const QCommandLineOption threadsOption({"j", "threads"}, "Parallel workers (0 = one per CPU).", "n");
    const QCommandLineOption yesOption({"y", "yes"}, "Start copying without asking for confirmation.");
    const QCommandLineOption deleteOption("delete-originals", "Delete the originals after copying (with --no-gui).");
    const QCommandLineOption noGuiOption("no-gui", "Do not show dialogs; take every answer from the options.");
    const QCommandLineOption logFileOption("log-file", "Write the log to this file.", "path");
    parser.addOptions({sourceOption, destinationOption, threadsOption, yesOption,
                       deleteOption, noGuiOption, logFileOption});

    // helpText() reads the executable name from the application object
    if (helpOut && QCoreApplication::instance()) *helpOut = parser.helpText();

    if (!parser.parse(arguments)) {
        if (errorOut) *errorOut = parser.errorText();
        return ParseResult::Error;
    }
    if (parser.isSet(helpOption)) return ParseResult::HelpRequested;
    if (parser.isSet(versionOption)) return ParseResult::VersionRequested;

    if (!parser.positionalArguments().isEmpty()) {
        if (errorOut) *errorOut = QString("Unexpected argument: %1").arg(parser.positionalArguments().first());
        return ParseResult::Error;
    }

    TransferSettings s = *settings;
    if (parser.isSet(sourceOption)) s.source = parser.value(sourceOption);
    if (parser.isSet(destinationOption)) s.destination = parser.value(destinationOption);
    if (parser.isSet(threadsOption)) {
        bool ok = false;
        const int n = parser.value(threadsOption).toInt(&ok);
        if (!ok || n < 0) {
            if (errorOut) *errorOut = QString("Invalid thread count: %1").arg(parser.value(threadsOption));
            return ParseResult::Error;
        }
        s.threads = n;
    }
    if (parser.isSet(yesOption)) s.assumeYes = true;
    if (parser.isSet(deleteOption)) s.deleteOriginals = true;
    if (parser.isSet(noGuiOption)) s.interactive = false;
    if (parser.isSet(logFileOption)) s.logFile = parser.value(logFileOption);

    if (!s.interactive && (s.source.isEmpty() || s.destination.isEmpty())) {
        if (errorOut) *errorOut = "--no-gui requires both --source and --destination";
        return ParseResult::Error;
    }

    *settings = s;
    return ParseResult::Ok;
}
