#pragma once
#include <QString>
#include <QStringList>

// Run configuration. Defaults come from QSettings (read-only, never written);
// command-line options override them.
struct TransferSettings {
    enum class ParseResult { Ok, Error, HelpRequested, VersionRequested };

    QString source;
    QString destination;
    int threads = 0;              // 0 = QThread::idealThreadCount()
    bool interactive = true;      // false: answer prompts from the options below
    bool assumeYes = false;       // confirm the copy without asking
    bool deleteOriginals = false; // non-interactive answer to the deletion prompt
    QString logFile;              // empty = LogManager default

    static TransferSettings loadDefaults();

    // `arguments` includes the program name, as QCoreApplication::arguments().
    // On Error, `errorOut` names the offending option.
    static ParseResult parse(const QStringList& arguments, TransferSettings* settings,
                             QString* errorOut = nullptr, QString* helpOut = nullptr);
};
