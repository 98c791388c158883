#include "log_manager.h"
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QCoreApplication>

#include <cstdio>

LogManager::LogManager(QObject* parent) : QObject(parent) {
    // Default sink: mediamover.log next to the executable (before QCoreApplication exists, use cwd)
    const QString dir = QCoreApplication::instance() ? QCoreApplication::applicationDirPath() : QDir::currentPath();
    QMutexLocker locker(&m_mutex);
    openFileLocked(dir + "/mediamover.log");
}

LogManager::~LogManager() {
    flush();
}

QStringList LogManager::logs() const {
    QMutexLocker locker(&m_mutex);
    return m_logs;
}

QString LogManager::logFile() const {
    QMutexLocker locker(&m_mutex);
    return m_file.fileName();
}

void LogManager::openFileLocked(const QString& path) {
    if (m_ts.device()) {
        m_ts.flush();
        m_ts.setDevice(nullptr);
    }
    if (m_file.isOpen()) m_file.close();
    m_unflushed = 0;
    if (path.isEmpty()) {
        m_file.setFileName(QString());
        return;
    }

    m_file.setFileName(path);
    QDir().mkpath(QFileInfo(path).absolutePath());
    if (m_file.open(QIODevice::Append | QIODevice::Text)) {
        m_ts.setDevice(&m_file);
        m_ts << "\n--- session start ---\n";
        m_ts.flush();
    } else {
        fprintf(stderr, "Cannot open log file %s: %s\n",
                path.toLocal8Bit().constData(),
                m_file.errorString().toLocal8Bit().constData());
    }
}

bool LogManager::setLogFile(const QString& path) {
    QMutexLocker locker(&m_mutex);
    openFileLocked(path);
    return path.isEmpty() || m_ts.device() != nullptr;
}

void LogManager::addLog(const QString& message, const QString& level) {
    QString logEntry;
    {
        QMutexLocker locker(&m_mutex);
        QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
        logEntry = QString("[%1] [%2] %3").arg(timestamp, level, message);
        m_logs.append(logEntry);
        if (m_logs.size() > MAX_LOGS) {
            m_logs.removeFirst();
        }

        // Write-through to disk log; warnings and errors are flushed right away
        if (m_ts.device()) {
            m_ts << logEntry << '\n';
            if (shouldFlushImmediately(level) || ++m_unflushed >= FLUSH_EVERY) {
                m_ts.flush();
                m_unflushed = 0;
            }
        }

        if (m_echo) {
            fprintf(stderr, "%s\n", logEntry.toLocal8Bit().constData());
            fflush(stderr);
        }
    } // unlock before emitting signals

    emit logsChanged();
    emit logAdded(logEntry);
}

void LogManager::flush() {
    QMutexLocker locker(&m_mutex);
    if (m_ts.device()) {
        m_ts.flush();
    }
    m_unflushed = 0;
}

bool LogManager::shouldFlushImmediately(const QString& level) const {
    const QString upper = level.toUpper();
    return upper == "WARN" || upper == "ERROR" || upper == "FATAL";
}

void LogManager::clear() {
    {
        QMutexLocker locker(&m_mutex);
        m_logs.clear();
    }
    emit logsChanged();
}

void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    Q_UNUSED(context);
    QString level;
    switch (type) {
        case QtDebugMsg:
            level = "DEBUG";
            break;
        case QtInfoMsg:
            level = "INFO";
            break;
        case QtWarningMsg:
            level = "WARN";
            break;
        case QtCriticalMsg:
            level = "ERROR";
            break;
        case QtFatalMsg:
            level = "FATAL";
            break;
    }

    // Workers log while the main thread blocks on the phase barrier, so log synchronously
    LogManager::instance().addLog(msg, level);

    if (type == QtFatalMsg) {
        LogManager::instance().flush();
        abort();
    }
}
