#ifndef LOG_MANAGER_H
#define LOG_MANAGER_H

#include <QObject>
#include <QStringList>
#include <QMutex>
#include <QDateTime>
#include <QFile>
#include <QTextStream>

class LogManager : public QObject {
    Q_OBJECT
    Q_PROPERTY(QStringList logs READ logs NOTIFY logsChanged)

public:
    static LogManager& instance() {
        static LogManager inst;
        return inst;
    }

    ~LogManager() override;

    QStringList logs() const;

    // Redirect the write-through log. An empty path disables the file sink.
    bool setLogFile(const QString& path);
    QString logFile() const;

    // Safe to call from transfer worker threads.
    Q_INVOKABLE void addLog(const QString& message, const QString& level = "INFO");
    Q_INVOKABLE void clear();
    void flush();

    // Also echo entries to stderr (on by default for the console build).
    void setEchoToStderr(bool echo) { m_echo = echo; }

signals:
    void logsChanged();
    void logAdded(const QString& message);

private:
    explicit LogManager(QObject* parent = nullptr);
    bool shouldFlushImmediately(const QString& level) const;
    void openFileLocked(const QString& path);

    QStringList m_logs;
    mutable QMutex m_mutex;
    QFile m_file;
    QTextStream m_ts;
    int m_unflushed = 0;
    bool m_echo = true;
    static constexpr int MAX_LOGS = 1000;
    static constexpr int FLUSH_EVERY = 32;
};

// Custom message handler for qDebug/qWarning/qCritical
void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

#endif // LOG_MANAGER_H
