#ifndef PROGRESS_MANAGER_H
#define PROGRESS_MANAGER_H

#include <QObject>
#include <QString>
#include <QMutex>
#include <QElapsedTimer>

// Phase progress shared by the scan, copy and delete phases.
// update()/increment() may be called from worker threads.
class ProgressManager : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool isActive READ isActive NOTIFY isActiveChanged)
    Q_PROPERTY(QString message READ message NOTIFY messageChanged)
    Q_PROPERTY(int current READ current NOTIFY currentChanged)
    Q_PROPERTY(int total READ total NOTIFY totalChanged)
    Q_PROPERTY(int percentage READ percentage NOTIFY currentChanged)

public:
    static ProgressManager& instance() {
        static ProgressManager inst;
        return inst;
    }

    bool isActive() const;
    QString message() const;
    int current() const;
    int total() const;
    int percentage() const;

    // total == 0 means open-ended (scanning)
    Q_INVOKABLE void start(const QString& message, int total = 0);
    Q_INVOKABLE void update(int current, const QString& message = QString());
    // Returns the new count; used for "(n/total)" lines from workers
    int increment();
    Q_INVOKABLE void finish();

    // Minimum interval between progress log lines
    void setLogInterval(int ms) { m_logIntervalMs = ms; }

signals:
    void isActiveChanged();
    void messageChanged();
    void currentChanged(int current, int total);
    void totalChanged();

private:
    explicit ProgressManager(QObject* parent = nullptr);
    void maybeLogLocked(bool force);

    bool m_isActive = false;
    QString m_message;
    int m_current = 0;
    int m_total = 0;
    int m_logIntervalMs = 250;
    QElapsedTimer m_sinceLog;
    mutable QMutex m_mutex;
};

#endif // PROGRESS_MANAGER_H
