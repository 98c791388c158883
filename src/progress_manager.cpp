#include "progress_manager.h"
#include <QDebug>
#include <QMutexLocker>
#include "log_manager.h"

ProgressManager::ProgressManager(QObject* parent) : QObject(parent) {
}

bool ProgressManager::isActive() const {
    QMutexLocker locker(&m_mutex);
    return m_isActive;
}

QString ProgressManager::message() const {
    QMutexLocker locker(&m_mutex);
    return m_message;
}

int ProgressManager::current() const {
    QMutexLocker locker(&m_mutex);
    return m_current;
}

int ProgressManager::total() const {
    QMutexLocker locker(&m_mutex);
    return m_total;
}

int ProgressManager::percentage() const {
    QMutexLocker locker(&m_mutex);
    return m_total > 0 ? int(qint64(m_current) * 100 / m_total) : 0;
}

void ProgressManager::start(const QString& message, int total) {
    {
        QMutexLocker locker(&m_mutex);
        m_isActive = true;
        m_message = message;
        m_current = 0;
        m_total = total;
        m_sinceLog.start();
    }

    LogManager::instance().addLog(total > 0 ? QString("%1 (%2)").arg(message).arg(total) : message);

    emit isActiveChanged();
    emit messageChanged();
    emit totalChanged();
    emit currentChanged(0, total);
}

void ProgressManager::update(int current, const QString& message) {
    int total = 0;
    bool messageUpdated = false;
    {
        QMutexLocker locker(&m_mutex);
        m_current = current;
        total = m_total;
        if (!message.isEmpty() && message != m_message) {
            m_message = message;
            messageUpdated = true;
        }
        maybeLogLocked(false);
    }

    if (messageUpdated) emit messageChanged();
    emit currentChanged(current, total);
}

int ProgressManager::increment() {
    int current = 0;
    int total = 0;
    {
        QMutexLocker locker(&m_mutex);
        current = ++m_current;
        total = m_total;
    }
    emit currentChanged(current, total);
    return current;
}

void ProgressManager::finish() {
    {
        QMutexLocker locker(&m_mutex);
        if (!m_isActive) return;
        maybeLogLocked(true);
        qDebug() << "Progress finished:" << m_message;
        m_isActive = false;
        m_message.clear();
        m_current = 0;
        m_total = 0;
    }

    emit isActiveChanged();
    emit messageChanged();
    emit totalChanged();
    emit currentChanged(0, 0);
}

void ProgressManager::maybeLogLocked(bool force) {
    if (!force && m_sinceLog.isValid() && m_sinceLog.elapsed() < m_logIntervalMs) return;
    m_sinceLog.restart();
    if (m_total > 0) {
        LogManager::instance().addLog(QString("%1: %2/%3").arg(m_message).arg(m_current).arg(m_total));
    } else {
        LogManager::instance().addLog(QString("%1: %2").arg(m_message).arg(m_current));
    }
}
