#include "daemon/change_notifier.hpp"

#include <QMetaObject>
#include <QThread>
#include <QTimer>

namespace tracedeck {

ChangeNotifier::ChangeNotifier(int sessionDebounceMs, int transcriptDebounceMs, QObject *parent)
    : QObject(parent)
    , m_transcriptDebounceMs(transcriptDebounceMs)
    , m_sessionTimer(new QTimer(this))
{
    m_sessionTimer->setSingleShot(true);
    m_sessionTimer->setInterval(sessionDebounceMs);
    connect(m_sessionTimer, &QTimer::timeout, this, &ChangeNotifier::flushSessions);
}

ChangeNotifier::~ChangeNotifier() = default;

void ChangeNotifier::notifySessionChanged(const QString &sessionId)
{
    if (QThread::currentThread() == thread()) {
        queueSession(sessionId);
        return;
    }
    QMetaObject::invokeMethod(this, [this, sessionId]() { queueSession(sessionId); },
                              Qt::QueuedConnection);
}

void ChangeNotifier::notifyTranscriptChanged(const QString &path)
{
    if (QThread::currentThread() == thread()) {
        queueTranscript(path);
        return;
    }
    QMetaObject::invokeMethod(this, [this, path]() { queueTranscript(path); },
                              Qt::QueuedConnection);
}

void ChangeNotifier::queueSession(const QString &sessionId)
{
    m_pendingSessions.insert(sessionId);
    if (!m_sessionTimer->isActive()) {
        m_sessionTimer->start();
    }
}

void ChangeNotifier::flushSessions()
{
    if (m_pendingSessions.isEmpty()) {
        return;
    }
    const QString target = m_pendingSessions.size() == 1 ? *m_pendingSessions.constBegin()
                                                         : QString();
    m_pendingSessions.clear();
    emit sessionChanged(target);
}

void ChangeNotifier::queueTranscript(const QString &path)
{
    QTimer *timer = m_transcriptTimers.value(path, nullptr);
    if (!timer) {
        timer = new QTimer(this);
        timer->setSingleShot(true);
        timer->setInterval(m_transcriptDebounceMs);
        connect(timer, &QTimer::timeout, this, [this, path]() {
            QTimer *finished = m_transcriptTimers.take(path);
            if (finished) {
                finished->deleteLater();
            }
            emit transcriptChanged(path);
        });
        m_transcriptTimers.insert(path, timer);
    }
    timer->start();
}

} // namespace tracedeck
