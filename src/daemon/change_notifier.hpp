#pragma once

#include <QHash>
#include <QObject>
#include <QSet>
#include <QString>

class QTimer;

namespace tracedeck {

/**
 * ChangeNotifier coalesces change reports into Qt signals.
 *
 * Session changes are collected over one debounce window: a single id in the
 * window is delivered as-is, several distinct ids collapse into one
 * broadcast (an empty id). Transcript changes are debounced per path.
 *
 * notify*() may be called from any thread; the signals are emitted on the
 * thread that owns the notifier.
 */
class ChangeNotifier : public QObject
{
    Q_OBJECT
public:
    explicit ChangeNotifier(int sessionDebounceMs = 100,
                            int transcriptDebounceMs = 150,
                            QObject *parent = nullptr);
    ~ChangeNotifier() override;

    void notifySessionChanged(const QString &sessionId);
    void notifyTranscriptChanged(const QString &path);

signals:
    // Empty sessionId means "several sessions changed, re-query everything".
    void sessionChanged(const QString &sessionId);
    void transcriptChanged(const QString &path);

private slots:
    void flushSessions();

private:
    void queueSession(const QString &sessionId);
    void queueTranscript(const QString &path);

    int m_transcriptDebounceMs = 150;
    QTimer *m_sessionTimer = nullptr;
    QSet<QString> m_pendingSessions;
    QHash<QString, QTimer *> m_transcriptTimers;
};

} // namespace tracedeck
