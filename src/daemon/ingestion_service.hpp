#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <QFileSystemWatcher>
#include <QHash>
#include <QObject>
#include <QString>
#include <QThreadPool>

#include "common/config.hpp"
#include "common/models.hpp"
#include "daemon/correlating_parser.hpp"
#include "daemon/cursor_store.hpp"
#include "daemon/file_tail_tracker.hpp"
#include "daemon/freshness_cache.hpp"
#include "daemon/line_event_interpreter.hpp"

class QTimer;

namespace tracedeck {

class ChangeNotifier;
class SessionStore;

/**
 * IngestionService coordinates:
 * - watching the transcript roots for new and growing *.jsonl files
 * - debouncing change signals per path and running one job per path at a
 *   time on a worker pool
 * - applying new lines through the format's interpreter and persisting the
 *   session and messages before the cursor is committed
 * - ending sessions that stayed idle past the configured timeout
 *
 * A null store disables ingestion; the service then only logs that fact.
 */
class IngestionService : public QObject
{
    Q_OBJECT
public:
    IngestionService(const Config &config,
                     SessionStore *store,
                     CursorStore &cursors,
                     ChangeNotifier &notifier,
                     Timestamp startedAt = std::chrono::system_clock::now(),
                     QObject *parent = nullptr);
    ~IngestionService() override;

    // Sets up watches and the sweep timer, then signals existing transcripts.
    void start();

    bool ingestionEnabled() const;

    // Debounced; must be called on the service's thread.
    void signalPath(const QString &path);

    // Runs one ingestion pass for path on the calling thread. Returns false
    // when the pass failed and the cursor was left in place.
    bool processPath(const std::string &path);

    // Rebuilds the path's session and messages from the whole file.
    bool resyncPath(const std::string &path);

    // Ends sessions idle for longer than the configured timeout.
    int endIdleSessions(Timestamp now);

    std::optional<Session> sessionForPath(const std::string &path) const;

    // Blocks until queued jobs have finished.
    void waitForIdle();

public slots:
    void sweep();

private slots:
    void onDirectoryChanged(const QString &path);
    void onFileChanged(const QString &path);

private:
    struct PathContext {
        std::mutex mutex;
        TranscriptState state;
        // The session row is known to exist in the store.
        bool persisted = false;
        bool restored = false;
        // Tailing started past the file's history; earlier calls are unknown.
        bool partialHistory = false;
        std::atomic<int> errorCount{0};
        std::atomic<int> backoffSweeps{0};
    };

    struct PathJob {
        bool running = false;
        bool dirty = false;
    };

    struct Resync {
        ParseResult result;
        TranscriptState state;
    };

    std::shared_ptr<PathContext> contextFor(const std::string &path);
    void schedule(const std::string &path);
    void runJob(const std::string &path);

    void ingestRead(PathContext &context, const TailRead &read);
    Resync computeResync(const std::string &path, uint64_t size);
    bool applyResync(PathContext &context, const Resync &resync);
    void restoreFromStore(PathContext &context, const std::string &path);
    TranscriptFormat resolveFormat(const PathContext &context, const TailRead &read) const;
    const LineEventInterpreter *interpreterFor(TranscriptFormat format) const;
    void notifyChanged(const Session &session, const std::string &path);

    void scanDirectory(const QString &dir, bool recursive);
    void watchRoot(const QString &root);

    Config m_config;
    SessionStore *m_store = nullptr;
    CursorStore &m_cursors;
    ChangeNotifier &m_notifier;
    FileTailTracker m_tracker;
    CorrelatingParser m_parser;
    FreshnessCache<Resync> m_resyncCache;
    std::unique_ptr<LineEventInterpreter> m_claude;
    std::unique_ptr<LineEventInterpreter> m_codex;

    bool m_ingestionEnabled = true;
    QThreadPool m_pool;
    QFileSystemWatcher m_watcher;
    QTimer *m_sweepTimer = nullptr;
    QHash<QString, QTimer *> m_debounceTimers;

    mutable std::mutex m_contextsMutex;
    std::unordered_map<std::string, std::shared_ptr<PathContext>> m_contexts;

    std::mutex m_jobsMutex;
    std::unordered_map<std::string, PathJob> m_jobs;

    std::atomic<uint64_t> m_runCounter{0};
};

} // namespace tracedeck
