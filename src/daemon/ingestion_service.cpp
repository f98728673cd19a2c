#include "daemon/ingestion_service.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QTimer>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "daemon/change_notifier.hpp"
#include "daemon/session_store.hpp"
#include "daemon/transcript_events.hpp"

namespace tracedeck {

namespace {

constexpr int kMaxConsecutiveErrors = 3;
constexpr int kBackoffSweeps = 2;
constexpr const char *kIdleEndReason = "timeout";

std::optional<std::string> nonEmpty(const std::string &value)
{
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::vector<nlohmann::json> decodeLines(const std::vector<std::string> &lines)
{
    std::vector<nlohmann::json> decoded;
    decoded.reserve(lines.size());
    for (const auto &line : lines) {
        auto json = nlohmann::json::parse(line, nullptr, false);
        if (json.is_discarded() || !json.is_object()) {
            continue;
        }
        decoded.push_back(std::move(json));
    }
    return decoded;
}

bool isUnknownCall(const std::string &callId, const TranscriptState &state)
{
    return !callId.empty() && !state.toolMessages.contains(callId)
        && !state.completedCalls.contains(callId);
}

// A call result whose call was never seen by this state cannot be
// correlated incrementally.
bool isUncorrelatedResult(TranscriptFormat format,
                          const nlohmann::json &json,
                          const TranscriptState &state)
{
    if (format == TranscriptFormat::Codex) {
        const CodexLine line = decodeCodexLine(json);
        return line.kind == CodexEventKind::FunctionCallOutput
            && isUnknownCall(line.callId, state);
    }
    const ClaudeLine line = decodeClaudeLine(json);
    if (line.kind != ClaudeLineKind::User) {
        return false;
    }
    return std::any_of(line.toolResults.begin(), line.toolResults.end(),
                       [&state](const ToolResult &result) {
                           return isUnknownCall(result.toolUseId, state);
                       });
}

} // namespace

IngestionService::IngestionService(const Config &config,
                                   SessionStore *store,
                                   CursorStore &cursors,
                                   ChangeNotifier &notifier,
                                   Timestamp startedAt,
                                   QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_store(store)
    , m_cursors(cursors)
    , m_notifier(notifier)
    , m_tracker(cursors, startedAt)
    , m_resyncCache(std::chrono::milliseconds(config.cacheValidityMs))
    , m_claude(makeInterpreter(TranscriptFormat::Claude))
    , m_codex(makeInterpreter(TranscriptFormat::Codex))
{
    m_pool.setMaxThreadCount(std::max(1, m_config.workerThreads));

    if (!m_store) {
        m_ingestionEnabled = false;
    } else {
        std::string integrityMessage;
        if (!m_store->integrityCheck(&integrityMessage)) {
            qWarning() << "Tracedeck: SQLite integrity check failed, database may be corrupt:"
                       << QString::fromStdString(integrityMessage);
            m_ingestionEnabled = false;
        }
    }

    connect(&m_watcher, &QFileSystemWatcher::directoryChanged,
            this, &IngestionService::onDirectoryChanged);
    connect(&m_watcher, &QFileSystemWatcher::fileChanged,
            this, &IngestionService::onFileChanged);
}

IngestionService::~IngestionService()
{
    m_pool.waitForDone();
}

void IngestionService::start()
{
    if (!m_ingestionEnabled) {
        qWarning() << "Tracedeck: session store unavailable, transcript ingestion disabled.";
        TDLOG_ERROR(QStringLiteral("IngestionService"),
                    QStringLiteral("start"),
                    QStringLiteral("ingestion_disabled"),
                    QStringLiteral("store_unavailable"),
                    QStringLiteral("idle_without_data"),
                    logging::defaultWho(),
                    QString(),
                    nlohmann::json::object());
        return;
    }

    if (m_config.enableClaude) {
        watchRoot(m_config.claudeProjectsDir);
    }
    if (m_config.enableCodex) {
        watchRoot(m_config.codexSessionsDir);
    }

    m_sweepTimer = new QTimer(this);
    m_sweepTimer->setInterval(m_config.sweepIntervalMs);
    connect(m_sweepTimer, &QTimer::timeout, this, &IngestionService::sweep);
    m_sweepTimer->start();
}

bool IngestionService::ingestionEnabled() const
{
    return m_ingestionEnabled;
}

void IngestionService::watchRoot(const QString &root)
{
    if (root.isEmpty()) {
        return;
    }
    if (!QDir(root).exists()) {
        TDLOG_INFO(QStringLiteral("IngestionService"),
                   QStringLiteral("watchRoot"),
                   QStringLiteral("root_missing"),
                   QStringLiteral("startup"),
                   QStringLiteral("retry_on_sweep"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json({{"root", root.toStdString()}}));
        return;
    }
    scanDirectory(root, true);
}

void IngestionService::scanDirectory(const QString &dir, bool recursive)
{
    QDir directory(dir);
    if (!directory.exists()) {
        return;
    }

    const QString dirPath = directory.absolutePath();
    if (!m_watcher.directories().contains(dirPath)) {
        m_watcher.addPath(dirPath);
    }

    const QFileInfoList files = directory.entryInfoList({QStringLiteral("*.jsonl")}, QDir::Files);
    for (const QFileInfo &file : files) {
        const QString path = file.absoluteFilePath();
        if (!m_watcher.files().contains(path)) {
            m_watcher.addPath(path);
        }
        const auto cursor = m_cursors.load(path.toStdString());
        if (!cursor || cursor->byteOffset != static_cast<uint64_t>(file.size())) {
            signalPath(path);
        }
    }

    if (!recursive) {
        return;
    }
    const QFileInfoList subdirs = directory.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QFileInfo &subdir : subdirs) {
        scanDirectory(subdir.absoluteFilePath(), true);
    }
}

void IngestionService::onDirectoryChanged(const QString &path)
{
    scanDirectory(path, true);
}

void IngestionService::onFileChanged(const QString &path)
{
    if (!QFileInfo::exists(path)) {
        return;
    }
    // Atomic replacement drops the watch; put it back.
    if (!m_watcher.files().contains(path)) {
        m_watcher.addPath(path);
    }
    signalPath(path);
}

void IngestionService::signalPath(const QString &path)
{
    if (!m_ingestionEnabled) {
        return;
    }

    QTimer *timer = m_debounceTimers.value(path, nullptr);
    if (!timer) {
        timer = new QTimer(this);
        timer->setSingleShot(true);
        timer->setInterval(m_config.debounceMs);
        connect(timer, &QTimer::timeout, this, [this, path]() {
            schedule(path.toStdString());
        });
        m_debounceTimers.insert(path, timer);
    }
    timer->start();
}

std::shared_ptr<IngestionService::PathContext> IngestionService::contextFor(const std::string &path)
{
    std::lock_guard<std::mutex> guard(m_contextsMutex);
    auto &slot = m_contexts[path];
    if (!slot) {
        slot = std::make_shared<PathContext>();
    }
    return slot;
}

void IngestionService::schedule(const std::string &path)
{
    if (contextFor(path)->backoffSweeps.load() > 0) {
        return;
    }

    std::lock_guard<std::mutex> guard(m_jobsMutex);
    PathJob &job = m_jobs[path];
    if (job.running) {
        job.dirty = true;
        return;
    }
    job.running = true;
    m_pool.start([this, path]() {
        runJob(path);
    });
}

void IngestionService::runJob(const std::string &path)
{
    for (;;) {
        processPath(path);

        std::lock_guard<std::mutex> guard(m_jobsMutex);
        PathJob &job = m_jobs[path];
        if (!job.dirty) {
            job.running = false;
            return;
        }
        job.dirty = false;
    }
}

bool IngestionService::processPath(const std::string &path)
{
    if (!m_ingestionEnabled) {
        return false;
    }

    auto context = contextFor(path);
    std::lock_guard<std::mutex> guard(context->mutex);
    logging::CorrelationScope scope(QStringLiteral("ingest-%1").arg(++m_runCounter));

    try {
        const std::optional<TailRead> read = m_tracker.onChangeSignal(path);
        if (read) {
            ingestRead(*context, *read);
        }
        context->errorCount = 0;
        return true;
    } catch (const std::exception &ex) {
        const int errors = ++context->errorCount;
        if (errors == 1) {
            qWarning() << "Tracedeck: transcript ingestion failed for"
                       << QString::fromStdString(path) << ":" << ex.what();
            TDLOG_WARN(QStringLiteral("IngestionService"),
                       QStringLiteral("processPath"),
                       QStringLiteral("ingestion_failed"),
                       QString::fromUtf8(ex.what()),
                       QStringLiteral("cursor_not_committed"),
                       logging::defaultWho(),
                       logging::currentCorrelationId(),
                       nlohmann::json({{"path", path}}));
        }
        if (errors >= kMaxConsecutiveErrors) {
            context->backoffSweeps = kBackoffSweeps;
            context->errorCount = 0;
            TDLOG_WARN(QStringLiteral("IngestionService"),
                       QStringLiteral("processPath"),
                       QStringLiteral("ingestion_backoff"),
                       QStringLiteral("consecutive_failures"),
                       QStringLiteral("skip_sweeps"),
                       logging::defaultWho(),
                       logging::currentCorrelationId(),
                       nlohmann::json({{"path", path}, {"sweeps", kBackoffSweeps}}));
        }
        return false;
    }
}

void IngestionService::ingestRead(PathContext &context, const TailRead &read)
{
    const std::string &path = read.path;
    TranscriptState &state = context.state;

    if (read.truncated) {
        state = TranscriptState{};
        context.persisted = false;
        context.partialHistory = false;
    }
    state.path = path;
    if (!context.restored) {
        restoreFromStore(context, path);
        context.restored = true;
    }

    const TranscriptFormat format = resolveFormat(context, read);
    const LineEventInterpreter *interpreter = interpreterFor(format);
    if (!interpreter) {
        // Not a transcript we understand (yet); skip the bytes.
        if (!m_tracker.commit(read)) {
            qWarning() << "Tracedeck: cursor could not be persisted for"
                       << QString::fromStdString(path);
        }
        return;
    }

    bool fullResync = read.startOffset == 0;
    if (read.bootstrapLine) {
        context.partialHistory = true;
    }

    const Session before = state.session;
    const bool hadSession = state.hasSession;
    std::vector<Message> emitted;

    if (!fullResync) {
        // Claude sessions start from any line; only Codex needs its header.
        if (!state.hasSession && read.bootstrapLine && format == TranscriptFormat::Codex) {
            const auto header = nlohmann::json::parse(*read.bootstrapLine, nullptr, false);
            if (!header.is_discarded() && header.is_object()) {
                interpreter->apply(header, state);
            }
        }
        for (const auto &json : decodeLines(read.lines)) {
            if (!context.partialHistory && isUncorrelatedResult(format, json, state)) {
                fullResync = true;
            }
            auto messages = interpreter->apply(json, state);
            emitted.insert(emitted.end(),
                           std::make_move_iterator(messages.begin()),
                           std::make_move_iterator(messages.end()));
        }
    }

    bool hasSession = false;
    if (fullResync) {
        hasSession = applyResync(context, computeResync(path, read.endOffset));
    } else if (state.hasSession) {
        SessionWrite write;
        write.sessionId = state.session.id;
        const bool sameSession = hadSession && before.id == state.session.id;
        if (!context.persisted || !sameSession) {
            write.upsert = state.session;
            write.update = counterUpdate(state.session);
        } else {
            write.update = diffSessions(before, state.session);
        }
        write.upserts = std::move(emitted);
        m_store->apply(write);
        context.persisted = true;
        notifyChanged(state.session, path);
        hasSession = true;
    }

    CursorIdentity identity;
    identity.format = format;
    if (hasSession) {
        identity.sessionId = state.session.id;
        identity.projectPath = nonEmpty(state.session.projectPath);
        identity.model = state.session.model;
    }
    if (!m_tracker.commit(read, identity)) {
        qWarning() << "Tracedeck: cursor could not be persisted for"
                   << QString::fromStdString(path);
    }

    TDLOG_DEBUG(QStringLiteral("IngestionService"),
                QStringLiteral("ingestRead"),
                QStringLiteral("transcript_ingested"),
                QStringLiteral("change_signal"),
                fullResync ? QStringLiteral("full_resync") : QStringLiteral("incremental"),
                logging::defaultWho(),
                logging::currentCorrelationId(),
                nlohmann::json({{"path", path},
                                {"lines", read.lines.size()},
                                {"startOffset", read.startOffset},
                                {"endOffset", read.endOffset}}));
}

IngestionService::Resync IngestionService::computeResync(const std::string &path, uint64_t size)
{
    // Keyed by size so a result parsed before the latest append is never reused.
    const std::string key = path + "@" + std::to_string(size);
    return m_resyncCache.getOrCompute(key, [this, &path]() {
        Resync resync;
        resync.state.path = path;
        resync.result = m_parser.parseAll(path, &resync.state);
        return resync;
    });
}

bool IngestionService::applyResync(PathContext &context, const Resync &resync)
{
    if (!resync.state.hasSession) {
        return false;
    }

    TranscriptState &state = context.state;
    std::optional<Timestamp> endedAt;
    std::optional<std::string> endReason;
    if (state.hasSession && state.session.id == resync.state.session.id) {
        endedAt = state.session.endedAt;
        endReason = state.session.endReason;
    }

    const std::string path = state.path;
    state = resync.state;
    state.path = path;
    // A rebuild without newer activity keeps an idle end in place.
    if (endedAt && state.session.lastActivityAt <= *endedAt) {
        endSession(state, *endedAt, endReason.value_or(kIdleEndReason));
    }

    SessionWrite write;
    write.sessionId = state.session.id;
    write.upsert = state.session;
    write.update = counterUpdate(state.session);
    write.replaceAll = resync.result.messages;
    m_store->apply(write);
    context.persisted = true;
    context.restored = true;
    context.partialHistory = false;

    notifyChanged(state.session, path);
    return true;
}

bool IngestionService::resyncPath(const std::string &path)
{
    if (!m_ingestionEnabled) {
        return false;
    }

    auto context = contextFor(path);
    std::lock_guard<std::mutex> guard(context->mutex);
    logging::CorrelationScope scope(QStringLiteral("resync-%1").arg(++m_runCounter));

    const QFileInfo info(QString::fromStdString(path));
    if (!info.exists()) {
        return false;
    }

    try {
        context->state.path = path;
        applyResync(*context, computeResync(path, static_cast<uint64_t>(info.size())));
        return true;
    } catch (const std::exception &ex) {
        qWarning() << "Tracedeck: transcript resync failed for"
                   << QString::fromStdString(path) << ":" << ex.what();
        TDLOG_WARN(QStringLiteral("IngestionService"),
                   QStringLiteral("resyncPath"),
                   QStringLiteral("resync_failed"),
                   QString::fromUtf8(ex.what()),
                   QStringLiteral("store_unchanged"),
                   logging::defaultWho(),
                   logging::currentCorrelationId(),
                   nlohmann::json({{"path", path}}));
        return false;
    }
}

void IngestionService::restoreFromStore(PathContext &context, const std::string &path)
{
    const auto cursor = m_tracker.cursor(path);
    if (!cursor || !cursor->sessionId) {
        return;
    }
    const auto stored = m_store->readSession(*cursor->sessionId);
    if (!stored) {
        return;
    }

    TranscriptState &state = context.state;
    state.session = *stored;
    state.hasSession = true;
    state.lastTimestamp = stored->lastActivityAt;
    if (stored->format == TranscriptFormat::Claude) {
        state.cumulativeTokens = stored->totalTokens;
    }
    context.persisted = true;

    TDLOG_DEBUG(QStringLiteral("IngestionService"),
                QStringLiteral("restoreFromStore"),
                QStringLiteral("session_restored"),
                QStringLiteral("first_read_since_start"),
                QStringLiteral("read_session_row"),
                logging::defaultWho(),
                logging::currentCorrelationId(),
                nlohmann::json({{"path", path}, {"sessionId", stored->id}}));
}

TranscriptFormat IngestionService::resolveFormat(const PathContext &context,
                                                 const TailRead &read) const
{
    if (context.state.hasSession && context.state.session.format != TranscriptFormat::Unknown) {
        return context.state.session.format;
    }
    const auto cursor = m_tracker.cursor(read.path);
    if (cursor && cursor->format != TranscriptFormat::Unknown) {
        return cursor->format;
    }

    std::vector<std::string> candidates;
    if (read.bootstrapLine) {
        candidates.push_back(*read.bootstrapLine);
    }
    candidates.insert(candidates.end(), read.lines.begin(), read.lines.end());
    for (const auto &json : decodeLines(candidates)) {
        const TranscriptFormat format = detectFormat(json);
        if (format != TranscriptFormat::Unknown) {
            return format;
        }
    }
    return TranscriptFormat::Unknown;
}

const LineEventInterpreter *IngestionService::interpreterFor(TranscriptFormat format) const
{
    switch (format) {
    case TranscriptFormat::Claude:
        return m_claude.get();
    case TranscriptFormat::Codex:
        return m_codex.get();
    case TranscriptFormat::Unknown:
        break;
    }
    return nullptr;
}

void IngestionService::notifyChanged(const Session &session, const std::string &path)
{
    m_notifier.notifySessionChanged(QString::fromStdString(session.id));
    m_notifier.notifyTranscriptChanged(QString::fromStdString(path));
}

int IngestionService::endIdleSessions(Timestamp now)
{
    if (!m_ingestionEnabled) {
        return 0;
    }

    std::vector<std::pair<std::string, std::shared_ptr<PathContext>>> contexts;
    {
        std::lock_guard<std::mutex> guard(m_contextsMutex);
        contexts.assign(m_contexts.begin(), m_contexts.end());
    }

    const auto timeout = std::chrono::seconds(m_config.sessionIdleTimeoutSec);
    int ended = 0;
    for (const auto &[path, context] : contexts) {
        // A path being ingested right now is not idle.
        std::unique_lock<std::mutex> lock(context->mutex, std::try_to_lock);
        if (!lock.owns_lock()) {
            continue;
        }
        TranscriptState &state = context->state;
        if (!state.hasSession || !context->persisted || state.session.endedAt) {
            continue;
        }
        if (now - state.session.lastActivityAt < timeout) {
            continue;
        }

        try {
            m_store->endSession(state.session.id, kIdleEndReason, now);
        } catch (const std::exception &ex) {
            TDLOG_WARN(QStringLiteral("IngestionService"),
                       QStringLiteral("endIdleSessions"),
                       QStringLiteral("end_session_failed"),
                       QString::fromUtf8(ex.what()),
                       QStringLiteral("retry_on_sweep"),
                       logging::defaultWho(),
                       QString(),
                       nlohmann::json({{"path", path}, {"sessionId", state.session.id}}));
            continue;
        }
        endSession(state, now, kIdleEndReason);
        notifyChanged(state.session, path);
        ++ended;

        TDLOG_INFO(QStringLiteral("IngestionService"),
                   QStringLiteral("endIdleSessions"),
                   QStringLiteral("session_ended"),
                   QStringLiteral("idle_timeout"),
                   QStringLiteral("mark_ended"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json({{"path", path}, {"sessionId", state.session.id}}));
    }
    return ended;
}

std::optional<Session> IngestionService::sessionForPath(const std::string &path) const
{
    std::shared_ptr<PathContext> context;
    {
        std::lock_guard<std::mutex> guard(m_contextsMutex);
        const auto it = m_contexts.find(path);
        if (it == m_contexts.end()) {
            return std::nullopt;
        }
        context = it->second;
    }
    std::lock_guard<std::mutex> guard(context->mutex);
    if (!context->state.hasSession) {
        return std::nullopt;
    }
    return context->state.session;
}

void IngestionService::waitForIdle()
{
    m_pool.waitForDone();
}

void IngestionService::sweep()
{
    if (!m_ingestionEnabled) {
        return;
    }

    {
        std::lock_guard<std::mutex> guard(m_contextsMutex);
        for (auto &entry : m_contexts) {
            if (entry.second->backoffSweeps.load() > 0) {
                --entry.second->backoffSweeps;
            }
        }
    }

    if (m_config.enableClaude) {
        scanDirectory(m_config.claudeProjectsDir, true);
    }
    if (m_config.enableCodex) {
        scanDirectory(m_config.codexSessionsDir, true);
    }
    endIdleSessions(std::chrono::system_clock::now());
}

} // namespace tracedeck
