#include "daemon/session_store.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <vector>

#include <QDebug>

#include <sqlite3.h>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/keyed_lock_registry.hpp"

namespace tracedeck {

namespace {

constexpr const char *kSchemaVersion = "2";

constexpr const char *kCreateSessionsTable =
    "CREATE TABLE IF NOT EXISTS sessions ("
    "    id TEXT PRIMARY KEY,"
    "    project_path TEXT NOT NULL DEFAULT '',"
    "    project_name TEXT NOT NULL DEFAULT '',"
    "    transcript_path TEXT NOT NULL DEFAULT '',"
    "    format TEXT NOT NULL DEFAULT 'unknown',"
    "    model TEXT,"
    "    work_status TEXT NOT NULL DEFAULT 'unknown',"
    "    attention_reason TEXT NOT NULL DEFAULT 'none',"
    "    pending_tool_name TEXT,"
    "    pending_tool_input TEXT,"
    "    pending_question TEXT,"
    "    first_prompt TEXT,"
    "    custom_name TEXT,"
    "    last_tool TEXT,"
    "    last_tool_at INTEGER,"
    "    prompt_count INTEGER NOT NULL DEFAULT 0,"
    "    tool_count INTEGER NOT NULL DEFAULT 0,"
    "    total_tokens INTEGER NOT NULL DEFAULT 0,"
    "    started_at INTEGER NOT NULL,"
    "    last_activity_at INTEGER NOT NULL,"
    "    ended_at INTEGER,"
    "    end_reason TEXT"
    ");";

constexpr const char *kCreateMessagesTable =
    "CREATE TABLE IF NOT EXISTS messages ("
    "    id TEXT PRIMARY KEY,"
    "    session_id TEXT NOT NULL,"
    "    type TEXT NOT NULL,"
    "    content TEXT NOT NULL DEFAULT '',"
    "    timestamp INTEGER NOT NULL,"
    "    sequence INTEGER NOT NULL,"
    "    tool_name TEXT,"
    "    tool_input TEXT,"
    "    tool_output TEXT,"
    "    tool_duration REAL,"
    "    is_in_progress INTEGER NOT NULL DEFAULT 0,"
    "    input_tokens INTEGER,"
    "    output_tokens INTEGER,"
    "    thinking TEXT,"
    "    images_json TEXT"
    ");";

constexpr const char *kCreateMessagesSequenceIndex =
    "CREATE INDEX IF NOT EXISTS idx_messages_session_sequence "
    "ON messages(session_id, sequence);";

constexpr const char *kCreateMessagesSessionIndex =
    "CREATE INDEX IF NOT EXISTS idx_messages_session ON messages(session_id);";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

// Columns introduced after the first schema. Older databases get them via
// ALTER TABLE on open.
struct ColumnMigration {
    const char *table;
    const char *column;
    const char *sql;
};

constexpr ColumnMigration kColumnMigrations[] = {
    {"sessions", "custom_name", "ALTER TABLE sessions ADD COLUMN custom_name TEXT;"},
    {"sessions", "last_tool", "ALTER TABLE sessions ADD COLUMN last_tool TEXT;"},
    {"sessions", "last_tool_at", "ALTER TABLE sessions ADD COLUMN last_tool_at INTEGER;"},
    {"sessions", "end_reason", "ALTER TABLE sessions ADD COLUMN end_reason TEXT;"},
    {"messages", "thinking", "ALTER TABLE messages ADD COLUMN thinking TEXT;"},
    {"messages", "images_json", "ALTER TABLE messages ADD COLUMN images_json TEXT;"},
};

constexpr const char *kSessionColumns =
    "id, project_path, project_name, transcript_path, format, model, "
    "work_status, attention_reason, pending_tool_name, pending_tool_input, "
    "pending_question, first_prompt, custom_name, last_tool, last_tool_at, "
    "prompt_count, tool_count, total_tokens, started_at, last_activity_at, "
    "ended_at, end_reason";

constexpr const char *kMessageColumns =
    "id, session_id, type, content, timestamp, sequence, tool_name, "
    "tool_input, tool_output, tool_duration, is_in_progress, input_tokens, "
    "output_tokens, thinking, images_json";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare failed: ")
                                     + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

int64_t toEpochMillis(Timestamp timestamp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               timestamp.time_since_epoch())
        .count();
}

Timestamp fromEpochMillis(int64_t value)
{
    return Timestamp{std::chrono::milliseconds{value}};
}

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

void stepDone(sqlite3_stmt *stmt, const char *what)
{
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw std::runtime_error(what);
    }
}

bool columnExists(sqlite3 *db, const std::string &table, const std::string &column)
{
    const std::string sql = "PRAGMA table_info(" + table + ");";
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    bool found = false;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char *name = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 1));
        if (name && column == name) {
            found = true;
            break;
        }
    }
    sqlite3_finalize(stmt);
    return found;
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt *stmt, int index, const std::optional<std::string> &value)
{
    if (!value) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, *value);
}

void bindOptionalTimestamp(sqlite3_stmt *stmt, int index, const std::optional<Timestamp> &value)
{
    if (!value) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    sqlite3_bind_int64(stmt, index, toEpochMillis(*value));
}

void bindOptionalInt64(sqlite3_stmt *stmt, int index, const std::optional<int64_t> &value)
{
    if (!value) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    sqlite3_bind_int64(stmt, index, *value);
}

void bindJson(sqlite3_stmt *stmt, int index, const nlohmann::json &value)
{
    if (value.is_null()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    bindText(stmt, index, value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return std::string(reinterpret_cast<const char *>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, index)));
}

std::optional<std::string> columnOptionalText(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return columnText(stmt, index);
}

std::optional<Timestamp> columnOptionalTimestamp(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return fromEpochMillis(sqlite3_column_int64(stmt, index));
}

std::optional<int64_t> columnOptionalInt64(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_int64(stmt, index);
}

nlohmann::json columnJson(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return nullptr;
    }
    auto value = nlohmann::json::parse(reinterpret_cast<const char *>(text), nullptr, false);
    if (value.is_discarded()) {
        return nullptr;
    }
    return value;
}

// Begins IMMEDIATE unless the connection is already inside a transaction;
// rolls back on destruction when not committed.
class Transaction {
public:
    explicit Transaction(sqlite3 *db)
        : m_db(db)
        , m_owned(sqlite3_get_autocommit(db) != 0)
    {
        if (m_owned) {
            execOrThrow(m_db, "BEGIN IMMEDIATE;");
        }
    }

    ~Transaction()
    {
        if (!m_owned || m_committed) {
            return;
        }
        char *error = nullptr;
        if (sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, &error) != SQLITE_OK) {
            qWarning() << "Tracedeck: rollback failed:" << (error ? error : "unknown error");
            sqlite3_free(error);
        }
    }

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void commit()
    {
        if (m_owned) {
            execOrThrow(m_db, "COMMIT;");
        }
        m_committed = true;
    }

private:
    sqlite3 *m_db = nullptr;
    bool m_owned = false;
    bool m_committed = false;
};

Session readSessionRow(sqlite3_stmt *stmt)
{
    Session session;
    session.id = columnText(stmt, 0);
    session.projectPath = columnText(stmt, 1);
    session.projectName = columnText(stmt, 2);
    session.transcriptPath = columnText(stmt, 3);
    session.format = parseFormatString(columnText(stmt, 4));
    session.model = columnOptionalText(stmt, 5);
    session.workStatus = parseWorkStatusString(columnText(stmt, 6));
    session.attentionReason = parseAttentionString(columnText(stmt, 7));
    session.pendingToolName = columnOptionalText(stmt, 8);
    session.pendingToolInput = columnOptionalText(stmt, 9);
    session.pendingQuestion = columnOptionalText(stmt, 10);
    session.firstPrompt = columnOptionalText(stmt, 11);
    session.customName = columnOptionalText(stmt, 12);
    session.lastTool = columnOptionalText(stmt, 13);
    session.lastToolAt = columnOptionalTimestamp(stmt, 14);
    session.promptCount = sqlite3_column_int(stmt, 15);
    session.toolCount = sqlite3_column_int(stmt, 16);
    session.totalTokens = sqlite3_column_int64(stmt, 17);
    session.startedAt = fromEpochMillis(sqlite3_column_int64(stmt, 18));
    session.lastActivityAt = fromEpochMillis(sqlite3_column_int64(stmt, 19));
    session.endedAt = columnOptionalTimestamp(stmt, 20);
    session.endReason = columnOptionalText(stmt, 21);
    return session;
}

Message readMessageRow(sqlite3_stmt *stmt)
{
    Message message;
    message.id = columnText(stmt, 0);
    message.sessionId = columnText(stmt, 1);
    message.type = parseMessageTypeString(columnText(stmt, 2));
    message.content = columnText(stmt, 3);
    message.timestamp = fromEpochMillis(sqlite3_column_int64(stmt, 4));
    message.sequence = static_cast<uint32_t>(sqlite3_column_int64(stmt, 5));
    message.toolName = columnOptionalText(stmt, 6);
    message.toolInput = columnJson(stmt, 7);
    message.toolOutput = columnOptionalText(stmt, 8);
    if (sqlite3_column_type(stmt, 9) != SQLITE_NULL) {
        message.toolDuration = sqlite3_column_double(stmt, 9);
    }
    message.inProgress = sqlite3_column_int(stmt, 10) != 0;
    message.inputTokens = columnOptionalInt64(stmt, 11);
    message.outputTokens = columnOptionalInt64(stmt, 12);
    message.thinking = columnOptionalText(stmt, 13);
    const nlohmann::json images = columnJson(stmt, 14);
    if (images.is_array()) {
        for (const auto &image : images) {
            if (image.is_object()) {
                message.images.push_back(image.get<MessageImage>());
            }
        }
    }
    return message;
}

void insertSession(sqlite3 *db, const Session &session)
{
    const std::string sql = std::string("INSERT INTO sessions (") + kSessionColumns
        + ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
          "ON CONFLICT(id) DO UPDATE SET "
          "project_path = excluded.project_path, "
          "project_name = excluded.project_name, "
          "transcript_path = excluded.transcript_path, "
          "format = excluded.format, "
          "model = COALESCE(excluded.model, sessions.model), "
          "work_status = excluded.work_status, "
          "attention_reason = excluded.attention_reason, "
          "pending_tool_name = excluded.pending_tool_name, "
          "pending_tool_input = excluded.pending_tool_input, "
          "pending_question = excluded.pending_question, "
          "first_prompt = COALESCE(sessions.first_prompt, excluded.first_prompt), "
          "custom_name = excluded.custom_name, "
          "last_tool = excluded.last_tool, "
          "last_tool_at = excluded.last_tool_at, "
          "last_activity_at = MAX(sessions.last_activity_at, excluded.last_activity_at), "
          "ended_at = excluded.ended_at, "
          "end_reason = excluded.end_reason;";

    Statement stmt(db, sql.c_str());
    bindText(stmt.get(), 1, session.id);
    bindText(stmt.get(), 2, session.projectPath);
    bindText(stmt.get(), 3, session.projectName);
    bindText(stmt.get(), 4, session.transcriptPath);
    bindText(stmt.get(), 5, toFormatString(session.format));
    bindOptionalText(stmt.get(), 6, session.model);
    bindText(stmt.get(), 7, toWorkStatusString(session.workStatus));
    bindText(stmt.get(), 8, toAttentionString(session.attentionReason));
    bindOptionalText(stmt.get(), 9, session.pendingToolName);
    bindOptionalText(stmt.get(), 10, session.pendingToolInput);
    bindOptionalText(stmt.get(), 11, session.pendingQuestion);
    bindOptionalText(stmt.get(), 12, session.firstPrompt);
    bindOptionalText(stmt.get(), 13, session.customName);
    bindOptionalText(stmt.get(), 14, session.lastTool);
    bindOptionalTimestamp(stmt.get(), 15, session.lastToolAt);
    sqlite3_bind_int(stmt.get(), 16, session.promptCount);
    sqlite3_bind_int(stmt.get(), 17, session.toolCount);
    sqlite3_bind_int64(stmt.get(), 18, session.totalTokens);
    sqlite3_bind_int64(stmt.get(), 19, toEpochMillis(session.startedAt));
    sqlite3_bind_int64(stmt.get(), 20, toEpochMillis(session.lastActivityAt));
    bindOptionalTimestamp(stmt.get(), 21, session.endedAt);
    bindOptionalText(stmt.get(), 22, session.endReason);
    stepDone(stmt.get(), "failed to upsert session");
}

struct Assignment {
    const char *column;
    std::function<void(sqlite3_stmt *, int)> bind;
};

template<typename T>
void assignOptional(std::vector<Assignment> &assignments,
                        const char *column,
                        const std::optional<std::optional<T>> &field)
{
    if (!field) {
        return;
    }
    const std::optional<T> value = *field;
    assignments.push_back({column, [value](sqlite3_stmt *stmt, int index) {
                               if constexpr (std::is_same_v<T, Timestamp>) {
                                   bindOptionalTimestamp(stmt, index, value);
                               } else {
                                   bindOptionalText(stmt, index, value);
                               }
                           }});
}

void updateSessionFields(sqlite3 *db, const std::string &sessionId, const SessionUpdate &update)
{
    std::vector<Assignment> assignments;
    assignOptional(assignments, "model", update.model);
    if (update.workStatus) {
        const std::string value = toWorkStatusString(*update.workStatus);
        assignments.push_back({"work_status", [value](sqlite3_stmt *stmt, int index) {
                                   bindText(stmt, index, value);
                               }});
    }
    if (update.attentionReason) {
        const std::string value = toAttentionString(*update.attentionReason);
        assignments.push_back({"attention_reason", [value](sqlite3_stmt *stmt, int index) {
                                   bindText(stmt, index, value);
                               }});
    }
    assignOptional(assignments, "pending_tool_name", update.pendingToolName);
    assignOptional(assignments, "pending_tool_input", update.pendingToolInput);
    assignOptional(assignments, "pending_question", update.pendingQuestion);
    assignOptional(assignments, "first_prompt", update.firstPrompt);
    assignOptional(assignments, "custom_name", update.customName);
    assignOptional(assignments, "last_tool", update.lastTool);
    assignOptional(assignments, "last_tool_at", update.lastToolAt);
    if (update.promptCount) {
        const int value = *update.promptCount;
        assignments.push_back({"prompt_count", [value](sqlite3_stmt *stmt, int index) {
                                   sqlite3_bind_int(stmt, index, value);
                               }});
    }
    if (update.toolCount) {
        const int value = *update.toolCount;
        assignments.push_back({"tool_count", [value](sqlite3_stmt *stmt, int index) {
                                   sqlite3_bind_int(stmt, index, value);
                               }});
    }
    if (update.totalTokens) {
        const int64_t value = *update.totalTokens;
        assignments.push_back({"total_tokens", [value](sqlite3_stmt *stmt, int index) {
                                   sqlite3_bind_int64(stmt, index, value);
                               }});
    }
    if (update.lastActivityAt) {
        const int64_t value = toEpochMillis(*update.lastActivityAt);
        assignments.push_back({"last_activity_at", [value](sqlite3_stmt *stmt, int index) {
                                   sqlite3_bind_int64(stmt, index, value);
                               }});
    }

    assignOptional(assignments, "ended_at", update.endedAt);
    assignOptional(assignments, "end_reason", update.endReason);

    if (assignments.empty()) {
        return;
    }

    std::string sql = "UPDATE sessions SET ";
    for (size_t i = 0; i < assignments.size(); ++i) {
        if (i > 0) {
            sql += ", ";
        }
        sql += assignments[i].column;
        sql += " = ?";
    }
    sql += " WHERE id = ?;";

    Statement stmt(db, sql.c_str());
    int index = 1;
    for (const auto &assignment : assignments) {
        assignment.bind(stmt.get(), index++);
    }
    bindText(stmt.get(), index, sessionId);
    stepDone(stmt.get(), "failed to update session");
}

void insertMessage(sqlite3 *db,
                   const std::string &sessionId,
                   const Message &message,
                   int64_t sequence)
{
    const std::string sql = std::string("INSERT OR REPLACE INTO messages (") + kMessageColumns
        + ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    Statement stmt(db, sql.c_str());
    bindText(stmt.get(), 1, message.id);
    bindText(stmt.get(), 2, sessionId);
    bindText(stmt.get(), 3, toMessageTypeString(message.type));
    bindText(stmt.get(), 4, message.content);
    sqlite3_bind_int64(stmt.get(), 5, toEpochMillis(message.timestamp));
    sqlite3_bind_int64(stmt.get(), 6, sequence);
    bindOptionalText(stmt.get(), 7, message.toolName);
    bindJson(stmt.get(), 8, message.toolInput);
    bindOptionalText(stmt.get(), 9, message.toolOutput);
    if (message.toolDuration) {
        sqlite3_bind_double(stmt.get(), 10, *message.toolDuration);
    } else {
        sqlite3_bind_null(stmt.get(), 10);
    }
    sqlite3_bind_int(stmt.get(), 11, message.inProgress ? 1 : 0);
    bindOptionalInt64(stmt.get(), 12, message.inputTokens);
    bindOptionalInt64(stmt.get(), 13, message.outputTokens);
    bindOptionalText(stmt.get(), 14, message.thinking);
    if (message.images.empty()) {
        sqlite3_bind_null(stmt.get(), 15);
    } else {
        bindJson(stmt.get(), 15, nlohmann::json(message.images));
    }
    stepDone(stmt.get(), "failed to insert message");
}

int64_t nextSequence(sqlite3 *db, const std::string &sessionId)
{
    Statement stmt(db, "SELECT COALESCE(MAX(sequence), -1) + 1 FROM messages WHERE session_id = ?;");
    bindText(stmt.get(), 1, sessionId);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw std::runtime_error("failed to read message sequence");
    }
    return sqlite3_column_int64(stmt.get(), 0);
}

void upsertMessageRow(sqlite3 *db, const std::string &sessionId, const Message &message)
{
    std::optional<int64_t> existing;
    {
        Statement stmt(db, "SELECT sequence FROM messages WHERE id = ? AND session_id = ? LIMIT 1;");
        bindText(stmt.get(), 1, message.id);
        bindText(stmt.get(), 2, sessionId);
        if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            existing = sqlite3_column_int64(stmt.get(), 0);
        }
    }
    insertMessage(db, sessionId, message, existing ? *existing : nextSequence(db, sessionId));
}

void replaceMessageRows(sqlite3 *db, const std::string &sessionId, const std::vector<Message> &messages)
{
    {
        Statement stmt(db, "DELETE FROM messages WHERE session_id = ?;");
        bindText(stmt.get(), 1, sessionId);
        stepDone(stmt.get(), "failed to delete messages");
    }
    for (size_t i = 0; i < messages.size(); ++i) {
        insertMessage(db, sessionId, messages[i], static_cast<int64_t>(i));
    }
}

void openConnection(const std::string &path, sqlite3 **db, int flags)
{
    if (sqlite3_open_v2(path.c_str(), db, flags, nullptr) != SQLITE_OK) {
        const std::string message = *db ? sqlite3_errmsg(*db) : "out of memory";
        sqlite3_close(*db);
        *db = nullptr;
        throw std::runtime_error("failed to open tracedeck database: " + message);
    }
    sqlite3_busy_timeout(*db, 5000);
}

template<typename T>
void diffField(std::optional<T> &field, const T &before, const T &after)
{
    if (before != after) {
        field = after;
    }
}

} // namespace

SessionUpdate diffSessions(const Session &before, const Session &after)
{
    SessionUpdate update;
    diffField(update.model, before.model, after.model);
    diffField(update.workStatus, before.workStatus, after.workStatus);
    diffField(update.attentionReason, before.attentionReason, after.attentionReason);
    diffField(update.pendingToolName, before.pendingToolName, after.pendingToolName);
    diffField(update.pendingToolInput, before.pendingToolInput, after.pendingToolInput);
    diffField(update.pendingQuestion, before.pendingQuestion, after.pendingQuestion);
    diffField(update.firstPrompt, before.firstPrompt, after.firstPrompt);
    diffField(update.customName, before.customName, after.customName);
    diffField(update.lastTool, before.lastTool, after.lastTool);
    diffField(update.lastToolAt, before.lastToolAt, after.lastToolAt);
    diffField(update.promptCount, before.promptCount, after.promptCount);
    diffField(update.toolCount, before.toolCount, after.toolCount);
    diffField(update.totalTokens, before.totalTokens, after.totalTokens);
    diffField(update.lastActivityAt, before.lastActivityAt, after.lastActivityAt);
    diffField(update.endedAt, before.endedAt, after.endedAt);
    diffField(update.endReason, before.endReason, after.endReason);
    return update;
}

SessionUpdate counterUpdate(const Session &session)
{
    SessionUpdate update;
    update.promptCount = session.promptCount;
    update.toolCount = session.toolCount;
    update.totalTokens = session.totalTokens;
    update.lastActivityAt = session.lastActivityAt;
    return update;
}

struct SessionStore::Impl {
    std::string path;
    sqlite3 *writer = nullptr;
    sqlite3 *reader = nullptr;
    std::recursive_mutex writerMutex;
    mutable std::mutex readerMutex;
    KeyedLockRegistry sessionLocks;

    ~Impl()
    {
        if (reader) {
            sqlite3_close(reader);
        }
        if (writer) {
            sqlite3_close(writer);
        }
    }

    // Runs work on the writer inside one transaction, holding the session
    // lock (when a session is named) and then the writer lock.
    template<typename Work>
    void write(const std::string &sessionId, Work &&work)
    {
        std::optional<KeyedLockGuard> sessionGuard;
        if (!sessionId.empty()) {
            sessionGuard.emplace(sessionLocks, sessionId);
        }
        std::lock_guard<std::recursive_mutex> writerGuard(writerMutex);
        Transaction transaction(writer);
        work(writer);
        transaction.commit();
    }

    void migrate()
    {
        execOrThrow(writer, kCreateSessionsTable);
        execOrThrow(writer, kCreateMessagesTable);
        execOrThrow(writer, kCreateMetaTable);

        for (const auto &migration : kColumnMigrations) {
            if (columnExists(writer, migration.table, migration.column)) {
                continue;
            }
            execOrThrow(writer, migration.sql);
            TDLOG_INFO(QStringLiteral("SessionStore"),
                       QStringLiteral("migrate"),
                       QStringLiteral("column_added"),
                       QStringLiteral("schema_upgrade"),
                       QStringLiteral("alter_table"),
                       logging::defaultWho(),
                       QString(),
                       nlohmann::json({{"table", migration.table},
                                       {"column", migration.column}}));
        }

        execOrThrow(writer, kCreateMessagesSequenceIndex);
        execOrThrow(writer, kCreateMessagesSessionIndex);

        Statement stmt(writer, "INSERT OR REPLACE INTO meta (key, value) VALUES ('schema_version', ?);");
        bindText(stmt.get(), 1, kSchemaVersion);
        stepDone(stmt.get(), "failed to record schema version");
    }
};

SessionStore::SessionStore(const std::string &dbPath)
    : impl(std::make_unique<Impl>())
{
    impl->path = dbPath;

    const std::filesystem::path parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("failed to create database directory: " + ec.message());
        }
    }

    openConnection(dbPath, &impl->writer, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    execOrThrow(impl->writer, "PRAGMA journal_mode=WAL;");
    execOrThrow(impl->writer, "PRAGMA synchronous=NORMAL;");
    impl->migrate();

    openConnection(dbPath, &impl->reader, SQLITE_OPEN_READONLY);

    TDLOG_INFO(QStringLiteral("SessionStore"),
               QStringLiteral("SessionStore"),
               QStringLiteral("store_opened"),
               QStringLiteral("startup"),
               QStringLiteral("sqlite_wal"),
               logging::defaultWho(),
               QString(),
               nlohmann::json({{"path", dbPath}}));
}

SessionStore::~SessionStore() = default;

void SessionStore::upsertSession(const Session &session)
{
    impl->write(session.id, [&](sqlite3 *db) {
        insertSession(db, session);
    });
}

void SessionStore::updateSession(const std::string &sessionId, const SessionUpdate &update)
{
    if (update.empty()) {
        return;
    }
    impl->write(sessionId, [&](sqlite3 *db) {
        updateSessionFields(db, sessionId, update);
    });
}

void SessionStore::incrementPromptCount(const std::string &sessionId)
{
    impl->write(sessionId, [&](sqlite3 *db) {
        Statement stmt(db, "UPDATE sessions SET prompt_count = prompt_count + 1 WHERE id = ?;");
        bindText(stmt.get(), 1, sessionId);
        stepDone(stmt.get(), "failed to increment prompt count");
    });
}

void SessionStore::incrementToolCount(const std::string &sessionId)
{
    impl->write(sessionId, [&](sqlite3 *db) {
        Statement stmt(db, "UPDATE sessions SET tool_count = tool_count + 1 WHERE id = ?;");
        bindText(stmt.get(), 1, sessionId);
        stepDone(stmt.get(), "failed to increment tool count");
    });
}

void SessionStore::updateFirstPromptIfMissing(const std::string &sessionId,
                                              const std::string &prompt)
{
    if (prompt.empty()) {
        return;
    }
    impl->write(sessionId, [&](sqlite3 *db) {
        Statement stmt(db,
                       "UPDATE sessions SET first_prompt = ? "
                       "WHERE id = ? AND (first_prompt IS NULL OR first_prompt = '');");
        bindText(stmt.get(), 1, prompt);
        bindText(stmt.get(), 2, sessionId);
        stepDone(stmt.get(), "failed to set first prompt");
    });
}

void SessionStore::endSession(const std::string &sessionId,
                              const std::string &reason,
                              Timestamp endedAt)
{
    impl->write(sessionId, [&](sqlite3 *db) {
        Statement stmt(db,
                       "UPDATE sessions SET work_status = 'unknown', "
                       "attention_reason = 'none', pending_tool_name = NULL, "
                       "pending_tool_input = NULL, pending_question = NULL, "
                       "ended_at = ?, end_reason = ? WHERE id = ?;");
        sqlite3_bind_int64(stmt.get(), 1, toEpochMillis(endedAt));
        bindText(stmt.get(), 2, reason);
        bindText(stmt.get(), 3, sessionId);
        stepDone(stmt.get(), "failed to end session");
    });
}

void SessionStore::replaceMessages(const std::string &sessionId,
                                   const std::vector<Message> &messages)
{
    impl->write(sessionId, [&](sqlite3 *db) {
        replaceMessageRows(db, sessionId, messages);
    });
}

void SessionStore::appendMessage(const std::string &sessionId, const Message &message)
{
    impl->write(sessionId, [&](sqlite3 *db) {
        insertMessage(db, sessionId, message, nextSequence(db, sessionId));
    });
}

void SessionStore::upsertMessage(const std::string &sessionId, const Message &message)
{
    impl->write(sessionId, [&](sqlite3 *db) {
        upsertMessageRow(db, sessionId, message);
    });
}

void SessionStore::apply(const SessionWrite &write)
{
    impl->write(write.sessionId, [&](sqlite3 *db) {
        if (write.upsert) {
            insertSession(db, *write.upsert);
        }
        updateSessionFields(db, write.sessionId, write.update);
        if (write.replaceAll) {
            replaceMessageRows(db, write.sessionId, *write.replaceAll);
        }
        for (const auto &message : write.upserts) {
            upsertMessageRow(db, write.sessionId, message);
        }
    });
}

std::vector<Message> SessionStore::readMessages(const std::string &sessionId) const
{
    std::lock_guard<std::mutex> guard(impl->readerMutex);
    const std::string sql = std::string("SELECT ") + kMessageColumns
        + " FROM messages WHERE session_id = ? ORDER BY sequence ASC;";
    Statement stmt(impl->reader, sql.c_str());
    bindText(stmt.get(), 1, sessionId);

    std::vector<Message> messages;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        messages.push_back(readMessageRow(stmt.get()));
    }
    return messages;
}

std::optional<Session> SessionStore::readSession(const std::string &sessionId) const
{
    std::lock_guard<std::mutex> guard(impl->readerMutex);
    const std::string sql = std::string("SELECT ") + kSessionColumns
        + " FROM sessions WHERE id = ? LIMIT 1;";
    Statement stmt(impl->reader, sql.c_str());
    bindText(stmt.get(), 1, sessionId);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return readSessionRow(stmt.get());
}

std::vector<Session> SessionStore::listSessions() const
{
    std::lock_guard<std::mutex> guard(impl->readerMutex);
    const std::string sql = std::string("SELECT ") + kSessionColumns
        + " FROM sessions ORDER BY last_activity_at DESC;";
    Statement stmt(impl->reader, sql.c_str());

    std::vector<Session> sessions;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        sessions.push_back(readSessionRow(stmt.get()));
    }
    return sessions;
}

bool SessionStore::hasMessages(const std::string &sessionId) const
{
    std::lock_guard<std::mutex> guard(impl->readerMutex);
    Statement stmt(impl->reader, "SELECT 1 FROM messages WHERE session_id = ? LIMIT 1;");
    bindText(stmt.get(), 1, sessionId);
    return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

bool SessionStore::sessionExists(const std::string &sessionId) const
{
    std::lock_guard<std::mutex> guard(impl->readerMutex);
    Statement stmt(impl->reader, "SELECT 1 FROM sessions WHERE id = ? LIMIT 1;");
    bindText(stmt.get(), 1, sessionId);
    return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

std::optional<std::string> SessionStore::getMeta(const std::string &key) const
{
    std::lock_guard<std::mutex> guard(impl->readerMutex);
    Statement stmt(impl->reader, "SELECT value FROM meta WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return columnText(stmt.get(), 0);
}

void SessionStore::setMeta(const std::string &key, const std::string &value)
{
    impl->write(std::string(), [&](sqlite3 *db) {
        Statement stmt(db, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
        bindText(stmt.get(), 1, key);
        bindText(stmt.get(), 2, value);
        stepDone(stmt.get(), "failed to set meta value");
    });
}

bool SessionStore::integrityCheck(std::string *message) const
{
    std::lock_guard<std::mutex> guard(impl->readerMutex);
    Statement stmt(impl->reader, "PRAGMA integrity_check;");

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        if (message) {
            *message = "integrity_check failed to return a result";
        }
        return false;
    }

    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

const std::string &SessionStore::path() const
{
    return impl->path;
}

std::size_t SessionStore::activeSessionLocks() const
{
    return impl->sessionLocks.size();
}

} // namespace tracedeck
