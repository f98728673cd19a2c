#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace tracedeck {

// Writes that must land together for one session. Applied in order:
// upsert, update, replaceAll, then upserts.
struct SessionWrite {
    std::string sessionId;
    std::optional<Session> upsert;
    SessionUpdate update;
    std::optional<std::vector<Message>> replaceAll;
    std::vector<Message> upserts;
};

// Fields of after that differ from before. Identity fields (id, paths,
// format, startedAt) are not part of an update.
SessionUpdate diffSessions(const Session &before, const Session &after);

// Counter columns set to the session's values, for rows rebuilt from scratch.
SessionUpdate counterUpdate(const Session &session);

// SessionStore is the SQLite access layer for sessions and their messages.
// Mutations go through a single writer connection; queries use a separate
// read-only connection so readers see the last committed state without
// waiting on an open write transaction.
class SessionStore {
public:
    // Opens (creating if needed) the database at dbPath. Throws
    // std::runtime_error when the database cannot be opened or migrated.
    explicit SessionStore(const std::string &dbPath);
    ~SessionStore();

    SessionStore(const SessionStore &) = delete;
    SessionStore &operator=(const SessionStore &) = delete;

    // Counters and startedAt of an existing row are preserved.
    void upsertSession(const Session &session);
    void updateSession(const std::string &sessionId, const SessionUpdate &update);
    void incrementPromptCount(const std::string &sessionId);
    void incrementToolCount(const std::string &sessionId);
    void updateFirstPromptIfMissing(const std::string &sessionId, const std::string &prompt);
    void endSession(const std::string &sessionId, const std::string &reason, Timestamp endedAt);

    // Message persistence. replaceMessages renumbers from 0 by array index;
    // upsertMessage keeps the sequence of an existing id.
    void replaceMessages(const std::string &sessionId, const std::vector<Message> &messages);
    void appendMessage(const std::string &sessionId, const Message &message);
    void upsertMessage(const std::string &sessionId, const Message &message);

    // All parts of write commit in one transaction or none do.
    void apply(const SessionWrite &write);

    std::vector<Message> readMessages(const std::string &sessionId) const;
    std::optional<Session> readSession(const std::string &sessionId) const;
    std::vector<Session> listSessions() const;
    bool hasMessages(const std::string &sessionId) const;
    bool sessionExists(const std::string &sessionId) const;

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

    bool integrityCheck(std::string *message) const;

    const std::string &path() const;

    // Sessions with a write currently holding or waiting on their lock.
    std::size_t activeSessionLocks() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace tracedeck
