#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "daemon/cursor_store.hpp"

namespace tracedeck {

struct TailRead {
    std::string path;
    uint64_t startOffset = 0;
    uint64_t endOffset = 0;
    std::vector<std::string> lines;
    std::string partialTail;
    // First line of the file, read when tailing skipped the session header.
    std::optional<std::string> bootstrapLine;
    // File shrank since the last observation; offset was reset to 0.
    bool truncated = false;
};

struct CursorIdentity {
    std::optional<std::string> sessionId;
    std::optional<std::string> projectPath;
    std::optional<std::string> model;
    TranscriptFormat format = TranscriptFormat::Unknown;
};

/**
 * FileTailTracker turns a change signal for a transcript path into the
 * complete lines appended since the last committed read.
 *
 * Reads are two-phase: onChangeSignal() computes the new lines without
 * moving the persisted cursor, commit() moves it once downstream
 * processing succeeded. Callers must not run two reads of the same path
 * concurrently.
 */
class FileTailTracker {
public:
    explicit FileTailTracker(CursorStore &cursors,
                             Timestamp startedAt = std::chrono::system_clock::now());

    std::optional<TailRead> onChangeSignal(const std::string &path);
    bool commit(const TailRead &read, const CursorIdentity &identity = {});

    std::optional<TranscriptCursor> cursor(const std::string &path) const;
    bool forget(const std::string &path);

    // Reads the first complete line of a file, up to 64 KiB.
    static std::optional<std::string> readFirstLine(const std::string &path);

private:
    TranscriptCursor initialCursor(const std::string &path, uint64_t size) const;

    CursorStore &m_cursors;
    Timestamp m_startedAt;
};

} // namespace tracedeck
