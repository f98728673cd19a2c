#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <QString>

#include "common/models.hpp"

namespace tracedeck {

/**
 * CursorStore keeps one TranscriptCursor per tailed path and mirrors the
 * whole set to a small JSON file:
 *
 *   {"version": 1, "files": {"<path>": {"offset": ..., ...}}}
 *
 * Writes go through QSaveFile so a crash never leaves a half-written file.
 * An empty file path keeps cursors in memory only.
 */
class CursorStore {
public:
    explicit CursorStore(const QString &filePath = QString());

    std::optional<TranscriptCursor> load(const std::string &path) const;
    std::vector<TranscriptCursor> all() const;

    // Returns false when the backing file could not be written. The
    // in-memory cursor is updated either way.
    bool save(const TranscriptCursor &cursor);
    bool remove(const std::string &path);

    QString filePath() const;

private:
    void readFile();
    bool writeFileLocked() const;

    QString m_filePath;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, TranscriptCursor> m_cursors;
};

} // namespace tracedeck
