#include "daemon/file_tail_tracker.hpp"

#include <fstream>

#include <QDateTime>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace tracedeck {

namespace {

constexpr std::streamsize kFirstLineLimitBytes = 64 * 1024;

Timestamp toTimestamp(const QDateTime &value)
{
    return Timestamp{std::chrono::milliseconds(value.toMSecsSinceEpoch())};
}

bool isBlank(const std::string &line)
{
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

void stripCarriageReturn(std::string &line)
{
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

} // namespace

FileTailTracker::FileTailTracker(CursorStore &cursors, Timestamp startedAt)
    : m_cursors(cursors)
    , m_startedAt(startedAt)
{
}

TranscriptCursor FileTailTracker::initialCursor(const std::string &path, uint64_t size) const
{
    TranscriptCursor cursor;
    cursor.path = path;

    const QFileInfo info(QString::fromStdString(path));
    QDateTime created = info.birthTime();
    if (!created.isValid()) {
        created = info.lastModified();
    }

    if (created.isValid() && toTimestamp(created) < m_startedAt) {
        cursor.ignoreExisting = true;
        cursor.byteOffset = size;
    }
    return cursor;
}

std::optional<TailRead> FileTailTracker::onChangeSignal(const std::string &path)
{
    const QFileInfo info(QString::fromStdString(path));
    if (!info.exists() || !info.isFile()) {
        return std::nullopt;
    }
    const uint64_t size = static_cast<uint64_t>(info.size());

    std::optional<TranscriptCursor> stored = m_cursors.load(path);
    if (!stored) {
        stored = initialCursor(path, size);
        // The seed offset is fixed now; later growth is measured from it.
        if (!m_cursors.save(*stored)) {
            TDLOG_WARN(QStringLiteral("FileTailTracker"),
                       QStringLiteral("onChangeSignal"),
                       QStringLiteral("cursor_persist_failed"),
                       QStringLiteral("first_observation"),
                       QStringLiteral("kept_in_memory"),
                       logging::defaultWho(),
                       QString(),
                       nlohmann::json({{"path", path}}));
        }
        if (stored->ignoreExisting) {
            TDLOG_DEBUG(QStringLiteral("FileTailTracker"),
                        QStringLiteral("onChangeSignal"),
                        QStringLiteral("ignore_existing_content"),
                        QStringLiteral("file_predates_tracker"),
                        QStringLiteral("seek_to_end"),
                        logging::defaultWho(),
                        QString(),
                        nlohmann::json({{"path", path}, {"offset", size}}));
        }
    }
    TranscriptCursor cursor = *stored;

    TailRead read;
    read.path = path;

    if (size < cursor.byteOffset) {
        TDLOG_INFO(QStringLiteral("FileTailTracker"),
                   QStringLiteral("onChangeSignal"),
                   QStringLiteral("transcript_truncated"),
                   QStringLiteral("file_shrank"),
                   QStringLiteral("reset_offset"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json({{"path", path},
                                   {"previousOffset", cursor.byteOffset},
                                   {"size", size}}));
        cursor.byteOffset = 0;
        cursor.partialTail.clear();
        read.truncated = true;
    }

    read.startOffset = cursor.byteOffset;
    read.endOffset = cursor.byteOffset;
    read.partialTail = cursor.partialTail;

    if (size == cursor.byteOffset) {
        if (read.truncated) {
            return read;
        }
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        TDLOG_WARN(QStringLiteral("FileTailTracker"),
                   QStringLiteral("onChangeSignal"),
                   QStringLiteral("transcript_open_failed"),
                   QStringLiteral("change_signal"),
                   QStringLiteral("retry_on_next_signal"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json({{"path", path}}));
        return std::nullopt;
    }

    file.seekg(static_cast<std::streamoff>(cursor.byteOffset));
    std::string chunk(static_cast<size_t>(size - cursor.byteOffset), '\0');
    file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    chunk.resize(static_cast<size_t>(file.gcount()));
    if (chunk.empty()) {
        return read.truncated ? std::optional<TailRead>(read) : std::nullopt;
    }
    read.endOffset = cursor.byteOffset + chunk.size();

    std::string pending = cursor.partialTail + chunk;
    size_t lineStart = 0;
    for (size_t newline = pending.find('\n'); newline != std::string::npos;
         newline = pending.find('\n', lineStart)) {
        std::string line = pending.substr(lineStart, newline - lineStart);
        lineStart = newline + 1;
        stripCarriageReturn(line);
        if (!isBlank(line)) {
            read.lines.push_back(std::move(line));
        }
    }
    read.partialTail = pending.substr(lineStart);

    const bool needsIdentity = cursor.ignoreExisting || !cursor.sessionId.has_value();
    if (needsIdentity && read.startOffset > 0) {
        read.bootstrapLine = readFirstLine(path);
    }

    return read;
}

bool FileTailTracker::commit(const TailRead &read, const CursorIdentity &identity)
{
    TranscriptCursor cursor = m_cursors.load(read.path).value_or(TranscriptCursor{});
    cursor.path = read.path;
    cursor.byteOffset = read.endOffset;
    cursor.partialTail = read.partialTail;
    cursor.ignoreExisting = false;

    if (identity.sessionId) {
        cursor.sessionId = identity.sessionId;
    }
    if (identity.projectPath) {
        cursor.projectPath = identity.projectPath;
    }
    if (identity.model) {
        cursor.model = identity.model;
    }
    if (identity.format != TranscriptFormat::Unknown) {
        cursor.format = identity.format;
    }

    if (!m_cursors.save(cursor)) {
        TDLOG_WARN(QStringLiteral("FileTailTracker"),
                   QStringLiteral("commit"),
                   QStringLiteral("cursor_persist_failed"),
                   QStringLiteral("commit_after_processing"),
                   QStringLiteral("kept_in_memory"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json({{"path", read.path}, {"offset", read.endOffset}}));
        return false;
    }
    return true;
}

std::optional<TranscriptCursor> FileTailTracker::cursor(const std::string &path) const
{
    return m_cursors.load(path);
}

bool FileTailTracker::forget(const std::string &path)
{
    return m_cursors.remove(path);
}

std::optional<std::string> FileTailTracker::readFirstLine(const std::string &path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string buffer(static_cast<size_t>(kFirstLineLimitBytes), '\0');
    file.read(buffer.data(), kFirstLineLimitBytes);
    buffer.resize(static_cast<size_t>(file.gcount()));

    const auto newline = buffer.find('\n');
    if (newline == std::string::npos) {
        return std::nullopt;
    }
    std::string line = buffer.substr(0, newline);
    stripCarriageReturn(line);
    if (isBlank(line)) {
        return std::nullopt;
    }
    return line;
}

} // namespace tracedeck
