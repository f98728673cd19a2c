#include "daemon/cursor_store.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace tracedeck {

namespace {

constexpr int kCursorFileVersion = 1;

} // namespace

CursorStore::CursorStore(const QString &filePath)
    : m_filePath(filePath)
{
    readFile();
}

QString CursorStore::filePath() const
{
    return m_filePath;
}

std::optional<TranscriptCursor> CursorStore::load(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_cursors.find(path);
    if (it == m_cursors.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<TranscriptCursor> CursorStore::all() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<TranscriptCursor> cursors;
    cursors.reserve(m_cursors.size());
    for (const auto &[path, cursor] : m_cursors) {
        cursors.push_back(cursor);
    }
    return cursors;
}

bool CursorStore::save(const TranscriptCursor &cursor)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cursors[cursor.path] = cursor;
    return writeFileLocked();
}

bool CursorStore::remove(const std::string &path)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_cursors.erase(path) == 0) {
        return true;
    }
    return writeFileLocked();
}

void CursorStore::readFile()
{
    if (m_filePath.isEmpty()) {
        return;
    }

    QFile file(m_filePath);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        TDLOG_WARN(QStringLiteral("CursorStore"),
                   QStringLiteral("readFile"),
                   QStringLiteral("cursor_file_unreadable"),
                   QStringLiteral("startup"),
                   QStringLiteral("start_with_empty_cursors"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json({{"path", m_filePath.toStdString()}}));
        return;
    }

    const QByteArray data = file.readAll();
    const auto document = nlohmann::json::parse(data.constData(),
                                                data.constData() + data.size(),
                                                nullptr,
                                                false);
    if (document.is_discarded() || !document.is_object()
        || !document.contains("files") || !document.at("files").is_object()) {
        TDLOG_WARN(QStringLiteral("CursorStore"),
                   QStringLiteral("readFile"),
                   QStringLiteral("cursor_file_corrupt"),
                   QStringLiteral("startup"),
                   QStringLiteral("start_with_empty_cursors"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json({{"path", m_filePath.toStdString()}}));
        return;
    }

    for (const auto &[path, entry] : document.at("files").items()) {
        if (!entry.is_object()) {
            continue;
        }
        try {
            TranscriptCursor cursor = entry.get<TranscriptCursor>();
            cursor.path = path;
            m_cursors[path] = std::move(cursor);
        } catch (const std::exception &error) {
            TDLOG_WARN(QStringLiteral("CursorStore"),
                       QStringLiteral("readFile"),
                       QStringLiteral("cursor_entry_invalid"),
                       QStringLiteral("startup"),
                       QStringLiteral("skip_entry"),
                       logging::defaultWho(),
                       QString(),
                       nlohmann::json({{"path", path}, {"error", error.what()}}));
        }
    }

    TDLOG_DEBUG(QStringLiteral("CursorStore"),
                QStringLiteral("readFile"),
                QStringLiteral("cursors_loaded"),
                QStringLiteral("startup"),
                QStringLiteral("json_file"),
                logging::defaultWho(),
                QString(),
                nlohmann::json({{"count", m_cursors.size()}}));
}

bool CursorStore::writeFileLocked() const
{
    if (m_filePath.isEmpty()) {
        return true;
    }

    nlohmann::json files = nlohmann::json::object();
    for (const auto &[path, cursor] : m_cursors) {
        files[path] = cursor;
    }
    const nlohmann::json document = {
        {"version", kCursorFileVersion},
        {"files", files}
    };

    QDir().mkpath(QFileInfo(m_filePath).absolutePath());
    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    const std::string payload =
        document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    if (file.write(payload.data(), static_cast<qint64>(payload.size()))
        != static_cast<qint64>(payload.size())) {
        file.cancelWriting();
        return false;
    }
    return file.commit();
}

} // namespace tracedeck
