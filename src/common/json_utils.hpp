#pragma once

#include <chrono>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include <QByteArray>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace tracedeck {

inline std::string toIso8601Utc(Timestamp timestamp)
{
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            timestamp.time_since_epoch())
                            .count();
    std::time_t time = static_cast<std::time_t>(millis / 1000);
    int fraction = static_cast<int>(millis % 1000);
    if (fraction < 0) {
        fraction += 1000;
        --time;
    }
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << fraction << 'Z';
    return out.str();
}

// Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and an
// optional "Z" or "+HH:MM" / "-HHMM" zone suffix. No suffix means UTC.
inline std::optional<Timestamp> parseIso8601(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }

    std::string rest;
    std::getline(in, rest);
    size_t pos = 0;

    int64_t millis = 0;
    if (pos < rest.size() && rest[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (rest[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 3; ++i) {
            millis *= 10;
        }
    }

    int offsetSeconds = 0;
    if (pos < rest.size()) {
        const char zone = rest[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            std::string digits;
            for (size_t i = pos + 1; i < rest.size(); ++i) {
                if (std::isdigit(static_cast<unsigned char>(rest[i]))) {
                    digits.push_back(rest[i]);
                } else if (rest[i] != ':') {
                    return std::nullopt;
                }
            }
            if (digits.size() != 4 && digits.size() != 2) {
                return std::nullopt;
            }
            const int hours = std::stoi(digits.substr(0, 2));
            const int minutes = digits.size() == 4 ? std::stoi(digits.substr(2, 2)) : 0;
            offsetSeconds = (hours * 3600 + minutes * 60) * (zone == '-' ? -1 : 1);
            pos = rest.size();
        } else {
            return std::nullopt;
        }
    }

    const std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(time - offsetSeconds)
        + std::chrono::milliseconds(millis);
}

inline Timestamp fromIso8601Utc(const std::string &value)
{
    return parseIso8601(value).value_or(Timestamp{});
}

inline std::string toFormatString(TranscriptFormat format)
{
    switch (format) {
    case TranscriptFormat::Claude:
        return "claude";
    case TranscriptFormat::Codex:
        return "codex";
    case TranscriptFormat::Unknown:
        return "unknown";
    }
    return "unknown";
}

inline TranscriptFormat parseFormatString(const std::string &value)
{
    if (value == "claude") {
        return TranscriptFormat::Claude;
    }
    if (value == "codex") {
        return TranscriptFormat::Codex;
    }
    return TranscriptFormat::Unknown;
}

inline std::string toWorkStatusString(WorkStatus status)
{
    switch (status) {
    case WorkStatus::Working:
        return "working";
    case WorkStatus::Waiting:
        return "waiting";
    case WorkStatus::Permission:
        return "permission";
    case WorkStatus::Unknown:
        return "unknown";
    }
    return "unknown";
}

inline WorkStatus parseWorkStatusString(const std::string &value)
{
    if (value == "working") {
        return WorkStatus::Working;
    }
    if (value == "waiting") {
        return WorkStatus::Waiting;
    }
    if (value == "permission") {
        return WorkStatus::Permission;
    }
    return WorkStatus::Unknown;
}

inline std::string toAttentionString(AttentionReason reason)
{
    switch (reason) {
    case AttentionReason::AwaitingPermission:
        return "awaitingPermission";
    case AttentionReason::AwaitingQuestion:
        return "awaitingQuestion";
    case AttentionReason::AwaitingReply:
        return "awaitingReply";
    case AttentionReason::None:
        return "none";
    }
    return "none";
}

inline AttentionReason parseAttentionString(const std::string &value)
{
    if (value == "awaitingPermission") {
        return AttentionReason::AwaitingPermission;
    }
    if (value == "awaitingQuestion") {
        return AttentionReason::AwaitingQuestion;
    }
    if (value == "awaitingReply") {
        return AttentionReason::AwaitingReply;
    }
    return AttentionReason::None;
}

inline std::string toMessageTypeString(MessageType type)
{
    switch (type) {
    case MessageType::User:
        return "user";
    case MessageType::Assistant:
        return "assistant";
    case MessageType::Tool:
        return "tool";
    case MessageType::ToolResult:
        return "toolResult";
    case MessageType::Thinking:
        return "thinking";
    case MessageType::System:
        return "system";
    }
    return "system";
}

inline MessageType parseMessageTypeString(const std::string &value)
{
    if (value == "user") {
        return MessageType::User;
    }
    if (value == "assistant") {
        return MessageType::Assistant;
    }
    if (value == "tool") {
        return MessageType::Tool;
    }
    if (value == "toolResult") {
        return MessageType::ToolResult;
    }
    if (value == "thinking") {
        return MessageType::Thinking;
    }
    return MessageType::System;
}

inline nlohmann::json optionalToJson(const std::optional<std::string> &value)
{
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

inline std::optional<std::string> optionalStringFrom(const nlohmann::json &j,
                                                     const char *key)
{
    if (!j.contains(key) || !j.at(key).is_string()) {
        return std::nullopt;
    }
    return j.at(key).get<std::string>();
}

inline void to_json(nlohmann::json &j, const MessageImage &image)
{
    j = nlohmann::json{
        {"mimeType", image.mimeType},
        {"data", image.data}
    };
}

inline void from_json(const nlohmann::json &j, MessageImage &image)
{
    image.mimeType = j.value("mimeType", "");
    image.data = j.value("data", "");
}

inline void to_json(nlohmann::json &j, const Message &message)
{
    j = nlohmann::json{
        {"id", message.id},
        {"sessionId", message.sessionId},
        {"type", toMessageTypeString(message.type)},
        {"content", message.content},
        {"timestamp", toIso8601Utc(message.timestamp)},
        {"sequence", message.sequence},
        {"toolName", optionalToJson(message.toolName)},
        {"toolInput", message.toolInput},
        {"toolOutput", optionalToJson(message.toolOutput)},
        {"toolDuration", message.toolDuration ? nlohmann::json(*message.toolDuration)
                                              : nlohmann::json(nullptr)},
        {"inputTokens", message.inputTokens ? nlohmann::json(*message.inputTokens)
                                            : nlohmann::json(nullptr)},
        {"outputTokens", message.outputTokens ? nlohmann::json(*message.outputTokens)
                                              : nlohmann::json(nullptr)},
        {"thinking", optionalToJson(message.thinking)},
        {"images", message.images},
        {"inProgress", message.inProgress}
    };
}

inline void from_json(const nlohmann::json &j, Message &message)
{
    message.id = j.value("id", "");
    message.sessionId = j.value("sessionId", "");
    message.type = parseMessageTypeString(j.value("type", "system"));
    message.content = j.value("content", "");
    message.timestamp = fromIso8601Utc(j.value("timestamp", ""));
    message.sequence = j.value("sequence", 0u);
    message.toolName = optionalStringFrom(j, "toolName");
    message.toolInput = j.contains("toolInput") ? j.at("toolInput") : nlohmann::json();
    message.toolOutput = optionalStringFrom(j, "toolOutput");
    if (j.contains("toolDuration") && j.at("toolDuration").is_number()) {
        message.toolDuration = j.at("toolDuration").get<double>();
    }
    if (j.contains("inputTokens") && j.at("inputTokens").is_number_integer()) {
        message.inputTokens = j.at("inputTokens").get<int64_t>();
    }
    if (j.contains("outputTokens") && j.at("outputTokens").is_number_integer()) {
        message.outputTokens = j.at("outputTokens").get<int64_t>();
    }
    message.thinking = optionalStringFrom(j, "thinking");
    if (j.contains("images") && j.at("images").is_array()) {
        message.images = j.at("images").get<std::vector<MessageImage>>();
    }
    message.inProgress = j.value("inProgress", false);
}

inline void to_json(nlohmann::json &j, const Session &session)
{
    j = nlohmann::json{
        {"id", session.id},
        {"projectPath", session.projectPath},
        {"projectName", session.projectName},
        {"transcriptPath", session.transcriptPath},
        {"format", toFormatString(session.format)},
        {"model", optionalToJson(session.model)},
        {"workStatus", toWorkStatusString(session.workStatus)},
        {"attentionReason", toAttentionString(session.attentionReason)},
        {"pendingToolName", optionalToJson(session.pendingToolName)},
        {"pendingToolInput", optionalToJson(session.pendingToolInput)},
        {"pendingQuestion", optionalToJson(session.pendingQuestion)},
        {"firstPrompt", optionalToJson(session.firstPrompt)},
        {"customName", optionalToJson(session.customName)},
        {"lastTool", optionalToJson(session.lastTool)},
        {"lastToolAt", session.lastToolAt ? nlohmann::json(toIso8601Utc(*session.lastToolAt))
                                          : nlohmann::json(nullptr)},
        {"promptCount", session.promptCount},
        {"toolCount", session.toolCount},
        {"totalTokens", session.totalTokens},
        {"startedAt", toIso8601Utc(session.startedAt)},
        {"lastActivityAt", toIso8601Utc(session.lastActivityAt)},
        {"endedAt", session.endedAt ? nlohmann::json(toIso8601Utc(*session.endedAt))
                                    : nlohmann::json(nullptr)},
        {"endReason", optionalToJson(session.endReason)}
    };
}

inline void from_json(const nlohmann::json &j, Session &session)
{
    session.id = j.value("id", "");
    session.projectPath = j.value("projectPath", "");
    session.projectName = j.value("projectName", "");
    session.transcriptPath = j.value("transcriptPath", "");
    session.format = parseFormatString(j.value("format", "unknown"));
    session.model = optionalStringFrom(j, "model");
    session.workStatus = parseWorkStatusString(j.value("workStatus", "unknown"));
    session.attentionReason = parseAttentionString(j.value("attentionReason", "none"));
    session.pendingToolName = optionalStringFrom(j, "pendingToolName");
    session.pendingToolInput = optionalStringFrom(j, "pendingToolInput");
    session.pendingQuestion = optionalStringFrom(j, "pendingQuestion");
    session.firstPrompt = optionalStringFrom(j, "firstPrompt");
    session.customName = optionalStringFrom(j, "customName");
    session.lastTool = optionalStringFrom(j, "lastTool");
    if (const auto lastToolAt = optionalStringFrom(j, "lastToolAt")) {
        session.lastToolAt = parseIso8601(*lastToolAt);
    }
    session.promptCount = j.value("promptCount", 0);
    session.toolCount = j.value("toolCount", 0);
    session.totalTokens = j.value("totalTokens", int64_t{0});
    session.startedAt = fromIso8601Utc(j.value("startedAt", ""));
    session.lastActivityAt = fromIso8601Utc(j.value("lastActivityAt", ""));
    if (const auto endedAt = optionalStringFrom(j, "endedAt")) {
        session.endedAt = parseIso8601(*endedAt);
    }
    session.endReason = optionalStringFrom(j, "endReason");
}

inline void to_json(nlohmann::json &j, const UsageStats &stats)
{
    j = nlohmann::json{
        {"inputTokens", stats.inputTokens},
        {"outputTokens", stats.outputTokens},
        {"cacheReadTokens", stats.cacheReadTokens},
        {"cacheCreationTokens", stats.cacheCreationTokens},
        {"model", optionalToJson(stats.model)},
        {"contextUsed", stats.contextUsed},
        {"contextLimit", stats.contextLimit}
    };
}

inline void to_json(nlohmann::json &j, const ParseResult &result)
{
    j = nlohmann::json{
        {"format", toFormatString(result.format)},
        {"sessionId", optionalToJson(result.sessionId)},
        {"projectPath", optionalToJson(result.projectPath)},
        {"messages", result.messages},
        {"stats", result.stats},
        {"lastUserPrompt", optionalToJson(result.lastUserPrompt)},
        {"lastTool", optionalToJson(result.lastTool)},
        {"session", result.session ? nlohmann::json(*result.session) : nlohmann::json(nullptr)}
    };
}

// The tail may end inside a multi-byte character, so it is stored as base64.
inline std::string encodePartialTail(const std::string &bytes)
{
    return QByteArray::fromStdString(bytes).toBase64().toStdString();
}

inline std::string decodePartialTail(const std::string &encoded)
{
    const auto result = QByteArray::fromBase64Encoding(
        QByteArray::fromStdString(encoded), QByteArray::AbortOnBase64DecodingErrors);
    if (!result) {
        throw std::invalid_argument("partialTail is not valid base64");
    }
    return result.decoded.toStdString();
}

inline void to_json(nlohmann::json &j, const TranscriptCursor &cursor)
{
    j = nlohmann::json{
        {"offset", cursor.byteOffset},
        {"partialTail", encodePartialTail(cursor.partialTail)},
        {"partialTailEncoding", "base64"},
        {"partialTailPresent", !cursor.partialTail.empty()},
        {"sessionId", optionalToJson(cursor.sessionId)},
        {"projectPath", optionalToJson(cursor.projectPath)},
        {"model", optionalToJson(cursor.model)},
        {"ignoreExisting", cursor.ignoreExisting},
        {"format", toFormatString(cursor.format)}
    };
}

inline void from_json(const nlohmann::json &j, TranscriptCursor &cursor)
{
    cursor.byteOffset = j.value("offset", uint64_t{0});
    const std::string tail = j.value("partialTail", "");
    cursor.partialTail = j.value("partialTailEncoding", "") == "base64"
        ? decodePartialTail(tail)
        : tail;
    cursor.sessionId = optionalStringFrom(j, "sessionId");
    cursor.projectPath = optionalStringFrom(j, "projectPath");
    cursor.model = optionalStringFrom(j, "model");
    cursor.ignoreExisting = j.value("ignoreExisting", false);
    cursor.format = parseFormatString(j.value("format", "unknown"));
}

} // namespace tracedeck
