#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace tracedeck {

using Timestamp = std::chrono::system_clock::time_point;

struct MessageImage {
    std::string mimeType;
    std::string data;
};

struct Message {
    std::string id;
    std::string sessionId;
    MessageType type = MessageType::System;
    std::string content;
    Timestamp timestamp;
    uint32_t sequence = 0;
    std::optional<std::string> toolName;
    nlohmann::json toolInput;
    std::optional<std::string> toolOutput;
    std::optional<double> toolDuration;
    std::optional<int64_t> inputTokens;
    std::optional<int64_t> outputTokens;
    std::optional<std::string> thinking;
    std::vector<MessageImage> images;
    bool inProgress = false;
};

struct Session {
    std::string id;
    std::string projectPath;
    std::string projectName;
    std::string transcriptPath;
    TranscriptFormat format = TranscriptFormat::Unknown;
    std::optional<std::string> model;
    WorkStatus workStatus = WorkStatus::Unknown;
    AttentionReason attentionReason = AttentionReason::None;
    std::optional<std::string> pendingToolName;
    std::optional<std::string> pendingToolInput;
    std::optional<std::string> pendingQuestion;
    std::optional<std::string> firstPrompt;
    std::optional<std::string> customName;
    std::optional<std::string> lastTool;
    std::optional<Timestamp> lastToolAt;
    int promptCount = 0;
    int toolCount = 0;
    int64_t totalTokens = 0;
    Timestamp startedAt;
    Timestamp lastActivityAt;
    std::optional<Timestamp> endedAt;
    std::optional<std::string> endReason;
};

// Partial update for SessionStore::updateSession. An unset outer optional
// leaves the column alone; a set outer optional holding std::nullopt clears it.
struct SessionUpdate {
    std::optional<std::optional<std::string>> model;
    std::optional<WorkStatus> workStatus;
    std::optional<AttentionReason> attentionReason;
    std::optional<std::optional<std::string>> pendingToolName;
    std::optional<std::optional<std::string>> pendingToolInput;
    std::optional<std::optional<std::string>> pendingQuestion;
    std::optional<std::optional<std::string>> firstPrompt;
    std::optional<std::optional<std::string>> customName;
    std::optional<std::optional<std::string>> lastTool;
    std::optional<std::optional<Timestamp>> lastToolAt;
    std::optional<int> promptCount;
    std::optional<int> toolCount;
    std::optional<int64_t> totalTokens;
    std::optional<Timestamp> lastActivityAt;
    std::optional<std::optional<Timestamp>> endedAt;
    std::optional<std::optional<std::string>> endReason;

    bool empty() const
    {
        return !model && !workStatus && !attentionReason && !pendingToolName
            && !pendingToolInput && !pendingQuestion && !firstPrompt
            && !customName && !lastTool && !lastToolAt && !promptCount
            && !toolCount && !totalTokens && !lastActivityAt && !endedAt
            && !endReason;
    }
};

struct PendingToolCall {
    std::string toolName;
    Timestamp startedAt;
};

struct TranscriptCursor {
    std::string path;
    uint64_t byteOffset = 0;
    std::string partialTail;
    std::optional<std::string> sessionId;
    std::optional<std::string> projectPath;
    std::optional<std::string> model;
    bool ignoreExisting = false;
    TranscriptFormat format = TranscriptFormat::Unknown;
};

struct UsageStats {
    int64_t inputTokens = 0;
    int64_t outputTokens = 0;
    int64_t cacheReadTokens = 0;
    int64_t cacheCreationTokens = 0;
    std::optional<std::string> model;
    int64_t contextUsed = 0;
    int64_t contextLimit = 200000;

    int64_t totalTokens() const
    {
        return inputTokens + outputTokens;
    }

    double contextPercentage() const
    {
        if (contextLimit <= 0) {
            return 0.0;
        }
        return std::min(100.0, static_cast<double>(contextUsed) * 100.0
                                   / static_cast<double>(contextLimit));
    }
};

struct ParseResult {
    TranscriptFormat format = TranscriptFormat::Unknown;
    std::optional<std::string> sessionId;
    std::optional<std::string> projectPath;
    std::vector<Message> messages;
    UsageStats stats;
    std::optional<std::string> lastUserPrompt;
    std::optional<std::string> lastTool;
    // Session state derived by applying every line in order.
    std::optional<Session> session;
};

} // namespace tracedeck
