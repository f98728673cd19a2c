#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace tracedeck {

// Transcript lines are decoded once into these closed vocabularies before
// any state or message logic looks at them. Tags we do not know decode to
// Unknown and are ignored downstream.

struct TokenUsage {
    int64_t inputTokens = 0;
    int64_t outputTokens = 0;
    int64_t cacheReadTokens = 0;
    int64_t cacheCreationTokens = 0;

    int64_t contextTokens() const
    {
        return inputTokens + cacheReadTokens + cacheCreationTokens;
    }

    int64_t total() const
    {
        return inputTokens + outputTokens + cacheReadTokens + cacheCreationTokens;
    }
};

struct ToolUse {
    std::string id;
    std::string name;
    nlohmann::json input;
};

struct ToolResult {
    std::string toolUseId;
    std::optional<std::string> output;
    bool isError = false;
};

enum class ClaudeLineKind {
    Unknown,
    User,
    Assistant,
    Summary,
    System
};

struct ClaudeLine {
    ClaudeLineKind kind = ClaudeLineKind::Unknown;
    std::string uuid;
    std::optional<std::string> sessionId;
    std::optional<std::string> cwd;
    std::optional<Timestamp> timestamp;
    std::optional<std::string> model;
    std::optional<std::string> stopReason;
    std::optional<std::string> summary;
    // User content given as a plain string rather than typed blocks.
    bool plainText = false;
    bool firstBlockIsToolResult = false;
    std::vector<std::string> texts;
    std::vector<std::string> thinking;
    std::vector<MessageImage> images;
    std::vector<ToolUse> toolUses;
    std::vector<ToolResult> toolResults;
    std::optional<TokenUsage> usage;
};

enum class CodexEventKind {
    Unknown,
    SessionMeta,
    TurnContext,
    TurnStarted,
    TurnComplete,
    UserMessage,
    AgentMessage,
    AgentReasoning,
    ToolBegin,
    ToolEnd,
    PermissionRequest,
    QuestionRequest,
    TokenCount,
    ThreadRenamed,
    FunctionCall,
    FunctionCallOutput
};

struct CodexLine {
    CodexEventKind kind = CodexEventKind::Unknown;
    std::optional<Timestamp> timestamp;
    // Stable content key used to derive message ids.
    std::string lineKey;

    std::optional<std::string> sessionId;
    std::optional<std::string> cwd;
    std::optional<std::string> model;
    std::optional<std::string> modelProvider;
    std::optional<Timestamp> sessionStartedAt;

    std::optional<std::string> text;
    std::vector<MessageImage> images;

    std::string callId;
    std::string toolName;
    nlohmann::json toolInput;
    std::optional<std::string> toolOutput;

    std::string permissionPayload;

    std::optional<TokenUsage> totalUsage;
    std::optional<TokenUsage> lastUsage;
    std::optional<int64_t> totalTokens;
    std::optional<int64_t> contextWindow;
};

TranscriptFormat detectFormat(const nlohmann::json &line);

ClaudeLine decodeClaudeLine(const nlohmann::json &line);
CodexLine decodeCodexLine(const nlohmann::json &line);

// Codex function names to display labels ("exec_command" -> "Shell", ...).
std::string codexToolLabel(const std::string &rawName);

// Messages a line contributes before any result correlation. Tool
// messages come back in progress, without output or duration.
std::vector<Message> claudeLineMessages(const ClaudeLine &line, Timestamp timestamp);
std::optional<Message> codexLineMessage(const CodexLine &line,
                                        Timestamp timestamp,
                                        const std::optional<std::string> &thinking);

// Applies a call result to an in-progress tool message.
void completeToolMessage(Message &message,
                         const std::optional<std::string> &output,
                         Timestamp endedAt);

// Seconds between start and end, only when positive.
std::optional<double> positiveDuration(Timestamp start, Timestamp end);

} // namespace tracedeck
