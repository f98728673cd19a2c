#include "daemon/line_event_interpreter.hpp"

#include <array>
#include <cctype>

#include "daemon/tool_summary.hpp"
#include "daemon/transcript_events.hpp"

namespace tracedeck {

namespace {

constexpr size_t kFirstPromptMaxChars = 80;
constexpr size_t kFirstPromptKeepChars = 77;
constexpr const char *kAskUserQuestionTool = "AskUserQuestion";

constexpr std::array<const char *, 16> kNameAdjectives = {
    "Dapper", "Stellar", "Brisk", "Golden", "Gentle", "Clever", "Nimble", "Radiant",
    "Bold", "Quiet", "Swift", "Witty", "Bright", "Calm", "Lucky", "Focused",
};

constexpr std::array<const char *, 16> kNameVerbs = {
    "Soaring", "Gliding", "Orbiting", "Cruising", "Humming", "Tuning", "Weaving", "Drifting",
    "Climbing", "Sailing", "Skimming", "Shaping", "Guiding", "Tracing", "Nesting", "Rolling",
};

constexpr std::array<const char *, 16> kNameNouns = {
    "Spindle", "Comet", "Beacon", "Canvas", "Signal", "Compass", "Workshop", "Harbor",
    "Circuit", "Pioneer", "Atlas", "Voyager", "Relay", "Forge", "Station", "Rocket",
};

size_t codePointCount(const std::string &text)
{
    size_t count = 0;
    for (const unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::string projectNameFor(const std::string &projectPath)
{
    std::string trimmed = projectPath;
    while (trimmed.size() > 1 && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    const auto slash = trimmed.find_last_of('/');
    return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
}

// Claude names transcripts "<session id>.jsonl".
std::string sessionIdFromPath(const std::string &path)
{
    std::string name = projectNameFor(path);
    const auto dot = name.rfind(".jsonl");
    if (dot != std::string::npos && dot + 6 == name.size()) {
        name.resize(dot);
    }
    return name;
}

void startSession(TranscriptState &state,
                  const std::string &sessionId,
                  TranscriptFormat format,
                  Timestamp startedAt)
{
    Session session;
    session.id = sessionId;
    session.transcriptPath = state.path;
    session.format = format;
    session.startedAt = startedAt;
    session.lastActivityAt = startedAt;
    state.session = std::move(session);
    state.hasSession = true;
    state.pendingCalls.clear();
    state.completedCalls.clear();
    state.toolMessages.clear();
    state.pendingReasoning.reset();
    state.cumulativeTokens = 0;
}

void setProjectPath(Session &session, const std::string &projectPath)
{
    if (projectPath.empty()) {
        return;
    }
    session.projectPath = projectPath;
    session.projectName = projectNameFor(projectPath);
}

// Activity after an idle end reopens the session.
void touch(Session &session, Timestamp timestamp)
{
    if (timestamp > session.lastActivityAt) {
        session.lastActivityAt = timestamp;
    }
    if (session.endedAt && timestamp > *session.endedAt) {
        session.endedAt.reset();
        session.endReason.reset();
    }
}

void clearPendingFields(Session &session)
{
    session.pendingToolName.reset();
    session.pendingToolInput.reset();
    session.pendingQuestion.reset();
}

void ensureSessionName(Session &session)
{
    if (!session.customName && !session.firstPrompt) {
        session.customName = stableSessionName(session.id);
    }
}

void markWorking(Session &session, const std::optional<std::string> &tool, Timestamp timestamp)
{
    session.workStatus = WorkStatus::Working;
    session.attentionReason = AttentionReason::None;
    if (tool) {
        session.lastTool = tool;
        session.lastToolAt = timestamp;
    }
}

void markWaiting(Session &session)
{
    session.workStatus = WorkStatus::Waiting;
    session.attentionReason = AttentionReason::AwaitingReply;
    clearPendingFields(session);
    ensureSessionName(session);
}

void recordUserInput(Session &session, const std::string &text)
{
    ++session.promptCount;
    if (!session.firstPrompt) {
        const std::string summary = firstPromptSummary(text);
        if (!summary.empty()) {
            session.firstPrompt = summary;
        }
    }
    session.workStatus = WorkStatus::Working;
    session.attentionReason = AttentionReason::None;
    session.pendingQuestion.reset();
}

void beginToolCall(TranscriptState &state,
                   const std::string &callId,
                   const std::string &toolName,
                   Timestamp timestamp)
{
    if (!callId.empty()) {
        state.pendingCalls[callId] = PendingToolCall{toolName, timestamp};
    }
    markWorking(state.session,
                toolName.empty() ? std::nullopt : std::optional<std::string>(toolName),
                timestamp);
}

// Returns the tool name of the call that ended, if one was pending.
std::optional<std::string> endToolCall(TranscriptState &state,
                                       const std::string &callId,
                                       const std::string &toolName,
                                       Timestamp timestamp)
{
    // Status and attention stay as they are; the next terminal event decides them.
    Session &session = state.session;
    session.pendingToolName.reset();
    session.pendingToolInput.reset();

    // Codex reports some calls in two vocabularies; count each id once.
    if (!callId.empty() && state.completedCalls.contains(callId)) {
        return std::nullopt;
    }

    std::optional<std::string> endedName;
    if (!callId.empty()) {
        state.completedCalls.insert(callId);
        const auto it = state.pendingCalls.find(callId);
        if (it != state.pendingCalls.end()) {
            endedName = it->second.toolName;
            state.pendingCalls.erase(it);
        }
    }

    ++session.toolCount;
    const std::string name = !toolName.empty() ? toolName : endedName.value_or("");
    if (!name.empty()) {
        session.lastTool = name;
        session.lastToolAt = timestamp;
    }
    return endedName;
}

void attachSessionId(std::vector<Message> &messages, const Session &session)
{
    for (auto &message : messages) {
        message.sessionId = session.id;
    }
}

} // namespace

Timestamp TranscriptState::resolveTimestamp(const std::optional<Timestamp> &lineTimestamp)
{
    if (lineTimestamp) {
        lastTimestamp = lineTimestamp;
    }
    return lastTimestamp.value_or(Timestamp{});
}

std::string stableSessionName(const std::string &sessionId)
{
    uint64_t hash = 5381;
    for (const unsigned char c : sessionId) {
        hash = hash * 33 + c;
    }
    const auto adjective = kNameAdjectives[hash % kNameAdjectives.size()];
    const auto verb = kNameVerbs[(hash / 7) % kNameVerbs.size()];
    const auto noun = kNameNouns[(hash / 31) % kNameNouns.size()];
    return std::string(adjective) + " " + verb + " " + noun;
}

std::string firstPromptSummary(const std::string &prompt)
{
    std::string cleaned;
    bool pendingSpace = false;
    for (const char c : prompt) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !cleaned.empty();
            continue;
        }
        if (pendingSpace) {
            cleaned.push_back(' ');
            pendingSpace = false;
        }
        cleaned.push_back(c);
    }

    if (codePointCount(cleaned) > kFirstPromptMaxChars) {
        return truncateWithEllipsis(cleaned, kFirstPromptKeepChars);
    }
    return cleaned;
}

void endSession(TranscriptState &state, Timestamp endedAt, const std::string &reason)
{
    if (!state.hasSession) {
        return;
    }
    Session &session = state.session;
    session.workStatus = WorkStatus::Unknown;
    session.attentionReason = AttentionReason::None;
    clearPendingFields(session);
    session.endedAt = endedAt;
    session.endReason = reason;
    state.pendingCalls.clear();
}

std::unique_ptr<LineEventInterpreter> makeInterpreter(TranscriptFormat format)
{
    switch (format) {
    case TranscriptFormat::Claude:
        return std::make_unique<ClaudeLineInterpreter>();
    case TranscriptFormat::Codex:
        return std::make_unique<CodexLineInterpreter>();
    case TranscriptFormat::Unknown:
        break;
    }
    return nullptr;
}

TranscriptFormat ClaudeLineInterpreter::format() const
{
    return TranscriptFormat::Claude;
}

std::vector<Message> ClaudeLineInterpreter::apply(const nlohmann::json &json,
                                                  TranscriptState &state) const
{
    const ClaudeLine line = decodeClaudeLine(json);
    if (line.kind == ClaudeLineKind::Unknown) {
        return {};
    }
    const Timestamp timestamp = state.resolveTimestamp(line.timestamp);

    if (!state.hasSession) {
        const std::string sessionId = line.sessionId.value_or(sessionIdFromPath(state.path));
        if (sessionId.empty()) {
            return {};
        }
        startSession(state, sessionId, TranscriptFormat::Claude, timestamp);
    }

    Session &session = state.session;
    if (line.cwd && session.projectPath.empty()) {
        setProjectPath(session, *line.cwd);
    }
    touch(session, timestamp);

    std::vector<Message> messages;

    switch (line.kind) {
    case ClaudeLineKind::Summary:
        if (line.summary && !line.summary->empty() && !session.customName) {
            session.customName = line.summary;
        }
        break;

    case ClaudeLineKind::User: {
        messages = claudeLineMessages(line, timestamp);
        for (const auto &result : line.toolResults) {
            const auto pending = state.pendingCalls.find(result.toolUseId);
            const bool wasQuestion = pending != state.pendingCalls.end()
                && pending->second.toolName == kAskUserQuestionTool;
            endToolCall(state, result.toolUseId, std::string(), timestamp);
            if (wasQuestion) {
                session.pendingQuestion.reset();
            }

            const auto toolMessage = state.toolMessages.find(result.toolUseId);
            if (toolMessage != state.toolMessages.end()) {
                Message completed = toolMessage->second;
                completeToolMessage(completed, result.output, timestamp);
                messages.push_back(std::move(completed));
                state.toolMessages.erase(toolMessage);
            }
        }
        if (!line.firstBlockIsToolResult && (!line.texts.empty() || !line.images.empty())) {
            std::string prompt;
            for (const auto &text : line.texts) {
                prompt += prompt.empty() ? text : "\n" + text;
            }
            recordUserInput(session, prompt);
        }
        break;
    }

    case ClaudeLineKind::Assistant: {
        if (line.model) {
            session.model = line.model;
        }
        if (line.usage) {
            state.cumulativeTokens += line.usage->total();
            session.totalTokens = state.cumulativeTokens;
        }

        messages = claudeLineMessages(line, timestamp);
        size_t toolIndex = 0;
        for (const auto &message : messages) {
            if (message.type == MessageType::Tool && toolIndex < line.toolUses.size()) {
                state.toolMessages[line.toolUses[toolIndex].id] = message;
                ++toolIndex;
            }
        }

        for (const auto &use : line.toolUses) {
            beginToolCall(state, use.id, use.name, timestamp);
            if (use.name == kAskUserQuestionTool) {
                session.workStatus = WorkStatus::Waiting;
                session.attentionReason = AttentionReason::AwaitingQuestion;
                std::optional<std::string> question;
                const auto questions = use.input.find("questions");
                if (use.input.is_object() && questions != use.input.end()
                    && questions->is_array() && !questions->empty()
                    && questions->front().is_object()) {
                    const auto &first = questions->front();
                    if (first.contains("question") && first.at("question").is_string()) {
                        question = first.at("question").get<std::string>();
                    }
                }
                session.pendingQuestion = question;
            }
        }

        const bool toolTurn = line.stopReason && *line.stopReason == "tool_use";
        if (line.toolUses.empty() && !line.texts.empty() && !toolTurn) {
            markWaiting(session);
        }
        break;
    }

    case ClaudeLineKind::System:
    case ClaudeLineKind::Unknown:
        break;
    }

    attachSessionId(messages, session);
    return messages;
}

TranscriptFormat CodexLineInterpreter::format() const
{
    return TranscriptFormat::Codex;
}

std::vector<Message> CodexLineInterpreter::apply(const nlohmann::json &json,
                                                 TranscriptState &state) const
{
    const CodexLine line = decodeCodexLine(json);
    if (line.kind == CodexEventKind::Unknown) {
        return {};
    }
    const Timestamp timestamp = state.resolveTimestamp(line.timestamp);

    if (line.kind == CodexEventKind::SessionMeta) {
        if (!state.hasSession || state.session.id != *line.sessionId) {
            startSession(state,
                         *line.sessionId,
                         TranscriptFormat::Codex,
                         line.sessionStartedAt.value_or(timestamp));
            state.session.workStatus = WorkStatus::Unknown;
        }
        if (line.cwd) {
            setProjectPath(state.session, *line.cwd);
        }
        if (line.model) {
            state.session.model = line.model;
        }
        touch(state.session, timestamp);
        return {};
    }

    if (!state.hasSession) {
        return {};
    }

    Session &session = state.session;
    touch(session, timestamp);
    std::vector<Message> messages;

    switch (line.kind) {
    case CodexEventKind::TurnContext:
        if (line.model) {
            session.model = line.model;
        }
        if (line.cwd && *line.cwd != session.projectPath) {
            setProjectPath(session, *line.cwd);
        }
        break;

    case CodexEventKind::TurnStarted:
        markWorking(session, std::nullopt, timestamp);
        clearPendingFields(session);
        break;

    case CodexEventKind::TurnComplete:
        markWaiting(session);
        break;

    case CodexEventKind::UserMessage:
        recordUserInput(session, line.text.value_or(""));
        if (auto message = codexLineMessage(line, timestamp, std::nullopt)) {
            messages.push_back(std::move(*message));
        }
        break;

    case CodexEventKind::AgentMessage:
        markWaiting(session);
        if (auto message = codexLineMessage(line, timestamp, state.pendingReasoning)) {
            messages.push_back(std::move(*message));
            state.pendingReasoning.reset();
        }
        break;

    case CodexEventKind::AgentReasoning:
        if (line.text && !line.text->empty()) {
            state.pendingReasoning = state.pendingReasoning
                ? *state.pendingReasoning + "\n\n" + *line.text
                : *line.text;
        }
        break;

    case CodexEventKind::ToolBegin:
        beginToolCall(state, line.callId, line.toolName, timestamp);
        break;

    case CodexEventKind::ToolEnd:
        endToolCall(state, line.callId, line.toolName, timestamp);
        break;

    case CodexEventKind::PermissionRequest:
        session.workStatus = WorkStatus::Permission;
        session.attentionReason = AttentionReason::AwaitingPermission;
        session.pendingToolName = line.toolName;
        session.pendingToolInput = line.permissionPayload;
        break;

    case CodexEventKind::QuestionRequest:
        session.workStatus = WorkStatus::Waiting;
        session.attentionReason = AttentionReason::AwaitingQuestion;
        session.pendingQuestion = line.text;
        break;

    case CodexEventKind::TokenCount:
        if (line.totalTokens) {
            session.totalTokens = *line.totalTokens;
        } else if (line.totalUsage) {
            session.totalTokens = line.totalUsage->total();
        }
        break;

    case CodexEventKind::ThreadRenamed:
        if (line.text && !line.text->empty()) {
            session.customName = line.text;
        }
        break;

    case CodexEventKind::FunctionCall: {
        beginToolCall(state, line.callId, line.toolName, timestamp);
        if (auto message = codexLineMessage(line, timestamp, std::nullopt)) {
            state.toolMessages[line.callId.empty() ? message->id : line.callId] = *message;
            messages.push_back(std::move(*message));
        }
        break;
    }

    case CodexEventKind::FunctionCallOutput: {
        endToolCall(state, line.callId, std::string(), timestamp);
        const auto toolMessage = state.toolMessages.find(line.callId);
        if (toolMessage != state.toolMessages.end()) {
            Message completed = toolMessage->second;
            completeToolMessage(completed, line.toolOutput, timestamp);
            messages.push_back(std::move(completed));
            state.toolMessages.erase(toolMessage);
        }
        break;
    }

    case CodexEventKind::SessionMeta:
    case CodexEventKind::Unknown:
        break;
    }

    attachSessionId(messages, session);
    return messages;
}

} // namespace tracedeck
