#include "daemon/transcript_events.hpp"

#include <cstdio>

#include "common/json_utils.hpp"
#include "daemon/tool_summary.hpp"

namespace tracedeck {

namespace {

std::optional<std::string> stringField(const nlohmann::json &object, const char *key)
{
    if (!object.is_object()) {
        return std::nullopt;
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

int64_t intField(const nlohmann::json &object, const char *key)
{
    if (!object.is_object()) {
        return 0;
    }
    const auto it = object.find(key);
    if (it == object.end()) {
        return 0;
    }
    if (it->is_number_integer()) {
        return it->get<int64_t>();
    }
    if (it->is_number_float()) {
        return static_cast<int64_t>(it->get<double>());
    }
    return 0;
}

const nlohmann::json &objectField(const nlohmann::json &object, const char *key)
{
    static const nlohmann::json kEmpty = nlohmann::json::object();
    if (!object.is_object()) {
        return kEmpty;
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_object()) {
        return kEmpty;
    }
    return *it;
}

std::optional<Timestamp> timestampField(const nlohmann::json &object, const char *key)
{
    if (const auto raw = stringField(object, key)) {
        return parseIso8601(*raw);
    }
    return std::nullopt;
}

std::string joined(const std::vector<std::string> &parts, const std::string &separator)
{
    std::string out;
    for (const auto &part : parts) {
        if (!out.empty()) {
            out += separator;
        }
        out += part;
    }
    return out;
}

std::string lineKeyFor(const nlohmann::json &line)
{
    const std::string text = line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    uint64_t hash = 1469598103934665603ULL;
    for (const unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    char buffer[17] = {};
    std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(hash));
    return buffer;
}

// Tool results carry either a string or a list of text blocks.
std::optional<std::string> toolResultText(const nlohmann::json &content)
{
    if (content.is_string()) {
        return content.get<std::string>();
    }
    if (!content.is_array()) {
        return std::nullopt;
    }
    std::vector<std::string> parts;
    for (const auto &block : content) {
        if (const auto text = stringField(block, "text")) {
            parts.push_back(*text);
        }
    }
    if (parts.empty()) {
        return std::nullopt;
    }
    return joined(parts, "\n");
}

// "data:image/png;base64,AAAA" -> {image/png, AAAA}
std::optional<MessageImage> imageFromDataUrl(const std::string &url)
{
    if (url.rfind("data:", 0) != 0) {
        return std::nullopt;
    }
    const auto marker = url.find(";base64,");
    if (marker == std::string::npos) {
        return std::nullopt;
    }
    MessageImage image;
    image.mimeType = url.substr(5, marker - 5);
    image.data = url.substr(marker + 8);
    if (image.data.empty()) {
        return std::nullopt;
    }
    return image;
}

TokenUsage claudeUsage(const nlohmann::json &usage)
{
    TokenUsage out;
    out.inputTokens = intField(usage, "input_tokens");
    out.outputTokens = intField(usage, "output_tokens");
    out.cacheReadTokens = intField(usage, "cache_read_input_tokens");
    out.cacheCreationTokens = intField(usage, "cache_creation_input_tokens");
    return out;
}

// Codex input counts include cached tokens; split them so the cached part
// is priced and reported as cache reads.
TokenUsage codexUsage(const nlohmann::json &usage)
{
    TokenUsage out;
    const int64_t input = intField(usage, "input_tokens");
    const int64_t cached = intField(usage, "cached_input_tokens");
    out.cacheReadTokens = cached;
    out.inputTokens = input > cached ? input - cached : 0;
    out.outputTokens = intField(usage, "output_tokens");
    return out;
}

std::string mcpToolLabel(const nlohmann::json &invocation)
{
    const auto server = stringField(invocation, "server");
    const auto tool = stringField(invocation, "tool");
    if (server && tool) {
        return "MCP:" + *server + "/" + *tool;
    }
    return "MCP";
}

std::optional<std::string> firstQuestion(const nlohmann::json &payload)
{
    const auto it = payload.find("questions");
    if (it == payload.end() || !it->is_array() || it->empty()) {
        return std::nullopt;
    }
    const auto &first = it->front();
    if (auto question = stringField(first, "question")) {
        return question;
    }
    return stringField(first, "header");
}

nlohmann::json functionArguments(const nlohmann::json &payload)
{
    const auto it = payload.find("arguments");
    if (it == payload.end()) {
        return nlohmann::json();
    }
    if (it->is_string()) {
        auto parsed = nlohmann::json::parse(it->get<std::string>(), nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }
    return *it;
}

// function_call_output.output is a string that often wraps JSON such as
// {"output": "...", "metadata": {...}}.
std::optional<std::string> functionOutput(const nlohmann::json &payload)
{
    const auto it = payload.find("output");
    if (it == payload.end()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        const std::string raw = it->get<std::string>();
        const auto parsed = nlohmann::json::parse(raw, nullptr, false);
        if (!parsed.is_discarded()) {
            if (auto inner = stringField(parsed, "output")) {
                return inner;
            }
        }
        return raw;
    }
    if (it->is_object()) {
        if (auto inner = stringField(*it, "output")) {
            return inner;
        }
        if (auto content = stringField(*it, "content")) {
            return content;
        }
    }
    if (it->is_null()) {
        return std::nullopt;
    }
    return it->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void decodeCodexEventMsg(const nlohmann::json &payload, CodexLine &out)
{
    const std::string type = stringField(payload, "type").value_or("");
    out.callId = stringField(payload, "call_id").value_or("");

    if (type == "task_started" || type == "turn_started") {
        out.kind = CodexEventKind::TurnStarted;
    } else if (type == "task_complete" || type == "turn_complete" || type == "turn_aborted") {
        out.kind = CodexEventKind::TurnComplete;
    } else if (type == "user_message") {
        out.kind = CodexEventKind::UserMessage;
        out.text = stringField(payload, "message");
        const auto images = payload.find("images");
        if (images != payload.end() && images->is_array()) {
            for (const auto &entry : *images) {
                if (!entry.is_string()) {
                    continue;
                }
                if (auto image = imageFromDataUrl(entry.get<std::string>())) {
                    out.images.push_back(std::move(*image));
                }
            }
        }
    } else if (type == "agent_message") {
        out.kind = CodexEventKind::AgentMessage;
        out.text = stringField(payload, "message");
    } else if (type == "agent_reasoning") {
        out.kind = CodexEventKind::AgentReasoning;
        out.text = stringField(payload, "text");
    } else if (type == "exec_command_begin" || type == "exec_command_end") {
        out.kind = type == "exec_command_begin" ? CodexEventKind::ToolBegin
                                                : CodexEventKind::ToolEnd;
        out.toolName = "Shell";
    } else if (type == "patch_apply_begin" || type == "patch_apply_end") {
        out.kind = type == "patch_apply_begin" ? CodexEventKind::ToolBegin
                                               : CodexEventKind::ToolEnd;
        out.toolName = "Edit";
    } else if (type == "mcp_tool_call_begin" || type == "mcp_tool_call_end") {
        out.kind = type == "mcp_tool_call_begin" ? CodexEventKind::ToolBegin
                                                 : CodexEventKind::ToolEnd;
        out.toolName = mcpToolLabel(objectField(payload, "invocation"));
    } else if (type == "web_search_begin" || type == "web_search_end") {
        out.kind = type == "web_search_begin" ? CodexEventKind::ToolBegin
                                              : CodexEventKind::ToolEnd;
        out.toolName = "WebSearch";
    } else if (type == "view_image_tool_call") {
        out.kind = CodexEventKind::ToolEnd;
        out.toolName = "ViewImage";
    } else if (type == "exec_approval_request" || type == "apply_patch_approval_request") {
        out.kind = CodexEventKind::PermissionRequest;
        out.toolName = type == "exec_approval_request" ? "ExecCommand" : "ApplyPatch";
        out.permissionPayload =
            payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } else if (type == "request_user_input") {
        out.kind = CodexEventKind::QuestionRequest;
        out.text = firstQuestion(payload);
    } else if (type == "elicitation_request") {
        out.kind = CodexEventKind::QuestionRequest;
        out.text = stringField(payload, "message");
        if (!out.text) {
            out.text = stringField(payload, "server_name");
        }
    } else if (type == "token_count") {
        const auto &info = objectField(payload, "info");
        const auto &total = objectField(info, "total_token_usage");
        const auto &last = objectField(info, "last_token_usage");
        if (total.empty() && last.empty()) {
            return;
        }
        out.kind = CodexEventKind::TokenCount;
        if (!total.empty()) {
            out.totalUsage = codexUsage(total);
            if (total.contains("total_tokens")) {
                out.totalTokens = intField(total, "total_tokens");
            }
        }
        if (!last.empty()) {
            out.lastUsage = codexUsage(last);
        }
        if (info.contains("model_context_window")) {
            out.contextWindow = intField(info, "model_context_window");
        }
    } else if (type == "thread_name_updated") {
        out.kind = CodexEventKind::ThreadRenamed;
        out.text = stringField(payload, "thread_name");
    }
}

void decodeCodexResponseItem(const nlohmann::json &payload, CodexLine &out)
{
    const std::string type = stringField(payload, "type").value_or("");
    out.callId = stringField(payload, "call_id").value_or("");

    if (type == "function_call") {
        out.kind = CodexEventKind::FunctionCall;
        out.toolName = codexToolLabel(stringField(payload, "name").value_or(""));
        out.toolInput = functionArguments(payload);
    } else if (type == "custom_tool_call") {
        out.kind = CodexEventKind::FunctionCall;
        out.toolName = codexToolLabel(stringField(payload, "name").value_or(""));
        out.toolInput = payload.contains("input") ? payload.at("input") : nlohmann::json();
    } else if (type == "function_call_output" || type == "custom_tool_call_output") {
        out.kind = CodexEventKind::FunctionCallOutput;
        out.toolOutput = functionOutput(payload);
    }
}

} // namespace

TranscriptFormat detectFormat(const nlohmann::json &line)
{
    const std::string type = stringField(line, "type").value_or("");
    if (type == "session_meta" || type == "turn_context" || type == "event_msg"
        || type == "response_item") {
        return TranscriptFormat::Codex;
    }
    if (type == "user" || type == "assistant" || type == "summary" || type == "system"
        || line.contains("sessionId")) {
        return TranscriptFormat::Claude;
    }
    return TranscriptFormat::Unknown;
}

std::string codexToolLabel(const std::string &rawName)
{
    if (rawName == "exec_command") {
        return "Shell";
    }
    if (rawName == "patch_apply" || rawName == "apply_patch") {
        return "Edit";
    }
    if (rawName == "web_search") {
        return "WebSearch";
    }
    if (rawName == "view_image") {
        return "ViewImage";
    }
    if (rawName == "mcp_tool_call") {
        return "MCP";
    }
    return rawName;
}

ClaudeLine decodeClaudeLine(const nlohmann::json &line)
{
    ClaudeLine out;
    if (!line.is_object()) {
        return out;
    }

    const std::string type = stringField(line, "type").value_or("");
    if (type == "user") {
        out.kind = ClaudeLineKind::User;
    } else if (type == "assistant") {
        out.kind = ClaudeLineKind::Assistant;
    } else if (type == "summary") {
        out.kind = ClaudeLineKind::Summary;
    } else if (type == "system") {
        out.kind = ClaudeLineKind::System;
    }

    out.uuid = stringField(line, "uuid").value_or("");
    if (out.uuid.empty()) {
        out.uuid = "claude-" + lineKeyFor(line);
    }
    out.sessionId = stringField(line, "sessionId");
    out.cwd = stringField(line, "cwd");
    out.timestamp = timestampField(line, "timestamp");

    if (out.kind == ClaudeLineKind::Summary) {
        out.summary = stringField(line, "summary");
        return out;
    }

    const auto &message = objectField(line, "message");
    if (auto model = stringField(message, "model"); model && *model != "<synthetic>") {
        out.model = std::move(model);
    }
    out.stopReason = stringField(message, "stop_reason");

    const auto content = message.find("content");
    if (content != message.end() && content->is_string()) {
        out.plainText = true;
        const std::string text = content->get<std::string>();
        if (!text.empty()) {
            out.texts.push_back(text);
        }
    } else if (content != message.end() && content->is_array()) {
        size_t index = 0;
        for (const auto &block : *content) {
            const std::string blockType = stringField(block, "type").value_or("");
            if (blockType == "text") {
                if (auto text = stringField(block, "text"); text && !text->empty()) {
                    out.texts.push_back(*text);
                }
            } else if (blockType == "thinking") {
                if (auto thinking = stringField(block, "thinking"); thinking && !thinking->empty()) {
                    out.thinking.push_back(*thinking);
                }
            } else if (blockType == "image") {
                const auto &source = objectField(block, "source");
                if (stringField(source, "type").value_or("") == "base64") {
                    MessageImage image;
                    image.mimeType = stringField(source, "media_type").value_or("image/png");
                    image.data = stringField(source, "data").value_or("");
                    if (!image.data.empty()) {
                        out.images.push_back(std::move(image));
                    }
                }
            } else if (blockType == "tool_use") {
                ToolUse use;
                use.id = stringField(block, "id").value_or("");
                use.name = stringField(block, "name").value_or("");
                use.input = block.contains("input") ? block.at("input") : nlohmann::json::object();
                if (!use.id.empty() && !use.name.empty()) {
                    out.toolUses.push_back(std::move(use));
                }
            } else if (blockType == "tool_result") {
                if (index == 0) {
                    out.firstBlockIsToolResult = true;
                }
                ToolResult result;
                result.toolUseId = stringField(block, "tool_use_id").value_or("");
                result.output = block.contains("content") ? toolResultText(block.at("content"))
                                                          : std::nullopt;
                const auto isError = block.find("is_error");
                result.isError = isError != block.end() && isError->is_boolean()
                    && isError->get<bool>();
                if (!result.toolUseId.empty()) {
                    out.toolResults.push_back(std::move(result));
                }
            }
            ++index;
        }
    }

    const auto &usage = objectField(message, "usage");
    if (!usage.empty()) {
        out.usage = claudeUsage(usage);
    }
    return out;
}

CodexLine decodeCodexLine(const nlohmann::json &line)
{
    CodexLine out;
    if (!line.is_object()) {
        return out;
    }

    out.timestamp = timestampField(line, "timestamp");
    out.lineKey = lineKeyFor(line);

    const std::string type = stringField(line, "type").value_or("");
    const auto &payload = objectField(line, "payload");

    if (type == "session_meta") {
        out.sessionId = stringField(payload, "id");
        if (!out.sessionId) {
            return out;
        }
        out.kind = CodexEventKind::SessionMeta;
        out.cwd = stringField(payload, "cwd");
        out.model = stringField(payload, "model");
        out.modelProvider = stringField(payload, "model_provider");
        out.sessionStartedAt = timestampField(payload, "timestamp");
    } else if (type == "turn_context") {
        out.kind = CodexEventKind::TurnContext;
        out.cwd = stringField(payload, "cwd");
        out.model = stringField(payload, "model");
    } else if (type == "event_msg") {
        decodeCodexEventMsg(payload, out);
    } else if (type == "response_item") {
        decodeCodexResponseItem(payload, out);
    }
    return out;
}

std::vector<Message> claudeLineMessages(const ClaudeLine &line, Timestamp timestamp)
{
    std::vector<Message> messages;

    if (line.kind == ClaudeLineKind::User) {
        if (line.firstBlockIsToolResult) {
            return messages;
        }
        const std::string content = joined(line.texts, "\n");
        if (content.empty() && line.images.empty()) {
            return messages;
        }
        Message message;
        message.id = line.uuid;
        message.type = MessageType::User;
        message.content = content;
        message.timestamp = timestamp;
        message.images = line.images;
        messages.push_back(std::move(message));
        return messages;
    }

    if (line.kind != ClaudeLineKind::Assistant) {
        return messages;
    }

    const std::string text = joined(line.texts, "\n");
    const std::string thinking = joined(line.thinking, "\n\n");

    if (!text.empty()) {
        Message message;
        message.id = line.uuid + "-text";
        message.type = MessageType::Assistant;
        message.content = text;
        message.timestamp = timestamp;
        if (!thinking.empty()) {
            message.thinking = thinking;
        }
        if (line.usage) {
            message.inputTokens = line.usage->inputTokens;
            message.outputTokens = line.usage->outputTokens;
        }
        messages.push_back(std::move(message));
    } else if (!thinking.empty()) {
        Message message;
        message.id = line.uuid + "-thinking";
        message.type = MessageType::Thinking;
        message.content = thinking;
        message.timestamp = timestamp;
        messages.push_back(std::move(message));
    }

    for (size_t i = 0; i < line.toolUses.size(); ++i) {
        const auto &use = line.toolUses[i];
        Message message;
        message.id = line.uuid + "-tool-" + std::to_string(i);
        message.type = MessageType::Tool;
        message.content = summarizeToolCall(use.name, use.input);
        message.timestamp = timestamp;
        message.toolName = use.name;
        message.toolInput = use.input;
        message.inProgress = true;
        messages.push_back(std::move(message));
    }
    return messages;
}

std::optional<Message> codexLineMessage(const CodexLine &line,
                                        Timestamp timestamp,
                                        const std::optional<std::string> &thinking)
{
    Message message;
    message.timestamp = timestamp;

    switch (line.kind) {
    case CodexEventKind::UserMessage:
        if (line.text.value_or("").empty() && line.images.empty()) {
            return std::nullopt;
        }
        message.id = "codex-" + line.lineKey + "-user";
        message.type = MessageType::User;
        message.content = line.text.value_or("");
        message.images = line.images;
        return message;
    case CodexEventKind::AgentMessage:
        if (line.text.value_or("").empty()) {
            return std::nullopt;
        }
        message.id = "codex-" + line.lineKey + "-assistant";
        message.type = MessageType::Assistant;
        message.content = *line.text;
        message.thinking = thinking;
        return message;
    case CodexEventKind::FunctionCall:
        message.id = line.callId.empty() ? "codex-" + line.lineKey + "-call"
                                         : "codex-call-" + line.callId;
        message.type = MessageType::Tool;
        message.toolName = line.toolName;
        message.toolInput = line.toolInput;
        message.content = summarizeToolCall(line.toolName, line.toolInput);
        message.inProgress = true;
        return message;
    default:
        return std::nullopt;
    }
}

void completeToolMessage(Message &message,
                         const std::optional<std::string> &output,
                         Timestamp endedAt)
{
    message.toolOutput = output;
    message.toolDuration = positiveDuration(message.timestamp, endedAt);
    message.inProgress = false;
}

std::optional<double> positiveDuration(Timestamp start, Timestamp end)
{
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    if (millis <= 0) {
        return std::nullopt;
    }
    return static_cast<double>(millis) / 1000.0;
}

} // namespace tracedeck
