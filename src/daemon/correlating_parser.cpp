#include "daemon/correlating_parser.hpp"

#include <fstream>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "daemon/transcript_events.hpp"

namespace tracedeck {

namespace {

struct CallResult {
    std::optional<std::string> output;
    Timestamp endedAt;
};

struct CorrelationMaps {
    std::unordered_map<std::string, Timestamp> starts;
    std::unordered_map<std::string, CallResult> results;
};

// Appends messages in order, assigning sequence numbers from position. A
// repeated tool message id replaces the earlier entry in place.
class MessageCollector {
public:
    void add(Message message)
    {
        const auto it = m_indexById.find(message.id);
        if (it != m_indexById.end()) {
            if (message.type == MessageType::Tool) {
                message.sequence = m_messages[it->second].sequence;
                m_messages[it->second] = std::move(message);
                return;
            }
            message.id += "-" + std::to_string(++m_duplicates[message.id]);
        }
        message.sequence = static_cast<uint32_t>(m_messages.size());
        m_indexById[message.id] = m_messages.size();
        m_messages.push_back(std::move(message));
    }

    std::vector<Message> take()
    {
        return std::move(m_messages);
    }

private:
    std::vector<Message> m_messages;
    std::unordered_map<std::string, size_t> m_indexById;
    std::unordered_map<std::string, int> m_duplicates;
};

void correlate(Message &message, const std::string &callId, const CorrelationMaps &maps)
{
    const auto start = maps.starts.find(callId);
    if (start != maps.starts.end()) {
        message.timestamp = start->second;
    }
    const auto result = maps.results.find(callId);
    if (result == maps.results.end()) {
        message.inProgress = true;
        message.toolOutput.reset();
        message.toolDuration.reset();
        return;
    }
    completeToolMessage(message, result->second.output, result->second.endedAt);
}

TranscriptFormat detectLinesFormat(const std::vector<nlohmann::json> &lines)
{
    for (const auto &line : lines) {
        const TranscriptFormat format = detectFormat(line);
        if (format != TranscriptFormat::Unknown) {
            return format;
        }
    }
    return TranscriptFormat::Unknown;
}

void parseClaude(const std::vector<nlohmann::json> &lines, ParseResult &result)
{
    std::vector<ClaudeLine> decoded;
    std::vector<Timestamp> timestamps;
    decoded.reserve(lines.size());
    timestamps.reserve(lines.size());

    CorrelationMaps maps;
    std::optional<Timestamp> previous;
    for (const auto &json : lines) {
        ClaudeLine line = decodeClaudeLine(json);
        if (line.timestamp) {
            previous = line.timestamp;
        }
        const Timestamp timestamp = previous.value_or(Timestamp{});
        for (const auto &use : line.toolUses) {
            maps.starts[use.id] = timestamp;
        }
        for (const auto &toolResult : line.toolResults) {
            maps.results[toolResult.toolUseId] = CallResult{toolResult.output, timestamp};
        }
        decoded.push_back(std::move(line));
        timestamps.push_back(timestamp);
    }

    MessageCollector collector;
    UsageStats &stats = result.stats;
    for (size_t i = 0; i < decoded.size(); ++i) {
        const ClaudeLine &line = decoded[i];

        if (line.kind == ClaudeLineKind::Assistant) {
            if (line.model && !stats.model) {
                stats.model = line.model;
            }
            if (line.usage) {
                stats.inputTokens += line.usage->inputTokens;
                stats.outputTokens += line.usage->outputTokens;
                stats.cacheReadTokens += line.usage->cacheReadTokens;
                stats.cacheCreationTokens += line.usage->cacheCreationTokens;
                if (line.usage->contextTokens() > 0) {
                    stats.contextUsed = line.usage->contextTokens();
                }
            }
        }

        size_t toolIndex = 0;
        for (Message &message : claudeLineMessages(line, timestamps[i])) {
            if (message.type == MessageType::User) {
                result.lastUserPrompt = message.content;
            }
            if (message.type == MessageType::Tool && toolIndex < line.toolUses.size()) {
                const auto &use = line.toolUses[toolIndex++];
                correlate(message, use.id, maps);
                result.lastTool = use.name;
            }
            collector.add(std::move(message));
        }
    }
    result.messages = collector.take();
}

void parseCodex(const std::vector<nlohmann::json> &lines, ParseResult &result)
{
    std::vector<CodexLine> decoded;
    std::vector<Timestamp> timestamps;
    decoded.reserve(lines.size());
    timestamps.reserve(lines.size());

    CorrelationMaps maps;
    std::optional<Timestamp> previous;
    for (const auto &json : lines) {
        CodexLine line = decodeCodexLine(json);
        if (line.timestamp) {
            previous = line.timestamp;
        }
        const Timestamp timestamp = previous.value_or(Timestamp{});
        if (line.kind == CodexEventKind::FunctionCall && !line.callId.empty()) {
            maps.starts[line.callId] = timestamp;
        } else if (line.kind == CodexEventKind::FunctionCallOutput && !line.callId.empty()) {
            maps.results[line.callId] = CallResult{line.toolOutput, timestamp};
        }
        decoded.push_back(std::move(line));
        timestamps.push_back(timestamp);
    }

    MessageCollector collector;
    UsageStats &stats = result.stats;
    std::optional<std::string> pendingReasoning;
    for (size_t i = 0; i < decoded.size(); ++i) {
        const CodexLine &line = decoded[i];

        switch (line.kind) {
        case CodexEventKind::SessionMeta:
        case CodexEventKind::TurnContext:
            if (line.model && !stats.model) {
                stats.model = line.model;
            }
            break;
        case CodexEventKind::TokenCount:
            if (line.totalUsage) {
                stats.inputTokens = line.totalUsage->inputTokens;
                stats.outputTokens = line.totalUsage->outputTokens;
                stats.cacheReadTokens = line.totalUsage->cacheReadTokens;
                stats.cacheCreationTokens = line.totalUsage->cacheCreationTokens;
            }
            if (line.lastUsage && line.lastUsage->contextTokens() > 0) {
                stats.contextUsed = line.lastUsage->contextTokens();
            }
            if (line.contextWindow && *line.contextWindow > 0) {
                stats.contextLimit = *line.contextWindow;
            }
            break;
        case CodexEventKind::AgentReasoning:
            if (line.text && !line.text->empty()) {
                pendingReasoning = pendingReasoning ? *pendingReasoning + "\n\n" + *line.text
                                                    : *line.text;
            }
            break;
        case CodexEventKind::UserMessage:
            if (auto message = codexLineMessage(line, timestamps[i], std::nullopt)) {
                result.lastUserPrompt = message->content;
                collector.add(std::move(*message));
            }
            break;
        case CodexEventKind::AgentMessage:
            if (auto message = codexLineMessage(line, timestamps[i], pendingReasoning)) {
                pendingReasoning.reset();
                collector.add(std::move(*message));
            }
            break;
        case CodexEventKind::FunctionCall:
            if (auto message = codexLineMessage(line, timestamps[i], std::nullopt)) {
                if (!line.callId.empty()) {
                    correlate(*message, line.callId, maps);
                }
                result.lastTool = line.toolName;
                collector.add(std::move(*message));
            }
            break;
        default:
            break;
        }
    }
    result.messages = collector.take();
}

} // namespace

std::vector<std::string> CorrelatingParser::readLines(const std::string &path, bool *ok)
{
    std::vector<std::string> lines;
    std::ifstream file(path, std::ios::binary);
    if (ok) {
        *ok = file.is_open();
    }
    if (!file.is_open()) {
        return lines;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") != std::string::npos) {
            lines.push_back(std::move(line));
        }
    }
    return lines;
}

ParseResult CorrelatingParser::parseAll(const std::string &path,
                                        TranscriptState *finalState) const
{
    bool ok = false;
    const std::vector<std::string> lines = readLines(path, &ok);
    if (!ok) {
        TDLOG_DEBUG(QStringLiteral("CorrelatingParser"),
                    QStringLiteral("parseAll"),
                    QStringLiteral("transcript_unreadable"),
                    QStringLiteral("full_resync"),
                    QStringLiteral("empty_result"),
                    logging::defaultWho(),
                    QString(),
                    nlohmann::json({{"path", path}}));
        return ParseResult{};
    }
    return parseLines(lines, path, finalState);
}

ParseResult CorrelatingParser::parseLines(const std::vector<std::string> &lines,
                                          const std::string &path,
                                          TranscriptState *finalState) const
{
    std::vector<nlohmann::json> decoded;
    decoded.reserve(lines.size());
    size_t malformed = 0;
    for (const auto &line : lines) {
        auto json = nlohmann::json::parse(line, nullptr, false);
        if (json.is_discarded() || !json.is_object()) {
            ++malformed;
            continue;
        }
        decoded.push_back(std::move(json));
    }

    ParseResult result;
    result.format = detectLinesFormat(decoded);
    if (result.format == TranscriptFormat::Unknown) {
        return result;
    }

    if (result.format == TranscriptFormat::Claude) {
        parseClaude(decoded, result);
    } else {
        parseCodex(decoded, result);
    }

    const auto interpreter = makeInterpreter(result.format);
    TranscriptState state;
    state.path = path;
    for (const auto &json : decoded) {
        interpreter->apply(json, state);
    }
    if (state.hasSession) {
        result.session = state.session;
        result.sessionId = state.session.id;
        if (!state.session.projectPath.empty()) {
            result.projectPath = state.session.projectPath;
        }
        for (auto &message : result.messages) {
            message.sessionId = state.session.id;
        }
    }
    if (!result.stats.model && result.session && result.session->model) {
        result.stats.model = result.session->model;
    }
    if (finalState) {
        *finalState = std::move(state);
    }

    if (malformed > 0) {
        TDLOG_DEBUG(QStringLiteral("CorrelatingParser"),
                    QStringLiteral("parseLines"),
                    QStringLiteral("malformed_lines_skipped"),
                    QStringLiteral("invalid_json"),
                    QStringLiteral("skip_line"),
                    logging::defaultWho(),
                    QString(),
                    nlohmann::json({{"path", path}, {"count", malformed}}));
    }
    return result;
}

} // namespace tracedeck
