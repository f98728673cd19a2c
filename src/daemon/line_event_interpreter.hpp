#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace tracedeck {

/**
 * Derived state of one transcript while its lines are being applied.
 *
 * pendingCalls holds at most one entry per call id; a second begin for the
 * same id overwrites the start timestamp. toolMessages keeps the in-progress
 * tool message for each call so the completed version can be emitted with
 * the same id once the result arrives.
 */
struct TranscriptState {
    std::string path;
    Session session;
    bool hasSession = false;

    std::unordered_map<std::string, PendingToolCall> pendingCalls;
    std::unordered_set<std::string> completedCalls;
    std::unordered_map<std::string, Message> toolMessages;

    std::optional<std::string> pendingReasoning;
    std::optional<Timestamp> lastTimestamp;
    int64_t cumulativeTokens = 0;

    // Line timestamp, falling back to the previous line's.
    Timestamp resolveTimestamp(const std::optional<Timestamp> &lineTimestamp);
};

/**
 * One adapter per transcript vocabulary. apply() decodes a single JSON line,
 * mutates the session state held in TranscriptState and returns the
 * messages the line produced (new or updated, identified by Message::id).
 * Unknown event tags are ignored.
 */
class LineEventInterpreter {
public:
    virtual ~LineEventInterpreter() = default;

    virtual TranscriptFormat format() const = 0;
    virtual std::vector<Message> apply(const nlohmann::json &line,
                                       TranscriptState &state) const = 0;
};

class ClaudeLineInterpreter final : public LineEventInterpreter {
public:
    TranscriptFormat format() const override;
    std::vector<Message> apply(const nlohmann::json &line,
                               TranscriptState &state) const override;
};

class CodexLineInterpreter final : public LineEventInterpreter {
public:
    TranscriptFormat format() const override;
    std::vector<Message> apply(const nlohmann::json &line,
                               TranscriptState &state) const override;
};

std::unique_ptr<LineEventInterpreter> makeInterpreter(TranscriptFormat format);

// "Brisk Orbiting Comet": adjective, verb and noun picked by a djb2 hash of the id.
std::string stableSessionName(const std::string &sessionId);

// Whitespace collapsed to single spaces, capped at 80 characters (77 + "...").
std::string firstPromptSummary(const std::string &prompt);

// Ends the session: status unknown, attention cleared, pending calls dropped.
void endSession(TranscriptState &state, Timestamp endedAt, const std::string &reason);

} // namespace tracedeck
