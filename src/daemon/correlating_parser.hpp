#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"
#include "daemon/line_event_interpreter.hpp"

namespace tracedeck {

/**
 * CorrelatingParser derives the full message list and usage statistics of a
 * transcript from scratch.
 *
 * - Pass 1 collects call start timestamps and call results by call id.
 * - Pass 2 walks the lines again in order, assigning sequence numbers from
 *   0, attaching images and reasoning to their messages and completing tool
 *   messages from the pass-1 maps.
 *
 * The result depends only on file content, so parsing an unchanged file
 * twice yields identical output.
 */
class CorrelatingParser {
public:
    // Missing or unreadable files yield an empty result. finalState, when
    // given, receives the interpreter state after the last line.
    ParseResult parseAll(const std::string &path,
                         TranscriptState *finalState = nullptr) const;

    // path, when given, names the transcript for session identity fallback.
    ParseResult parseLines(const std::vector<std::string> &lines,
                           const std::string &path = std::string(),
                           TranscriptState *finalState = nullptr) const;

    static std::vector<std::string> readLines(const std::string &path, bool *ok = nullptr);
};

} // namespace tracedeck
