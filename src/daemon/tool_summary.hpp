#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace tracedeck {

// One-line display text for a tool invocation, chosen by tool name.
// Falls back to the tool name when the input lacks the expected field.
std::string summarizeToolCall(const std::string &toolName, const nlohmann::json &input);

// "/a/b/c/d.txt" -> ".../c/d.txt" once the path has more than three components.
std::string shortenPath(const std::string &path);

// Path from the first "*** Add File:" or "*** Update File:" header of a patch body.
std::optional<std::string> patchTargetPath(const std::string &patch);

// Cuts to at most maxChars code points and appends "..." when anything was cut.
std::string truncateWithEllipsis(const std::string &text, size_t maxChars);

} // namespace tracedeck
