#include "daemon/tool_summary.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace tracedeck {

namespace {

constexpr size_t kCommandSummaryChars = 60;
constexpr size_t kPromptSummaryChars = 50;

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::optional<std::string> stringField(const nlohmann::json &input, const char *key)
{
    if (!input.is_object() || !input.contains(key) || !input.at(key).is_string()) {
        return std::nullopt;
    }
    return input.at(key).get<std::string>();
}

// Shell tools send either a string or an argv array.
std::optional<std::string> commandText(const nlohmann::json &input)
{
    for (const char *key : {"command", "cmd"}) {
        if (!input.is_object() || !input.contains(key)) {
            continue;
        }
        const auto &value = input.at(key);
        if (value.is_string()) {
            return value.get<std::string>();
        }
        if (value.is_array()) {
            std::string joined;
            for (const auto &part : value) {
                if (!part.is_string()) {
                    continue;
                }
                if (!joined.empty()) {
                    joined += ' ';
                }
                joined += part.get<std::string>();
            }
            if (!joined.empty()) {
                return joined;
            }
        }
    }
    return std::nullopt;
}

std::string trim(const std::string &value)
{
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

bool isUtf8Continuation(unsigned char c)
{
    return (c & 0xC0) == 0x80;
}

} // namespace

std::string truncateWithEllipsis(const std::string &text, size_t maxChars)
{
    size_t chars = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (isUtf8Continuation(static_cast<unsigned char>(text[i]))) {
            continue;
        }
        if (chars == maxChars) {
            return text.substr(0, i) + "...";
        }
        ++chars;
    }
    return text;
}

std::string shortenPath(const std::string &path)
{
    std::vector<std::string> components;
    std::string current;
    std::istringstream in(path);
    while (std::getline(in, current, '/')) {
        components.push_back(current);
    }
    if (!path.empty() && path.back() == '/') {
        components.emplace_back();
    }

    if (components.size() > 3) {
        return ".../" + components[components.size() - 2] + "/" + components.back();
    }
    return path;
}

std::optional<std::string> patchTargetPath(const std::string &patch)
{
    static const std::vector<std::string> kHeaders = {
        "*** Add File:",
        "*** Update File:",
    };

    std::istringstream in(patch);
    std::string line;
    while (std::getline(in, line)) {
        const std::string trimmed = trim(line);
        for (const auto &header : kHeaders) {
            if (trimmed.rfind(header, 0) == 0) {
                const std::string path = trim(trimmed.substr(header.size()));
                if (!path.empty()) {
                    return path;
                }
            }
        }
    }
    return std::nullopt;
}

std::string summarizeToolCall(const std::string &toolName, const nlohmann::json &input)
{
    const std::string name = toLower(toolName);

    if (name == "read" || name == "write" || name == "edit" || name == "multiedit") {
        if (const auto path = stringField(input, "file_path")) {
            return shortenPath(*path);
        }
        if (name == "edit") {
            std::optional<std::string> patch = stringField(input, "patch");
            if (!patch && input.is_string()) {
                patch = input.get<std::string>();
            }
            if (patch) {
                if (const auto path = patchTargetPath(*patch)) {
                    return shortenPath(*path);
                }
            }
        }
        return toolName;
    }

    if (name == "bash" || name == "shell") {
        if (auto command = commandText(input)) {
            std::string summary = truncateWithEllipsis(*command, kCommandSummaryChars);
            std::replace(summary.begin(), summary.end(), '\n', ' ');
            return summary;
        }
        return toolName;
    }

    if (name == "glob") {
        return stringField(input, "pattern").value_or(toolName);
    }

    if (name == "grep") {
        if (const auto pattern = stringField(input, "pattern")) {
            return "Pattern: " + *pattern;
        }
        return toolName;
    }

    if (name == "task") {
        if (const auto prompt = stringField(input, "prompt")) {
            return truncateWithEllipsis(*prompt, kPromptSummaryChars);
        }
        return toolName;
    }

    if (name == "webfetch") {
        return stringField(input, "url").value_or(toolName);
    }

    if (name == "websearch") {
        return stringField(input, "query").value_or(toolName);
    }

    return toolName;
}

} // namespace tracedeck
