#pragma once

namespace tracedeck {

enum class TranscriptFormat {
    Unknown,
    Claude,
    Codex
};

enum class WorkStatus {
    Unknown,
    Working,
    Waiting,
    Permission
};

enum class AttentionReason {
    None,
    AwaitingPermission,
    AwaitingQuestion,
    AwaitingReply
};

enum class MessageType {
    User,
    Assistant,
    Tool,
    ToolResult,
    Thinking,
    System
};

} // namespace tracedeck
