#pragma once
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace agnt {

// A file produced by code execution. `display_name` equals `id` until the
// file resolver reports the real filename.
struct FileRef {
    std::string id;
    std::string display_name;

    bool operator==(const FileRef& other) const {
        return id == other.id && display_name == other.display_name;
    }
};

// ── Domain events produced by the stream task ───────────────────

struct TextEvent {
    std::string text;
};

// Code extracted from a completed code-execution tool invocation.
struct ToolInputReadyEvent {
    std::string code;
};

struct ToolOutputEvent {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    std::vector<FileRef> files;
};

struct ToolErrorEvent {
    std::string error_code;
};

// Container backing code execution for this conversation.
struct SessionInfoEvent {
    std::string id;
    std::string expires_at;
};

struct ConnectionStatusEvent {
    std::string status;
};

using StreamEvent = std::variant<TextEvent,
                                 ToolInputReadyEvent,
                                 ToolOutputEvent,
                                 ToolErrorEvent,
                                 SessionInfoEvent,
                                 ConnectionStatusEvent>;

// (file_id, resolved display name) reported by the file resolver.
using FileNameUpdate = std::pair<std::string, std::string>;

} // namespace agnt
