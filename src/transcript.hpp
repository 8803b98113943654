#pragma once
#include "event_sink.hpp"
#include "providers/anthropic.hpp"
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace agnt {

// ── Conversation content ────────────────────────────────────────

struct TextContent {
    std::string text;
};

struct CodeContent {
    std::string input;
};

struct CodeOutputContent {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    std::vector<FileRef> files;
};

struct CodeErrorContent {
    std::string error_code;
};

struct ApiErrorContent {
    std::string message;
};

using MessageContent = std::variant<TextContent, CodeContent, CodeOutputContent,
                                    CodeErrorContent, ApiErrorContent>;

struct TranscriptMessage {
    std::string role;
    std::vector<MessageContent> contents;
};

// Conversation state for interactive mode. Stream events are collected into
// a pending assistant turn that finish_streaming() commits to the history.
class Transcript : public EventSink {
public:
    void add_message(const std::string& role, const std::string& text);
    void add_api_error(const std::string& message);

    void start_streaming();
    void finish_streaming();
    // End a turn whose request failed: its text (the failure message) is
    // recorded as a system API error instead of an assistant turn.
    void fail_streaming();
    bool is_streaming() const { return streaming_; }

    void on_text(const TextEvent& ev) override;
    void on_tool_input(const ToolInputReadyEvent& ev) override;
    void on_tool_output(const ToolOutputEvent& ev) override;
    void on_tool_error(const ToolErrorEvent& ev) override;
    void on_session_info(const SessionInfoEvent& ev) override;
    void on_connection_status(const ConnectionStatusEvent& ev) override;

    // Rename every FileRef with this id, in history and the pending turn.
    // Returns the number of references updated.
    size_t update_file_metadata(const std::string& file_id, const std::string& name);

    // Forget the whole conversation, including container info.
    void clear();

    // History as request messages: text parts only, system turns and turns
    // without text skipped.
    std::vector<Message> to_request_messages() const;

    const std::vector<TranscriptMessage>& messages() const { return messages_; }
    const std::vector<MessageContent>& streaming_content() const { return streaming_content_; }
    const std::optional<SessionInfoEvent>& container_info() const { return container_info_; }
    const std::optional<std::string>& connection_status() const { return connection_status_; }

private:
    std::vector<TranscriptMessage> messages_;
    std::vector<MessageContent> streaming_content_;
    std::optional<SessionInfoEvent> container_info_;
    std::optional<std::string> connection_status_;
    bool streaming_ = false;
};

} // namespace agnt
