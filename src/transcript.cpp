#include "transcript.hpp"
#include "util.hpp"

namespace agnt {

void Transcript::add_message(const std::string& role, const std::string& text) {
    messages_.push_back({role, {TextContent{text}}});
}

void Transcript::add_api_error(const std::string& message) {
    messages_.push_back({"system", {ApiErrorContent{message}}});
}

void Transcript::start_streaming() {
    streaming_content_.clear();
    streaming_ = true;
}

void Transcript::finish_streaming() {
    if (!streaming_content_.empty()) {
        messages_.push_back({"assistant", std::move(streaming_content_)});
        streaming_content_.clear();
    }
    connection_status_.reset();
    streaming_ = false;
}

void Transcript::fail_streaming() {
    std::string message;
    for (const auto& content : streaming_content_) {
        if (const auto* t = std::get_if<TextContent>(&content))
            message += t->text;
    }
    streaming_content_.clear();
    message = trim(message);
    if (message.rfind("Error: ", 0) == 0) message.erase(0, 7);
    if (!message.empty()) add_api_error(message);
    connection_status_.reset();
    streaming_ = false;
}

void Transcript::on_text(const TextEvent& ev) {
    // Consecutive deltas extend the last text part
    if (!streaming_content_.empty()) {
        if (auto* last = std::get_if<TextContent>(&streaming_content_.back())) {
            last->text += ev.text;
            return;
        }
    }
    streaming_content_.emplace_back(TextContent{ev.text});
}

void Transcript::on_tool_input(const ToolInputReadyEvent& ev) {
    streaming_content_.emplace_back(CodeContent{ev.code});
}

void Transcript::on_tool_output(const ToolOutputEvent& ev) {
    streaming_content_.emplace_back(
        CodeOutputContent{ev.stdout_text, ev.stderr_text, ev.exit_code, ev.files});
}

void Transcript::on_tool_error(const ToolErrorEvent& ev) {
    streaming_content_.emplace_back(CodeErrorContent{ev.error_code});
}

void Transcript::on_session_info(const SessionInfoEvent& ev) {
    container_info_ = ev;
}

void Transcript::on_connection_status(const ConnectionStatusEvent& ev) {
    connection_status_ = ev.status;
}

static size_t rename_files(std::vector<MessageContent>& contents,
                           const std::string& file_id, const std::string& name) {
    size_t updated = 0;
    for (auto& content : contents) {
        auto* output = std::get_if<CodeOutputContent>(&content);
        if (!output) continue;
        for (auto& file : output->files) {
            if (file.id == file_id) {
                file.display_name = name;
                updated++;
            }
        }
    }
    return updated;
}

size_t Transcript::update_file_metadata(const std::string& file_id, const std::string& name) {
    size_t updated = 0;
    for (auto& msg : messages_) {
        updated += rename_files(msg.contents, file_id, name);
    }
    updated += rename_files(streaming_content_, file_id, name);
    return updated;
}

void Transcript::clear() {
    messages_.clear();
    streaming_content_.clear();
    container_info_.reset();
    connection_status_.reset();
    streaming_ = false;
}

std::vector<Message> Transcript::to_request_messages() const {
    std::vector<Message> out;
    for (const auto& msg : messages_) {
        if (msg.role == "system") continue;
        std::string text;
        for (const auto& content : msg.contents) {
            if (const auto* t = std::get_if<TextContent>(&content))
                text += t->text;
        }
        if (!text.empty()) out.push_back({msg.role, text});
    }
    return out;
}

} // namespace agnt
