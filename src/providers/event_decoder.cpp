#include "event_decoder.hpp"
#include "tool_result.hpp"
#include "../log.hpp"

using json = nlohmann::json;

namespace agnt {

EventDecoder::EventDecoder(LogSink* log, std::string tool_name)
    : log_(log), tool_name_(std::move(tool_name)) {}

void EventDecoder::note(const std::string& message) {
    if (log_) log_->log("decoder", message);
}

std::optional<StreamEvent> EventDecoder::decode(const RawFrame& frame) {
    std::string payload;
    if (!frame.data(payload)) return std::nullopt; // heartbeat / comment
    return decode_payload(payload);
}

std::optional<StreamEvent> EventDecoder::decode_payload(const std::string& payload) {
    json j = json::parse(payload, nullptr, /*allow_exceptions=*/false);
    if (!j.is_object()) {
        note("skipping unparseable frame payload");
        return std::nullopt;
    }

    auto type_it = j.find("type");
    if (type_it == j.end() || !type_it->is_string()) return std::nullopt;
    const std::string type = type_it->get<std::string>();

    try {
        if (type == stream_types::MessageStart) return on_message_start(j);
        if (type == stream_types::ContentBlockStart) return on_block_start(j);
        if (type == stream_types::ContentBlockDelta) return on_block_delta(j);
        if (type == stream_types::ContentBlockStop) return on_block_stop();
    } catch (const std::exception& e) {
        note("skipping " + type + " frame: " + e.what());
    }
    // message_delta, message_stop, ping and anything newer: nothing to emit
    return std::nullopt;
}

std::optional<StreamEvent> EventDecoder::on_message_start(const json& payload) {
    auto msg = payload.find("message");
    if (msg == payload.end() || !msg->is_object()) return std::nullopt;
    auto container = msg->find("container");
    if (container == msg->end() || !container->is_object()) return std::nullopt;

    auto id = container->find("id");
    auto expires = container->find("expires_at");
    if (id == container->end() || !id->is_string() ||
        expires == container->end() || !expires->is_string())
        return std::nullopt;
    return SessionInfoEvent{id->get<std::string>(), expires->get<std::string>()};
}

std::optional<StreamEvent> EventDecoder::on_block_start(const json& payload) {
    auto block = payload.find("content_block");
    if (block == payload.end() || !block->is_object()) return std::nullopt;
    std::string type = block->value("type", "");

    if (type == stream_types::ServerToolUse || type == stream_types::ToolUse) {
        if (block->value("name", "") == tool_name_) {
            if (tool_input_.is_open())
                note("tool block opened while another was open; discarding it");
            tool_input_.open();
        } else {
            // Fragments of some other tool must not leak into ours.
            tool_input_.discard();
        }
        return std::nullopt;
    }

    if (type == stream_types::CodeExecutionToolResult) {
        auto content = block->find("content");
        if (content == block->end())
            throw ProtocolError("tool result block without content");
        return interpret_tool_result(*content);
    }
    return std::nullopt;
}

std::optional<StreamEvent> EventDecoder::on_block_delta(const json& payload) {
    auto delta = payload.find("delta");
    if (delta == payload.end() || !delta->is_object()) return std::nullopt;
    std::string type = delta->value("type", "");

    if (type == stream_types::TextDelta) {
        auto text = delta->find("text");
        if (text == delta->end() || !text->is_string()) return std::nullopt;
        return TextEvent{text->get<std::string>()};
    }
    if (type == stream_types::InputJsonDelta) {
        auto fragment = delta->find("partial_json");
        if (fragment != delta->end() && fragment->is_string())
            tool_input_.append(fragment->get<std::string>());
    }
    return std::nullopt;
}

std::optional<StreamEvent> EventDecoder::on_block_stop() {
    if (!tool_input_.is_open()) return std::nullopt;
    bool had_input = !tool_input_.buffer().empty();
    auto code = tool_input_.close();
    if (!code) {
        if (had_input) note("dropping tool input that is not a JSON object with code");
        return std::nullopt;
    }
    return ToolInputReadyEvent{std::move(*code)};
}

} // namespace agnt
