#pragma once
#include "sse.hpp"
#include "tool_input.hpp"
#include "../stream_event.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace agnt {

class LogSink;

namespace stream_types {
    constexpr const char* MessageStart      = "message_start";
    constexpr const char* ContentBlockStart = "content_block_start";
    constexpr const char* ContentBlockDelta = "content_block_delta";
    constexpr const char* ContentBlockStop  = "content_block_stop";
    constexpr const char* MessageDelta      = "message_delta";
    constexpr const char* MessageStop       = "message_stop";

    constexpr const char* TextDelta      = "text_delta";
    constexpr const char* InputJsonDelta = "input_json_delta";

    constexpr const char* ServerToolUse  = "server_tool_use";
    constexpr const char* ToolUse        = "tool_use";
    constexpr const char* CodeExecutionToolResult = "code_execution_tool_result";
} // namespace stream_types

// Stateful decoder for one streamed response. Frames must be fed in arrival
// order. Unknown event types and fields are ignored; malformed frames
// produce nothing and never stop the stream.
class EventDecoder {
public:
    explicit EventDecoder(LogSink* log = nullptr,
                          std::string tool_name = "code_execution");

    std::optional<StreamEvent> decode(const RawFrame& frame);

    // Decode the JSON text of a `data:` line.
    std::optional<StreamEvent> decode_payload(const std::string& payload);

    // True while a code-execution block is collecting input fragments.
    bool tool_open() const { return tool_input_.is_open(); }

private:
    std::optional<StreamEvent> on_message_start(const nlohmann::json& payload);
    std::optional<StreamEvent> on_block_start(const nlohmann::json& payload);
    std::optional<StreamEvent> on_block_delta(const nlohmann::json& payload);
    std::optional<StreamEvent> on_block_stop();

    void note(const std::string& message);

    LogSink* log_;
    std::string tool_name_;
    ToolInputAccumulator tool_input_;
};

} // namespace agnt
