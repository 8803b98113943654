#pragma once
#include "../stream_event.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace agnt {

// Raised for payloads the decoder cannot interpret. Never leaves the
// stream task; the offending frame is skipped.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

namespace tool_result_types {
    constexpr const char* Success = "code_execution_result";
    constexpr const char* Error   = "code_execution_tool_result_error";
    constexpr const char* FileOutput = "code_execution_output";
} // namespace tool_result_types

// Map the `content` object of a code_execution_tool_result block to
// ToolOutputEvent (success) or ToolErrorEvent (error). Each FileRef starts
// unresolved, with display_name == id. Throws ProtocolError when the object
// is neither shape.
StreamEvent interpret_tool_result(const nlohmann::json& content);

} // namespace agnt
