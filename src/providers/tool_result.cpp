#include "tool_result.hpp"

#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace agnt {

static std::string string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

static int exit_code_field(const json& obj) {
    // The API calls it return_code; exit_code is accepted as well.
    for (const char* key : {"return_code", "exit_code"}) {
        auto it = obj.find(key);
        if (it == obj.end() || !it->is_number_integer()) continue;
        if (it->is_number_unsigned()) {
            auto code = it->get<uint64_t>();
            return code > static_cast<uint64_t>(std::numeric_limits<int>::max())
                       ? std::numeric_limits<int>::max()
                       : static_cast<int>(code);
        }
        auto code = it->get<int64_t>();
        if (code > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
        if (code < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
        return static_cast<int>(code);
    }
    return 0;
}

static std::vector<FileRef> file_outputs(const json& obj) {
    std::vector<FileRef> files;
    auto it = obj.find("content");
    if (it == obj.end() || !it->is_array()) return files;

    for (const auto& item : *it) {
        if (!item.is_object()) continue;
        // A missing type means a file output; any other type, or a
        // non-string one, skips just this item.
        if (item.contains("type") &&
            string_field(item, "type") != tool_result_types::FileOutput)
            continue;
        std::string id = string_field(item, "file_id");
        if (id.empty()) continue;
        files.push_back(FileRef{id, id});
    }
    return files;
}

StreamEvent interpret_tool_result(const json& content) {
    if (!content.is_object())
        throw ProtocolError("tool result content is not an object");

    std::string type = string_field(content, "type");
    if (type == tool_result_types::Success) {
        ToolOutputEvent out;
        out.stdout_text = string_field(content, "stdout");
        out.stderr_text = string_field(content, "stderr");
        out.exit_code = exit_code_field(content);
        out.files = file_outputs(content);
        return out;
    }
    if (type == tool_result_types::Error) {
        return ToolErrorEvent{string_field(content, "error_code")};
    }
    throw ProtocolError("unrecognised tool result type: " + type);
}

} // namespace agnt
