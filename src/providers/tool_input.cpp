#include "tool_input.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace agnt {

void ToolInputAccumulator::open() {
    buffer_.clear();
    open_ = true;
}

void ToolInputAccumulator::discard() {
    buffer_.clear();
    open_ = false;
}

void ToolInputAccumulator::append(const std::string& fragment) {
    if (open_) buffer_ += fragment;
}

std::optional<std::string> ToolInputAccumulator::close() {
    if (!open_) return std::nullopt;
    std::string text;
    text.swap(buffer_);
    open_ = false;
    if (text.empty()) return std::nullopt;

    json input = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (!input.is_object()) return std::nullopt;
    auto it = input.find("code");
    if (it == input.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // namespace agnt
