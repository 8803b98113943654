#pragma once
#include <optional>
#include <string>

namespace agnt {

// Collects the partial-JSON fragments of one open code-execution block.
// At most one block is tracked; opening a new one discards the old.
class ToolInputAccumulator {
public:
    void open();
    void discard();
    bool is_open() const { return open_; }

    // Fragments arriving while no block is open are ignored.
    void append(const std::string& fragment);

    // Close the block. Returns the `code` member when the accumulated text
    // parses as a JSON object holding a string `code`; nullopt otherwise
    // (including an empty or already closed block).
    std::optional<std::string> close();

    const std::string& buffer() const { return buffer_; }

private:
    bool open_ = false;
    std::string buffer_;
};

} // namespace agnt
