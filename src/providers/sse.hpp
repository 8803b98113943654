#pragma once
#include <string>
#include <vector>

namespace agnt {

// One blank-line-delimited block of the event stream, without its separator.
// Holds zero or more field lines (`event: ...`, `: comment`) and normally
// one `data: ...` line.
struct RawFrame {
    std::string text;

    // Payload of the first `data:` line, or empty when the frame has none.
    // Returns false if no `data:` line is present.
    bool data(std::string& out) const;
};

// Turns an arbitrarily chunked byte stream into complete frames.
// Bytes are kept verbatim, so a multi-byte UTF-8 sequence split across two
// chunks is reassembled before any frame containing it is emitted.
class FrameAssembler {
public:
    // Append a chunk and return every frame completed by it, in order.
    // A trailing partial frame stays buffered until its separator arrives.
    std::vector<RawFrame> feed(const char* data, size_t len);
    std::vector<RawFrame> feed(const std::string& chunk) {
        return feed(chunk.data(), chunk.size());
    }

    // Bytes received but not yet part of a complete frame.
    size_t pending() const { return buffer_.size() - start_; }

    void reset();

private:
    void compact();

    std::string buffer_;
    size_t start_ = 0; // first byte of the current (incomplete) frame
    size_t scan_ = 0;  // resume point for the separator search
};

} // namespace agnt
