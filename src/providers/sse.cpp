#include "sse.hpp"

namespace agnt {

bool RawFrame::data(std::string& out) const {
    size_t pos = 0;
    while (pos < text.size()) {
        size_t newline = text.find('\n', pos);
        size_t end = (newline == std::string::npos) ? text.size() : newline;
        size_t len = end - pos;
        // Remove trailing \r if present
        if (len > 0 && text[pos + len - 1] == '\r') len--;

        if (text.compare(pos, 5, "data:") == 0 && len >= 5) {
            // Handle both "data: payload" (with space) and "data:payload" (without)
            size_t skip = (len > 5 && text[pos + 5] == ' ') ? 6 : 5;
            out.assign(text, pos + skip, len - skip);
            return true;
        }
        if (newline == std::string::npos) break;
        pos = newline + 1;
    }
    return false;
}

std::vector<RawFrame> FrameAssembler::feed(const char* data, size_t len) {
    std::vector<RawFrame> frames;
    buffer_.append(data, len);

    while (scan_ < buffer_.size()) {
        size_t newline = buffer_.find('\n', scan_);
        if (newline == std::string::npos) {
            scan_ = buffer_.size();
            break;
        }

        // A blank line is "\n\n" or "\n\r\n"; wait for more bytes if the
        // character after this newline has not arrived yet.
        size_t next = newline + 1;
        size_t sep_end = std::string::npos;
        if (next < buffer_.size() && buffer_[next] == '\n') {
            sep_end = next + 1;
        } else if (next + 1 < buffer_.size() && buffer_[next] == '\r' &&
                   buffer_[next + 1] == '\n') {
            sep_end = next + 2;
        } else if (next >= buffer_.size() ||
                   (buffer_[next] == '\r' && next + 1 >= buffer_.size())) {
            scan_ = newline;
            break;
        }

        if (sep_end == std::string::npos) {
            scan_ = next;
            continue;
        }

        size_t frame_end = newline;
        if (frame_end > start_ && buffer_[frame_end - 1] == '\r') frame_end--;
        // Runs of blank lines between frames carry nothing.
        if (frame_end > start_) {
            frames.push_back(RawFrame{buffer_.substr(start_, frame_end - start_)});
        }
        start_ = sep_end;
        scan_ = sep_end;
    }

    compact();
    return frames;
}

void FrameAssembler::reset() {
    buffer_.clear();
    start_ = 0;
    scan_ = 0;
}

// Drop consumed bytes once they dominate the buffer, so growth stays
// amortised instead of shifting the buffer on every frame.
void FrameAssembler::compact() {
    if (start_ == 0) return;
    if (start_ == buffer_.size()) {
        buffer_.clear();
        start_ = 0;
        scan_ = 0;
        return;
    }
    if (start_ * 2 >= buffer_.size()) {
        buffer_.erase(0, start_);
        scan_ -= start_;
        start_ = 0;
    }
}

} // namespace agnt
