#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>

namespace sandrun::execution {

// Keeps at most `cap` bytes of a stream. Everything past the cap is dropped and
// only recorded as truncation, so a runaway producer cannot grow memory.
class CappedOutput {
public:
    explicit CappedOutput(std::size_t cap) : cap_(cap) {}

    void append(const char* data, std::size_t size) {
        const std::size_t room = cap_ - std::min(cap_, text_.size());
        const std::size_t take = std::min(room, size);
        text_.append(data, take);
        if (take < size) {
            truncated_ = true;
        }
    }

    const std::string& text() const { return text_; }
    std::string take_text() { return std::move(text_); }
    bool truncated() const { return truncated_; }

private:
    std::size_t cap_;
    std::string text_;
    bool truncated_ = false;
};

}  // namespace sandrun::execution
