#include "snippets/code_blocks.hpp"

#include <cctype>

namespace sandrun::snippets {

namespace {

constexpr const char* kFence = "```";
constexpr std::size_t kFenceSize = 3;

bool is_word_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

std::string strip(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n\f\v");
    return text.substr(first, last - first + 1);
}

std::string normalize_newlines(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
            continue;
        }
        out += text[i];
    }
    return out;
}

}  // namespace

std::vector<CodeBlock> extract_code_blocks(const std::string& markdown) {
    const std::string text = normalize_newlines(markdown);
    std::vector<CodeBlock> blocks;

    std::size_t search_from = 0;
    while (true) {
        const auto open = text.find(kFence, search_from);
        if (open == std::string::npos) {
            break;
        }

        // An opener is the fence, an optional word tag, then a newline.
        std::size_t cursor = open + kFenceSize;
        while (cursor < text.size() && is_word_char(text[cursor])) {
            ++cursor;
        }
        if (cursor >= text.size() || text[cursor] != '\n') {
            search_from = open + 1;
            continue;
        }

        const std::size_t body_start = cursor + 1;
        const auto close = text.find(kFence, body_start);
        if (close == std::string::npos) {
            search_from = open + 1;
            continue;
        }

        const std::string tag = text.substr(open + kFenceSize, cursor - open - kFenceSize);
        blocks.push_back(CodeBlock{tag.empty() ? "text" : tag,
                                   strip(text.substr(body_start, close - body_start))});
        search_from = close + kFenceSize;
    }

    return blocks;
}

}  // namespace sandrun::snippets
