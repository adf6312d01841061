#pragma once

#include <string>
#include <vector>

namespace sandrun::snippets {

struct CodeBlock {
    std::string language;  // "text" when the fence has no tag
    std::string code;
};

// Fenced blocks of a markdown reply, in order of appearance. An opening fence is
// ``` anywhere in the text, an optional word tag, then a newline; the block ends
// at the next ```. A fence without a closing ``` is ignored. CRLF line endings
// are treated as LF.
std::vector<CodeBlock> extract_code_blocks(const std::string& markdown);

}  // namespace sandrun::snippets
