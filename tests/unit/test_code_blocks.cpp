#include <string>
#include <gtest/gtest.h>
#include "snippets/code_blocks.hpp"

namespace {

using sandrun::snippets::extract_code_blocks;

TEST(CodeBlocksTest, ExtractsTaggedBlocksInOrder) {
    const std::string markdown =
        "Here you go:\n"
        "```python\n"
        "print('a')\n"
        "```\n"
        "and in JS:\n"
        "```javascript\n"
        "console.log('b');\n"
        "```\n";

    const auto blocks = extract_code_blocks(markdown);
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].language, "python");
    EXPECT_EQ(blocks[0].code, "print('a')");
    EXPECT_EQ(blocks[1].language, "javascript");
    EXPECT_EQ(blocks[1].code, "console.log('b');");
}

TEST(CodeBlocksTest, UntaggedFenceDefaultsToText) {
    const auto blocks = extract_code_blocks("```\nplain\n```\n");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].language, "text");
    EXPECT_EQ(blocks[0].code, "plain");
}

TEST(CodeBlocksTest, KeepsInnerIndentationAndStripsEdges) {
    const auto blocks =
        extract_code_blocks("```python\n\nfor i in range(2):\n    print(i)\n\n```\n");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].code, "for i in range(2):\n    print(i)");
}

TEST(CodeBlocksTest, ClosingFenceMayTrailCode) {
    const auto blocks = extract_code_blocks("```python\nx = 1\nprint(x)```\n");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].code, "x = 1\nprint(x)");
}

TEST(CodeBlocksTest, OpeningFenceMayFollowTextOnTheSameLine) {
    const auto blocks =
        extract_code_blocks("Run this: ```python\nprint('inline')\n``` and then this ```\nls\n```");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].language, "python");
    EXPECT_EQ(blocks[0].code, "print('inline')");
    EXPECT_EQ(blocks[1].language, "text");
    EXPECT_EQ(blocks[1].code, "ls");
}

TEST(CodeBlocksTest, TagMustBeFollowedByNewline) {
    const auto blocks = extract_code_blocks("```python print(1)```\n");
    EXPECT_TRUE(blocks.empty());
}

TEST(CodeBlocksTest, IgnoresUnterminatedBlock) {
    const auto blocks = extract_code_blocks("```python\nprint(1)\n```\n```python\nprint(2)\n");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].code, "print(1)");
}

TEST(CodeBlocksTest, SkipsFenceWithNonWordTag) {
    const auto blocks = extract_code_blocks("```c++ main\nint x;\n```\n");
    EXPECT_TRUE(blocks.empty());
}

TEST(CodeBlocksTest, HandlesWindowsLineEndings) {
    const auto blocks = extract_code_blocks("```python\r\nprint(1)\r\n```\r\n");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].language, "python");
    EXPECT_EQ(blocks[0].code, "print(1)");
}

TEST(CodeBlocksTest, NoFencesMeansNoBlocks) {
    EXPECT_TRUE(extract_code_blocks("just prose, no code").empty());
    EXPECT_TRUE(extract_code_blocks("").empty());
}

}  // namespace
