#include <gtest/gtest.h>

#include <string>

#include "agent/code_extract.hpp"

namespace codeteam::agent {
namespace {

TEST(TruncateCodeTest, TakesFirstFencedBlock) {
    const std::string response =
        "Here is the code:\n"
        "```python\n"
        "def add(a, b):\n"
        "    return a + b\n"
        "```\n"
        "and an example:\n"
        "```python\nprint(add(1, 2))\n```\n";
    EXPECT_EQ(TruncateCode(response), "def add(a, b):\n    return a + b\n");
}

TEST(TruncateCodeTest, FallsBackToDefinitionBlocks) {
    const std::string response =
        "Sure thing.\n"
        "def add(a, b):\n"
        "    return a + b\n"
        "\n"
        "This adds numbers.\n"
        "\n"
        "def sub(a, b):\n"
        "    return a - b\n";
    EXPECT_EQ(TruncateCode(response),
              "def add(a, b):\n    return a + b\n\ndef sub(a, b):\n    return a - b");
}

TEST(TruncateCodeTest, NoCodeYieldsEmpty) {
    EXPECT_EQ(TruncateCode("I am unable to help with that."), "");
    EXPECT_EQ(TruncateCode(""), "");
}

TEST(FindEntryPointTest, LastTopLevelDefinition) {
    const std::string code =
        "def helper(x):\n"
        "    def inner():\n"
        "        return x\n"
        "    return inner()\n"
        "\n"
        "def solve(values):\n"
        "    return [helper(v) for v in values]\n";
    EXPECT_EQ(FindEntryPoint(code), std::optional<std::string>("solve"));
}

TEST(FindEntryPointTest, SkipsTrailingMain) {
    const std::string code =
        "def add(a, b):\n"
        "    return a + b\n"
        "def main():\n"
        "    print(add(1, 2))\n";
    EXPECT_EQ(FindEntryPoint(code), std::optional<std::string>("add"));
    EXPECT_EQ(FindEntryPoint("def main():\n    pass\n"), std::optional<std::string>("main"));
}

TEST(FindEntryPointTest, IgnoresDefinitionsInsideDocstrings) {
    const std::string code =
        "def real(x):\n"
        "    \"\"\"\n"
        "def fake(y):\n"
        "    \"\"\"\n"
        "    return x\n";
    EXPECT_EQ(FindEntryPoint(code), std::optional<std::string>("real"));
}

TEST(FindEntryPointTest, NoDefinition) {
    EXPECT_FALSE(FindEntryPoint("print('hello')\n").has_value());
    EXPECT_FALSE(FindEntryPoint("").has_value());
}

TEST(PromptPreludeTest, KeepsTextBeforeLastDefinition) {
    const std::string prompt =
        "from typing import List\r\n"
        "\r\n"
        "def total(values: List[int]) -> int:\r\n"
        "    \"\"\" Sum of values.\"\"\"\r\n";
    EXPECT_EQ(PromptPrelude(prompt), "from typing import List\n\n");
    EXPECT_EQ(PromptPrelude("Write a program that prints hello."), "");
}

TEST(IsIdentifierTest, Basics) {
    EXPECT_TRUE(IsIdentifier("add"));
    EXPECT_TRUE(IsIdentifier("_private2"));
    EXPECT_FALSE(IsIdentifier("2fast"));
    EXPECT_FALSE(IsIdentifier("a-b"));
    EXPECT_FALSE(IsIdentifier(""));
}

}  // namespace
}  // namespace codeteam::agent
