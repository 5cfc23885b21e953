#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "harness/test_harness.hpp"

namespace codeteam::harness {
namespace {

TEST(BuildCheckTest, EmptyStatementsReturnTrue) {
    EXPECT_EQ(BuildCheck({}, "add"), "def check(candidate):\n    return True\n");
}

TEST(BuildCheckTest, BindsEntryPointToCandidate) {
    const auto check = BuildCheck({"assert add(1, 2) == 3", "print(candidate(2,3))"}, "add");
    EXPECT_EQ(check,
              "def check(candidate):\n"
              "    add = candidate\n"
              "    assert add(1, 2) == 3\n"
              "    print(candidate(2,3))\n");
}

TEST(BuildCheckTest, SkipsAliasForCandidateOrInvalidNames) {
    EXPECT_EQ(BuildCheck({"assert candidate(1)"}, "candidate"),
              "def check(candidate):\n    assert candidate(1)\n");
    EXPECT_EQ(BuildCheck({"assert candidate(1)"}, ""),
              "def check(candidate):\n    assert candidate(1)\n");
}

TEST(BuildCheckTest, ImportsPrecedeRoutineAndMultiLineStatementsAreIndented) {
    const auto check = BuildCheck({"for x in range(3):\n    assert f(x) == x"}, "f", {"import math"});
    EXPECT_EQ(check,
              "import math\n"
              "def check(candidate):\n"
              "    f = candidate\n"
              "    for x in range(3):\n"
              "        assert f(x) == x\n");
}

TEST(ComposeTestProgramTest, ConcatenatesInOrder) {
    const auto program = ComposeTestProgram("import os\n", "def f():\n    return 1", "def check(candidate):\n    return True\n", "f");
    EXPECT_EQ(program,
              "import os\n"
              "def f():\n    return 1\n"
              "def check(candidate):\n    return True\n\n"
              "check(f)\n");
}

TEST(ExtractTestStatementsTest, TopLevelStatementsOutsideDefinitions) {
    const std::string code =
        "import math\n"
        "\n"
        "def add(a, b):\n"
        "    return a + b\n"
        "\n"
        "# edge cases\n"
        "assert add(1, 2) == 3\n"
        "assert add(\n"
        "    -1, 1) == 0\n"
        "for value in range(3):\n"
        "    assert add(value, 0) == value\n"
        "check(add)\n";
    const auto suite = ExtractTestStatements(code);
    ASSERT_EQ(suite.imports.size(), 1u);
    EXPECT_EQ(suite.imports[0], "import math");
    ASSERT_EQ(suite.definitions.size(), 1u);
    EXPECT_EQ(suite.definitions[0], "def add(a, b):\n    return a + b");
    ASSERT_EQ(suite.statements.size(), 3u);
    EXPECT_EQ(suite.statements[0], "assert add(1, 2) == 3");
    EXPECT_EQ(suite.statements[1], "assert add(\n    -1, 1) == 0");
    EXPECT_EQ(suite.statements[2], "for value in range(3):\n    assert add(value, 0) == value");
}

TEST(ExtractTestStatementsTest, UsesBodyOfOwnCheck) {
    const std::string code =
        "from typing import List\n"
        "def check(candidate):\n"
        "    assert candidate([1]) == 1\n"
        "    assert candidate([]) == 0\n"
        "\n"
        "check(total)\n";
    const auto suite = ExtractTestStatements(code);
    ASSERT_EQ(suite.imports.size(), 1u);
    ASSERT_EQ(suite.statements.size(), 2u);
    EXPECT_EQ(suite.statements[0], "assert candidate([1]) == 1");
    EXPECT_EQ(suite.statements[1], "assert candidate([]) == 0");
}

TEST(ExtractTestStatementsTest, KeepsHelpersAroundOwnCheck) {
    const std::string code =
        "import functools\n"
        "def is_sorted(xs):\n"
        "    return all(a <= b for a, b in zip(xs, xs[1:]))\n"
        "\n"
        "@functools.lru_cache(maxsize=None)\n"
        "def expected(n):\n"
        "    return list(range(n))\n"
        "\n"
        "def check(candidate):\n"
        "    def local(x):\n"
        "        return candidate(x)\n"
        "    assert is_sorted(local([3, 1, 2]))\n"
        "\n"
        "class Spare:\n"
        "    pass\n"
        "\n"
        "check(sort_list)\n";
    const auto suite = ExtractTestStatements(code);

    ASSERT_EQ(suite.imports.size(), 1u);
    ASSERT_EQ(suite.definitions.size(), 3u);
    EXPECT_EQ(suite.definitions[0],
              "def is_sorted(xs):\n    return all(a <= b for a, b in zip(xs, xs[1:]))");
    EXPECT_EQ(suite.definitions[1],
              "@functools.lru_cache(maxsize=None)\ndef expected(n):\n    return list(range(n))");
    EXPECT_EQ(suite.definitions[2], "class Spare:\n    pass");
    ASSERT_EQ(suite.statements.size(), 2u);
    EXPECT_EQ(suite.statements[0], "def local(x):\n    return candidate(x)");
    EXPECT_EQ(suite.statements[1], "assert is_sorted(local([3, 1, 2]))");
}

TEST(BuildCheckTest, EmitsHelpersBeforeRoutineAndDropsShadowingCopy) {
    const auto check = BuildCheck({"assert is_sorted(sort_list([2, 1]))"}, "sort_list", {},
                                  {"def is_sorted(xs):\n    return xs == sorted(xs)",
                                   "def sort_list(xs):\n    return xs"});
    EXPECT_EQ(check,
              "def is_sorted(xs):\n    return xs == sorted(xs)\n\n"
              "def check(candidate):\n"
              "    sort_list = candidate\n"
              "    assert is_sorted(sort_list([2, 1]))\n");
}

TEST(ExtractTestStatementsTest, MainGuardBodyBecomesStatements) {
    const std::string code =
        "if __name__ == '__main__':\n"
        "    assert f(2) == 4\n"
        "    print('ok')\n";
    const auto suite = ExtractTestStatements(code);
    ASSERT_EQ(suite.statements.size(), 2u);
    EXPECT_EQ(suite.statements[0], "assert f(2) == 4");
    EXPECT_EQ(suite.statements[1], "print('ok')");
}

TEST(ExtractTestStatementsTest, BracketsInsideStringsDoNotJoinLines) {
    const auto suite = ExtractTestStatements("assert f('(') == 1\nassert f(')') == 2\n");
    ASSERT_EQ(suite.statements.size(), 2u);
}

TEST(ExtractTestStatementsTest, EmptyInputYieldsNothing) {
    const auto suite = ExtractTestStatements("");
    EXPECT_TRUE(suite.imports.empty());
    EXPECT_TRUE(suite.statements.empty());
}

}  // namespace
}  // namespace codeteam::harness
