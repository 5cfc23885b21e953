#include "agent/prompts.hpp"

namespace codeteam::agent::prompts {

const char kTeam[] =
    "You are part of a small software team made up of a requirements analyst, a Python developer "
    "and a tester. Together the team turns a user requirement into a working program. Each member "
    "has its own responsibility and builds on the output of the others.";

const char kAnalyst[] =
    "Your role is the requirements analyst. Break the requirement down into small subproblems the "
    "developer can solve one at a time, then lay out a high-level plan listing the major steps of "
    "the program. Keep the plan at the level of steps and do not write the implementation.";

const char kDeveloper[] =
    "Your role is the developer. When you receive a plan, write Python code that satisfies the "
    "requirement by following it. When you receive a test report, repair or improve the code so "
    "that the reported problems are fixed without introducing new ones. Reply with the complete "
    "code only, inside a single ```python fenced block, without explanations.";

const char kTester[] =
    "Your role is the tester. You receive code written by the developer. Write Python test "
    "statements that exercise it, one assert per behaviour, covering the examples in the "
    "requirement and relevant edge cases. Call the function by its own name. Reply with the "
    "statements only, inside a single ```python fenced block.";

std::string SystemMessage(const std::string& requirement, const std::string& role) {
    return std::string(kTeam) + "\n" + role + "\n\nRequirement:\n" + requirement;
}

std::string PlanInstruction(const std::string& plan) {
    return "The analyst produced the following plan:\n" + plan;
}

std::string ReportInstruction(const std::string& report) {
    return "The compilation output of the preceding code is: " + report +
        "\nFix the code so that it passes.";
}

std::string CodeInstruction(const std::string& requirement) {
    return "Write the complete Python implementation for the requirement:\n" + requirement;
}

std::string TestInstruction(const std::string& code) {
    return "Write test statements for the following code:\n```python\n" + code + "\n```";
}

}  // namespace codeteam::agent::prompts
