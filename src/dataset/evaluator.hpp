#pragma once

#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

#include "dataset/task_store.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace codeteam::dataset {

struct TaskEvaluation {
    std::string task_id;
    codeteam::sandbox::ExecutionResult result;
};

struct EvaluationSummary {
    std::vector<TaskEvaluation> results;
    std::size_t passed = 0;
    double pass_at_1 = 0.0;
};

// Unbiased pass@k estimate for one task with n samples of which c passed.
double PassAtK(int n, int c, int k);

// Program used to verify one solution: its own test (which defines check) or, when the task has
// an entry in test_cases, a check built from those statements.
std::string BuildEvaluationProgram(const SolutionRecord& solution, const TestCases* test_cases);

// test_cases may be empty, in which case each solution's own test field is used.
EvaluationSummary Evaluate(const std::vector<SolutionRecord>& solutions,
                           const std::unordered_map<std::string, TestCases>& test_cases,
                           codeteam::sandbox::SandboxExecutor& sandbox,
                           std::chrono::milliseconds timeout);

}  // namespace codeteam::dataset
