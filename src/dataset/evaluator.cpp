#include "dataset/evaluator.hpp"

#include <map>

#include "agent/code_extract.hpp"
#include "harness/test_harness.hpp"
#include "utils/logging.hpp"

namespace codeteam::dataset {

double PassAtK(int n, int c, int k) {
    if (n <= 0 || k <= 0) {
        return 0.0;
    }
    if (n - c < k) {
        return 1.0;
    }
    double fail_probability = 1.0;
    for (int i = n - c + 1; i <= n; ++i) {
        fail_probability *= 1.0 - static_cast<double>(k) / static_cast<double>(i);
    }
    return 1.0 - fail_probability;
}

std::string BuildEvaluationProgram(const SolutionRecord& solution, const TestCases* test_cases) {
    const auto generation = solution.prompt + solution.completion;
    const auto entry_point = codeteam::agent::FindEntryPoint(generation).value_or("candidate");
    const auto check = test_cases
        ? codeteam::harness::BuildCheck(test_cases->statements, test_cases->entry_point)
        : solution.test;
    return codeteam::harness::ComposeTestProgram(solution.prompt, solution.completion, check, entry_point);
}

EvaluationSummary Evaluate(const std::vector<SolutionRecord>& solutions,
                           const std::unordered_map<std::string, TestCases>& test_cases,
                           codeteam::sandbox::SandboxExecutor& sandbox,
                           std::chrono::milliseconds timeout) {
    EvaluationSummary summary{};
    std::map<std::string, std::pair<int, int>> per_task;

    for (const auto& solution : solutions) {
        const auto it = test_cases.find(solution.task_id);
        const TestCases* cases = it == test_cases.end() ? nullptr : &it->second;

        TaskEvaluation evaluation{};
        evaluation.task_id = solution.task_id;
        if (!cases && solution.test.empty()) {
            evaluation.result.status = codeteam::sandbox::ExecutionStatus::kOtherError;
            evaluation.result.detail = "no tests available";
        } else {
            evaluation.result = sandbox.Run(BuildEvaluationProgram(solution, cases), timeout);
        }

        auto& counts = per_task[solution.task_id];
        counts.first += 1;
        if (evaluation.result.Passed()) {
            counts.second += 1;
            summary.passed += 1;
        }
        codeteam::utils::LogDebug("eval", solution.task_id + ": " +
            codeteam::sandbox::Describe(evaluation.result));
        summary.results.push_back(std::move(evaluation));
    }

    if (!per_task.empty()) {
        double total = 0.0;
        for (const auto& entry : per_task) {
            total += PassAtK(entry.second.first, entry.second.second, 1);
        }
        summary.pass_at_1 = total / static_cast<double>(per_task.size());
    }
    return summary;
}

}  // namespace codeteam::dataset
