#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

#include "nlohmann/json.hpp"

namespace codeteam::dataset {

struct Task {
    std::string task_id;
    std::string prompt;
    std::string entry_point;
    std::string test;
};

struct TestCases {
    std::string entry_point;
    std::vector<std::string> statements;
};

struct SolutionRecord {
    std::string task_id;
    std::string prompt;
    std::string test;
    std::string entry_point;
    std::string completion;
    nlohmann::json session_history = nlohmann::json::object();
};

// JSONL readers. Malformed lines are logged and skipped; an unreadable file throws
// std::runtime_error.
std::vector<Task> LoadTasks(const std::filesystem::path& path);
std::unordered_map<std::string, TestCases> LoadTestCases(const std::filesystem::path& path);
std::vector<SolutionRecord> LoadSolutions(const std::filesystem::path& path);

nlohmann::json ToJson(const SolutionRecord& solution);
void WriteSolution(std::ostream& output, const SolutionRecord& solution);

// Task ids appear both as strings ("HumanEval/0") and as integers.
std::string TaskIdToString(const nlohmann::json& id);

}  // namespace codeteam::dataset
