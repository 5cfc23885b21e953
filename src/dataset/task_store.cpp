#include "dataset/task_store.hpp"

#include <fstream>
#include <functional>
#include <stdexcept>

#include "utils/logging.hpp"

namespace codeteam::dataset {
namespace {

std::string StringField(const nlohmann::json& json, const char* key) {
    if (json.contains(key) && json[key].is_string()) {
        return json[key].get<std::string>();
    }
    return "";
}

void ForEachJsonLine(const std::filesystem::path& path,
                     const std::function<void(const nlohmann::json&)>& handle) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("cannot open " + path.string());
    }
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }
        auto json = nlohmann::json::parse(line, nullptr, false);
        if (json.is_discarded() || !json.is_object() || !json.contains("task_id")) {
            codeteam::utils::LogWarn("dataset", path.filename().string() + ":" +
                std::to_string(line_number) + " skipped malformed record");
            continue;
        }
        handle(json);
    }
}

}  // namespace

std::string TaskIdToString(const nlohmann::json& id) {
    if (id.is_string()) {
        return id.get<std::string>();
    }
    return id.dump();
}

std::vector<Task> LoadTasks(const std::filesystem::path& path) {
    std::vector<Task> tasks;
    ForEachJsonLine(path, [&tasks](const nlohmann::json& json) {
        Task task{};
        task.task_id = TaskIdToString(json["task_id"]);
        task.prompt = StringField(json, "prompt");
        task.entry_point = StringField(json, "entry_point");
        task.test = StringField(json, "test");
        tasks.push_back(std::move(task));
    });
    codeteam::utils::LogInfo("dataset", "loaded " + std::to_string(tasks.size()) + " tasks from " +
        path.string());
    return tasks;
}

std::unordered_map<std::string, TestCases> LoadTestCases(const std::filesystem::path& path) {
    std::unordered_map<std::string, TestCases> cases;
    ForEachJsonLine(path, [&cases](const nlohmann::json& json) {
        TestCases entry{};
        entry.entry_point = StringField(json, "entry_point");
        if (json.contains("test_case_list") && json["test_case_list"].is_array()) {
            for (const auto& item : json["test_case_list"]) {
                if (item.is_string()) {
                    entry.statements.push_back(item.get<std::string>());
                }
            }
        }
        cases[TaskIdToString(json["task_id"])] = std::move(entry);
    });
    return cases;
}

std::vector<SolutionRecord> LoadSolutions(const std::filesystem::path& path) {
    std::vector<SolutionRecord> solutions;
    ForEachJsonLine(path, [&solutions](const nlohmann::json& json) {
        SolutionRecord solution{};
        solution.task_id = TaskIdToString(json["task_id"]);
        solution.prompt = StringField(json, "prompt");
        solution.test = StringField(json, "test");
        solution.entry_point = StringField(json, "entry_point");
        solution.completion = StringField(json, "completion");
        if (json.contains("session_history")) {
            solution.session_history = json["session_history"];
        }
        solutions.push_back(std::move(solution));
    });
    return solutions;
}

nlohmann::json ToJson(const SolutionRecord& solution) {
    return {
        {"task_id", solution.task_id},
        {"prompt", solution.prompt},
        {"test", solution.test},
        {"entry_point", solution.entry_point},
        {"completion", solution.completion},
        {"session_history", solution.session_history}
    };
}

void WriteSolution(std::ostream& output, const SolutionRecord& solution) {
    output << ToJson(solution).dump() << "\n";
    output.flush();
}

}  // namespace codeteam::dataset
