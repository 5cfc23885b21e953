#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include "agent/code_extract.hpp"
#include "agent/role_client.hpp"
#include "config/config_loader.hpp"
#include "dataset/evaluator.hpp"
#include "dataset/task_store.hpp"
#include "providers/llm_provider.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "session/session.hpp"
#include "utils/logging.hpp"

namespace {

std::chrono::milliseconds SecondsToMillis(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  codeteam run <tasks.jsonl> <output.jsonl> [--mode full|analyst-coder|coder-tester|coder]"
              << " [--max-round N] [--test-final-round]\n"
              << "  codeteam eval <solutions.jsonl> [test_cases.jsonl]\n"
              << "  codeteam exec <program.py> [timeout_s]" << std::endl;
}

codeteam::agent::SamplingOptions MakeSampling(const codeteam::config::Config& config) {
    codeteam::agent::SamplingOptions sampling{};
    sampling.model = config.agents.defaults.model;
    sampling.max_tokens = config.agents.defaults.max_tokens;
    sampling.temperature = config.agents.defaults.temperature;
    sampling.top_p = config.agents.defaults.top_p;
    sampling.majority = config.agents.defaults.majority;
    return sampling;
}

int RunTasks(const codeteam::config::Config& config, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        PrintUsage();
        return 1;
    }
    codeteam::session::SessionOptions options{};
    options.max_rounds = config.agents.defaults.max_round;
    options.test_timeout = SecondsToMillis(config.sandbox.timeout_s);
    for (std::size_t i = 2; i < args.size(); ++i) {
        if (args[i] == "--mode" && i + 1 < args.size()) {
            if (!codeteam::session::ParseSessionMode(args[++i], options.mode)) {
                std::cout << "Unknown mode: " << args[i] << std::endl;
                return 1;
            }
        } else if (args[i] == "--max-round" && i + 1 < args.size()) {
            try {
                options.max_rounds = std::stoi(args[++i]);
            } catch (const std::exception&) {
                std::cout << "Invalid --max-round value: " << args[i] << std::endl;
                return 1;
            }
        } else if (args[i] == "--test-final-round") {
            options.test_final_round = true;
        } else {
            std::cout << "Unknown option: " << args[i] << std::endl;
            return 1;
        }
    }

    auto provider = codeteam::providers::CreateProvider(config);
    if (!provider) {
        std::cout << "Failed to create provider." << std::endl;
        return 1;
    }
    codeteam::agent::ProviderRoleClient client(*provider, config.agents.defaults.max_attempts);
    codeteam::sandbox::SandboxExecutor sandbox(codeteam::sandbox::MakeSandboxOptions(config.sandbox));
    const auto sampling = MakeSampling(config);

    std::vector<codeteam::dataset::Task> tasks;
    try {
        tasks = codeteam::dataset::LoadTasks(args[0]);
    } catch (const std::exception& ex) {
        std::cout << ex.what() << std::endl;
        return 1;
    }

    std::ofstream output(args[1], std::ios::trunc);
    if (!output.is_open()) {
        std::cout << "Cannot write " << args[1] << std::endl;
        return 1;
    }

    std::size_t written = 0;
    for (const auto& task : tasks) {
        auto task_options = options;
        task_options.prelude = codeteam::agent::PromptPrelude(task.prompt);
        codeteam::session::Session session(
            task.prompt, client, client, client, sandbox, sampling, task_options);
        const auto result = session.Run();
        if (!result.Ok()) {
            codeteam::utils::LogWarn("session", "task " + task.task_id + " failed: " + result.error);
            continue;
        }

        codeteam::dataset::SolutionRecord solution{};
        solution.task_id = task.task_id;
        solution.prompt = task_options.prelude + "\n";
        solution.test = task.test;
        solution.entry_point = codeteam::agent::FindEntryPoint(result.code).value_or(task.entry_point);
        solution.completion = result.code;
        solution.session_history = codeteam::session::ToJson(result);
        codeteam::dataset::WriteSolution(output, solution);
        ++written;
        codeteam::utils::LogInfo("session", "task " + task.task_id + " finished: " +
            codeteam::session::ToString(result.status));
    }
    std::cout << "Wrote " << written << " of " << tasks.size() << " solutions to " << args[1] << std::endl;
    return 0;
}

int EvaluateSolutions(const codeteam::config::Config& config, const std::vector<std::string>& args) {
    if (args.empty()) {
        PrintUsage();
        return 1;
    }
    codeteam::sandbox::SandboxExecutor sandbox(codeteam::sandbox::MakeSandboxOptions(config.sandbox));
    try {
        const auto solutions = codeteam::dataset::LoadSolutions(args[0]);
        std::unordered_map<std::string, codeteam::dataset::TestCases> test_cases;
        if (args.size() > 1) {
            test_cases = codeteam::dataset::LoadTestCases(args[1]);
        }
        const auto summary = codeteam::dataset::Evaluate(
            solutions, test_cases, sandbox, SecondsToMillis(config.sandbox.timeout_s));
        std::cout << "passed " << summary.passed << " of " << summary.results.size() << std::endl;
        std::cout << "pass@1: " << std::fixed << std::setprecision(4) << summary.pass_at_1 << std::endl;
    } catch (const std::exception& ex) {
        std::cout << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

int ExecuteFile(const codeteam::config::Config& config, const std::vector<std::string>& args) {
    if (args.empty()) {
        PrintUsage();
        return 1;
    }
    std::ifstream input(args[0]);
    if (!input.is_open()) {
        std::cout << "Cannot read " << args[0] << std::endl;
        return 1;
    }
    std::ostringstream program;
    program << input.rdbuf();

    double timeout_s = config.sandbox.timeout_s;
    if (args.size() > 1) {
        try {
            timeout_s = std::stod(args[1]);
        } catch (const std::exception&) {
            std::cout << "Invalid timeout: " << args[1] << std::endl;
            return 1;
        }
    }

    codeteam::sandbox::SandboxExecutor sandbox(codeteam::sandbox::MakeSandboxOptions(config.sandbox));
    const auto result = sandbox.Run(program.str(), SecondsToMillis(timeout_s));
    std::cout << codeteam::sandbox::ToString(result.status) << ": "
              << codeteam::sandbox::Describe(result) << std::endl;
    return result.Passed() ? 0 : 2;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }

    const auto config = codeteam::config::LoadConfig();
    codeteam::utils::LogConfig log_config{};
    log_config.min_level = codeteam::utils::ParseLogLevel(config.log_level, log_config.min_level);
    codeteam::utils::SetLogConfig(log_config);

    const std::string command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);
    if (command == "run") {
        return RunTasks(config, args);
    }
    if (command == "eval") {
        return EvaluateSolutions(config, args);
    }
    if (command == "exec") {
        return ExecuteFile(config, args);
    }
    PrintUsage();
    return 1;
}
