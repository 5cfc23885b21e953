#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>

#include "config/config_schema.hpp"

namespace codeteam::sandbox {

enum class ExecutionStatus {
    kPassed,
    kAssertionFailure,
    kTimeout,
    kOtherError
};

const char* ToString(ExecutionStatus status);

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::kOtherError;
    std::string detail;

    bool Passed() const { return status == ExecutionStatus::kPassed; }
};

// Feedback text for a result, e.g. "Code Test Passed." or "timed out".
std::string Describe(const ExecutionResult& result);

struct SandboxOptions {
    std::string interpreter = "python3";
    std::size_t memory_bytes = 1024ULL * 1024 * 1024;
    std::size_t max_output_bytes = 16ULL * 1024 * 1024;
    bool block_subprocesses = true;
};

SandboxOptions MakeSandboxOptions(const codeteam::config::SandboxConfig& config);

// Runs one untrusted program per call in a short-lived child process with its own
// temporary working directory. Calls on one executor are serialized.
class SandboxExecutor {
public:
    explicit SandboxExecutor(SandboxOptions options = SandboxOptions{});

    // Never throws; every outcome, including internal failures, is an ExecutionResult.
    ExecutionResult Run(const std::string& program, std::chrono::milliseconds timeout);

    // Compiles the program in a child without executing it. kPassed when it parses,
    // kOtherError carrying the SyntaxError otherwise.
    ExecutionResult CheckSyntax(const std::string& program);

    const SandboxOptions& Options() const { return options_; }

private:
    ExecutionResult Execute(const std::string& program, std::chrono::milliseconds timeout, bool parse_only);

    SandboxOptions options_;
    std::mutex mutex_;
};

}  // namespace codeteam::sandbox
