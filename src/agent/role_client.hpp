#pragma once

#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "providers/llm_provider.hpp"

namespace codeteam::agent {

struct SamplingOptions {
    std::string model;
    int max_tokens = 512;
    double temperature = 0.0;
    double top_p = 1.0;
    int majority = 1;
};

class ProviderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Produces completions for a role-tagged history. Raises ProviderError when no usable
// completions can be obtained.
class RoleClient {
public:
    virtual ~RoleClient() = default;
    virtual std::vector<std::string> Generate(
        const std::vector<codeteam::providers::Message>& history,
        const SamplingOptions& options) = 0;
};

class ProviderRoleClient : public RoleClient {
public:
    using SleepFunction = std::function<void(std::chrono::seconds)>;

    static constexpr int kBatchSize = 10;

    ProviderRoleClient(codeteam::providers::LLMProvider& provider,
                       int max_attempts = 20,
                       SleepFunction sleep = {});

    std::vector<std::string> Generate(
        const std::vector<codeteam::providers::Message>& history,
        const SamplingOptions& options) override;

private:
    codeteam::providers::LLMProvider& provider_;
    int max_attempts_;
    SleepFunction sleep_;
};

// Most frequent completion; ties go to the earliest one.
std::string SelectMajority(const std::vector<std::string>& completions);

}  // namespace codeteam::agent
