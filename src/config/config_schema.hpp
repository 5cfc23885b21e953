#pragma once

#include <string>

namespace codeteam::config {

struct ProviderConfig {
    std::string api_key;
    std::string api_base;
};

struct ProvidersConfig {
    ProviderConfig openai;
    ProviderConfig openrouter;
    ProviderConfig anthropic;
    ProviderConfig vllm;
    bool use_proxy_for_llm = false;
};

struct AgentDefaults {
    std::string model = "gpt-3.5-turbo";
    int max_tokens = 512;
    double temperature = 0.0;
    double top_p = 0.95;
    int majority = 1;
    int max_round = 2;
    int max_attempts = 20;
};

struct AgentsConfig {
    AgentDefaults defaults;
};

struct SandboxConfig {
    std::string interpreter = "python3";
    double timeout_s = 10.0;
    int memory_mb = 1024;
    int max_output_mb = 16;
    bool block_subprocesses = true;
};

struct Config {
    AgentsConfig agents;
    ProvidersConfig providers;
    SandboxConfig sandbox;
    std::string log_level = "info";
};

}  // namespace codeteam::config
