#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include "utils/logging.hpp"

namespace codeteam::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ApplyProviderConfig(ProviderConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    if (source.contains("apiKey") && source["apiKey"].is_string()) {
        target.api_key = source["apiKey"].get<std::string>();
    }
    if (source.contains("apiBase") && source["apiBase"].is_string()) {
        target.api_base = source["apiBase"].get<std::string>();
    }
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".codeteam" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("logLevel") && data["logLevel"].is_string()) {
        config.log_level = data["logLevel"].get<std::string>();
    }

    if (data.contains("agents") && data["agents"].is_object()) {
        const auto& agents = data["agents"];
        if (agents.contains("defaults") && agents["defaults"].is_object()) {
            const auto& defaults = agents["defaults"];
            if (defaults.contains("model") && defaults["model"].is_string()) {
                config.agents.defaults.model = defaults["model"].get<std::string>();
            }
            if (defaults.contains("maxTokens") && defaults["maxTokens"].is_number_integer()) {
                config.agents.defaults.max_tokens = defaults["maxTokens"].get<int>();
            }
            if (defaults.contains("temperature") && defaults["temperature"].is_number()) {
                config.agents.defaults.temperature = defaults["temperature"].get<double>();
            }
            if (defaults.contains("topP") && defaults["topP"].is_number()) {
                config.agents.defaults.top_p = defaults["topP"].get<double>();
            }
            if (defaults.contains("majority") && defaults["majority"].is_number_integer()) {
                config.agents.defaults.majority = defaults["majority"].get<int>();
            }
            if (defaults.contains("maxRound") && defaults["maxRound"].is_number_integer()) {
                config.agents.defaults.max_round = defaults["maxRound"].get<int>();
            }
            if (defaults.contains("maxAttempts") && defaults["maxAttempts"].is_number_integer()) {
                config.agents.defaults.max_attempts = defaults["maxAttempts"].get<int>();
            }
        }
    }

    if (data.contains("providers") && data["providers"].is_object()) {
        const auto& providers = data["providers"];
        if (providers.contains("useProxyForLLM") && providers["useProxyForLLM"].is_boolean()) {
            config.providers.use_proxy_for_llm = providers["useProxyForLLM"].get<bool>();
        }
        if (providers.contains("openai")) {
            ApplyProviderConfig(config.providers.openai, providers["openai"]);
        }
        if (providers.contains("openrouter")) {
            ApplyProviderConfig(config.providers.openrouter, providers["openrouter"]);
        }
        if (providers.contains("anthropic")) {
            ApplyProviderConfig(config.providers.anthropic, providers["anthropic"]);
        }
        if (providers.contains("vllm")) {
            ApplyProviderConfig(config.providers.vllm, providers["vllm"]);
        }
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        if (sandbox.contains("interpreter") && sandbox["interpreter"].is_string()) {
            config.sandbox.interpreter = sandbox["interpreter"].get<std::string>();
        }
        if (sandbox.contains("timeoutS") && sandbox["timeoutS"].is_number()) {
            config.sandbox.timeout_s = sandbox["timeoutS"].get<double>();
        }
        if (sandbox.contains("memoryMb") && sandbox["memoryMb"].is_number_integer()) {
            config.sandbox.memory_mb = sandbox["memoryMb"].get<int>();
        }
        if (sandbox.contains("maxOutputMb") && sandbox["maxOutputMb"].is_number_integer()) {
            config.sandbox.max_output_mb = sandbox["maxOutputMb"].get<int>();
        }
        if (sandbox.contains("blockSubprocesses") && sandbox["blockSubprocesses"].is_boolean()) {
            config.sandbox.block_subprocesses = sandbox["blockSubprocesses"].get<bool>();
        }
    }
}

Config LoadConfig() {
    Config config{};

    const auto config_path = GetConfigPath();
    if (std::filesystem::exists(config_path)) {
        std::ifstream input(config_path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            codeteam::utils::LogWarn("config", "ignoring malformed " + config_path.string());
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    const auto openai_key = GetEnvFallback(
        "CODETEAM_PROVIDERS__OPENAI__API_KEY",
        "OPENAI_API_KEY");
    if (!openai_key.empty()) {
        config.providers.openai.api_key = openai_key;
    }

    const auto openai_base = GetEnvFallback(
        "CODETEAM_PROVIDERS__OPENAI__API_BASE",
        "CODETEAM_PROVIDERS_OPENAI_API_BASE");
    if (!openai_base.empty()) {
        config.providers.openai.api_base = openai_base;
    }

    const auto openrouter_key = GetEnvFallback(
        "CODETEAM_PROVIDERS__OPENROUTER__API_KEY",
        "CODETEAM_PROVIDERS_OPENROUTER_API_KEY");
    if (!openrouter_key.empty()) {
        config.providers.openrouter.api_key = openrouter_key;
    }

    const auto anthropic_key = GetEnvFallback(
        "CODETEAM_PROVIDERS__ANTHROPIC__API_KEY",
        "CODETEAM_PROVIDERS_ANTHROPIC_API_KEY");
    if (!anthropic_key.empty()) {
        config.providers.anthropic.api_key = anthropic_key;
    }

    const auto vllm_base = GetEnvFallback(
        "CODETEAM_PROVIDERS__VLLM__API_BASE",
        "CODETEAM_PROVIDERS_VLLM_API_BASE");
    if (!vllm_base.empty()) {
        config.providers.vllm.api_base = vllm_base;
    }

    const auto use_proxy_for_llm = GetEnvFallback(
        "CODETEAM_PROVIDERS__USE_PROXY_FOR_LLM",
        "CODETEAM_PROVIDERS_USE_PROXY_FOR_LLM");
    if (!use_proxy_for_llm.empty()) {
        config.providers.use_proxy_for_llm = ParseBool(use_proxy_for_llm);
    }

    const auto model = GetEnvFallback(
        "CODETEAM_AGENTS__DEFAULTS__MODEL",
        "CODETEAM_AGENT_MODEL");
    if (!model.empty()) {
        config.agents.defaults.model = model;
    }

    const auto max_tokens = GetEnvFallback(
        "CODETEAM_AGENTS__DEFAULTS__MAX_TOKENS",
        "CODETEAM_AGENT_MAX_TOKENS");
    if (!max_tokens.empty()) {
        config.agents.defaults.max_tokens = ParseInt(max_tokens, config.agents.defaults.max_tokens);
    }

    const auto temperature = GetEnvFallback(
        "CODETEAM_AGENTS__DEFAULTS__TEMPERATURE",
        "CODETEAM_AGENT_TEMPERATURE");
    if (!temperature.empty()) {
        config.agents.defaults.temperature = ParseDouble(temperature, config.agents.defaults.temperature);
    }

    const auto majority = GetEnvFallback(
        "CODETEAM_AGENTS__DEFAULTS__MAJORITY",
        "CODETEAM_AGENT_MAJORITY");
    if (!majority.empty()) {
        config.agents.defaults.majority = ParseInt(majority, config.agents.defaults.majority);
    }

    const auto max_round = GetEnvFallback(
        "CODETEAM_AGENTS__DEFAULTS__MAX_ROUND",
        "CODETEAM_AGENT_MAX_ROUND");
    if (!max_round.empty()) {
        config.agents.defaults.max_round = ParseInt(max_round, config.agents.defaults.max_round);
    }

    const auto interpreter = GetEnvFallback(
        "CODETEAM_SANDBOX__INTERPRETER",
        "CODETEAM_SANDBOX_INTERPRETER");
    if (!interpreter.empty()) {
        config.sandbox.interpreter = interpreter;
    }

    const auto timeout_s = GetEnvFallback(
        "CODETEAM_SANDBOX__TIMEOUT_S",
        "CODETEAM_SANDBOX_TIMEOUT_S");
    if (!timeout_s.empty()) {
        config.sandbox.timeout_s = ParseDouble(timeout_s, config.sandbox.timeout_s);
    }

    const auto log_level = GetEnv("CODETEAM_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log_level = log_level;
    }

    return config;
}

}  // namespace codeteam::config
