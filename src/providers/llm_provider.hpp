#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config/config_schema.hpp"

namespace codeteam::providers {

struct Message {
    std::string role;
    std::string content;
};

struct CompletionRequest {
    std::string model;
    int max_tokens = 512;
    double temperature = 0.0;
    double top_p = 1.0;
    int n = 1;
};

struct CompletionResponse {
    std::vector<std::string> completions;
    std::string finish_reason = "stop";
    int http_status = 200;
    std::string error;

    bool Failed() const { return finish_reason == "error"; }
    bool RateLimited() const { return http_status == 429; }
};

struct ProviderSettings {
    std::string api_key;
    std::string api_base;
    std::string model;
    bool use_proxy_for_llm = false;
};

class LLMProvider {
public:
    virtual ~LLMProvider() = default;
    // Transport and API failures are reported through the response, never thrown.
    virtual CompletionResponse Complete(
        const std::vector<Message>& messages,
        const CompletionRequest& request) = 0;
};

ProviderSettings ResolveProviderSettings(const codeteam::config::Config& config);
std::unique_ptr<LLMProvider> CreateProvider(const codeteam::config::Config& config);

}  // namespace codeteam::providers
