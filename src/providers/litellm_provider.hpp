#pragma once

#include <string>
#include <vector>

#include "providers/llm_provider.hpp"

namespace codeteam::providers {

class LiteLLMProvider : public LLMProvider {
public:
    LiteLLMProvider(std::string api_key,
                    std::string api_base,
                    std::string default_model,
                    bool use_proxy_for_llm);

    CompletionResponse Complete(
        const std::vector<Message>& messages,
        const CompletionRequest& request) override;

private:
    std::string api_key_;
    std::string api_base_;
    std::string default_model_;
    bool is_openrouter_ = false;
    bool use_proxy_for_llm_ = false;

    struct HttpReply {
        int status = 0;
        std::string body;
        std::string error;

        bool Ok() const { return error.empty(); }
    };

    HttpReply Post(const std::string& endpoint_suffix,
                   const std::string& body,
                   bool use_anthropic) const;
};

}  // namespace codeteam::providers
