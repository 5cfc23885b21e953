#include "providers/litellm_provider.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace codeteam::providers {
namespace {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string base_path;
};

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        parsed.port = std::stoi(host_port.substr(colon_pos + 1));
    } else {
        parsed.host = host_port;
    }

    if (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }

    return parsed;
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

bool ParseProxyHostPort(const std::string& proxy, std::string& host, int& port) {
    if (proxy.empty()) {
        return false;
    }
    std::string working = proxy;
    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        working = working.substr(scheme_pos + 3);
    }
    const auto slash_pos = working.find('/');
    if (slash_pos != std::string::npos) {
        working = working.substr(0, slash_pos);
    }
    const auto colon_pos = working.rfind(':');
    if (colon_pos == std::string::npos) {
        return false;
    }
    host = working.substr(0, colon_pos);
    try {
        port = std::stoi(working.substr(colon_pos + 1));
    } catch (const std::exception&) {
        return false;
    }
    return !host.empty() && port > 0;
}

std::string MaskKey(const std::string& key) {
    if (key.size() <= 8) {
        return "****";
    }
    return key.substr(0, 4) + "****" + key.substr(key.size() - 4);
}

bool ShouldUseAnthropicMessages(const std::string& model, const std::string& api_base) {
    const auto combined = ToLower(model + " " + api_base);
    return combined.find("anthropic") != std::string::npos ||
        combined.find("claude") != std::string::npos;
}

CompletionResponse ErrorResponse(std::string error, int http_status = 0) {
    CompletionResponse response{};
    response.finish_reason = "error";
    response.http_status = http_status;
    response.error = std::move(error);
    return response;
}

nlohmann::json BuildOpenAIPayload(const std::vector<Message>& messages,
                                  const CompletionRequest& request,
                                  const std::string& model) {
    nlohmann::json payload;
    payload["model"] = model;
    payload["max_tokens"] = request.max_tokens;
    payload["temperature"] = request.temperature;
    payload["top_p"] = request.top_p;
    payload["n"] = request.n;
    payload["messages"] = nlohmann::json::array();
    for (const auto& msg : messages) {
        nlohmann::json entry;
        entry["role"] = msg.role;
        entry["content"] = msg.content;
        payload["messages"].push_back(entry);
    }
    return payload;
}

nlohmann::json BuildAnthropicPayload(const std::vector<Message>& messages,
                                     const CompletionRequest& request,
                                     const std::string& model) {
    nlohmann::json payload;
    std::string system_prompt;
    payload["model"] = model;
    payload["max_tokens"] = request.max_tokens;
    payload["temperature"] = request.temperature;
    payload["top_p"] = request.top_p;
    payload["messages"] = nlohmann::json::array();
    for (const auto& msg : messages) {
        if (msg.role == "system") {
            if (!system_prompt.empty()) {
                system_prompt.append("\n");
            }
            system_prompt.append(msg.content);
            continue;
        }
        payload["messages"].push_back({
            {"role", msg.role},
            {"content", nlohmann::json::array({{{"type", "text"}, {"text", msg.content}}})}
        });
    }
    if (!system_prompt.empty()) {
        payload["system"] = system_prompt;
    }
    return payload;
}

}  // namespace

LiteLLMProvider::LiteLLMProvider(std::string api_key,
                                 std::string api_base,
                                 std::string default_model,
                                 bool use_proxy_for_llm)
    : api_key_(std::move(api_key))
    , api_base_(std::move(api_base))
    , default_model_(std::move(default_model))
    , use_proxy_for_llm_(use_proxy_for_llm) {
    is_openrouter_ = (!api_key_.empty() && api_key_.rfind("sk-or-", 0) == 0) ||
        (api_base_.find("openrouter") != std::string::npos);
}

CompletionResponse LiteLLMProvider::Complete(
    const std::vector<Message>& messages,
    const CompletionRequest& request) {
    try {
        const auto model = request.model.empty() ? default_model_ : request.model;
        const bool use_anthropic = ShouldUseAnthropicMessages(model, api_base_);

        if (!use_anthropic) {
            const auto payload = BuildOpenAIPayload(messages, request, model);
            const auto reply = Post("/chat/completions", payload.dump(), false);
            if (!reply.Ok()) {
                return ErrorResponse(reply.error, reply.status);
            }
            auto json = nlohmann::json::parse(reply.body, nullptr, false);
            if (json.is_discarded() || !json.contains("choices") || !json["choices"].is_array() ||
                json["choices"].empty()) {
                return ErrorResponse("Error calling LLM: invalid response", reply.status);
            }
            CompletionResponse parsed{};
            parsed.http_status = reply.status;
            for (const auto& choice : json["choices"]) {
                if (!choice.contains("message")) {
                    continue;
                }
                const auto& message = choice["message"];
                if (message.contains("content") && message["content"].is_string()) {
                    parsed.completions.push_back(message["content"].get<std::string>());
                } else {
                    parsed.completions.emplace_back();
                }
                if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
                    parsed.finish_reason = choice["finish_reason"].get<std::string>();
                }
            }
            return parsed;
        }

        // The messages API returns a single completion per call.
        const auto payload = BuildAnthropicPayload(messages, request, model);
        CompletionResponse parsed{};
        const int wanted = std::max(1, request.n);
        for (int i = 0; i < wanted; ++i) {
            const auto reply = Post("/messages", payload.dump(), true);
            if (!reply.Ok()) {
                return ErrorResponse(reply.error, reply.status);
            }
            auto json = nlohmann::json::parse(reply.body, nullptr, false);
            if (json.is_discarded() || !json.contains("content") || !json["content"].is_array()) {
                return ErrorResponse("Error calling LLM: invalid response", reply.status);
            }
            std::string text;
            for (const auto& block : json["content"]) {
                if (block.value("type", "") == "text") {
                    text += block.value("text", "");
                }
            }
            parsed.completions.push_back(std::move(text));
            parsed.http_status = reply.status;
            if (json.contains("stop_reason") && json["stop_reason"].is_string()) {
                parsed.finish_reason = json["stop_reason"].get<std::string>();
            }
        }
        return parsed;
    } catch (const std::exception& ex) {
        return ErrorResponse(std::string("Error calling LLM: ") + ex.what());
    }
}

LiteLLMProvider::HttpReply LiteLLMProvider::Post(const std::string& endpoint_suffix,
                                                 const std::string& body,
                                                 bool use_anthropic) const {
    std::string base_url = api_base_;
    if (base_url.empty()) {
        if (use_anthropic) {
            base_url = "https://api.anthropic.com/v1";
        } else {
            base_url = is_openrouter_ ? "https://openrouter.ai/api/v1" : "https://api.openai.com/v1";
        }
    }

    const auto parsed = ParseUrl(base_url);
    const std::string endpoint = parsed.base_path + endpoint_suffix;

    std::string scheme_host_port = parsed.https ? "https://" : "http://";
    scheme_host_port += parsed.host + ":" + std::to_string(parsed.port);
    auto client = std::make_unique<httplib::Client>(scheme_host_port);
    client->set_connection_timeout(60);
    client->set_read_timeout(120);

    if (use_proxy_for_llm_) {
        const char* kProxyVars[] = {"HTTPS_PROXY", "HTTP_PROXY", "https_proxy", "http_proxy"};
        for (const auto* key : kProxyVars) {
            std::string proxy_host;
            int proxy_port = 0;
            if (ParseProxyHostPort(GetEnv(key), proxy_host, proxy_port)) {
                client->set_proxy(proxy_host, proxy_port);
                break;
            }
        }
    }

    codeteam::utils::LogDebug("llm", "POST " + scheme_host_port + endpoint +
        " api_key=" + MaskKey(api_key_) +
        " style=" + (use_anthropic ? "anthropic" : "openai"));

    httplib::Headers headers{{"Content-Type", "application/json"}};
    if (!api_key_.empty()) {
        if (use_anthropic) {
            headers.emplace("x-api-key", api_key_);
            headers.emplace("anthropic-version", "2023-06-01");
        } else {
            headers.emplace("Authorization", "Bearer " + api_key_);
        }
    }

    HttpReply reply{};
    auto response = client->Post(endpoint.c_str(), headers, body, "application/json");
    if (!response) {
        const auto err = response.error();
        const auto err_text = httplib::to_string(err);
        codeteam::utils::LogWarn("llm", "request failed: httplib error=" +
            std::to_string(static_cast<int>(err)) + "(" + err_text + ")");
        reply.error = "Error calling LLM: request failed (" + err_text + ")";
        return reply;
    }
    reply.status = response->status;
    if (response->status >= 400) {
        codeteam::utils::LogWarn("llm", "HTTP " + std::to_string(response->status) +
            " body=" + response->body);
        reply.error = "Error calling LLM: HTTP " + std::to_string(response->status);
        return reply;
    }
    reply.body = response->body;
    return reply;
}

}  // namespace codeteam::providers
