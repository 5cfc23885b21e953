#include "agent/role_client.hpp"

#include <algorithm>
#include <thread>
#include <unordered_map>

#include "utils/logging.hpp"

namespace codeteam::agent {

ProviderRoleClient::ProviderRoleClient(codeteam::providers::LLMProvider& provider,
                                       int max_attempts,
                                       SleepFunction sleep)
    : provider_(provider)
    , max_attempts_(std::max(1, max_attempts))
    , sleep_(std::move(sleep)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::seconds duration) { std::this_thread::sleep_for(duration); };
    }
}

std::vector<std::string> ProviderRoleClient::Generate(
    const std::vector<codeteam::providers::Message>& history,
    const SamplingOptions& options) {
    const int wanted = std::max(1, options.majority);
    const int attempts = max_attempts_ * (wanted / kBatchSize + 1);
    std::vector<std::string> completions;

    for (int attempt = 0; attempt < attempts; ++attempt) {
        codeteam::providers::CompletionRequest request{};
        request.model = options.model;
        request.max_tokens = options.max_tokens;
        request.temperature = options.temperature;
        request.top_p = options.top_p;
        request.n = std::min(kBatchSize, wanted - static_cast<int>(completions.size()));

        const auto response = provider_.Complete(history, request);
        if (response.RateLimited()) {
            const auto backoff = std::chrono::seconds(std::min(attempt * attempt, 60));
            codeteam::utils::LogWarn("llm", "rate limited, retrying in " +
                std::to_string(backoff.count()) + "s (attempt " + std::to_string(attempt + 1) + ")");
            sleep_(backoff);
            continue;
        }
        if (response.Failed()) {
            throw ProviderError(response.error.empty() ? "completion request failed" : response.error);
        }

        completions.insert(completions.end(), response.completions.begin(), response.completions.end());
        if (static_cast<int>(completions.size()) >= wanted) {
            completions.resize(static_cast<std::size_t>(wanted));
            return completions;
        }
    }
    throw ProviderError("failed to obtain completions after " + std::to_string(attempts) + " attempts");
}

std::string SelectMajority(const std::vector<std::string>& completions) {
    if (completions.empty()) {
        throw ProviderError("no completions to choose from");
    }
    std::unordered_map<std::string, int> counts;
    for (const auto& completion : completions) {
        ++counts[completion];
    }
    const std::string* best = &completions.front();
    int best_count = 0;
    for (const auto& completion : completions) {
        const int count = counts[completion];
        if (count > best_count) {
            best = &completion;
            best_count = count;
        }
    }
    return *best;
}

}  // namespace codeteam::agent
