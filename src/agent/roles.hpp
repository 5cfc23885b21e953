#pragma once

#include <string>
#include <vector>

#include "agent/role_client.hpp"
#include "providers/llm_provider.hpp"

namespace codeteam::agent {

// Append-only message log. Appending yields a new log; an existing value never changes.
class Conversation {
public:
    Conversation() = default;

    Conversation With(const std::string& role, const std::string& content) const;
    Conversation WithoutLast() const;

    const std::vector<codeteam::providers::Message>& Messages() const { return messages_; }
    std::size_t Size() const { return messages_.size(); }
    bool Empty() const { return messages_.empty(); }

private:
    explicit Conversation(std::vector<codeteam::providers::Message> messages)
        : messages_(std::move(messages)) {}

    std::vector<codeteam::providers::Message> messages_;
};

class RoleAgent {
public:
    RoleAgent(RoleClient& client, SamplingOptions sampling, const std::string& system_message);
    virtual ~RoleAgent() = default;

    const Conversation& History() const { return history_; }

protected:
    // One majority-selected completion for the given conversation. Raises ProviderError.
    std::string Ask(const Conversation& conversation);

    RoleClient& client_;
    SamplingOptions sampling_;
    Conversation history_;
};

class Analyst : public RoleAgent {
public:
    Analyst(RoleClient& client, SamplingOptions sampling, const std::string& requirement);

    std::string Analyze();
};

class Developer : public RoleAgent {
public:
    Developer(RoleClient& client, SamplingOptions sampling, std::string requirement);

    // report is the plan on the first call (initial) or the last test report afterwards; an
    // empty report asks for code from the requirement alone. Returns the extracted code.
    std::string Implement(const std::string& report, bool initial);

private:
    std::string requirement_;
};

class Tester : public RoleAgent {
public:
    Tester(RoleClient& client, SamplingOptions sampling, const std::string& requirement);

    std::string Test(const std::string& code);
};

}  // namespace codeteam::agent
