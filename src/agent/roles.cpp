#include "agent/roles.hpp"

#include "agent/code_extract.hpp"
#include "agent/prompts.hpp"

namespace codeteam::agent {

Conversation Conversation::With(const std::string& role, const std::string& content) const {
    auto messages = messages_;
    codeteam::providers::Message message{};
    message.role = role;
    message.content = content;
    messages.push_back(std::move(message));
    return Conversation(std::move(messages));
}

Conversation Conversation::WithoutLast() const {
    auto messages = messages_;
    if (!messages.empty()) {
        messages.pop_back();
    }
    return Conversation(std::move(messages));
}

RoleAgent::RoleAgent(RoleClient& client, SamplingOptions sampling, const std::string& system_message)
    : client_(client)
    , sampling_(std::move(sampling))
    , history_(Conversation().With("user", system_message)) {}

std::string RoleAgent::Ask(const Conversation& conversation) {
    return SelectMajority(client_.Generate(conversation.Messages(), sampling_));
}

Analyst::Analyst(RoleClient& client, SamplingOptions sampling, const std::string& requirement)
    : RoleAgent(client, std::move(sampling), prompts::SystemMessage(requirement, prompts::kAnalyst)) {}

std::string Analyst::Analyze() {
    auto plan = Ask(history_);
    history_ = history_.With("assistant", plan);
    return plan;
}

Developer::Developer(RoleClient& client, SamplingOptions sampling, std::string requirement)
    : RoleAgent(client, std::move(sampling), prompts::SystemMessage(requirement, prompts::kDeveloper))
    , requirement_(std::move(requirement)) {}

std::string Developer::Implement(const std::string& report, bool initial) {
    auto prompt = history_;
    const bool with_report = !report.empty();
    if (with_report) {
        prompt = prompt
            .With("user", initial ? prompts::PlanInstruction(report) : prompts::ReportInstruction(report))
            .With("user", prompts::CodeInstruction(requirement_));
    }

    const auto code = TruncateCode(Ask(prompt));

    // The code request is transient; only the reply is kept.
    history_ = (with_report ? prompt.WithoutLast() : prompt).With("assistant", code);
    return code;
}

Tester::Tester(RoleClient& client, SamplingOptions sampling, const std::string& requirement)
    : RoleAgent(client, std::move(sampling), prompts::SystemMessage(requirement, prompts::kTester)) {}

std::string Tester::Test(const std::string& code) {
    const auto prompt = history_.With("user", prompts::TestInstruction(code));
    auto tests = Ask(prompt);
    history_ = prompt.With("assistant", tests);
    return tests;
}

}  // namespace codeteam::agent
