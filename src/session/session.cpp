#include "session/session.hpp"

#include <algorithm>

#include "agent/code_extract.hpp"
#include "harness/test_harness.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codeteam::session {

const char* ToString(SessionMode mode) {
    switch (mode) {
        case SessionMode::kFull: return "full";
        case SessionMode::kAnalystCoder: return "analyst-coder";
        case SessionMode::kCoderTester: return "coder-tester";
        case SessionMode::kCoderOnly: return "coder";
    }
    return "unknown";
}

bool ParseSessionMode(const std::string& value, SessionMode& mode) {
    for (const auto candidate : {SessionMode::kFull, SessionMode::kAnalystCoder,
                                 SessionMode::kCoderTester, SessionMode::kCoderOnly}) {
        if (value == ToString(candidate)) {
            mode = candidate;
            return true;
        }
    }
    return false;
}

Session::Session(std::string requirement,
                 codeteam::agent::RoleClient& analyst,
                 codeteam::agent::RoleClient& developer,
                 codeteam::agent::RoleClient& tester,
                 codeteam::sandbox::SandboxExecutor& sandbox,
                 codeteam::agent::SamplingOptions sampling,
                 SessionOptions options)
    : requirement_(std::move(requirement))
    , sandbox_(sandbox)
    , options_(std::move(options))
    , analyst_(analyst, sampling, requirement_)
    , developer_(developer, sampling, requirement_)
    , tester_(tester, sampling, requirement_) {}

SessionResult Session::Fail(SessionResult result, const std::string& reason) const {
    codeteam::utils::LogError("session", reason);
    result.status = SessionStatus::kError;
    result.error = reason;
    result.code.clear();
    result.entry_point.clear();
    return result;
}

std::optional<std::string> Session::AcceptedEntryPoint(const std::string& candidate, int round) {
    auto entry_point = codeteam::agent::FindEntryPoint(candidate);
    if (!entry_point) {
        codeteam::utils::LogWarn("session", "round " + std::to_string(round) + ": no function found in candidate");
        return std::nullopt;
    }
    const auto parsed = sandbox_.CheckSyntax(candidate);
    if (!parsed.Passed()) {
        codeteam::utils::LogWarn("session", "round " + std::to_string(round) +
            ": candidate does not parse: " + parsed.detail);
        return std::nullopt;
    }
    return entry_point;
}

codeteam::sandbox::ExecutionResult Session::TestCandidate(const std::string& code,
                                                          const std::string& entry_point) {
    const auto tests = tester_.Test(code);
    const auto suite = codeteam::harness::ExtractTestStatements(codeteam::agent::TruncateCode(tests));
    const auto check = codeteam::harness::BuildCheck(
        suite.statements, entry_point, suite.imports, suite.definitions);
    const auto program = codeteam::harness::ComposeTestProgram(options_.prelude, code, check, entry_point);
    codeteam::utils::LogDebug("session", "running " + std::to_string(suite.statements.size()) +
        " test statements against " + entry_point);
    return sandbox_.Run(program, options_.test_timeout);
}

SessionResult Session::Run() {
    SessionResult result{};
    const bool use_analyst = options_.mode == SessionMode::kFull || options_.mode == SessionMode::kAnalystCoder;
    const bool verify = options_.mode == SessionMode::kFull || options_.mode == SessionMode::kCoderTester;
    const int max_rounds = verify ? std::max(1, options_.max_rounds) : 1;

    std::string report;
    if (use_analyst) {
        try {
            result.plan = analyst_.Analyze();
        } catch (const std::exception& ex) {
            return Fail(std::move(result), std::string("analyst failed: ") + ex.what());
        }
        report = result.plan;
    }

    for (int round = 0; round < max_rounds; ++round) {
        if (cancelled_) {
            codeteam::utils::LogInfo("session", "cancelled before round " + std::to_string(round));
            result.status = SessionStatus::kCancelled;
            return result;
        }

        std::string candidate;
        try {
            candidate = developer_.Implement(report, round == 0);
        } catch (const std::exception& ex) {
            return Fail(std::move(result),
                        "developer failed in round " + std::to_string(round) + ": " + ex.what());
        }

        if (const auto entry_point = AcceptedEntryPoint(candidate, round)) {
            result.code = candidate;
            result.entry_point = *entry_point;
        } else {
            codeteam::utils::LogWarn("session", "round " + std::to_string(round) +
                ": keeping previous code");
        }
        if (codeteam::utils::Trim(result.code).empty()) {
            return Fail(std::move(result), "no function could be extracted in round " + std::to_string(round));
        }

        RoundRecord record{};
        record.index = round;
        record.code = result.code;

        const bool final_round = round == max_rounds - 1;
        if (final_round && !(verify && options_.test_final_round)) {
            result.rounds.push_back(std::move(record));
            result.status = SessionStatus::kExhausted;
            return result;
        }

        codeteam::sandbox::ExecutionResult execution{};
        try {
            execution = TestCandidate(result.code, result.entry_point);
        } catch (const std::exception& ex) {
            return Fail(std::move(result),
                        "testing failed in round " + std::to_string(round) + ": " + ex.what());
        }

        record.report = codeteam::sandbox::Describe(execution);
        record.outcome = execution.Passed() ? RoundOutcome::kPassed : RoundOutcome::kFailed;
        record.execution = execution;
        report = *record.report;
        result.rounds.push_back(std::move(record));
        codeteam::utils::LogInfo("session", "round " + std::to_string(round) + ": " + report);

        if (execution.Passed()) {
            result.status = SessionStatus::kSuccess;
            return result;
        }
    }

    result.status = SessionStatus::kExhausted;
    return result;
}

}  // namespace codeteam::session
