#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

#include "agent/role_client.hpp"
#include "agent/roles.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "session/session_types.hpp"

namespace codeteam::session {

enum class SessionMode {
    kFull,
    kAnalystCoder,
    kCoderTester,
    kCoderOnly
};

const char* ToString(SessionMode mode);
bool ParseSessionMode(const std::string& value, SessionMode& mode);

struct SessionOptions {
    int max_rounds = 2;
    std::chrono::milliseconds test_timeout{10000};
    // Code that must precede every candidate in the test program.
    std::string prelude;
    SessionMode mode = SessionMode::kFull;
    // The final round is accepted untested unless this is set.
    bool test_final_round = false;
};

// One bounded plan / implement / test / repair attempt at a single requirement.
class Session {
public:
    Session(std::string requirement,
            codeteam::agent::RoleClient& analyst,
            codeteam::agent::RoleClient& developer,
            codeteam::agent::RoleClient& tester,
            codeteam::sandbox::SandboxExecutor& sandbox,
            codeteam::agent::SamplingOptions sampling,
            SessionOptions options);

    // Never throws for role or sandbox failures; they end the session with kError.
    SessionResult Run();

    // No further rounds start after the current one returns.
    void Cancel() { cancelled_ = true; }

    const std::string& Requirement() const { return requirement_; }

private:
    SessionResult Fail(SessionResult result, const std::string& reason) const;
    // Entry point of a candidate that names a top-level function and parses; nullopt otherwise.
    std::optional<std::string> AcceptedEntryPoint(const std::string& candidate, int round);
    codeteam::sandbox::ExecutionResult TestCandidate(const std::string& code, const std::string& entry_point);

    std::string requirement_;
    codeteam::sandbox::SandboxExecutor& sandbox_;
    SessionOptions options_;
    codeteam::agent::Analyst analyst_;
    codeteam::agent::Developer developer_;
    codeteam::agent::Tester tester_;
    std::atomic<bool> cancelled_{false};
};

}  // namespace codeteam::session
