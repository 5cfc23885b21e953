#pragma once

#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace codeteam::session {

enum class SessionStatus {
    kSuccess,
    kExhausted,
    kCancelled,
    kError
};

enum class RoundOutcome {
    kPassed,
    kFailed,
    kUntested
};

const char* ToString(SessionStatus status);
const char* ToString(RoundOutcome outcome);

struct RoundRecord {
    int index = 0;
    std::string code;
    std::optional<std::string> report;
    std::optional<codeteam::sandbox::ExecutionResult> execution;
    RoundOutcome outcome = RoundOutcome::kUntested;
};

struct SessionResult {
    SessionStatus status = SessionStatus::kExhausted;
    std::string code;
    std::string entry_point;
    std::string plan;
    std::string error;
    std::vector<RoundRecord> rounds;

    bool Ok() const { return status != SessionStatus::kError; }
};

// {"status", "plan", "Round_<i>": {"code", "report"}, "error"} as written to solution files.
nlohmann::json ToJson(const SessionResult& result);

}  // namespace codeteam::session
