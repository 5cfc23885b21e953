#include "session/session_types.hpp"

namespace codeteam::session {

const char* ToString(SessionStatus status) {
    switch (status) {
        case SessionStatus::kSuccess: return "success";
        case SessionStatus::kExhausted: return "exhausted";
        case SessionStatus::kCancelled: return "cancelled";
        case SessionStatus::kError: return "error";
    }
    return "unknown";
}

const char* ToString(RoundOutcome outcome) {
    switch (outcome) {
        case RoundOutcome::kPassed: return "passed";
        case RoundOutcome::kFailed: return "failed";
        case RoundOutcome::kUntested: return "untested";
    }
    return "unknown";
}

nlohmann::json ToJson(const SessionResult& result) {
    nlohmann::json json = nlohmann::json::object();
    json["status"] = ToString(result.status);
    if (!result.plan.empty()) {
        json["plan"] = result.plan;
    }
    for (const auto& round : result.rounds) {
        nlohmann::json entry = {
            {"code", round.code},
            {"outcome", ToString(round.outcome)}
        };
        if (round.report) {
            entry["report"] = *round.report;
        }
        json["Round_" + std::to_string(round.index)] = std::move(entry);
    }
    if (!result.error.empty()) {
        json["error"] = result.error;
    }
    return json;
}

}  // namespace codeteam::session
