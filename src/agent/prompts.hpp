#pragma once

#include <string>

namespace codeteam::agent::prompts {

extern const char kTeam[];
extern const char kAnalyst[];
extern const char kDeveloper[];
extern const char kTester[];

std::string SystemMessage(const std::string& requirement, const std::string& role);
std::string PlanInstruction(const std::string& plan);
std::string ReportInstruction(const std::string& report);
std::string CodeInstruction(const std::string& requirement);
std::string TestInstruction(const std::string& code);

}  // namespace codeteam::agent::prompts
