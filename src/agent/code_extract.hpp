#pragma once

#include <optional>
#include <string>

namespace codeteam::agent {

// Body of the first fenced block in a model reply; without a fence, the blocks from the first
// "def" onwards that look like code.
std::string TruncateCode(const std::string& response);

// Name of the top-level function a candidate exposes. With several, the last one wins unless it
// is "main", in which case the one before it is used.
std::optional<std::string> FindEntryPoint(const std::string& code);

// Everything in a task prompt before its final function definition (imports, helpers).
std::string PromptPrelude(const std::string& prompt);

bool IsIdentifier(const std::string& name);

}  // namespace codeteam::agent
