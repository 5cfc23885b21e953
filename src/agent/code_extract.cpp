#include "agent/code_extract.hpp"

#include <cctype>
#include <vector>

#include "utils/common.hpp"

namespace codeteam::agent {
namespace {

std::string StripChars(const std::string& value, const std::string& chars) {
    return codeteam::utils::Trim(value, chars);
}

std::string FencedBlock(const std::string& response) {
    const auto open = response.find("```");
    if (open == std::string::npos) {
        return "";
    }
    const auto line_end = response.find('\n', open + 3);
    if (line_end == std::string::npos) {
        return "";
    }
    const auto close = response.find("```", line_end + 1);
    if (close == std::string::npos) {
        return "";
    }
    return response.substr(line_end + 1, close - line_end - 1);
}

// Advances the triple-quote state across one line; active is the open delimiter or empty.
void TrackTripleQuotes(const std::string& line, std::string& active) {
    std::size_t pos = 0;
    while (pos < line.size()) {
        if (active.empty()) {
            if (line[pos] == '#') {
                return;
            }
            if (line.compare(pos, 3, "\"\"\"") == 0 || line.compare(pos, 3, "'''") == 0) {
                active = line.substr(pos, 3);
                pos += 3;
                continue;
            }
            ++pos;
        } else {
            const auto close = line.find(active, pos);
            if (close == std::string::npos) {
                return;
            }
            active.clear();
            pos = close + 3;
        }
    }
}

}  // namespace

bool IsIdentifier(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    const auto first = static_cast<unsigned char>(name.front());
    if (!(std::isalpha(first) || first == '_')) {
        return false;
    }
    for (const auto c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (!(std::isalnum(uc) || uc == '_')) {
            return false;
        }
    }
    return true;
}

std::string TruncateCode(const std::string& response) {
    auto code = FencedBlock(response);
    if (!code.empty()) {
        return code;
    }

    const auto def_pos = response.find("def");
    if (def_pos == std::string::npos) {
        return "";
    }
    const auto generation = response.substr(def_pos);
    std::vector<std::string> kept;
    for (const auto& block : codeteam::utils::Split(generation, "\n\n")) {
        if (block.find("def ") != std::string::npos || (!block.empty() && block.front() == ' ')) {
            kept.push_back(block);
        }
    }
    code = StripChars(codeteam::utils::Join(kept, "\n\n"), "`");
    return codeteam::utils::Trim(code);
}

std::optional<std::string> FindEntryPoint(const std::string& code) {
    std::vector<std::string> names;
    std::string active_quote;
    for (const auto& line : codeteam::utils::SplitLines(code)) {
        const bool in_string = !active_quote.empty();
        TrackTripleQuotes(line, active_quote);
        if (in_string || !codeteam::utils::StartsWith(line, "def ")) {
            continue;
        }
        const auto paren = line.find('(');
        if (paren == std::string::npos) {
            continue;
        }
        const auto name = codeteam::utils::Trim(line.substr(4, paren - 4));
        if (IsIdentifier(name)) {
            names.push_back(name);
        }
    }

    if (names.empty()) {
        return std::nullopt;
    }
    if (names.size() == 1 || names.back() != "main") {
        return names.back();
    }
    return names[names.size() - 2];
}

std::string PromptPrelude(const std::string& prompt) {
    std::string normalized;
    normalized.reserve(prompt.size());
    for (std::size_t i = 0; i < prompt.size(); ++i) {
        if (prompt[i] == '\r' && i + 1 < prompt.size() && prompt[i + 1] == '\n') {
            continue;
        }
        normalized.push_back(prompt[i]);
    }
    normalized = codeteam::utils::Trim(normalized);
    const auto def_pos = normalized.rfind("def ");
    if (def_pos == std::string::npos) {
        return "";
    }
    return normalized.substr(0, def_pos);
}

}  // namespace codeteam::agent
