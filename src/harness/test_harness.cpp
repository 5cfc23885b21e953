#include "harness/test_harness.hpp"

#include <cstddef>
#include <sstream>

#include "agent/code_extract.hpp"
#include "utils/common.hpp"

namespace codeteam::harness {
namespace {

constexpr char kIndent[] = "    ";

std::size_t Indentation(const std::string& line) {
    std::size_t count = 0;
    while (count < line.size() && (line[count] == ' ' || line[count] == '\t')) {
        ++count;
    }
    return count;
}

bool IsBlank(const std::string& line) {
    return codeteam::utils::Trim(line).empty();
}

bool IsComment(const std::string& line) {
    return codeteam::utils::StartsWith(codeteam::utils::Trim(line), "#");
}

bool IsImport(const std::string& line) {
    return codeteam::utils::StartsWith(line, "import ") || codeteam::utils::StartsWith(line, "from ");
}

bool StartsDefinition(const std::string& line) {
    return codeteam::utils::StartsWith(line, "def ") ||
        codeteam::utils::StartsWith(line, "async def ") ||
        codeteam::utils::StartsWith(line, "class ") ||
        codeteam::utils::StartsWith(line, "@");
}

// Net bracket depth change of a line, ignoring brackets inside string literals and comments.
int BracketDelta(const std::string& line) {
    int depth = 0;
    char quote = 0;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quote != 0) {
            if (c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '#') {
            break;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            --depth;
        }
    }
    return depth;
}

// Lines of the indented block that follows lines[header], up to the next top-level line.
std::vector<std::string> BlockBody(const std::vector<std::string>& lines, std::size_t header,
                                   std::size_t& next) {
    std::vector<std::string> body;
    std::size_t i = header + 1;
    for (; i < lines.size(); ++i) {
        if (!IsBlank(lines[i]) && Indentation(lines[i]) == 0) {
            break;
        }
        body.push_back(lines[i]);
    }
    next = i;
    return body;
}

std::vector<std::string> Dedent(const std::vector<std::string>& lines) {
    std::size_t indent = std::string::npos;
    for (const auto& line : lines) {
        if (!IsBlank(line)) {
            indent = Indentation(line);
            break;
        }
    }
    std::vector<std::string> dedented;
    for (const auto& line : lines) {
        if (IsBlank(line)) {
            dedented.emplace_back();
        } else if (indent != std::string::npos && Indentation(line) >= indent) {
            dedented.push_back(line.substr(indent));
        } else {
            dedented.push_back(line.substr(Indentation(line)));
        }
    }
    return dedented;
}

// Decorators, header and body of the definition starting at lines[first], without trailing blanks.
std::string DefinitionBlock(const std::vector<std::string>& lines, std::size_t first, std::size_t& next) {
    std::size_t header = first;
    while (header + 1 < lines.size() && codeteam::utils::StartsWith(lines[header], "@")) {
        ++header;
    }
    auto body = BlockBody(lines, header, next);
    while (!body.empty() && IsBlank(body.back())) {
        body.pop_back();
    }
    std::vector<std::string> block(lines.begin() + static_cast<std::ptrdiff_t>(first),
                                   lines.begin() + static_cast<std::ptrdiff_t>(header) + 1);
    block.insert(block.end(), body.begin(), body.end());
    return codeteam::utils::Join(block, "\n");
}

// Name bound by a definition block, or empty.
std::string DefinedName(const std::string& block) {
    for (const auto& line : codeteam::utils::SplitLines(block)) {
        if (codeteam::utils::StartsWith(line, "@")) {
            continue;
        }
        std::string rest;
        for (const char* keyword : {"def ", "async def ", "class "}) {
            if (codeteam::utils::StartsWith(line, keyword)) {
                rest = line.substr(std::string(keyword).size());
                break;
            }
        }
        const auto end = rest.find_first_of("(:");
        return codeteam::utils::Trim(rest.substr(0, end));
    }
    return "";
}

// module_level: lines are top-level tester code rather than the body of its check routine.
void GroupStatements(const std::vector<std::string>& lines, bool module_level, TestSuite& suite) {
    std::string current;
    int depth = 0;
    bool continuation = false;
    auto flush = [&]() {
        if (!current.empty()) {
            suite.statements.push_back(current);
            current.clear();
        }
    };

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (IsBlank(line) || IsComment(line)) {
            continue;
        }
        const bool top_level = Indentation(line) == 0 && depth <= 0 && !continuation;
        if (top_level) {
            flush();
            depth = 0;
            if (module_level && IsImport(line)) {
                suite.imports.push_back(line);
                continue;
            }
            if (module_level && codeteam::utils::StartsWith(line, "if __name__")) {
                std::size_t next = i;
                auto body = Dedent(BlockBody(lines, i, next));
                GroupStatements(body, module_level, suite);
                i = next - 1;
                continue;
            }
            if (StartsDefinition(line)) {
                std::size_t next = i;
                auto block = DefinitionBlock(lines, i, next);
                if (!module_level) {
                    suite.statements.push_back(std::move(block));
                } else if (DefinedName(block) != "check") {
                    suite.definitions.push_back(std::move(block));
                }
                i = next - 1;
                continue;
            }
            if (codeteam::utils::StartsWith(line, "check(")) {
                continue;
            }
            current = line;
        } else if (current.empty()) {
            current = line;
        } else {
            current += "\n" + line;
        }
        depth += BracketDelta(line);
        const auto trimmed = codeteam::utils::Trim(line);
        continuation = !trimmed.empty() && trimmed.back() == '\\';
    }
    flush();
}

}  // namespace

std::string BuildCheck(const std::vector<std::string>& statements,
                       const std::string& entry_point,
                       const std::vector<std::string>& imports,
                       const std::vector<std::string>& definitions) {
    std::ostringstream out;
    for (const auto& line : imports) {
        out << line << "\n";
    }
    for (const auto& definition : definitions) {
        // A tester's own copy of the function under test would shadow the candidate.
        if (DefinedName(definition) == entry_point) {
            continue;
        }
        out << definition << "\n\n";
    }
    out << "def check(candidate):\n";
    if (statements.empty()) {
        out << kIndent << "return True\n";
        return out.str();
    }
    if (codeteam::agent::IsIdentifier(entry_point) && entry_point != "candidate") {
        out << kIndent << entry_point << " = candidate\n";
    }
    for (const auto& statement : statements) {
        for (const auto& line : codeteam::utils::SplitLines(statement)) {
            if (IsBlank(line)) {
                out << "\n";
            } else {
                out << kIndent << line << "\n";
            }
        }
    }
    return out.str();
}

TestSuite ExtractTestStatements(const std::string& test_code) {
    TestSuite suite;
    const auto lines = codeteam::utils::SplitLines(test_code);

    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (!codeteam::utils::StartsWith(lines[i], "def check(")) {
            continue;
        }
        std::size_t next = i;
        const auto body = Dedent(BlockBody(lines, i, next));

        // Imports and helpers around the routine; loose statements there are not kept.
        std::vector<std::string> outside(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(i));
        outside.insert(outside.end(), lines.begin() + static_cast<std::ptrdiff_t>(next), lines.end());
        TestSuite module;
        GroupStatements(outside, true, module);
        suite.imports = std::move(module.imports);
        suite.definitions = std::move(module.definitions);

        GroupStatements(body, false, suite);
        return suite;
    }

    GroupStatements(lines, true, suite);
    return suite;
}

std::string ComposeTestProgram(const std::string& prelude,
                               const std::string& candidate,
                               const std::string& check,
                               const std::string& entry_point) {
    std::ostringstream program;
    program << prelude << candidate << "\n" << check << "\n" << "check(" << entry_point << ")\n";
    return program.str();
}

}  // namespace codeteam::harness
