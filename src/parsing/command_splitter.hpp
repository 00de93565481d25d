#pragma once

#include <string>
#include <vector>

namespace bashgate::parsing {

// Breaks a raw command into the sub-commands a shell would run one after
// another. Implementations must preserve order and drop empty segments.
class CommandSplitter {
public:
    virtual ~CommandSplitter() = default;

    virtual std::vector<std::string> split(const std::string& raw_command) const = 0;
};

// Splits on &&, ||, |, ;, newlines and background & outside of quotes.
// Quoting follows bash ('...', "...", $'...' and backslash escapes) and a #
// at the start of an unquoted word comments out the rest of the line.
// Nested subshells are not understood.
class ShellOperatorSplitter : public CommandSplitter {
public:
    std::vector<std::string> split(const std::string& raw_command) const override;
};

// Convenience wrapper over ShellOperatorSplitter.
std::vector<std::string> split_command(const std::string& raw_command);

// True when $( ... ), <( ... ), >( ... ) or a backtick would be expanded by
// the shell. Their inner commands never reach per-sub-command validation.
bool has_command_substitution(const std::string& raw_command);

std::string trim(const std::string& value);

}  // namespace bashgate::parsing
