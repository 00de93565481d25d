#include "parsing/command_splitter.hpp"

#include <cstddef>
#include <utility>

namespace bashgate::parsing {

namespace {

bool is_space(const char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' ||
           c == '\v';
}

void flush_segment(std::string& current, std::vector<std::string>& segments) {
    std::string segment = trim(current);
    if (!segment.empty()) {
        segments.push_back(std::move(segment));
    }
    current.clear();
}

enum class Quote {
    None,
    Single,
    Double,
    AnsiC   // $'...', where a backslash escapes the closing quote
};

struct ScanResult {
    std::vector<std::string> segments;
    bool has_substitution = false;
};

// Walks the command once with bash's quoting and comment rules. Characters
// stay verbatim in the segments; only operators and comments are removed.
ScanResult scan(const std::string& raw_command) {
    ScanResult result;
    std::string current;
    Quote quote = Quote::None;
    // A word starts after whitespace or a metacharacter; only there does #
    // begin a comment.
    bool word_start = true;
    // Set only right after an unquoted, unescaped < or >.
    bool after_redirect = false;

    const std::size_t n = raw_command.size();
    for (std::size_t i = 0; i < n; ++i) {
        const char c = raw_command[i];
        const char next = i + 1 < n ? raw_command[i + 1] : '\0';
        const bool follows_redirect = after_redirect;
        after_redirect = false;

        switch (quote) {
            case Quote::Single:
                current.push_back(c);
                if (c == '\'') {
                    quote = Quote::None;
                }
                continue;
            case Quote::AnsiC:
                current.push_back(c);
                if (c == '\\' && i + 1 < n) {
                    current.push_back(next);
                    ++i;
                } else if (c == '\'') {
                    quote = Quote::None;
                }
                continue;
            case Quote::Double:
                current.push_back(c);
                if (c == '\\' && i + 1 < n) {
                    current.push_back(next);
                    ++i;
                } else if (c == '"') {
                    quote = Quote::None;
                } else if (c == '`' || (c == '$' && next == '(')) {
                    result.has_substitution = true;
                }
                continue;
            case Quote::None:
                break;
        }

        if (c == '#' && word_start) {
            // Comment runs to the end of the line; the newline still separates.
            while (i + 1 < n && raw_command[i + 1] != '\n') {
                ++i;
            }
            continue;
        }

        if (c == '\\') {
            // Escaped character belongs to the current word verbatim.
            current.push_back(c);
            if (i + 1 < n) {
                current.push_back(next);
                ++i;
            }
            word_start = false;
            continue;
        }

        if (c != '\n' && is_space(c)) {
            current.push_back(c);
            word_start = true;
            continue;
        }

        word_start = false;
        switch (c) {
            case '\'':
                quote = Quote::Single;
                current.push_back(c);
                break;
            case '"':
                quote = Quote::Double;
                current.push_back(c);
                break;
            case '$':
                current.push_back(c);
                if (next == '\'') {
                    quote = Quote::AnsiC;
                    current.push_back(next);
                    ++i;
                } else if (next == '(') {
                    result.has_substitution = true;
                }
                break;
            case '`':
                result.has_substitution = true;
                current.push_back(c);
                break;
            case '<':
            case '>':
                if (next == '(') {
                    result.has_substitution = true;
                }
                current.push_back(c);
                word_start = true;
                after_redirect = true;
                break;
            case '(':
            case ')':
                current.push_back(c);
                word_start = true;
                break;
            case ';':
            case '\n':
                flush_segment(current, result.segments);
                word_start = true;
                break;
            case '|':
                word_start = true;
                if (follows_redirect && raw_command[i - 1] == '>') {
                    // >| is a clobbering redirection, not a pipe.
                    current.push_back(c);
                    break;
                }
                flush_segment(current, result.segments);
                if (next == '|' || next == '&') {
                    ++i;
                }
                break;
            case '&':
                word_start = true;
                if (next == '&') {
                    flush_segment(current, result.segments);
                    ++i;
                } else if (follows_redirect || next == '>') {
                    // 2>&1, <&3, &>file
                    current.push_back(c);
                } else {
                    flush_segment(current, result.segments);
                }
                break;
            default:
                current.push_back(c);
                break;
        }
    }

    flush_segment(current, result.segments);
    return result;
}

}  // namespace

std::string trim(const std::string& value) {
    std::size_t begin = 0;
    while (begin < value.size() && is_space(value[begin])) {
        ++begin;
    }
    std::size_t end = value.size();
    while (end > begin && is_space(value[end - 1])) {
        --end;
    }
    return value.substr(begin, end - begin);
}

std::vector<std::string> ShellOperatorSplitter::split(
    const std::string& raw_command) const {
    return scan(raw_command).segments;
}

std::vector<std::string> split_command(const std::string& raw_command) {
    return ShellOperatorSplitter{}.split(raw_command);
}

bool has_command_substitution(const std::string& raw_command) {
    return scan(raw_command).has_substitution;
}

}  // namespace bashgate::parsing
