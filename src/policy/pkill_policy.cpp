#include "policy/pkill_policy.hpp"

#include "parsing/invocation_extractor.hpp"

namespace bashgate::policy {

using protocol::Decision;

namespace {

// "node server.js" -> "node", "/usr/bin/node" -> "node"
std::string pattern_process_name(const std::string& pattern) {
    const auto begin = pattern.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = pattern.find_first_of(" \t", begin);
    return parsing::base_name(pattern.substr(begin, end == std::string::npos
                                                        ? std::string::npos
                                                        : end - begin));
}

}  // namespace

Decision validate_pkill(const std::vector<std::string>& arguments,
                        const std::set<std::string>& dev_process_names) {
    std::vector<const std::string*> patterns;
    for (const auto& token : arguments) {
        if (!token.empty() && token[0] == '-') {
            continue;
        }
        patterns.push_back(&token);
    }

    if (patterns.empty()) {
        return Decision::block("missing process name");
    }
    if (patterns.size() > 1) {
        return Decision::block("expected a single process pattern, got " +
                               std::to_string(patterns.size()));
    }

    const std::string& pattern = *patterns.front();
    // pkill matches an extended regex; alternation, classes or anchors could
    // reach processes other than the named one.
    if (pattern.find_first_of("|()[]*+?^$\\{}") != std::string::npos) {
        return Decision::block("process pattern uses regular expression operators: '" +
                               pattern + "'");
    }

    const std::string name = pattern_process_name(pattern);
    if (dev_process_names.count(name) > 0) {
        return Decision::allow();
    }
    return Decision::block("process termination target not in dev-process allowlist: '" +
                           pattern + "'");
}

}  // namespace bashgate::policy
