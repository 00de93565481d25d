#include <set>
#include <string>
#include <gtest/gtest.h>
#include "core/config/policy_config.hpp"
#include "parsing/invocation_extractor.hpp"
#include "policy/allowlist_policy.hpp"

namespace {

using bashgate::core::config::default_policy_config;
using bashgate::parsing::Invocation;
using bashgate::policy::AllowlistPolicy;

TEST(AllowlistPolicyTest, MatchesExactBaseNames) {
    AllowlistPolicy policy(default_policy_config().allowed_commands);
    EXPECT_TRUE(policy.is_allowed("git"));
    EXPECT_TRUE(policy.is_allowed("init.sh"));
    EXPECT_FALSE(policy.is_allowed("rm"));
    EXPECT_FALSE(policy.is_allowed("Git"));
    EXPECT_FALSE(policy.is_allowed("gitk"));
    EXPECT_FALSE(policy.is_allowed(""));
}

TEST(AllowlistPolicyTest, IgnoresArguments) {
    AllowlistPolicy policy(std::set<std::string>{"git"});
    Invocation invocation{"/usr/bin/git", "git", {"push", "--force"}};
    EXPECT_TRUE(policy.check(invocation).allowed());
}

TEST(AllowlistPolicyTest, BlockReasonNamesProgram) {
    AllowlistPolicy policy(std::set<std::string>{"ls"});
    Invocation invocation{"rm", "rm", {"-rf", "/"}};
    const auto decision = policy.check(invocation);
    ASSERT_FALSE(decision.allowed());
    EXPECT_NE(decision.reason.find("'rm'"), std::string::npos);
}

TEST(AllowlistPolicyTest, SubstitutedTableIsUsed) {
    AllowlistPolicy policy(std::set<std::string>{"make"});
    EXPECT_TRUE(policy.is_allowed("make"));
    EXPECT_FALSE(policy.is_allowed("ls"));
}

}  // namespace
