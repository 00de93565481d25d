#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "policy/chmod_validator.hpp"

namespace {

using bashgate::policy::is_execute_only_mode;
using bashgate::policy::validate_chmod;
using bashgate::policy::validate_chmod_command;

TEST(ChmodValidatorTest, AllowsExecuteGrants) {
    for (const char* command : {"chmod +x init.sh", "chmod +x script.sh", "chmod u+x init.sh",
                                "chmod a+x init.sh", "chmod ug+x init.sh",
                                "chmod +x file1.sh file2.sh"}) {
        const auto decision = validate_chmod_command(command);
        EXPECT_TRUE(decision.allowed()) << command << ": " << decision.reason;
    }
}

TEST(ChmodValidatorTest, BlocksOtherModes) {
    for (const char* command : {"chmod 777 init.sh", "chmod 755 init.sh", "chmod +w init.sh",
                                "chmod +r init.sh", "chmod -x init.sh", "chmod =x init.sh",
                                "chmod u+xw init.sh", "chmod +x,o+w init.sh"}) {
        const auto decision = validate_chmod_command(command);
        EXPECT_FALSE(decision.allowed()) << command;
        EXPECT_NE(decision.reason.find("disallowed chmod mode"), std::string::npos)
            << command << ": " << decision.reason;
    }
}

TEST(ChmodValidatorTest, BlocksRecursion) {
    EXPECT_EQ(validate_chmod_command("chmod -R +x dir/").reason,
              "recursive chmod not allowed");
    EXPECT_EQ(validate_chmod_command("chmod --recursive +x dir/").reason,
              "recursive chmod not allowed");
    EXPECT_EQ(validate_chmod_command("chmod -vR +x dir/").reason,
              "recursive chmod not allowed");
    EXPECT_EQ(validate_chmod_command("chmod +x dir/ -R").reason,
              "recursive chmod not allowed");
}

TEST(ChmodValidatorTest, BlocksMissingTarget) {
    EXPECT_EQ(validate_chmod_command("chmod +x").reason, "missing target file");
    EXPECT_EQ(validate_chmod_command("chmod").reason, "missing chmod mode");
}

TEST(ChmodValidatorTest, BlocksOptionsAndSecondModes) {
    EXPECT_FALSE(validate_chmod(std::vector<std::string>{"--reference=other", "init.sh"}).allowed());
    EXPECT_FALSE(validate_chmod(std::vector<std::string>{"-v", "+x", "init.sh"}).allowed());
    EXPECT_FALSE(validate_chmod(std::vector<std::string>{"+x", "+w", "init.sh"}).allowed());
}

TEST(ChmodValidatorTest, RejectsNonChmodCommands) {
    EXPECT_FALSE(validate_chmod_command("chown +x init.sh").allowed());
    EXPECT_FALSE(validate_chmod_command("chmod '+x init.sh").allowed());
}

TEST(ChmodValidatorTest, ModeGrammar) {
    EXPECT_TRUE(is_execute_only_mode("+x"));
    EXPECT_TRUE(is_execute_only_mode("ugoa+x"));
    EXPECT_FALSE(is_execute_only_mode("x"));
    EXPECT_FALSE(is_execute_only_mode("u"));
    EXPECT_FALSE(is_execute_only_mode(""));
    EXPECT_FALSE(is_execute_only_mode("+X"));
    EXPECT_FALSE(is_execute_only_mode("u+x+w"));
    EXPECT_FALSE(is_execute_only_mode("0755"));
}

}  // namespace
