#include <gtest/gtest.h>

#include "task/command.hpp"
#include "task/exception.hpp"
#include "task/task.hpp"

using namespace emuflow::task;
using json = nlohmann::json;

TEST(CommandTest, FromJson_StringShorthand) {
    auto cmd = Command::fromJson("uname -a");

    EXPECT_EQ(cmd.command, "uname -a");
    EXPECT_FALSE(cmd.expect.has_value());
    EXPECT_FALSE(cmd.timeout.has_value());
    EXPECT_FALSE(cmd.echo.has_value());
    EXPECT_FALSE(cmd.checkExitCode.has_value());
    EXPECT_FALSE(cmd.shouldFail.has_value());
}

TEST(CommandTest, FromJson_HyphenatedKeys) {
    json record = {{"command", "false"},
                   {"expect", "#"},
                   {"timeout", 15},
                   {"echo", true},
                   {"check-exit-code", false},
                   {"should-fail", true}};
    auto cmd = Command::fromJson(record);

    EXPECT_EQ(cmd.command, "false");
    EXPECT_EQ(cmd.expect, "#");
    ASSERT_TRUE(cmd.timeout.has_value());
    EXPECT_EQ(cmd.timeout->value().count(), 15);
    EXPECT_EQ(cmd.echo, true);
    EXPECT_EQ(cmd.checkExitCode, false);
    EXPECT_EQ(cmd.shouldFail, true);
}

TEST(CommandTest, FromJson_SnakeCaseKeys) {
    auto cmd = Command::fromJson(
        {{"command", "ls"}, {"check_exit_code", true}, {"should_fail", false}});

    EXPECT_EQ(cmd.checkExitCode, true);
    EXPECT_EQ(cmd.shouldFail, false);
}

TEST(CommandTest, FromJson_TimeoutInheritSentinel) {
    EXPECT_FALSE(
        Command::fromJson({{"command", "ls"}, {"timeout", -1}}).timeout);
}

TEST(CommandTest, FromJson_NullTimeoutMeansNoLimit) {
    auto cmd = Command::fromJson({{"command", "long"}, {"timeout", nullptr}});

    ASSERT_TRUE(cmd.timeout.has_value());
    EXPECT_FALSE(cmd.timeout->has_value());
    EXPECT_TRUE(cmd.toJson()["timeout"].is_null());
}

TEST(CommandTest, FromJson_RejectsInvalidRecords) {
    EXPECT_THROW(Command::fromJson({{"command", "ls"}, {"retries", 3}}),
                 emuflow::InvalidTaskDefinition);
    EXPECT_THROW(Command::fromJson({{"command", "ls"}, {"timeout", -5}}),
                 emuflow::InvalidTaskDefinition);
    EXPECT_THROW(Command::fromJson({{"command", "ls"}, {"echo", "yes"}}),
                 emuflow::InvalidTaskDefinition);
    EXPECT_THROW(Command::fromJson(json::array({"ls"})),
                 emuflow::InvalidTaskDefinition);
}

TEST(CommandTest, ToJson_OmitsUnsetFields) {
    Command cmd("ls");
    cmd.shouldFail = false;

    auto j = cmd.toJson();
    EXPECT_EQ(j["command"], "ls");
    EXPECT_EQ(j["should-fail"], false);
    EXPECT_FALSE(j.contains("expect"));
    EXPECT_FALSE(j.contains("timeout"));
    EXPECT_FALSE(j.contains("echo"));
}

TEST(CommandTest, ApplyVars_SubstitutesPlaceholders) {
    Command cmd("echo ${{ X }} ${{Y}}");
    cmd.applyVars({{"X", "hi"}, {"Y", "there"}});

    EXPECT_EQ(cmd.command, "echo hi there");
}

TEST(CommandTest, ApplyVars_UnknownVariableThrows) {
    Command cmd("echo ${{X}}");
    EXPECT_THROW(cmd.applyVars({}), emuflow::UnresolvedVariable);
    EXPECT_EQ(cmd.command, "echo ${{X}}");
}

class CommandPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        task = std::make_unique<Task>("policy", "host");
        TaskPolicy policy;
        policy.echo = true;
        policy.timeout = std::chrono::seconds{30};
        policy.checkExitCode = false;
        policy.shouldFail = true;
        task->setPolicy(policy);
    }

    void TearDown() override { task.reset(); }

    std::unique_ptr<Task> task;
};

TEST_F(CommandPolicyTest, UnsetFieldsInheritTaskDefaults) {
    auto policy = task->policyFor(Command("ls"));

    EXPECT_TRUE(policy.echo);
    ASSERT_TRUE(policy.timeout.has_value());
    EXPECT_EQ(policy.timeout->count(), 30);
    EXPECT_FALSE(policy.checkExitCode);
    EXPECT_TRUE(policy.shouldFail);
    EXPECT_FALSE(policy.expect.has_value());
}

TEST_F(CommandPolicyTest, ExplicitValuesOverrideEvenWhenEqualToDefault) {
    Command cmd("ls");
    cmd.echo = false;
    cmd.timeout = std::chrono::seconds{5};
    cmd.checkExitCode = true;
    cmd.shouldFail = false;
    cmd.expect = "done";

    auto policy = task->policyFor(cmd);
    EXPECT_FALSE(policy.echo);
    EXPECT_EQ(policy.timeout->count(), 5);
    EXPECT_TRUE(policy.checkExitCode);
    EXPECT_FALSE(policy.shouldFail);
    EXPECT_EQ(policy.expect, "done");
}

TEST_F(CommandPolicyTest, NullTimeoutOptsOutOfTaskTimeout) {
    auto cmd = Command::fromJson({{"command", "long"}, {"timeout", nullptr}});

    auto policy = task->policyFor(cmd);
    EXPECT_FALSE(policy.timeout.has_value());
    EXPECT_EQ(task->policyFor(Command("short")).timeout->count(), 30);
}
