#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <regex>

#include "app/prepare.hpp"
#include "shell/dry_run_session.hpp"
#include "task/exception.hpp"

using namespace emuflow;
namespace fs = std::filesystem;

class PrepareDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("emuflow_prepare_" + std::string(::testing::UnitTest::GetInstance()
                                                    ->current_test_info()
                                                    ->name()));
        fs::remove_all(dir);
        fs::create_directories(dir);
        write("chroot.yml", "name: chroot\nshell: target\ncommands: [chroot /mnt]\n");
        write("python.yml",
              "name: python\nshell: target\nrequires: [chroot]\ndisabled: true\n"
              "commands: ['pip install ${{python}}']\n");
        write("host_network.yml",
              "name: host_network\nshell: host\ncommands: [ip link]\n");
        write("target_network.yml",
              "name: target_network\nshell: target\nrequires: [host_network]\n"
              "commands: [ip addr]\n");
        config.taskDirs = {dir.string()};
    }

    void TearDown() override { fs::remove_all(dir); }

    void write(const std::string& name, const std::string& content) {
        std::ofstream(dir / name) << content;
    }

    auto prepare() -> std::unique_ptr<dispatch::Dispatcher> {
        return app::prepareDispatcher(config, shell::DryRunSession::factory());
    }

    fs::path dir;
    config::RunConfig config;
};

TEST_F(PrepareDispatcherTest, FormatLocalTime) {
    auto text = app::formatLocalTime(std::chrono::system_clock::now());
    EXPECT_TRUE(std::regex_match(
        text, std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})")));
}

TEST_F(PrepareDispatcherTest, GlobalVariables) {
    config.vars = {{"ARCH", "rv64"}, {"MIRROR", "local"}};
    auto dispatcher = prepare();

    const auto& globals = dispatcher->getContext().globalVars;
    EXPECT_EQ(globals.at("BOARD"), "hifive_unleashed");
    EXPECT_EQ(globals.at("ARCH"), "rv64");
    EXPECT_EQ(globals.at("MIRROR"), "local");
    EXPECT_FALSE(globals.at("NOW").empty());
}

TEST_F(PrepareDispatcherTest, LoadsDirectoriesThenFiles) {
    auto extra = dir / "extra";
    fs::create_directories(extra);
    std::ofstream(extra / "mount.yml")
        << "name: mount\nshell: target\ncommands: [mount -a]\n";
    config.taskFiles = {(extra / "mount.yml").string()};

    auto dispatcher = prepare();
    EXPECT_EQ(dispatcher->getTaskNames(),
              (std::vector<std::string>{"chroot", "host_network", "python",
                                        "target_network", "mount"}));
}

TEST_F(PrepareDispatcherTest, PackageOverrideEnablesTask) {
    config.packages = {{"python", "numpy"}};
    auto dispatcher = prepare();

    EXPECT_TRUE(dispatcher->getTask("python").isEnabled());
    EXPECT_EQ(dispatcher->getContext().overrideVars.at("python"), "numpy");
}

TEST_F(PrepareDispatcherTest, NetworkOffDisablesNetworkTasks) {
    config.network = false;
    auto dispatcher = prepare();

    EXPECT_FALSE(dispatcher->getTask("host_network").isEnabled());
    EXPECT_FALSE(dispatcher->getTask("target_network").isEnabled());
    EXPECT_TRUE(dispatcher->getTask("chroot").isEnabled());

    auto plan = dispatcher->plan();
    EXPECT_EQ(plan.shells.count("host"), 0);
}

TEST_F(PrepareDispatcherTest, TestTaskFromCommands) {
    config.testCommands = "uname -a\n\npython3 -c 'import numpy'\n";
    auto dispatcher = prepare();

    const auto& test = dispatcher->getTask(app::TEST_TASK_NAME);
    EXPECT_EQ(test.getShell(), "target");
    EXPECT_EQ(test.getRequires(),
              (std::vector<std::string>{"chroot", "python"}));
    EXPECT_TRUE(test.getPolicy().echo);
    ASSERT_EQ(test.getCommands().size(), 2);
    EXPECT_EQ(test.getCommands()[1].command, "python3 -c 'import numpy'");
}

TEST_F(PrepareDispatcherTest, TestTaskFromYamlTakesPrecedence) {
    config.testCommands = "ignored";
    config.testYaml =
        "name: custom\nshell: host\ncommands:\n  - command: make check\n"
        "    timeout: 120\n";
    config.testShell = "target";
    config.testRequires = {"chroot"};
    auto dispatcher = prepare();

    EXPECT_FALSE(dispatcher->hasTask("custom"));
    const auto& test = dispatcher->getTask(app::TEST_TASK_NAME);
    EXPECT_EQ(test.getShell(), "target");
    EXPECT_EQ(test.getRequires(), std::vector<std::string>{"chroot"});
    ASSERT_EQ(test.getCommands().size(), 1);
    EXPECT_EQ(test.getCommands()[0].command, "make check");
}

TEST_F(PrepareDispatcherTest, NoTestTaskWithoutCommands) {
    auto dispatcher = prepare();
    EXPECT_FALSE(dispatcher->hasTask(app::TEST_TASK_NAME));
}

TEST_F(PrepareDispatcherTest, DryRunEvaluation) {
    config.packages = {{"python", "numpy"}};
    config.testCommands = "pytest";
    auto dispatcher = prepare();

    auto report = dispatcher->evaluate();
    EXPECT_TRUE(report.success) << report.summary();
    EXPECT_EQ(report.find("python")->commands[0].command, "pip install numpy");
    EXPECT_EQ(report.find(app::TEST_TASK_NAME)->status,
              dispatch::TaskStatus::Succeeded);
}

TEST_F(PrepareDispatcherTest, DuplicateTaskAcrossSources) {
    config.taskFiles = {(dir / "chroot.yml").string()};
    EXPECT_THROW({ [[maybe_unused]] auto d = prepare(); }, DuplicateTask);
}
