#include <gtest/gtest.h>

#include <fstream>

#include "config/run_config.hpp"
#include "task/exception.hpp"

using namespace emuflow::config;
using json = nlohmann::json;

TEST(RunConfigTest, Defaults) {
    auto config = RunConfig::fromJson(json::object());

    EXPECT_EQ(config.arch, "riscv64");
    EXPECT_EQ(config.board, "default");
    EXPECT_EQ(config.resolveBoard(), "hifive_unleashed");
    EXPECT_TRUE(config.network);
    EXPECT_TRUE(config.taskDirs.empty());
    EXPECT_EQ(config.testShell, "target");
    EXPECT_EQ(config.testRequires,
              (std::vector<std::string>{"chroot", "python"}));
    EXPECT_EQ(config.logging.consoleLevel, "info");
}

TEST(RunConfigTest, KeySpellingsNormalized) {
    auto config = RunConfig::fromJson({{"task-dirs", {"tasks"}},
                                       {"taskFiles", {"user.yml"}},
                                       {"test_shell", "host"}});

    EXPECT_EQ(config.taskDirs, std::vector<std::string>{"tasks"});
    EXPECT_EQ(config.taskFiles, std::vector<std::string>{"user.yml"});
    EXPECT_EQ(config.testShell, "host");
}

TEST(RunConfigTest, ConflictingSpellingsRejected) {
    EXPECT_THROW(
        { [[maybe_unused]] auto c = RunConfig::fromJson({{"task-dirs", {"a"}}, {"taskDirs", {"b"}}}); },
        emuflow::InvalidRunConfig);
}

TEST(RunConfigTest, ListsAcceptMultilineStrings) {
    auto config = RunConfig::fromJson(
        {{"task-files", "a.yml\n\n  b.yml  \n"}, {"test-requires", "login"}});

    EXPECT_EQ(config.taskFiles, (std::vector<std::string>{"a.yml", "b.yml"}));
    EXPECT_EQ(config.testRequires, std::vector<std::string>{"login"});
}

TEST(RunConfigTest, NetworkAcceptsBooleanOrString) {
    EXPECT_FALSE(RunConfig::fromJson({{"network", false}}).network);
    EXPECT_FALSE(RunConfig::fromJson({{"network", "false"}}).network);
    EXPECT_TRUE(RunConfig::fromJson({{"network", "true"}}).network);
    EXPECT_THROW(
        { [[maybe_unused]] auto c = RunConfig::fromJson({{"network", "maybe"}}); },
        emuflow::InvalidRunConfig);
}

TEST(RunConfigTest, OverrideVarsPackagesWin) {
    auto config = RunConfig::fromJson(
        {{"devices", {{"vivid", "n_devs=1"}, {"shared", "device"}}},
         {"packages", {{"python", "numpy"}, {"shared", "package"}}}});

    auto vars = config.overrideVars();
    EXPECT_EQ(vars.size(), 3);
    EXPECT_EQ(vars.at("vivid"), "n_devs=1");
    EXPECT_EQ(vars.at("python"), "numpy");
    EXPECT_EQ(vars.at("shared"), "package");
}

TEST(RunConfigTest, ScalarVarsConvertedToStrings) {
    auto config = RunConfig::fromJson({{"vars", {{"RETRIES", 3}, {"DEBUG", true}}}});

    EXPECT_EQ(config.vars.at("RETRIES"), "3");
    EXPECT_EQ(config.vars.at("DEBUG"), "true");
    EXPECT_THROW(
        { [[maybe_unused]] auto c = RunConfig::fromJson({{"vars", {{"X", {1, 2}}}}}); },
        emuflow::InvalidRunConfig);
}

TEST(RunConfigTest, BoardResolution) {
    EXPECT_EQ(RunConfig::fromJson({{"board", "my_board"}}).resolveBoard(),
              "my_board");

    EXPECT_THROW({ [[maybe_unused]] auto c = RunConfig::fromJson({{"arch", "mips"}}); },
                 emuflow::InvalidRunConfig);
    EXPECT_THROW(
        { [[maybe_unused]] auto c = RunConfig::fromJson({{"board", "custom"}, {"resc", "init.resc"}}); },
        emuflow::InvalidRunConfig);
    EXPECT_THROW(
        {
            [[maybe_unused]] auto c = RunConfig::fromJson(
                {{"board", "custom"}, {"resc", "init.resc"}, {"repl", "p.repl"}});
        },
        emuflow::InvalidRunConfig);

    auto custom = RunConfig::fromJson({{"board", "custom"},
                                       {"resc", "init.resc"},
                                       {"repl", "platform.repl"},
                                       {"kernel", "kernel.tar.xz"}});
    EXPECT_EQ(custom.resolveBoard(), "custom");
}

TEST(RunConfigTest, WrongTypesRejected) {
    EXPECT_THROW({ [[maybe_unused]] auto c = RunConfig::fromJson(json::array()); },
                 emuflow::InvalidRunConfig);
    EXPECT_THROW({ [[maybe_unused]] auto c = RunConfig::fromJson({{"arch", 64}}); },
                 emuflow::InvalidRunConfig);
    EXPECT_THROW({ [[maybe_unused]] auto c = RunConfig::fromJson({{"devices", "vivid"}}); },
                 emuflow::InvalidRunConfig);
}

TEST(RunConfigTest, UnknownKeysIgnored) {
    auto config = RunConfig::fromJson({{"rootfs-size", "auto"}, {"arch", "riscv64"}});
    EXPECT_EQ(config.arch, "riscv64");
}

TEST(RunConfigTest, LoggingSection) {
    auto config = RunConfig::fromJson(
        {{"logging", {{"consoleLevel", "debug"}, {"enableFile", true}}}});

    EXPECT_EQ(config.logging.consoleLevel, "debug");
    EXPECT_TRUE(config.logging.enableFile);
    EXPECT_EQ(config.logging.logFilename, "emuflow");
}

TEST(RunConfigTest, FromYamlAndToJson) {
    auto config = RunConfig::fromYaml(R"(
arch: riscv64
task-dirs: [tasks]
network: false
test-commands: |
  uname -a
  pytest
)");

    EXPECT_FALSE(config.network);
    EXPECT_EQ(config.testCommands, "uname -a\npytest\n");

    auto copy = RunConfig::fromJson(config.toJson());
    EXPECT_EQ(copy.taskDirs, config.taskDirs);
    EXPECT_EQ(copy.testCommands, config.testCommands);
    EXPECT_FALSE(copy.network);
}

TEST(RunConfigTest, EmptyYamlGivesDefaults) {
    EXPECT_EQ(RunConfig::fromYaml("").arch, "riscv64");
}

TEST(RunConfigTest, ReadFile) {
    auto dir = std::filesystem::temp_directory_path();
    auto yamlPath = dir / "emuflow_run_config.yml";
    auto jsonPath = dir / "emuflow_run_config.json";
    std::ofstream(yamlPath) << "taskDirs: [tasks]\nboard: default\n";
    std::ofstream(jsonPath) << R"({"test_shell": "host"})";

    auto yaml = RunConfig::readFile(yamlPath);
    EXPECT_TRUE(yaml.contains("task-dirs"));
    auto fromJson = RunConfig::readFile(jsonPath);
    EXPECT_EQ(fromJson["test-shell"], "host");

    std::filesystem::remove(yamlPath);
    std::filesystem::remove(jsonPath);
    EXPECT_THROW({ [[maybe_unused]] auto j = RunConfig::readFile(jsonPath); },
                 emuflow::InvalidRunConfig);
}
