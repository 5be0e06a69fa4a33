/*
 * app.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-26

Description: emuflow command line entry point

**************************************************/

#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "app/prepare.hpp"
#include "config/run_config.hpp"
#include "logging/setup.hpp"
#include "shell/dry_run_session.hpp"
#include "task/exception.hpp"

#include "atom/system/crash.hpp"
#include "atom/utils/argsview.hpp"

using namespace std::string_literals;
using json = nlohmann::json;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_EVALUATION_FAILED = 1;
constexpr int EXIT_CONFIG_ERROR = 2;

auto loadRunConfig(atom::utils::ArgumentParser& program)
    -> emuflow::config::RunConfig {
    json description = json::object();

    auto configPath = program.get<std::string>("config");
    if (configPath && !configPath->empty()) {
        spdlog::info("Loading run configuration from: {}", *configPath);
        description = emuflow::config::RunConfig::readFile(*configPath);
    }

    // Inline arguments win per key
    auto inlineArgs = program.get<std::string>("args");
    if (inlineArgs && !inlineArgs->empty()) {
        try {
            description.update(
                emuflow::config::RunConfig::normalize(json::parse(*inlineArgs)));
        } catch (const json::exception& e) {
            THROW_INVALID_RUN_CONFIG("Invalid --args JSON: "s + e.what());
        }
    }

    auto config = emuflow::config::RunConfig::fromJson(description);
    auto taskDir = program.get<std::string>("task-dir");
    if (taskDir && !taskDir->empty()) {
        config.taskDirs.push_back(*taskDir);
    }
    return config;
}

void printPlan(const emuflow::dispatch::ExecutionPlan& plan) {
    for (const auto& [shell, tasks] : plan.shells) {
        std::string line;
        for (const auto& name : tasks) {
            line += (line.empty() ? "" : " -> ") + name;
        }
        spdlog::info("[{}] {}", shell, line);
    }
    for (const auto& name : plan.disabled) {
        spdlog::info("disabled: {}", name);
    }
    std::cout << plan.toJson().dump(2) << std::endl;
}

}  // namespace

int main(int argc, char *argv[]) {
    // Console logging until the run configuration is read
    emuflow::logging::initDefaultLogging();

    atom::utils::ArgumentParser program("emuflow"s);

    // NOTE: --args has priority over keys of the --config file
    program.addArgument("config", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Path to the run config (YAML or JSON)",
                        {"c"});
    program.addArgument("args", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Inline run config as a JSON object",
                        {"a"});
    program.addArgument("task-dir",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        ""s, "Additional directory of task definitions", {"t"});
    program.addArgument("plan", atom::utils::ArgumentParser::ArgType::BOOLEAN,
                        false, false, "Print the per-shell execution plan",
                        {"p"});
    program.addArgument("dry-run",
                        atom::utils::ArgumentParser::ArgType::BOOLEAN, false,
                        false, "Log commands instead of sending them", {"n"});
    program.addArgument("log-level",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        ""s, "Log level (trace/debug/info/warn/error)", {"l"});

    program.addDescription("emuflow: runs dependent shell tasks on emulated boards");
    program.addEpilog("Exit codes: 0 success, 1 evaluation failed, 2 configuration error.");

    std::vector<std::string> args(argv, argv + argc);
    program.parse(argc, args);

    try {
        auto config = loadRunConfig(program);

        emuflow::logging::initLogging(config.logging);
        auto logLevel = program.get<std::string>("log-level");
        if (logLevel && !logLevel->empty()) {
            emuflow::logging::setLevel(*logLevel);
        }

        bool planOnly = program.get<bool>("plan").value_or(false);
        bool dryRun = program.get<bool>("dry-run").value_or(false);

        // No transports are built in; only dry-run sessions exist.
        emuflow::shell::SessionFactory factory;
        if (planOnly || dryRun) {
            factory = emuflow::shell::DryRunSession::factory();
        }

        auto dispatcher = emuflow::app::prepareDispatcher(config, factory);
        auto plan = dispatcher->plan();
        if (planOnly) {
            printPlan(plan);
            return EXIT_OK;
        }

        if (!dryRun && !plan.shells.empty()) {
            std::string shells;
            for (const auto& [shell, tasks] : plan.shells) {
                shells += (shells.empty() ? "" : ", ") + shell;
            }
            THROW_INVALID_RUN_CONFIG(
                "No session transport for shells: " + shells +
                " (use --dry-run or --plan)");
        }

        auto report = dispatcher->evaluate();
        std::string summary = report.summary();
        size_t start = 0;
        while (start < summary.size()) {
            auto end = summary.find('\n', start);
            if (end == std::string::npos) {
                end = summary.size();
            }
            spdlog::info("{}", summary.substr(start, end - start));
            start = end + 1;
        }
        spdlog::default_logger()->flush();
        return report.success ? EXIT_OK : EXIT_EVALUATION_FAILED;
    } catch (const atom::error::Exception &e) {
        spdlog::error("Configuration error: {}", e.what());
        spdlog::default_logger()->flush();
        return EXIT_CONFIG_ERROR;
    } catch (const std::exception &e) {
        spdlog::critical("Unexpected error: {}", e.what());
        atom::system::saveCrashLog(e.what());
        spdlog::default_logger()->flush();
        return EXIT_EVALUATION_FAILED;
    }
}
