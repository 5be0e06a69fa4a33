/*
 * command.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "command.hpp"

#include <array>

#include "exception.hpp"
#include "spdlog/spdlog.h"
#include "variables.hpp"

namespace emuflow::task {

namespace {

constexpr std::array<std::string_view, 6> COMMAND_FIELDS = {
    "command", "expect", "timeout", "echo", "check_exit_code", "should_fail"};

// Legacy spelling of "inherit the task timeout".
constexpr long long INHERIT_TIMEOUT = -1;

}  // namespace

Command Command::fromJson(const json& record) {
    if (record.is_string()) {
        return Command(record.get<std::string>());
    }

    constexpr std::string_view context = "command";
    auto fields = normalizeKeys(record, COMMAND_FIELDS, context);

    Command cmd;
    cmd.command = optionalString(fields, "command", context).value_or("");
    cmd.expect = optionalString(fields, "expect", context);
    cmd.echo = optionalBool(fields, "echo", context);
    cmd.checkExitCode = optionalBool(fields, "check_exit_code", context);
    cmd.shouldFail = optionalBool(fields, "should_fail", context);

    if (auto it = fields.find("timeout"); it != fields.end() && it->is_null()) {
        cmd.timeout = Timeout{};
    } else if (auto timeout = optionalInteger(fields, "timeout", context)) {
        if (*timeout < INHERIT_TIMEOUT) {
            THROW_INVALID_TASK_DEFINITION("command '" + cmd.command +
                                          "': timeout must not be negative");
        }
        if (*timeout != INHERIT_TIMEOUT) {
            cmd.timeout = std::chrono::seconds{*timeout};
        }
    }

    return cmd;
}

json Command::toJson() const {
    json j = {{"command", command}};
    if (expect) {
        j["expect"] = *expect;
    }
    if (timeout) {
        j["timeout"] = *timeout ? json((*timeout)->count()) : json(nullptr);
    }
    if (echo) {
        j["echo"] = *echo;
    }
    if (checkExitCode) {
        j["check-exit-code"] = *checkExitCode;
    }
    if (shouldFail) {
        j["should-fail"] = *shouldFail;
    }
    return j;
}

void Command::applyVars(const VariableMap& vars) {
    auto resolved = resolvePlaceholders(command, vars);
    if (resolved != command) {
        spdlog::debug("Resolved command '{}' -> '{}'", command, resolved);
        command = std::move(resolved);
    }
}

}  // namespace emuflow::task
