/*
 * command.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-26

Description: Shell command with optional execution policy overrides

**************************************************/

#ifndef EMUFLOW_TASK_COMMAND_HPP
#define EMUFLOW_TASK_COMMAND_HPP

#include <chrono>
#include <optional>
#include <string>

#include "fields.hpp"

namespace emuflow::task {

/// Completion timeout; empty waits forever
using Timeout = std::optional<std::chrono::seconds>;

/**
 * @struct Command
 * @brief A single shell invocation.
 *
 * Every policy field is optional; an empty field inherits the owning task's
 * default. An explicit value equal to the default is still an override.
 */
struct Command {
    std::string command;                         ///< Shell text
    std::optional<std::string> expect;           ///< Output pattern to wait for
    std::optional<Timeout> timeout;              ///< Completion timeout
    std::optional<bool> echo;                    ///< Print session output
    std::optional<bool> checkExitCode;           ///< Inspect exit status
    std::optional<bool> shouldFail;              ///< Require non-zero status

    Command() = default;
    explicit Command(std::string text) : command(std::move(text)) {}

    /**
     * @brief Builds a command from a definition record.
     *
     * A plain string is shorthand for `{command: <string>}`. Keys may use the
     * hyphenated spelling (`check-exit-code`). A timeout of `-1` means
     * "inherit"; `null` means no limit for this command.
     *
     * @throws InvalidTaskDefinition On unknown keys or mistyped values.
     */
    [[nodiscard]] static Command fromJson(const json& record);

    [[nodiscard]] json toJson() const;

    /**
     * @brief Substitutes placeholders in the command text in place.
     * @throws UnresolvedVariable If a placeholder has no value.
     */
    void applyVars(const VariableMap& vars);
};

/**
 * @struct CommandPolicy
 * @brief Execution policy of one command after inheritance from its task.
 */
struct CommandPolicy {
    std::optional<std::string> expect;
    Timeout timeout;
    bool echo{false};
    bool checkExitCode{true};
    bool shouldFail{false};
};

}  // namespace emuflow::task

#endif  // EMUFLOW_TASK_COMMAND_HPP
