/**
 * @file task.hpp
 * @brief Task: a named group of commands bound to one shell.
 *
 * A Task carries the default execution policy inherited by its commands,
 * its ordering constraints (`requires`, `before`), an enabled flag and
 * task-local variables.
 *
 * @par Usage Example:
 * @code
 * #include "task/task.hpp"
 *
 * using namespace emuflow::task;
 *
 * auto task = Task::fromYaml(R"(
 * name: chroot
 * shell: target
 * requires: [mount]
 * commands:
 *   - chroot /mnt/rootfs
 *   - command: uname -a
 *     expect: Linux
 * )");
 *
 * auto test = Task::fromMultilineString("action_test", "pytest\n",
 *                                       {{"shell", "target"}});
 * @endcode
 *
 * @date 2024-12-26
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef EMUFLOW_TASK_TASK_HPP
#define EMUFLOW_TASK_TASK_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "command.hpp"
#include "fields.hpp"

namespace emuflow::task {

/**
 * @struct TaskPolicy
 * @brief Defaults a task applies to each of its commands.
 */
struct TaskPolicy {
    bool echo{false};
    std::optional<std::chrono::seconds> timeout;  ///< Empty waits forever
    bool failFast{true};
    bool checkExitCode{true};
    bool shouldFail{false};
};

/**
 * @class Task
 * @brief Ordered list of commands executed sequentially on one shell.
 */
class Task {
public:
    /**
     * @brief Constructs an empty, enabled task.
     * @param name Globally unique task name.
     * @param shell Name of the shell the commands run on.
     * @throws InvalidTaskDefinition If either name is empty.
     */
    Task(std::string name, std::string shell);

    /**
     * @brief Builds a task from a structured mapping.
     *
     * Keys may use hyphenated display spellings (`fail-fast`). Commands may be
     * plain strings or command mappings.
     *
     * @param definition The task mapping.
     * @param overrides Fields merged over @p definition; they win.
     * @throws InvalidTaskDefinition If `name` or `shell` is missing, a key is
     * unknown, or a value has the wrong type.
     */
    [[nodiscard]] static Task fromJson(const json& definition,
                                       const json& overrides = json::object());

    /**
     * @brief Builds a task from a YAML document.
     *
     * @param yaml YAML text describing a single task mapping.
     * @param overrides Fields merged over the parsed mapping; they win.
     * @throws InvalidTaskDefinition If the text is not a YAML mapping or the
     * resulting definition is invalid.
     */
    [[nodiscard]] static Task fromYaml(std::string_view yaml,
                                       const json& overrides = json::object());

    /**
     * @brief Builds a task whose commands are the non-empty lines of
     * @p text, without per-command overrides.
     *
     * @param name Task name.
     * @param text One command per line.
     * @param params All other task fields (`shell`, `requires`, ...).
     */
    [[nodiscard]] static Task fromMultilineString(std::string name,
                                                  std::string_view text,
                                                  json params);

    [[nodiscard]] json toJson() const;

    [[nodiscard]] auto getName() const -> const std::string&;
    [[nodiscard]] auto getShell() const -> const std::string&;
    [[nodiscard]] auto getRequires() const -> const std::vector<std::string>&;
    [[nodiscard]] auto getBefore() const -> const std::vector<std::string>&;
    [[nodiscard]] auto getPolicy() const -> const TaskPolicy&;
    [[nodiscard]] auto getSleep() const -> std::chrono::seconds;
    [[nodiscard]] auto getCommands() const -> const std::vector<Command>&;
    [[nodiscard]] auto getVars() const -> const VariableMap&;

    void addRequirement(const std::string& taskName);
    void addBefore(const std::string& taskName);
    void addCommand(Command command);
    void setPolicy(const TaskPolicy& policy);
    void setSleep(std::chrono::seconds sleep);
    void setVar(const std::string& name, const std::string& value);

    /**
     * @brief Enables or disables the task. A disabled task is skipped but
     * still satisfies its dependents.
     */
    void enable(bool value);
    [[nodiscard]] bool isEnabled() const;

    /**
     * @brief Effective policy of @p command: its own value where set,
     * otherwise this task's default.
     */
    [[nodiscard]] CommandPolicy policyFor(const Command& command) const;

    /**
     * @brief Resolves placeholders of every command against
     * global < task vars < overrides. Runs at most once per task.
     *
     * @throws UnresolvedVariable If any placeholder has no value.
     */
    void applyVars(const VariableMap& globals, const VariableMap& overrides);

    [[nodiscard]] bool varsApplied() const;

private:
    std::string name_;
    std::string shell_;
    std::vector<std::string> requires_;
    std::vector<std::string> before_;
    TaskPolicy policy_;
    std::chrono::seconds sleep_{0};
    bool disabled_{false};
    std::vector<Command> commands_;
    VariableMap vars_;
    bool varsApplied_{false};
};

}  // namespace emuflow::task

#endif  // EMUFLOW_TASK_TASK_HPP
