#include "task.hpp"

#include <algorithm>
#include <array>

#include "config/yaml_parser.hpp"
#include "exception.hpp"
#include "spdlog/spdlog.h"
#include "variables.hpp"

namespace emuflow::task {

namespace {

constexpr std::array<std::string_view, 13> TASK_FIELDS = {
    "name",    "shell",           "requires",    "before",   "echo",
    "timeout", "fail_fast",       "check_exit_code",
    "should_fail", "sleep",       "disabled",    "commands", "vars"};

auto readSeconds(const json& fields, const std::string& key,
                 const std::string& context)
    -> std::optional<std::chrono::seconds> {
    auto value = optionalInteger(fields, key, context);
    if (!value) {
        return std::nullopt;
    }
    if (*value < 0) {
        THROW_INVALID_TASK_DEFINITION(context + ": '" + key +
                                      "' must not be negative");
    }
    return std::chrono::seconds{*value};
}

}  // namespace

Task::Task(std::string name, std::string shell)
    : name_(std::move(name)), shell_(std::move(shell)) {
    if (name_.empty()) {
        THROW_INVALID_TASK_DEFINITION("Task name cannot be empty");
    }
    if (shell_.empty()) {
        THROW_INVALID_TASK_DEFINITION("Task '" + name_ +
                                      "' must name the shell it runs on");
    }
}

Task Task::fromJson(const json& definition, const json& overrides) {
    auto fields = normalizeKeys(definition, TASK_FIELDS, "task");
    if (!overrides.is_null() && !overrides.empty()) {
        fields.update(normalizeKeys(overrides, TASK_FIELDS, "overrides"));
    }

    auto name = optionalString(fields, "name", "task");
    if (!name || name->empty()) {
        spdlog::error("Task description without a name: {}",
                      definition.dump());
        THROW_INVALID_TASK_DEFINITION(
            "Task description must at least contain a 'name' field");
    }

    const std::string context = "task '" + *name + "'";
    auto shell = optionalString(fields, "shell", context);
    if (!shell) {
        THROW_INVALID_TASK_DEFINITION(context + ": missing 'shell' field");
    }

    Task task(*name, *shell);
    for (const auto& dep : stringList(fields, "requires", context)) {
        task.addRequirement(dep);
    }
    for (const auto& dep : stringList(fields, "before", context)) {
        task.addBefore(dep);
    }

    TaskPolicy policy;
    policy.echo = optionalBool(fields, "echo", context).value_or(policy.echo);
    policy.timeout = readSeconds(fields, "timeout", context);
    policy.failFast =
        optionalBool(fields, "fail_fast", context).value_or(policy.failFast);
    policy.checkExitCode = optionalBool(fields, "check_exit_code", context)
                               .value_or(policy.checkExitCode);
    policy.shouldFail = optionalBool(fields, "should_fail", context)
                            .value_or(policy.shouldFail);
    task.setPolicy(policy);

    task.setSleep(
        readSeconds(fields, "sleep", context).value_or(std::chrono::seconds{0}));
    task.enable(!optionalBool(fields, "disabled", context).value_or(false));

    if (auto it = fields.find("commands");
        it != fields.end() && !it->is_null()) {
        if (!it->is_array()) {
            THROW_INVALID_TASK_DEFINITION(context +
                                          ": 'commands' must be a list");
        }
        for (const auto& record : *it) {
            task.addCommand(Command::fromJson(record));
        }
    }

    for (const auto& [varName, value] : stringMap(fields, "vars", context)) {
        task.setVar(varName, value);
    }

    spdlog::debug("Task {} loaded for shell {} with {} commands",
                  task.getName(), task.getShell(), task.getCommands().size());
    return task;
}

Task Task::fromYaml(std::string_view yaml, const json& overrides) {
    auto parsed = config::YamlParser::parse(yaml);
    if (!parsed || !parsed->is_object()) {
        auto reason = parsed ? std::string("document is not a mapping")
                             : config::YamlParser::getLastError();
        spdlog::error("Invalid task description: {}", reason);
        THROW_INVALID_TASK_DEFINITION("Invalid task description: " + reason);
    }

    return fromJson(*parsed, overrides);
}

Task Task::fromMultilineString(std::string name, std::string_view text,
                               json params) {
    if (params.is_null()) {
        params = json::object();
    }
    auto definition = normalizeKeys(params, TASK_FIELDS, "task '" + name + "'");

    json commands = json::array();
    size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string line(text.substr(start, end - start));
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") != std::string::npos) {
            commands.push_back(json{{"command", line}});
        }
        start = end + 1;
    }

    definition["name"] = std::move(name);
    definition["commands"] = std::move(commands);
    return fromJson(definition);
}

json Task::toJson() const {
    json commands = json::array();
    for (const auto& cmd : commands_) {
        commands.push_back(cmd.toJson());
    }
    json vars = json::object();
    for (const auto& [varName, value] : vars_) {
        vars[varName] = value;
    }
    return {
        {"name", name_},
        {"shell", shell_},
        {"requires", requires_},
        {"before", before_},
        {"echo", policy_.echo},
        {"timeout", policy_.timeout ? json(policy_.timeout->count())
                                    : json(nullptr)},
        {"fail-fast", policy_.failFast},
        {"check-exit-code", policy_.checkExitCode},
        {"should-fail", policy_.shouldFail},
        {"sleep", sleep_.count()},
        {"disabled", disabled_},
        {"commands", commands},
        {"vars", vars},
    };
}

auto Task::getName() const -> const std::string& { return name_; }

auto Task::getShell() const -> const std::string& { return shell_; }

auto Task::getRequires() const -> const std::vector<std::string>& {
    return requires_;
}

auto Task::getBefore() const -> const std::vector<std::string>& {
    return before_;
}

auto Task::getPolicy() const -> const TaskPolicy& { return policy_; }

auto Task::getSleep() const -> std::chrono::seconds { return sleep_; }

auto Task::getCommands() const -> const std::vector<Command>& {
    return commands_;
}

auto Task::getVars() const -> const VariableMap& { return vars_; }

void Task::addRequirement(const std::string& taskName) {
    if (std::find(requires_.begin(), requires_.end(), taskName) ==
        requires_.end()) {
        requires_.push_back(taskName);
    }
}

void Task::addBefore(const std::string& taskName) {
    if (std::find(before_.begin(), before_.end(), taskName) == before_.end()) {
        before_.push_back(taskName);
    }
}

void Task::addCommand(Command command) {
    commands_.push_back(std::move(command));
}

void Task::setPolicy(const TaskPolicy& policy) { policy_ = policy; }

void Task::setSleep(std::chrono::seconds sleep) {
    if (sleep.count() < 0) {
        THROW_INVALID_TASK_DEFINITION("Task '" + name_ +
                                      "': sleep must not be negative");
    }
    sleep_ = sleep;
}

void Task::setVar(const std::string& name, const std::string& value) {
    vars_[name] = value;
}

void Task::enable(bool value) {
    disabled_ = !value;
    spdlog::debug("Task {} {}", name_, value ? "enabled" : "disabled");
}

bool Task::isEnabled() const { return !disabled_; }

CommandPolicy Task::policyFor(const Command& command) const {
    CommandPolicy effective;
    effective.expect = command.expect;
    effective.timeout = command.timeout.value_or(policy_.timeout);
    effective.echo = command.echo.value_or(policy_.echo);
    effective.checkExitCode =
        command.checkExitCode.value_or(policy_.checkExitCode);
    effective.shouldFail = command.shouldFail.value_or(policy_.shouldFail);
    return effective;
}

void Task::applyVars(const VariableMap& globals, const VariableMap& overrides) {
    if (varsApplied_) {
        spdlog::debug("Variables of task {} already resolved", name_);
        return;
    }

    auto scope = mergeScopes(globals, vars_, overrides);
    auto resolved = commands_;
    for (auto& cmd : resolved) {
        cmd.applyVars(scope);
    }
    commands_ = std::move(resolved);
    varsApplied_ = true;
}

bool Task::varsApplied() const { return varsApplied_; }

}  // namespace emuflow::task
