/*
 * run_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "run_config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <unordered_map>

#include "atom/utils/string.hpp"
#include "spdlog/spdlog.h"
#include "task/exception.hpp"
#include "yaml_parser.hpp"

namespace emuflow::config {

namespace {

const std::unordered_map<std::string, std::string> DEFAULT_BOARDS = {
    {"riscv64", "hifive_unleashed"}};

const std::vector<std::string> KNOWN_KEYS = {
    "arch",          "board",         "resc",          "repl",
    "kernel",        "task-dirs",     "task-files",    "vars",
    "devices",       "packages",      "network",       "test-commands",
    "test-yaml",     "test-shell",    "test-requires", "logging"};

auto hyphenate(const std::string& key) -> std::string {
    std::string result;
    result.reserve(key.size() + 4);
    for (char c : key) {
        if (c == '_') {
            result += '-';
        } else if (std::isupper(static_cast<unsigned char>(c))) {
            if (!result.empty() && result.back() != '-') {
                result += '-';
            }
            result += static_cast<char>(
                std::tolower(static_cast<unsigned char>(c)));
        } else {
            result += c;
        }
    }
    return result;
}

auto readString(const json& j, const std::string& key,
                const std::string& fallback) -> std::string {
    if (!j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    if (!j[key].is_string()) {
        THROW_INVALID_RUN_CONFIG("Run config: '" + key + "' must be a string");
    }
    return j[key].get<std::string>();
}

auto splitLines(const std::string& text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        std::string entry{atom::utils::trim(line)};
        if (!entry.empty()) {
            lines.push_back(std::move(entry));
        }
    }
    return lines;
}

// Array of strings or a multi-line string
auto readList(const json& j, const std::string& key,
              const std::vector<std::string>& fallback)
    -> std::vector<std::string> {
    if (!j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    const auto& value = j[key];
    if (value.is_string()) {
        return splitLines(value.get<std::string>());
    }
    if (!value.is_array()) {
        THROW_INVALID_RUN_CONFIG("Run config: '" + key +
                                 "' must be a list or a multi-line string");
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.is_string()) {
            THROW_INVALID_RUN_CONFIG("Run config: entries of '" + key +
                                     "' must be strings");
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}

auto readMap(const json& j, const std::string& key) -> task::VariableMap {
    task::VariableMap map;
    if (!j.contains(key) || j[key].is_null()) {
        return map;
    }
    if (!j[key].is_object()) {
        THROW_INVALID_RUN_CONFIG("Run config: '" + key + "' must be a mapping");
    }
    for (const auto& [name, value] : j[key].items()) {
        if (value.is_string()) {
            map[name] = value.get<std::string>();
        } else if (value.is_primitive() && !value.is_null()) {
            map[name] = value.dump();
        } else {
            THROW_INVALID_RUN_CONFIG("Run config: value of '" + key + "." +
                                     name + "' must be a scalar");
        }
    }
    return map;
}

auto readNetwork(const json& j) -> bool {
    if (!j.contains("network") || j["network"].is_null()) {
        return true;
    }
    const auto& value = j["network"];
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_string()) {
        auto text = value.get<std::string>();
        if (text == "true") return true;
        if (text == "false") return false;
    }
    THROW_INVALID_RUN_CONFIG(
        "Run config: 'network' must be true or false, got " + value.dump());
}

}  // namespace

json RunConfig::normalize(const json& j) {
    if (!j.is_object()) {
        THROW_INVALID_RUN_CONFIG("Run config must be a mapping, got " +
                                 std::string(j.type_name()));
    }
    json result = json::object();
    for (const auto& [key, value] : j.items()) {
        auto canonical = hyphenate(key);
        if (result.contains(canonical)) {
            THROW_INVALID_RUN_CONFIG("Run config: key '" + canonical +
                                     "' given more than once");
        }
        result[canonical] = value;
    }
    return result;
}

RunConfig RunConfig::fromJson(const json& input) {
    auto j = normalize(input);
    for (const auto& [key, value] : j.items()) {
        if (std::find(KNOWN_KEYS.begin(), KNOWN_KEYS.end(), key) ==
            KNOWN_KEYS.end()) {
            spdlog::warn("Run config: ignoring unknown key '{}'", key);
        }
    }

    RunConfig cfg;
    cfg.arch = readString(j, "arch", cfg.arch);
    cfg.board = readString(j, "board", cfg.board);
    cfg.resc = readString(j, "resc", cfg.resc);
    cfg.repl = readString(j, "repl", cfg.repl);
    cfg.kernel = readString(j, "kernel", cfg.kernel);
    cfg.taskDirs = readList(j, "task-dirs", cfg.taskDirs);
    cfg.taskFiles = readList(j, "task-files", cfg.taskFiles);
    cfg.vars = readMap(j, "vars");
    cfg.devices = readMap(j, "devices");
    cfg.packages = readMap(j, "packages");
    cfg.network = readNetwork(j);
    cfg.testCommands = readString(j, "test-commands", cfg.testCommands);
    cfg.testYaml = readString(j, "test-yaml", cfg.testYaml);
    cfg.testShell = readString(j, "test-shell", cfg.testShell);
    cfg.testRequires = readList(j, "test-requires", cfg.testRequires);

    if (j.contains("logging") && !j["logging"].is_null()) {
        if (!j["logging"].is_object()) {
            THROW_INVALID_RUN_CONFIG("Run config: 'logging' must be a mapping");
        }
        try {
            cfg.logging = LoggingConfig::fromJson(j["logging"]);
        } catch (const json::exception& e) {
            THROW_INVALID_RUN_CONFIG(std::string("Run config: invalid "
                                                 "'logging' section: ") +
                                     e.what());
        }
    }

    // Fail on a bad board before anything else is prepared.
    [[maybe_unused]] auto board = cfg.resolveBoard();
    return cfg;
}

RunConfig RunConfig::fromYaml(std::string_view yaml) {
    auto parsed = YamlParser::parse(yaml);
    if (!parsed) {
        THROW_INVALID_RUN_CONFIG("Invalid run config: " +
                                 YamlParser::getLastError());
    }
    if (parsed->is_null()) {
        return fromJson(json::object());
    }
    return fromJson(*parsed);
}

json RunConfig::readFile(const std::filesystem::path& path) {
    if (path.extension() != ".json") {
        auto parsed = YamlParser::parseFile(path);
        if (!parsed) {
            THROW_INVALID_RUN_CONFIG("Invalid run config " + path.string() +
                                     ": " + YamlParser::getLastError());
        }
        return parsed->is_null() ? json::object() : normalize(*parsed);
    }

    std::ifstream file(path);
    if (!file) {
        THROW_INVALID_RUN_CONFIG("Cannot open run config: " + path.string());
    }
    try {
        return normalize(json::parse(file));
    } catch (const json::exception& e) {
        THROW_INVALID_RUN_CONFIG("Invalid JSON in " + path.string() + ": " +
                                 e.what());
    }
}

json RunConfig::toJson() const {
    return {{"arch", arch},
            {"board", board},
            {"resc", resc},
            {"repl", repl},
            {"kernel", kernel},
            {"task-dirs", taskDirs},
            {"task-files", taskFiles},
            {"vars", vars},
            {"devices", devices},
            {"packages", packages},
            {"network", network},
            {"test-commands", testCommands},
            {"test-yaml", testYaml},
            {"test-shell", testShell},
            {"test-requires", testRequires},
            {"logging", logging.toJson()}};
}

std::string RunConfig::resolveBoard() const {
    auto it = DEFAULT_BOARDS.find(arch);
    if (it == DEFAULT_BOARDS.end()) {
        THROW_INVALID_RUN_CONFIG("Architecture not supported: " + arch);
    }
    if (board == "default") {
        return it->second;
    }
    if (board == "custom") {
        if (resc == "default" || repl == "default") {
            THROW_INVALID_RUN_CONFIG(
                "A custom board needs both 'resc' and 'repl'");
        }
        if (atom::utils::trim(kernel).empty()) {
            THROW_INVALID_RUN_CONFIG("A custom board needs a 'kernel'");
        }
    }
    return board;
}

task::VariableMap RunConfig::overrideVars() const {
    auto merged = devices;
    for (const auto& [name, value] : packages) {
        merged[name] = value;
    }
    return merged;
}

}  // namespace emuflow::config
