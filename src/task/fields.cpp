/*
 * fields.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "fields.hpp"

#include <algorithm>

#include "exception.hpp"
#include "spdlog/spdlog.h"

namespace emuflow::task {

namespace {

auto scalarToString(const json& value) -> std::optional<std::string> {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    if (value.is_number_float()) {
        return value.dump();
    }
    return std::nullopt;
}

}  // namespace

std::string normalizeKey(std::string_view key) {
    std::string result(key);
    std::replace(result.begin(), result.end(), '-', '_');
    return result;
}

json normalizeKeys(const json& record,
                   std::span<const std::string_view> allowed,
                   std::string_view context) {
    if (!record.is_object()) {
        spdlog::error("{}: definition is not a mapping", context);
        THROW_INVALID_TASK_DEFINITION(std::string(context) +
                                      ": definition must be a mapping");
    }

    json normalized = json::object();
    for (const auto& [key, value] : record.items()) {
        auto name = normalizeKey(key);
        if (std::find(allowed.begin(), allowed.end(), name) == allowed.end()) {
            spdlog::error("{}: unknown key '{}'", context, key);
            THROW_INVALID_TASK_DEFINITION(std::string(context) +
                                          ": unknown key '" + key + "'");
        }
        if (normalized.contains(name)) {
            THROW_INVALID_TASK_DEFINITION(std::string(context) + ": key '" +
                                          name + "' is given more than once");
        }
        normalized[name] = value;
    }
    return normalized;
}

std::optional<bool> optionalBool(const json& record, const std::string& key,
                                 std::string_view context) {
    auto it = record.find(key);
    if (it == record.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_boolean()) {
        THROW_INVALID_TASK_DEFINITION(std::string(context) + ": '" + key +
                                      "' must be a boolean");
    }
    return it->get<bool>();
}

std::optional<std::string> optionalString(const json& record,
                                          const std::string& key,
                                          std::string_view context) {
    auto it = record.find(key);
    if (it == record.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        THROW_INVALID_TASK_DEFINITION(std::string(context) + ": '" + key +
                                      "' must be a string");
    }
    return it->get<std::string>();
}

std::optional<long long> optionalInteger(const json& record,
                                         const std::string& key,
                                         std::string_view context) {
    auto it = record.find(key);
    if (it == record.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number_integer()) {
        THROW_INVALID_TASK_DEFINITION(std::string(context) + ": '" + key +
                                      "' must be an integer");
    }
    return it->get<long long>();
}

std::vector<std::string> stringList(const json& record, const std::string& key,
                                    std::string_view context) {
    auto it = record.find(key);
    if (it == record.end() || it->is_null()) {
        return {};
    }
    if (it->is_string()) {
        return {it->get<std::string>()};
    }
    if (!it->is_array()) {
        THROW_INVALID_TASK_DEFINITION(std::string(context) + ": '" + key +
                                      "' must be a list of names");
    }

    std::vector<std::string> result;
    result.reserve(it->size());
    for (const auto& item : *it) {
        if (!item.is_string()) {
            THROW_INVALID_TASK_DEFINITION(std::string(context) + ": '" + key +
                                          "' must contain only names");
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

VariableMap stringMap(const json& record, const std::string& key,
                      std::string_view context) {
    auto it = record.find(key);
    if (it == record.end() || it->is_null()) {
        return {};
    }
    if (!it->is_object()) {
        THROW_INVALID_TASK_DEFINITION(std::string(context) + ": '" + key +
                                      "' must be a mapping");
    }

    VariableMap result;
    for (const auto& [name, value] : it->items()) {
        auto text = scalarToString(value);
        if (!text) {
            THROW_INVALID_TASK_DEFINITION(std::string(context) + ": value of '" +
                                          key + "." + name +
                                          "' must be a scalar");
        }
        result.emplace(name, std::move(*text));
    }
    return result;
}

}  // namespace emuflow::task
