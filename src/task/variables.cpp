/*
 * variables.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "variables.hpp"

#include <regex>

#include "atom/utils/string.hpp"
#include "exception.hpp"
#include "spdlog/spdlog.h"

namespace emuflow::task {

namespace {

const std::regex& placeholderPattern() {
    static const std::regex pattern(R"(\$\{\{([\sa-zA-Z0-9_\-]*)\}\})");
    return pattern;
}

}  // namespace

VariableMap mergeScopes(const VariableMap& global, const VariableMap& local,
                        const VariableMap& overrides) {
    VariableMap merged = global;
    for (const auto& [name, value] : local) {
        merged[name] = value;
    }
    for (const auto& [name, value] : overrides) {
        merged[name] = value;
    }
    return merged;
}

std::vector<std::string> findPlaceholders(std::string_view text) {
    std::vector<std::string> names;
    std::string input(text);
    for (auto it = std::sregex_iterator(input.begin(), input.end(),
                                        placeholderPattern());
         it != std::sregex_iterator(); ++it) {
        names.emplace_back(atom::utils::trim((*it)[1].str()));
    }
    return names;
}

std::string resolvePlaceholders(std::string_view text,
                                const VariableMap& scope) {
    std::string input(text);
    std::string result;
    result.reserve(input.size());

    auto last = input.cbegin();
    for (auto it = std::sregex_iterator(input.begin(), input.end(),
                                        placeholderPattern());
         it != std::sregex_iterator(); ++it) {
        const auto& match = *it;
        std::string name{atom::utils::trim(match[1].str())};

        auto value = scope.find(name);
        if (value == scope.end()) {
            spdlog::error("Variable {} not found while resolving '{}'", name,
                          input);
            THROW_UNRESOLVED_VARIABLE("Variable '" + name +
                                      "' not found in command: " + input);
        }

        result.append(last, match[0].first);
        result.append(value->second);
        last = match[0].second;
    }
    result.append(last, input.cend());
    return result;
}

}  // namespace emuflow::task
