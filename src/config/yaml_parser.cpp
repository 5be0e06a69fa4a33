/*
 * yaml_parser.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: YAML parser implementation

**************************************************/

#include "yaml_parser.hpp"

#include <fstream>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include "spdlog/spdlog.h"

namespace emuflow::config {

thread_local std::string YamlParser::lastError_;

namespace {

auto parseInteger(const std::string& value) -> std::optional<long long> {
    try {
        size_t pos = 0;
        long long intVal = std::stoll(value, &pos);
        if (pos == value.size()) {
            return intVal;
        }
    } catch (const std::logic_error&) {
    }
    return std::nullopt;
}

auto parseFloat(const std::string& value) -> std::optional<double> {
    try {
        size_t pos = 0;
        double floatVal = std::stod(value, &pos);
        if (pos == value.size()) {
            return floatVal;
        }
    } catch (const std::logic_error&) {
    }
    return std::nullopt;
}

json yamlNodeToJson(const YAML::Node& node, size_t depth, size_t maxDepth) {
    if (depth > maxDepth) {
        throw std::runtime_error("Maximum nesting depth exceeded");
    }

    switch (node.Type()) {
        case YAML::NodeType::Null:
            return json(nullptr);

        case YAML::NodeType::Scalar: {
            std::string value = node.as<std::string>();

            // Quoted scalars carry the non-specific "!" tag
            if (node.Tag() == "!") {
                return json(value);
            }

            if (value == "true" || value == "True" || value == "TRUE" ||
                value == "yes" || value == "Yes" || value == "YES" ||
                value == "on" || value == "On" || value == "ON") {
                return json(true);
            }
            if (value == "false" || value == "False" || value == "FALSE" ||
                value == "no" || value == "No" || value == "NO" ||
                value == "off" || value == "Off" || value == "OFF") {
                return json(false);
            }

            if (value == "null" || value == "Null" || value == "NULL" ||
                value == "~" || value.empty()) {
                return json(nullptr);
            }

            if (auto intVal = parseInteger(value)) {
                return json(*intVal);
            }
            if (auto floatVal = parseFloat(value)) {
                return json(*floatVal);
            }

            return json(value);
        }

        case YAML::NodeType::Sequence: {
            json arr = json::array();
            for (const auto& item : node) {
                arr.push_back(yamlNodeToJson(item, depth + 1, maxDepth));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            json obj = json::object();
            for (const auto& pair : node) {
                std::string key = pair.first.as<std::string>();
                obj[key] = yamlNodeToJson(pair.second, depth + 1, maxDepth);
            }
            return obj;
        }

        default:
            return json(nullptr);
    }
}

}  // namespace

std::optional<json> YamlParser::parse(std::string_view content,
                                      const YamlParseOptions& options) {
    lastError_.clear();
    try {
        YAML::Node root = YAML::Load(std::string(content));
        return yamlNodeToJson(root, 0, options.maxDepth);
    } catch (const YAML::Exception& e) {
        lastError_ = std::string("YAML parse error: ") + e.what();
        spdlog::debug("{}", lastError_);
        return std::nullopt;
    } catch (const std::exception& e) {
        lastError_ = std::string("YAML conversion error: ") + e.what();
        spdlog::debug("{}", lastError_);
        return std::nullopt;
    }
}

std::optional<json> YamlParser::parseFile(const fs::path& path,
                                          const YamlParseOptions& options) {
    std::ifstream file(path);
    if (!file) {
        lastError_ = "Cannot open file: " + path.string();
        spdlog::debug("{}", lastError_);
        return std::nullopt;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), options);
}

std::string YamlParser::getLastError() { return lastError_; }

}  // namespace emuflow::config
