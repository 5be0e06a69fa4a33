/*
 * yaml_parser.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: YAML to JSON bridge for task and run definitions

**************************************************/

#ifndef EMUFLOW_CONFIG_YAML_PARSER_HPP
#define EMUFLOW_CONFIG_YAML_PARSER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace emuflow::config {

using json = nlohmann::json;

/**
 * @brief YAML parsing options
 */
struct YamlParseOptions {
    size_t maxDepth{100};  ///< Maximum nesting depth
};

/**
 * @brief Parses YAML documents into JSON values.
 *
 * Task definitions and run descriptions are handled as JSON in memory; this
 * class is the only place yaml-cpp is used. Plain scalars are typed
 * (booleans, null, integers, floats); quoted scalars always stay strings.
 */
class YamlParser {
public:
    /**
     * @brief Parse YAML string to JSON
     *
     * @param content YAML content string
     * @param options Parsing options
     * @return JSON value or nullopt on error
     */
    [[nodiscard]] static std::optional<json> parse(
        std::string_view content, const YamlParseOptions& options = {});

    /**
     * @brief Parse YAML file to JSON
     *
     * @param path Path to YAML file
     * @param options Parsing options
     * @return JSON value or nullopt on error
     */
    [[nodiscard]] static std::optional<json> parseFile(
        const fs::path& path, const YamlParseOptions& options = {});

    /**
     * @brief Get the last error message of the calling thread
     *
     * @return Error message or empty string
     */
    [[nodiscard]] static std::string getLastError();

private:
    static thread_local std::string lastError_;
};

}  // namespace emuflow::config

#endif  // EMUFLOW_CONFIG_YAML_PARSER_HPP
