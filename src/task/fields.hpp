/*
 * fields.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-26

Description: Typed field access for task definition records

**************************************************/

#ifndef EMUFLOW_TASK_FIELDS_HPP
#define EMUFLOW_TASK_FIELDS_HPP

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace emuflow::task {

using json = nlohmann::json;
using VariableMap = std::unordered_map<std::string, std::string>;

/**
 * @brief Converts a display spelling (`check-exit-code`) to the internal
 * field spelling (`check_exit_code`).
 */
[[nodiscard]] std::string normalizeKey(std::string_view key);

/**
 * @brief Normalizes every key of a definition record and rejects keys that
 * are not in @p allowed.
 *
 * @param record The record to normalize, must be a JSON object.
 * @param allowed Internal field spellings accepted for this record.
 * @param context Owner description used in error messages.
 * @throws InvalidTaskDefinition If the record is not an object, contains an
 * unknown key, or spells the same field twice.
 */
[[nodiscard]] json normalizeKeys(const json& record,
                                 std::span<const std::string_view> allowed,
                                 std::string_view context);

[[nodiscard]] std::optional<bool> optionalBool(const json& record,
                                               const std::string& key,
                                               std::string_view context);

[[nodiscard]] std::optional<std::string> optionalString(
    const json& record, const std::string& key, std::string_view context);

[[nodiscard]] std::optional<long long> optionalInteger(
    const json& record, const std::string& key, std::string_view context);

/**
 * @brief Reads a list of names. A single string is accepted as a one-element
 * list; `null` or a missing key yields an empty list.
 */
[[nodiscard]] std::vector<std::string> stringList(const json& record,
                                                  const std::string& key,
                                                  std::string_view context);

/**
 * @brief Reads a name -> value mapping. Scalar values are converted to their
 * textual form.
 */
[[nodiscard]] VariableMap stringMap(const json& record, const std::string& key,
                                    std::string_view context);

}  // namespace emuflow::task

#endif  // EMUFLOW_TASK_FIELDS_HPP
