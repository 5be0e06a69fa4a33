/*
 * variables.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-26

Description: ${{name}} placeholder resolution for command text

**************************************************/

#ifndef EMUFLOW_TASK_VARIABLES_HPP
#define EMUFLOW_TASK_VARIABLES_HPP

#include <string>
#include <string_view>
#include <vector>

#include "fields.hpp"

namespace emuflow::task {

/**
 * @brief Merges variable scopes; later scopes override earlier ones.
 *
 * @param global Global defaults (lowest precedence).
 * @param local Task-local `vars`.
 * @param overrides Per-run override variables (highest precedence).
 */
[[nodiscard]] VariableMap mergeScopes(const VariableMap& global,
                                      const VariableMap& local,
                                      const VariableMap& overrides);

/**
 * @brief Lists the trimmed names of all placeholders in @p text, in order of
 * appearance.
 */
[[nodiscard]] std::vector<std::string> findPlaceholders(std::string_view text);

/**
 * @brief Replaces every `${{ name }}` in @p text with its value from
 * @p scope.
 *
 * Names may contain alphanumerics, underscores and hyphens, surrounding
 * whitespace is ignored. Substituted values are not scanned again.
 *
 * @throws UnresolvedVariable If a name is missing from @p scope.
 */
[[nodiscard]] std::string resolvePlaceholders(std::string_view text,
                                              const VariableMap& scope);

}  // namespace emuflow::task

#endif  // EMUFLOW_TASK_VARIABLES_HPP
