#pragma once

/**
 * @file value.hpp
 * @brief Dynamic value model shared by game state and the expression evaluator
 *
 * Game state is an open JSON-shaped mapping, so values are nlohmann::json
 * documents. The helpers below give them the loose semantics story authors
 * expect from conditions: truthiness, numeric equality across integer and
 * floating-point values, and ordering that is simply false for values of
 * unrelated types.
 */

#include "Narrata/core/types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace Narrata::scripting {

using Value = nlohmann::json;

/**
 * @brief false, 0, "", null (including a missing key) are falsy
 */
[[nodiscard]] bool isTruthy(const Value& value);

[[nodiscard]] bool valuesEqual(const Value& a, const Value& b);

/**
 * @brief Three-way comparison of two numbers or two strings
 * @return negative, zero or positive; std::nullopt when the values are
 *         not comparable
 */
[[nodiscard]] std::optional<int> compareValues(const Value& a, const Value& b);

/**
 * @brief Text form used for string concatenation and log output
 */
[[nodiscard]] std::string toDisplayString(const Value& value);

} // namespace Narrata::scripting
