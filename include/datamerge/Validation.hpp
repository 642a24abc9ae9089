/**
 * @file Validation.hpp
 * @brief Minimal per-path validation rules
 *
 * A rule checks the merged value at one path. Checks run in this order and
 * the first failing one decides:
 * - required: value must not be null (an absent path counts as null)
 * - type: "null", "boolean", "number", "integer", "float", "string",
 *         "array" or "object"
 * - min / max: lower / upper bound on a number, or on the length of a
 *              string or array
 * - pattern: ECMAScript regex searched in string values
 * - enum: value must deep-equal one of the listed values
 * - custom: predicate on the value
 *
 * This is not a schema language: no nesting, references or combinators.
 */

#ifndef DATAMERGE_VALIDATION_HPP
#define DATAMERGE_VALIDATION_HPP

#include "datamerge/Options.hpp"
#include "datamerge/Value.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace datamerge {

struct Rule {
    bool required = false;
    std::optional<std::string> type;
    std::optional<double> min;
    std::optional<double> max;
    std::optional<std::string> pattern;
    std::optional<std::vector<Value>> enum_values;
    std::function<bool(const Value&)> custom;
};

/// Path -> rule
using Schema = std::map<std::string, Rule>;

/**
 * @brief Check a value against a rule
 * @throws std::regex_error if the rule's pattern does not compile
 */
bool validate_value(const Value& value, const Rule& rule);

/**
 * @brief Wrap a rule as a validator for MergeOptions::validators
 */
Validator make_validator(Rule rule);

/**
 * @brief Build a rule from its document form
 *
 * Example:
 * ```json
 * {"required": true, "type": "string", "min": 3, "pattern": "^[a-z]+$",
 *  "enum": ["abc", "xyz"]}
 * ```
 *
 * @param path Path the rule belongs to, for error messages
 * @param doc Rule object
 * @throws SchemaError for unknown keys, wrongly typed entries, unknown
 *         type names or a pattern that does not compile
 */
Rule rule_from_value(const std::string& path, const Value& doc);

/**
 * @brief Build a schema from an object mapping paths to rule objects
 * @throws SchemaError
 */
Schema compile_schema(const Value& doc);

} // namespace datamerge

#endif // DATAMERGE_VALIDATION_HPP
