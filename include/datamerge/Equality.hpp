/**
 * @file Equality.hpp
 * @brief Structural equality and identity keys for values
 *
 * Rules:
 * - RULE E1: Numbers compare by numeric value (1 == 1.0, 1u == 1)
 * - RULE E2: Objects compare by key set and per-key value; key order is
 *            ignored ({a:1,b:2} equals {b:2,a:1})
 * - RULE E3: Arrays compare element-wise in order
 * - RULE E4: Values of different shapes are never equal (1 != "1")
 */

#ifndef DATAMERGE_EQUALITY_HPP
#define DATAMERGE_EQUALITY_HPP

#include "datamerge/Value.hpp"
#include <string>
#include <vector>

namespace datamerge {

/**
 * @brief Deep structural equality
 *
 * Follows RULES E1-E4.
 */
bool deep_equal(const Value& a, const Value& b);

/**
 * @brief Check whether any element of values deep-equals item
 */
bool contains_equal(const std::vector<Value>& values, const Value& item);

/**
 * @brief Serialize a value with object keys sorted
 *
 * Two values that deep_equal() each other serialize to the same text.
 * Integral floats are written as integers so 2.0 and 2 agree.
 *
 * Examples:
 * - {b:2, a:[1, 2.0]} → {"a":[1,2],"b":2}
 */
std::string canonical_dump(const Value& val);

/**
 * @brief Identity key used for duplicate removal and row matching
 *
 * An object with an "id", "_id" or "key" field (checked in that order) is
 * identified by that field: "id:<value>". Anything else is identified by
 * its canonical serialization. String field values are used as-is, other
 * field values by their canonical serialization, so {id: 1} and {id: "1"}
 * share the key "id:1".
 *
 * Examples:
 * - {id: 7, name: "a"} → "id:7"
 * - {_id: "x"} → "_id:x"
 * - {name: "a"} → {"name":"a"}
 * - 3 → 3
 */
std::string identity_key(const Value& val);

/**
 * @brief Text form of a scalar for concatenation and identity keys
 *
 * Strings are returned without quotes; anything else is its canonical
 * serialization.
 */
std::string to_text(const Value& val);

} // namespace datamerge

#endif // DATAMERGE_EQUALITY_HPP
