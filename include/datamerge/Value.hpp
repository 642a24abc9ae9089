/**
 * @file Value.hpp
 * @brief Value type for merge sources and results
 *
 * Uses nlohmann::ordered_json as the underlying value model to support:
 * - Null
 * - Bool (true | false)
 * - Number (int64_t, uint64_t, double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...}, insertion ordered)
 */

#ifndef DATAMERGE_VALUE_HPP
#define DATAMERGE_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace datamerge {

/**
 * @brief JSON-like value type for merge sources
 *
 * The ordered variant keeps object keys in insertion order, so merged
 * objects list the first source's keys before keys introduced by later
 * sources. Key order is not significant for equality; use deep_equal()
 * from Equality.hpp rather than operator== when comparing objects.
 *
 * See nlohmann::json documentation for the complete API.
 */
using Value = nlohmann::ordered_json;

/**
 * @brief Runtime shape of a value, as used by the dispatcher
 *
 * Integers and floats share the Number shape: merging 1 with 1.5 is a
 * value conflict, not a type conflict.
 */
enum class Shape {
    Null,
    Boolean,
    Number,
    String,
    Array,
    Object
};

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Classify a value's shape
 */
inline Shape shape_of(const Value& val) {
    switch (val.type()) {
        case Value::value_t::boolean:
            return Shape::Boolean;
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::number_float:
            return Shape::Number;
        case Value::value_t::string:
            return Shape::String;
        case Value::value_t::array:
            return Shape::Array;
        case Value::value_t::object:
            return Shape::Object;
        case Value::value_t::null:
        case Value::value_t::binary:
        case Value::value_t::discarded:
        default:
            return Shape::Null;
    }
}

/**
 * @brief Shape name ("null", "boolean", "number", "string", "array", "object")
 */
inline const char* shape_name(Shape shape) {
    switch (shape) {
        case Shape::Null: return "null";
        case Shape::Boolean: return "boolean";
        case Shape::Number: return "number";
        case Shape::String: return "string";
        case Shape::Array: return "array";
        case Shape::Object: return "object";
    }
    return "null";
}

/**
 * @brief Check if value is a container (array or object)
 * @param val The value to check
 * @return true if val is array or object, false otherwise
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

/**
 * @brief Check if value counts as "empty" for source filtering
 *
 * Empty arrays, empty objects and strings made only of whitespace are
 * empty. Null, numbers and booleans never are.
 */
inline bool is_empty_value(const Value& val) {
    if (val.is_array() || val.is_object()) {
        return val.empty();
    }
    if (val.is_string()) {
        const auto& s = val.get_ref<const std::string&>();
        return s.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
    }
    return false;
}

} // namespace datamerge

#endif // DATAMERGE_VALUE_HPP
