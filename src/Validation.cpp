/**
 * @file Validation.cpp
 * @brief Implementation of validation rules
 */

#include "datamerge/Validation.hpp"
#include "datamerge/Equality.hpp"
#include "datamerge/Errors.hpp"

#include <regex>
#include <utility>

namespace datamerge {

namespace {

const char* const kTypeNames[] = {
    "null", "boolean", "number", "integer", "float", "string", "array", "object"
};

bool is_known_type(const std::string& type) {
    for (const char* name : kTypeNames) {
        if (type == name) return true;
    }
    return false;
}

bool matches_type(const Value& value, const std::string& type) {
    if (type == "number") return value.is_number();
    if (type == "integer") return value.is_number_integer();
    if (type == "float") return value.is_number_float();
    return type_name(value) == type;
}

/**
 * @brief Quantity compared against min/max, if the value has one
 */
std::optional<double> measure(const Value& value) {
    if (value.is_number()) return value.get<double>();
    if (value.is_string()) return static_cast<double>(value.get_ref<const std::string&>().size());
    if (value.is_array()) return static_cast<double>(value.size());
    return std::nullopt;
}

double require_number(const std::string& path, const char* key, const Value& val) {
    if (!val.is_number()) {
        throw SchemaError(path, std::string("'") + key + "' must be a number, got " + type_name(val));
    }
    return val.get<double>();
}

} // anonymous namespace

bool validate_value(const Value& value, const Rule& rule) {
    if (rule.required && value.is_null()) {
        return false;
    }

    if (rule.type && !matches_type(value, *rule.type)) {
        return false;
    }

    const auto quantity = measure(value);
    if (rule.min && quantity && *quantity < *rule.min) {
        return false;
    }
    if (rule.max && quantity && *quantity > *rule.max) {
        return false;
    }

    if (rule.pattern && value.is_string()) {
        std::regex re(*rule.pattern);
        if (!std::regex_search(value.get_ref<const std::string&>(), re)) {
            return false;
        }
    }

    if (rule.enum_values && !contains_equal(*rule.enum_values, value)) {
        return false;
    }

    if (rule.custom) {
        return rule.custom(value);
    }

    return true;
}

Validator make_validator(Rule rule) {
    return [rule = std::move(rule)](const Value& value, const std::string&) {
        return validate_value(value, rule);
    };
}

Rule rule_from_value(const std::string& path, const Value& doc) {
    if (!doc.is_object()) {
        throw SchemaError(path, "rule must be an object, got " + type_name(doc));
    }

    Rule rule;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const std::string& key = it.key();
        const Value& val = it.value();

        if (key == "required") {
            if (!val.is_boolean()) {
                throw SchemaError(path, "'required' must be a boolean");
            }
            rule.required = val.get<bool>();
        } else if (key == "type") {
            if (!val.is_string() || !is_known_type(val.get<std::string>())) {
                throw SchemaError(path, "unknown type " + val.dump(-1, ' ', false, Value::error_handler_t::replace));
            }
            rule.type = val.get<std::string>();
        } else if (key == "min") {
            rule.min = require_number(path, "min", val);
        } else if (key == "max") {
            rule.max = require_number(path, "max", val);
        } else if (key == "pattern") {
            if (!val.is_string()) {
                throw SchemaError(path, "'pattern' must be a string");
            }
            try {
                std::regex compiled(val.get<std::string>());
            } catch (const std::regex_error& e) {
                throw SchemaError(path, std::string("bad pattern: ") + e.what());
            }
            rule.pattern = val.get<std::string>();
        } else if (key == "enum") {
            if (!val.is_array()) {
                throw SchemaError(path, "'enum' must be an array");
            }
            rule.enum_values = std::vector<Value>(val.begin(), val.end());
        } else {
            throw SchemaError(path, "unknown rule key '" + key + "'");
        }
    }
    return rule;
}

Schema compile_schema(const Value& doc) {
    if (!doc.is_object()) {
        throw SchemaError("<root>", "schema must be an object, got " + type_name(doc));
    }

    Schema schema;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        schema[it.key()] = rule_from_value(it.key(), it.value());
    }
    return schema;
}

} // namespace datamerge
