/**
 * @file Presets.cpp
 * @brief Implementation of preset engines
 */

#include "datamerge/Presets.hpp"
#include "datamerge/Equality.hpp"

#include <optional>

namespace datamerge {

namespace {

/**
 * @brief Numeric field, or fallback when missing, zero or not a number
 */
Value field_or(const Value& obj, const char* key, const Value& fallback) {
    if (!obj.is_object()) {
        return fallback;
    }
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number() || it->get<double>() == 0.0) {
        return fallback;
    }
    return *it;
}

const Value& larger(const Value& a, const Value& b) {
    return b.get<double>() > a.get<double>() ? b : a;
}

const Value& smaller(const Value& a, const Value& b) {
    return b.get<double>() < a.get<double>() ? b : a;
}

bool is_truthy(const Value& v) {
    switch (shape_of(v)) {
        case Shape::Null:
            return false;
        case Shape::Boolean:
            return v.get<bool>();
        case Shape::Number:
            return v.get<double>() != 0.0;
        case Shape::String:
            return !v.get_ref<const std::string&>().empty();
        case Shape::Array:
        case Shape::Object:
        default:
            return true;
    }
}

std::optional<Value> row_identity(const Value& row) {
    for (const char* field : {"id", "_id", "key"}) {
        auto it = row.find(field);
        if (it != row.end() && is_truthy(*it)) {
            return *it;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

Value merge_connection_pools(const std::vector<Value>& values, const std::string&) {
    const Value default_min = 0;
    const Value default_max = 10;
    const Value default_idle = 10000;

    Value result = Value::object();
    for (const auto& v : values) {
        Value next = Value::object();
        next["min"] = larger(field_or(result, "min", default_min), field_or(v, "min", default_min));
        next["max"] = larger(field_or(result, "max", default_max), field_or(v, "max", default_max));
        next["idle"] = smaller(field_or(result, "idle", default_idle), field_or(v, "idle", default_idle));
        result = std::move(next);
    }
    return result;
}

Value merge_headers(const std::vector<Value>& values, const std::string&) {
    Value result = Value::object();
    for (const auto& v : values) {
        if (!v.is_object()) {
            continue;
        }
        for (auto it = v.begin(); it != v.end(); ++it) {
            result[it.key()] = it.value();
        }
    }
    return result;
}

Value merge_feature_flags(const std::vector<Value>& values, const std::string&) {
    for (const auto& v : values) {
        if (v.is_boolean() && v.get<bool>()) {
            return true;
        }
    }
    return false;
}

Value merge_rows_by_identity(const std::vector<Value>& values, const std::string&) {
    // Keyed by canonical identity text; ordered, so first-seen order is kept
    Value by_identity = Value::object();

    for (const auto& rows : values) {
        if (!rows.is_array()) {
            continue;
        }
        for (const auto& row : rows) {
            if (!row.is_object()) {
                continue;
            }
            const auto identity = row_identity(row);
            if (!identity) {
                continue;
            }

            const std::string key = canonical_dump(*identity);
            auto existing = by_identity.find(key);
            if (existing == by_identity.end()) {
                by_identity[key] = row;
                continue;
            }
            for (auto field = row.begin(); field != row.end(); ++field) {
                (*existing)[field.key()] = field.value();
            }
        }
    }

    Value result = Value::array();
    for (auto it = by_identity.begin(); it != by_identity.end(); ++it) {
        result.push_back(it.value());
    }
    return result;
}

DataMerger create_config_merger() {
    DataMerger merger;
    merger.register_custom_merger("database.connectionPool", merge_connection_pools);
    merger.register_custom_merger("api.headers", merge_headers);
    merger.register_custom_merger("features.enabled", merge_feature_flags);
    return merger;
}

DataMerger create_table_merger() {
    MergeOptions options;
    options.array_merge = ArrayMerge::Combine;
    options.conflict_resolution = ConflictResolution::Override;
    options.preserve_order = true;

    DataMerger merger(std::move(options));
    merger.register_custom_merger("rows", merge_rows_by_identity);
    return merger;
}

} // namespace datamerge
