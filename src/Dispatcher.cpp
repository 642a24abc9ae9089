/**
 * @file Dispatcher.cpp
 * @brief Implementation of the recursive two-value merge
 */

#include "datamerge/Dispatcher.hpp"
#include "datamerge/ArrayMerge.hpp"
#include "datamerge/Equality.hpp"
#include "datamerge/Path.hpp"

namespace datamerge {

Value Dispatcher::dispatch(const Value& v1, const Value& v2, const std::string& path) {
    auto custom = options_.custom_mergers.find(path);
    if (custom != options_.custom_mergers.end() && custom->second) {
        Value merged = custom->second(std::vector<Value>{v1, v2}, path);
        metadata_.merged_paths.insert(path);
        return merged;
    }

    if (v1.is_null()) {
        return v2;
    }
    if (v2.is_null()) {
        return v1;
    }

    const Shape shape = shape_of(v1);
    if (shape != shape_of(v2)) {
        return resolver_.resolve(path, {v1, v2});
    }

    switch (shape) {
        case Shape::Object:
            return merge_objects(v1, v2, path);

        case Shape::Array:
            return merge_array_values(v1, v2, path);

        case Shape::Null:
        case Shape::Boolean:
        case Shape::Number:
        case Shape::String:
        default:
            if (!deep_equal(v1, v2)) {
                return resolver_.resolve(path, {v1, v2});
            }
            return v1;
    }
}

Value Dispatcher::merge_objects(const Value& obj1, const Value& obj2, const std::string& base) {
    // Second object's entries under their mapped names; a later key that
    // maps onto an earlier one wins
    Value mapped = Value::object();
    for (auto it = obj2.begin(); it != obj2.end(); ++it) {
        auto mapping = options_.key_mappings.find(it.key());
        const std::string& key =
            mapping != options_.key_mappings.end() ? mapping->second : it.key();
        mapped[key] = it.value();
    }

    std::vector<std::string> keys;
    keys.reserve(obj1.size() + mapped.size());
    for (auto it = obj1.begin(); it != obj1.end(); ++it) {
        keys.push_back(it.key());
    }
    for (auto it = mapped.begin(); it != mapped.end(); ++it) {
        if (!obj1.contains(it.key())) {
            keys.push_back(it.key());
        }
    }

    Value result = Value::object();
    for (const auto& key : keys) {
        const std::string child_path = join_key(base, key);
        auto in1 = obj1.find(key);
        auto in2 = mapped.find(key);

        Value merged;
        if (in1 != obj1.end() && in2 != mapped.end()) {
            merged = dispatch(*in1, *in2, child_path);
        } else if (in1 != obj1.end()) {
            merged = *in1;
        } else {
            merged = *in2;
        }

        auto transformer = options_.transformers.find(child_path);
        if (transformer != options_.transformers.end() && transformer->second) {
            merged = transformer->second(merged, child_path);
            metadata_.transformed_paths.insert(child_path);
        }

        result[key] = std::move(merged);
        metadata_.merged_paths.insert(child_path);
    }

    return result;
}

Value Dispatcher::merge_array_values(const Value& arr1, const Value& arr2, const std::string& path) {
    Value result = merge_arrays(
        arr1, arr2, path, options_,
        [this](const Value& a, const Value& b, const std::string& element_path) {
            return dispatch(a, b, element_path);
        });
    metadata_.merged_paths.insert(path);
    return result;
}

} // namespace datamerge
