/**
 * @file ArrayMerge.cpp
 * @brief Implementation of array merge strategies
 */

#include "datamerge/ArrayMerge.hpp"
#include "datamerge/Equality.hpp"
#include "datamerge/Path.hpp"

#include <algorithm>
#include <unordered_set>
#include <vector>

namespace datamerge {

namespace {

bool array_contains(const Value& arr, const Value& item) {
    return std::any_of(arr.begin(), arr.end(),
                       [&](const Value& v) { return deep_equal(v, item); });
}

} // anonymous namespace

Value concat_arrays(const Value& a, const Value& b) {
    Value result = a;
    for (const auto& item : b) {
        result.push_back(item);
    }
    return result;
}

Value union_arrays(const Value& a, const Value& b) {
    Value result = a;
    for (const auto& item : b) {
        if (!array_contains(result, item)) {
            result.push_back(item);
        }
    }
    return result;
}

Value intersect_arrays(const Value& a, const Value& b) {
    Value result = Value::array();
    for (const auto& item : a) {
        if (array_contains(b, item)) {
            result.push_back(item);
        }
    }
    return result;
}

Value zip_arrays(const Value& a, const Value& b) {
    const std::size_t n = std::max(a.size(), b.size());
    Value result = Value::array();
    for (std::size_t i = 0; i < n; ++i) {
        Value pair = Value::array();
        if (i < a.size()) pair.push_back(a[i]);
        if (i < b.size()) pair.push_back(b[i]);
        result.push_back(std::move(pair));
    }
    return result;
}

Value combine_arrays(const Value& a, const Value& b, const std::string& base,
                     const ElementMerger& merge_element) {
    const std::size_t n = std::max(a.size(), b.size());
    Value result = Value::array();
    for (std::size_t i = 0; i < n; ++i) {
        if (i < a.size() && i < b.size()) {
            result.push_back(merge_element(a[i], b[i], join_index(base, i)));
        } else if (i < a.size()) {
            result.push_back(a[i]);
        } else {
            result.push_back(b[i]);
        }
    }
    return result;
}

Value remove_duplicates(const Value& arr) {
    Value result = Value::array();
    std::unordered_set<std::string> seen;
    for (const auto& item : arr) {
        if (seen.insert(identity_key(item)).second) {
            result.push_back(item);
        }
    }
    return result;
}

Value preserve_original_order(const Value& merged, const Value& a, const Value& b) {
    Value result = Value::array();
    std::vector<bool> used(merged.size(), false);

    auto take_matching = [&](const Value& item) {
        for (std::size_t i = 0; i < merged.size(); ++i) {
            if (!used[i] && deep_equal(merged[i], item)) {
                result.push_back(merged[i]);
                used[i] = true;
                return;
            }
        }
    };

    for (const auto& item : a) take_matching(item);
    for (const auto& item : b) take_matching(item);
    return result;
}

Value merge_arrays(const Value& a, const Value& b, const std::string& path,
                   const MergeOptions& options, const ElementMerger& merge_element) {
    Value result;

    switch (options.array_merge) {
        case ArrayMerge::Union:
            result = union_arrays(a, b);
            break;
        case ArrayMerge::Intersection:
            result = intersect_arrays(a, b);
            break;
        case ArrayMerge::Override:
            result = b;
            break;
        case ArrayMerge::Combine:
            result = combine_arrays(a, b, path, merge_element);
            break;
        case ArrayMerge::Zip:
            result = zip_arrays(a, b);
            break;
        case ArrayMerge::Concat:
        case ArrayMerge::Replace:
        case ArrayMerge::Merge:
        case ArrayMerge::Unique:
        default:
            result = concat_arrays(a, b);
            break;
    }

    if (options.remove_duplicates && options.array_merge != ArrayMerge::Intersection) {
        result = remove_duplicates(result);
    }

    if (options.preserve_order && options.array_merge == ArrayMerge::Union) {
        result = preserve_original_order(result, a, b);
    }

    return result;
}

} // namespace datamerge
