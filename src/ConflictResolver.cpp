/**
 * @file ConflictResolver.cpp
 * @brief Implementation of the conflict resolution table
 */

#include "datamerge/ConflictResolver.hpp"
#include "datamerge/Equality.hpp"
#include "datamerge/Errors.hpp"

#include <cstdint>
#include <limits>

namespace datamerge {

namespace {

/**
 * @brief Strict ordering used by Min / Max
 *
 * Mixed or non-orderable shapes are never "less".
 */
bool ordered_less(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        return a.get<double>() < b.get<double>();
    }
    if (a.is_string() && b.is_string()) {
        return a.get_ref<const std::string&>() < b.get_ref<const std::string&>();
    }
    return false;
}

Value concat_text(const std::vector<Value>& values) {
    std::string out;
    for (const auto& v : values) {
        out += to_text(v);
    }
    return Value(out);
}

} // anonymous namespace

Value Conflict::to_value() const {
    Value out = Value::object();
    out["path"] = path;
    out["values"] = Value(values);
    out["resolved"] = resolved;
    return out;
}

Value sum_numbers(const std::vector<Value>& values) {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();

    std::int64_t int_sum = 0;
    double float_sum = 0.0;
    // Stays true while every number so far fits the int64 running sum
    bool exact = true;

    for (const auto& v : values) {
        if (!v.is_number()) {
            continue;
        }
        float_sum += v.get<double>();
        if (!exact) {
            continue;
        }

        if (v.is_number_float() ||
            (v.is_number_unsigned() && v.get<std::uint64_t>() > static_cast<std::uint64_t>(kMax))) {
            exact = false;
            continue;
        }

        const std::int64_t n = v.get<std::int64_t>();
        if ((n > 0 && int_sum > kMax - n) || (n < 0 && int_sum < kMin - n)) {
            exact = false;
            continue;
        }
        int_sum += n;
    }

    if (!exact) {
        return Value(float_sum);
    }
    return Value(int_sum);
}

Value average_numbers(const std::vector<Value>& values) {
    double total = 0.0;
    std::size_t count = 0;
    for (const auto& v : values) {
        if (v.is_number()) {
            total += v.get<double>();
            ++count;
        }
    }
    if (count == 0) {
        return Value(0);
    }
    return Value(total / static_cast<double>(count));
}

Value min_value(const std::vector<Value>& values) {
    if (values.empty()) {
        return Value(nullptr);
    }
    const Value* best = &values.front();
    for (const auto& v : values) {
        if (ordered_less(v, *best)) {
            best = &v;
        }
    }
    return *best;
}

Value max_value(const std::vector<Value>& values) {
    if (values.empty()) {
        return Value(nullptr);
    }
    const Value* best = &values.front();
    for (const auto& v : values) {
        if (ordered_less(*best, v)) {
            best = &v;
        }
    }
    return *best;
}

Value ConflictResolver::apply(const std::string& path, const std::vector<Value>& values) const {
    if (values.empty()) {
        return Value(nullptr);
    }

    switch (policy_) {
        case ConflictResolution::Preserve:
        case ConflictResolution::Original:
            return values.front();

        case ConflictResolution::Array:
            return Value(values);

        case ConflictResolution::Concat:
            return concat_text(values);

        case ConflictResolution::Sum:
            return sum_numbers(values);

        case ConflictResolution::Average:
            return average_numbers(values);

        case ConflictResolution::Min:
            return min_value(values);

        case ConflictResolution::Max:
            return max_value(values);

        case ConflictResolution::Custom: {
            auto it = custom_mergers_->find(kConflictResolverPrefix + path);
            if (it != custom_mergers_->end() && it->second) {
                return it->second(values, path);
            }
            return values.back();
        }

        case ConflictResolution::Error:
        case ConflictResolution::Override:
        case ConflictResolution::New:
        default:
            return values.back();
    }
}

Value ConflictResolver::resolve(const std::string& path, std::vector<Value> values) {
    if (policy_ == ConflictResolution::Error) {
        throw MergeConflictError(path, std::move(values));
    }

    Value resolved = apply(path, values);
    conflicts_.push_back(Conflict{path, std::move(values), resolved});
    return resolved;
}

Value ConflictResolver::suggest(const std::string& path, const std::vector<Value>& values) const {
    return apply(path, values);
}

} // namespace datamerge
