/**
 * @file Plan.cpp
 * @brief Implementation of the merge preview
 */

#include "datamerge/Plan.hpp"
#include "datamerge/ConflictResolver.hpp"
#include "datamerge/Equality.hpp"
#include "datamerge/Path.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace datamerge {

std::string to_string(PlanAction action) {
    switch (action) {
        case PlanAction::Add: return "add";
        case PlanAction::Update: return "update";
        case PlanAction::Conflict: return "conflict";
        case PlanAction::Transform: return "transform";
    }
    return "unknown";
}

Value MergePlan::to_value() const {
    Value ops = Value::array();
    for (const auto& op : operations) {
        Value entry = Value::object();
        entry["path"] = op.path;
        entry["action"] = to_string(op.action);
        entry["values"] = Value(op.values);
        if (op.resolution) {
            entry["resolution"] = *op.resolution;
        }
        ops.push_back(std::move(entry));
    }

    Value conflict_list = Value::array();
    for (const auto& c : conflicts) {
        Value entry = Value::object();
        entry["path"] = c.path;
        entry["values"] = Value(c.values);
        entry["suggestedResolution"] = c.suggested_resolution;
        conflict_list.push_back(std::move(entry));
    }

    Value out = Value::object();
    out["operations"] = std::move(ops);
    out["conflicts"] = std::move(conflict_list);
    return out;
}

MergePlan analyze_merge(const std::vector<Value>& sources, const MergeOptions& options) {
    using Locations = std::unordered_map<std::string, const Value*>;

    std::vector<std::string> order;
    std::unordered_set<std::string> seen;
    std::vector<Locations> per_source;
    per_source.reserve(sources.size());

    for (const auto& source : sources) {
        Locations locations;
        for (auto& entry : flatten(source)) {
            locations.emplace(entry.path, entry.value);
            if (seen.insert(entry.path).second) {
                order.push_back(std::move(entry.path));
            }
        }
        per_source.push_back(std::move(locations));
    }

    const ConflictResolver resolver(options.conflict_resolution, options.custom_mergers);
    MergePlan plan;

    for (const auto& path : order) {
        std::vector<Value> values;
        for (const auto& locations : per_source) {
            auto it = locations.find(path);
            if (it != locations.end()) {
                values.push_back(*it->second);
            }
        }

        if (values.empty()) {
            continue;
        }

        if (values.size() == 1) {
            plan.operations.push_back(PlanOperation{path, PlanAction::Add, std::move(values), std::nullopt});
        } else {
            const bool all_equal = std::all_of(
                values.begin() + 1, values.end(),
                [&](const Value& v) { return deep_equal(v, values.front()); });

            if (all_equal) {
                plan.operations.push_back(
                    PlanOperation{path, PlanAction::Update, {values.front()}, std::nullopt});
            } else {
                Value suggestion = resolver.suggest(path, values);
                plan.operations.push_back(PlanOperation{path, PlanAction::Conflict, values, suggestion});
                plan.conflicts.push_back(PlanConflict{path, std::move(values), std::move(suggestion)});
            }
        }

        if (options.transformers.count(path) > 0) {
            plan.operations.push_back(PlanOperation{path, PlanAction::Transform, {}, std::nullopt});
        }
    }

    return plan;
}

} // namespace datamerge
