/**
 * @file Result.cpp
 * @brief Serialization of merge result envelopes
 */

#include "datamerge/Result.hpp"

namespace datamerge {

Value MergeResult::to_value() const {
    Value conflict_list = Value::array();
    for (const auto& c : conflicts) {
        conflict_list.push_back(c.to_value());
    }

    Value meta = Value::object();
    meta["sourceCount"] = metadata.source_count;
    meta["mergedProperties"] = metadata.merged_paths.size();
    meta["transformedProperties"] = metadata.transformed_paths.size();
    meta["conflictCount"] = conflicts.size();
    meta["mergedPaths"] = Value(metadata.merged_paths);
    meta["transformedPaths"] = Value(metadata.transformed_paths);
    meta["validationErrors"] = Value(metadata.validation_errors);

    Value out = Value::object();
    out["success"] = success;
    out["result"] = result;
    out["conflicts"] = std::move(conflict_list);
    out["metadata"] = std::move(meta);
    return out;
}

} // namespace datamerge
