/**
 * @file Dispatcher.hpp
 * @brief Recursive two-value merge
 *
 * dispatch(v1, v2, path) decides, in order:
 * 1. A custom merger registered for path gets [v1, v2] and its result is
 *    returned as-is, nulls included.
 * 2. If exactly one side is null, the other side is returned.
 * 3. Different shapes (object vs string, array vs number, ...) are a
 *    conflict and go to the ConflictResolver.
 * 4. Objects merge key by key, arrays through merge_arrays(), equal
 *    scalars return the shared value, unequal scalars are a conflict.
 *
 * Object merge:
 * - key_mappings rename the second object's keys before matching, so a
 *   renamed key meets the first object's key of the new name
 * - keys present on one side only are copied without a conflict
 * - a transformer registered for a key's path rewrites the merged value
 * - every key path visited lands in merged_paths
 */

#ifndef DATAMERGE_DISPATCHER_HPP
#define DATAMERGE_DISPATCHER_HPP

#include "datamerge/ConflictResolver.hpp"
#include "datamerge/Options.hpp"
#include "datamerge/Result.hpp"
#include "datamerge/Value.hpp"

#include <string>
#include <vector>

namespace datamerge {

/**
 * @brief Merges value pairs under one set of options
 *
 * A Dispatcher lives for one merge call. It borrows the options and the
 * metadata it fills in; both must outlive it.
 */
class Dispatcher {
public:
    Dispatcher(const MergeOptions& options, MergeMetadata& metadata)
        : options_(options)
        , metadata_(metadata)
        , resolver_(options.conflict_resolution, options.custom_mergers)
    {}

    /**
     * @brief Merge v2 into v1 at path
     * @throws MergeConflictError under the Error policy
     */
    Value dispatch(const Value& v1, const Value& v2, const std::string& path);

    const std::vector<Conflict>& conflicts() const noexcept {
        return resolver_.conflicts();
    }

    std::vector<Conflict> take_conflicts() noexcept {
        return resolver_.take_conflicts();
    }

private:
    Value merge_objects(const Value& obj1, const Value& obj2, const std::string& base);
    Value merge_array_values(const Value& arr1, const Value& arr2, const std::string& path);

    const MergeOptions& options_;
    MergeMetadata& metadata_;
    ConflictResolver resolver_;
};

} // namespace datamerge

#endif // DATAMERGE_DISPATCHER_HPP
