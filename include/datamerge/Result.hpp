/**
 * @file Result.hpp
 * @brief Result envelope returned by a merge
 */

#ifndef DATAMERGE_RESULT_HPP
#define DATAMERGE_RESULT_HPP

#include "datamerge/ConflictResolver.hpp"
#include "datamerge/Value.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace datamerge {

/**
 * @brief Statistics and soft failures collected during a merge
 */
struct MergeMetadata {
    /// Sources that survived null/empty filtering
    std::size_t source_count = 0;
    /// Every object key path, array path and custom-merged path visited
    std::set<std::string> merged_paths;
    /// Paths whose merged value went through a transformer
    std::set<std::string> transformed_paths;
    /// One message per failed or throwing validator
    std::vector<std::string> validation_errors;
};

/**
 * @brief Outcome of a completed merge
 *
 * success is false iff a validator failed; result still holds the merged
 * value in that case.
 */
struct MergeResult {
    bool success = true;
    Value result;
    std::vector<Conflict> conflicts;
    MergeMetadata metadata;

    /**
     * @brief Serialize the envelope
     *
     * Shape:
     * ```json
     * {"success": true, "result": ..., "conflicts": [{"path","values","resolved"}],
     *  "metadata": {"sourceCount", "mergedProperties", "transformedProperties",
     *               "conflictCount", "mergedPaths", "transformedPaths",
     *               "validationErrors"}}
     * ```
     */
    Value to_value() const;
};

} // namespace datamerge

#endif // DATAMERGE_RESULT_HPP
