/**
 * @file Presets.hpp
 * @brief Ready-configured engines for common merge jobs
 *
 * Each factory returns a new engine; nothing shared is modified, so two
 * engines from the same factory are independent.
 */

#ifndef DATAMERGE_PRESETS_HPP
#define DATAMERGE_PRESETS_HPP

#include "datamerge/Merger.hpp"
#include "datamerge/Value.hpp"

#include <string>
#include <vector>

namespace datamerge {

/**
 * @brief Engine for layered application configuration
 *
 * Custom mergers:
 * - "database.connectionPool": merge_connection_pools()
 * - "api.headers": merge_headers()
 * - "features.enabled": merge_feature_flags()
 */
DataMerger create_config_merger();

/**
 * @brief Engine for tabular data
 *
 * array_merge = Combine, conflict_resolution = Override,
 * preserve_order = true, and "rows" merged by merge_rows_by_identity().
 */
DataMerger create_table_merger();

/**
 * @brief Connection pool bounds: largest min and max, smallest idle
 *
 * Missing, zero or non-numeric fields count as min 0, max 10 and
 * idle 10000; non-object values count as {}.
 *
 * Example: [{min:2, max:20, idle:5000}, {min:5, max:8}]
 *          → {min:5, max:20, idle:5000}
 */
Value merge_connection_pools(const std::vector<Value>& values, const std::string& path);

/**
 * @brief Shallow union of header maps; later values win
 *
 * Non-object values are skipped.
 */
Value merge_headers(const std::vector<Value>& values, const std::string& path);

/**
 * @brief true iff any value is the boolean true
 */
Value merge_feature_flags(const std::vector<Value>& values, const std::string& path);

/**
 * @brief Union of row arrays keyed by identity
 *
 * A row's identity is its first truthy "id", "_id" or "key" field. Rows
 * sharing an identity are shallow-merged (later fields win) into the
 * position of the first. Rows without an identity and non-array values
 * are dropped.
 */
Value merge_rows_by_identity(const std::vector<Value>& values, const std::string& path);

} // namespace datamerge

#endif // DATAMERGE_PRESETS_HPP
