/**
 * @file ConflictResolver.hpp
 * @brief Conflict resolution policies and the conflict audit trail
 *
 * Resolution table (values are in source order):
 * - Override, New: last value
 * - Preserve, Original: first value
 * - Error: throw MergeConflictError (suggest() answers like Override)
 * - Array: all values as an array
 * - Concat: text of every value joined, strings without quotes
 * - Sum: sum of the number-typed values; other values are skipped
 * - Average: mean of the number-typed values, 0 if there are none
 * - Min / Max: pairwise reduction; numbers compare numerically, strings
 *              lexicographically, anything else never replaces the
 *              running result
 * - Custom: merger registered under "conflict:<path>", else Override
 */

#ifndef DATAMERGE_CONFLICT_RESOLVER_HPP
#define DATAMERGE_CONFLICT_RESOLVER_HPP

#include "datamerge/Options.hpp"
#include "datamerge/Value.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace datamerge {

/**
 * @brief One reconciled conflict
 *
 * Recorded for every conflict, including those a policy settles
 * deterministically, so the list is a full audit trail.
 */
struct Conflict {
    std::string path;
    std::vector<Value> values;
    Value resolved;

    Value to_value() const;
};

/**
 * @brief Numeric sum of the number-typed entries
 *
 * Integer-only input yields an integer; any float, an unsigned value
 * above INT64_MAX or a running sum leaving the int64 range makes the
 * result a float.
 *
 * Example: [1, "2", 3] → 4
 */
Value sum_numbers(const std::vector<Value>& values);

/**
 * @brief Mean of the number-typed entries, or 0 if there are none
 *
 * Example: [1, "2", 3] → 2.0
 */
Value average_numbers(const std::vector<Value>& values);

/**
 * @brief Smallest / largest value under the Min / Max ordering
 *
 * Returns null for an empty list.
 */
Value min_value(const std::vector<Value>& values);
Value max_value(const std::vector<Value>& values);

/**
 * @brief Applies one policy and records what it decided
 *
 * The resolver borrows the custom merger registry; it must outlive the
 * resolver.
 */
class ConflictResolver {
public:
    ConflictResolver(ConflictResolution policy,
                     const std::map<std::string, CustomMerger>& custom_mergers)
        : policy_(policy)
        , custom_mergers_(&custom_mergers)
    {}

    /**
     * @brief Resolve a conflict and append it to conflicts()
     *
     * @param path Where the conflict occurred
     * @param values Conflicting values in source order (at least one)
     * @return The resolved value
     * @throws MergeConflictError under the Error policy
     */
    Value resolve(const std::string& path, std::vector<Value> values);

    /**
     * @brief Compute what resolve() would pick, without recording or throwing
     *
     * The Error policy suggests the Override winner. A Custom resolver is
     * still invoked.
     */
    Value suggest(const std::string& path, const std::vector<Value>& values) const;

    const std::vector<Conflict>& conflicts() const noexcept {
        return conflicts_;
    }

    std::vector<Conflict> take_conflicts() noexcept {
        std::vector<Conflict> out;
        out.swap(conflicts_);
        return out;
    }

    ConflictResolution policy() const noexcept {
        return policy_;
    }

private:
    Value apply(const std::string& path, const std::vector<Value>& values) const;

    ConflictResolution policy_;
    const std::map<std::string, CustomMerger>* custom_mergers_;
    std::vector<Conflict> conflicts_;
};

} // namespace datamerge

#endif // DATAMERGE_CONFLICT_RESOLVER_HPP
