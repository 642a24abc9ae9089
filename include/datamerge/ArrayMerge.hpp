/**
 * @file ArrayMerge.hpp
 * @brief Algorithms for merging two arrays found at the same path
 *
 * Strategies (ArrayMerge):
 * - Concat: a then b, duplicates kept
 * - Union: a, then each element of b not deep-equal to one already kept
 * - Intersection: elements of a deep-equal to some element of b
 * - Override: b
 * - Combine: element-wise merge by index; the longer array's tail is kept
 * - Zip: [a[i], b[i]] pairs, [x] for the ragged tail
 * - Replace, Merge, Unique: merge like Concat
 *
 * Post-processing, in this order, after every strategy but Intersection:
 * - remove_duplicates: keep the first element of each identity key
 * - preserve_order (Union only): reorder to a's order, then b's
 */

#ifndef DATAMERGE_ARRAY_MERGE_HPP
#define DATAMERGE_ARRAY_MERGE_HPP

#include "datamerge/Options.hpp"
#include "datamerge/Value.hpp"

#include <functional>
#include <string>

namespace datamerge {

/// Merges two elements at a path: (a, b, path) -> merged element
using ElementMerger = std::function<Value(const Value&, const Value&, const std::string&)>;

Value concat_arrays(const Value& a, const Value& b);

/**
 * @brief Union by deep equality, first-seen order
 *
 * Example: [1,2,3] ∪ [2,3,4] → [1,2,3,4]
 */
Value union_arrays(const Value& a, const Value& b);

/**
 * @brief Elements of a that deep-equal some element of b
 *
 * Duplicates in a are kept. Example: [1,2,3] ∩ [2,3,4] → [2,3]
 */
Value intersect_arrays(const Value& a, const Value& b);

/**
 * @brief Index-paired sub-arrays
 *
 * Example: zip([1,2,3], ["a"]) → [[1,"a"],[2],[3]]
 */
Value zip_arrays(const Value& a, const Value& b);

/**
 * @brief Element-wise merge by index
 *
 * Paired elements are merged with merge_element using the path
 * "<base>[i]". Elements past the shorter array's end are copied.
 */
Value combine_arrays(const Value& a, const Value& b, const std::string& base,
                     const ElementMerger& merge_element);

/**
 * @brief Drop elements whose identity key was already seen
 *
 * Keeps the first occurrence. See identity_key() in Equality.hpp.
 */
Value remove_duplicates(const Value& arr);

/**
 * @brief Reorder merged elements to follow their source arrays
 *
 * Walks a, then b, and for each element takes the first not-yet-taken
 * deep-equal element of merged. Elements of merged matching neither
 * source are dropped.
 */
Value preserve_original_order(const Value& merged, const Value& a, const Value& b);

/**
 * @brief Apply the configured strategy and post-processing
 *
 * @param a First array (earlier source)
 * @param b Second array (later source)
 * @param path Path of the arrays, used to build element paths for Combine
 * @param options Supplies array_merge, remove_duplicates, preserve_order
 * @param merge_element Used by Combine only
 */
Value merge_arrays(const Value& a, const Value& b, const std::string& path,
                   const MergeOptions& options, const ElementMerger& merge_element);

} // namespace datamerge

#endif // DATAMERGE_ARRAY_MERGE_HPP
