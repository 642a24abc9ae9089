/**
 * @file Merger.hpp
 * @brief Merge engine: folds sources into one value
 *
 * Merge rules:
 * - RULE M1: Null sources are dropped unless ignore_null is false; empty
 *            sources (empty array/object, blank string) are dropped when
 *            ignore_empty is true
 * - RULE M2: With nothing left, the result is [] for the Array strategy
 *            and {} otherwise, with no conflicts
 * - RULE M3: Sources fold left to right: result = dispatch(result, next).
 *            Not commutative: under Override the last source wins, under
 *            Preserve the first
 * - RULE M4: Validators run on the folded result; a false return or any
 *            thrown exception is recorded and clears success, the merged
 *            value is still returned
 * - RULE M5: The Error policy aborts with MergeConflictError; no result
 *
 * Example:
 * ```cpp
 * DataMerger merger;
 * auto res = merger.merge({Value{{"a", 1}}, Value{{"b", 2}}});
 * // res.result == {"a": 1, "b": 2}, res.conflicts.empty()
 *
 * MergeOptions opts = merger.options();
 * opts.array_merge = ArrayMerge::Union;
 * auto u = merger.merge({Value{1, 2, 3}, Value{2, 3, 4}}, opts);
 * // u.result == [1, 2, 3, 4]
 * ```
 */

#ifndef DATAMERGE_MERGER_HPP
#define DATAMERGE_MERGER_HPP

#include "datamerge/Options.hpp"
#include "datamerge/Plan.hpp"
#include "datamerge/Result.hpp"
#include "datamerge/Validation.hpp"
#include "datamerge/Value.hpp"

#include <future>
#include <string>
#include <utility>
#include <vector>

namespace datamerge {

/**
 * @brief Configured merge engine
 *
 * The engine owns its default options, extension registries included.
 * Registration is configuration: do it before merging, not while a merge
 * (including an async one) is running. Per-call options replace the
 * defaults wholesale; pass OptionOverrides to layer changes over them.
 */
class DataMerger {
public:
    DataMerger() = default;
    explicit DataMerger(MergeOptions defaults) : options_(std::move(defaults)) {}

    /**
     * @brief Merge sources using the engine's options
     * @throws MergeConflictError under the Error policy
     */
    MergeResult merge(const std::vector<Value>& sources) const;

    /**
     * @brief Merge sources using the given options
     * @throws MergeConflictError under the Error policy
     */
    MergeResult merge(const std::vector<Value>& sources, const MergeOptions& options) const;

    /**
     * @brief Merge sources using the engine's options with overrides applied
     *
     * Registered extensions stay in effect unless an override replaces them.
     * @throws MergeConflictError under the Error policy
     */
    MergeResult merge(const std::vector<Value>& sources, const OptionOverrides& overrides) const;

    /**
     * @brief Merge two values with a strategy, returning only the value
     */
    Value merge_with(const Value& a, const Value& b, MergeStrategy strategy) const;
    Value merge_with(const Value& a, const Value& b, MergeStrategy strategy,
                     MergeOptions options) const;

    /**
     * @brief Merge with validators compiled from schema rules
     *
     * Schema validators are added to (and for the same path replace) the
     * validators already in the options.
     */
    MergeResult merge_with_validation(const std::vector<Value>& sources,
                                      const Schema& schema) const;
    MergeResult merge_with_validation(const std::vector<Value>& sources,
                                      const Schema& schema,
                                      MergeOptions options) const;

    /**
     * @brief Preview a merge without performing it
     *
     * Never throws for conflicts, whatever the policy.
     */
    MergePlan create_merge_plan(const std::vector<Value>& sources) const;
    MergePlan create_merge_plan(const std::vector<Value>& sources,
                                const MergeOptions& options) const;

    /**
     * @brief Run merge() on another thread
     *
     * The task works on a copy of the engine, so the engine may be
     * destroyed before the future is ready. Extension functions run on
     * the worker thread.
     */
    std::future<MergeResult> merge_async(std::vector<Value> sources) const;
    std::future<MergeResult> merge_async(std::vector<Value> sources, MergeOptions options) const;

    /**
     * @brief Run create_merge_plan() on another thread
     */
    std::future<MergePlan> create_merge_plan_async(std::vector<Value> sources,
                                                   MergeOptions options) const;

    // Registration

    void register_custom_merger(const std::string& path, CustomMerger merger);
    void register_key_mapping(const std::string& from_key, const std::string& to_key);
    void register_transformer(const std::string& path, Transformer transformer);
    void register_validator(const std::string& path, Validator validator);

    /**
     * @brief Register the resolver used by the Custom policy at path
     *
     * Stored among the custom mergers as "conflict:<path>".
     */
    void register_conflict_resolver(const std::string& path, CustomMerger resolver);

    const MergeOptions& options() const noexcept { return options_; }
    MergeOptions& options() noexcept { return options_; }

private:
    MergeOptions options_;
};

} // namespace datamerge

#endif // DATAMERGE_MERGER_HPP
