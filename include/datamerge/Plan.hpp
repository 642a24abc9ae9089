/**
 * @file Plan.hpp
 * @brief Read-only merge preview
 *
 * A plan lists, for every path found in any source, what a merge would do
 * there. Nothing is merged and no source is modified.
 *
 * Classification of a path, given the values the sources hold there:
 * - no source has it: skipped
 * - one source has it: Add
 * - several, all deep-equal: Update, with one representative value
 * - several, not all equal: Conflict, with the resolution the configured
 *   policy would pick (the Error policy suggests the Override winner)
 * - a transformer is registered for it: an extra Transform operation
 */

#ifndef DATAMERGE_PLAN_HPP
#define DATAMERGE_PLAN_HPP

#include "datamerge/Options.hpp"
#include "datamerge/Value.hpp"

#include <optional>
#include <string>
#include <vector>

namespace datamerge {

enum class PlanAction {
    Add,
    Update,
    Conflict,
    Transform
};

std::string to_string(PlanAction action);

struct PlanOperation {
    std::string path;
    PlanAction action = PlanAction::Add;
    std::vector<Value> values;
    /// Set for Conflict operations only
    std::optional<Value> resolution;
};

struct PlanConflict {
    std::string path;
    std::vector<Value> values;
    Value suggested_resolution;
};

struct MergePlan {
    std::vector<PlanOperation> operations;
    std::vector<PlanConflict> conflicts;

    /**
     * @brief Serialize the plan
     *
     * ```json
     * {"operations": [{"path", "action", "values", "resolution"?}],
     *  "conflicts": [{"path", "values", "suggestedResolution"}]}
     * ```
     */
    Value to_value() const;
};

/**
 * @brief Build a plan for merging sources in order
 *
 * Paths are visited in first-seen order across the sources. Sources are
 * not filtered for null or emptiness; a null or scalar source simply
 * contributes no paths.
 *
 * Never throws for conflicts; exceptions thrown by a Custom-policy
 * resolver propagate.
 */
MergePlan analyze_merge(const std::vector<Value>& sources, const MergeOptions& options);

} // namespace datamerge

#endif // DATAMERGE_PLAN_HPP
