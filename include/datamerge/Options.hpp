/**
 * @file Options.hpp
 * @brief Merge policies and the options bundle passed to every merge
 *
 * Three independent policy axes:
 * - MergeStrategy: overall merge shape; decides the empty result
 * - ConflictResolution: how two differing values at one path are reconciled
 * - ArrayMerge: how two arrays at one path are combined
 *
 * Extension points (custom mergers, transformers, validators) and key
 * mappings are keyed by path text exactly as built by Path.hpp.
 */

#ifndef DATAMERGE_OPTIONS_HPP
#define DATAMERGE_OPTIONS_HPP

#include "datamerge/Value.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace datamerge {

enum class MergeStrategy {
    Append,
    Merge,
    Replace,
    Join,
    Deep,
    Array
};

enum class ConflictResolution {
    Original,
    New,
    Custom,
    Override,
    Preserve,
    Error,
    Array,
    Concat,
    Sum,
    Average,
    Min,
    Max
};

/**
 * @brief Array merge algorithm
 *
 * Replace, Merge and Unique are accepted names with no algorithm of their
 * own; they merge like Concat.
 */
enum class ArrayMerge {
    Concat,
    Replace,
    Merge,
    Unique,
    Union,
    Intersection,
    Override,
    Combine,
    Zip
};

/// Merges the values found at one path: (values, path) -> merged value
using CustomMerger = std::function<Value(const std::vector<Value>&, const std::string&)>;

/// Rewrites the merged value at one path: (value, path) -> new value
using Transformer = std::function<Value(const Value&, const std::string&)>;

/// Checks the merged value at one path: (value, path) -> valid
using Validator = std::function<bool(const Value&, const std::string&)>;

/**
 * @brief Everything that controls a single merge or plan
 *
 * Default-constructed options carry the documented defaults.
 */
struct MergeOptions {
    MergeStrategy strategy = MergeStrategy::Deep;
    ConflictResolution conflict_resolution = ConflictResolution::Override;
    ArrayMerge array_merge = ArrayMerge::Concat;
    bool preserve_order = true;
    bool remove_duplicates = true;
    bool ignore_null = true;
    bool ignore_empty = false;

    /// Path -> merger. "conflict:<path>" entries serve the Custom policy.
    std::map<std::string, CustomMerger> custom_mergers;
    /// Second-object key -> first-object key
    std::map<std::string, std::string> key_mappings;
    std::map<std::string, Transformer> transformers;
    std::map<std::string, Validator> validators;
};

/**
 * @brief Per-call changes layered over an engine's options
 *
 * Unset policy fields keep the engine's value. Registry entries are added
 * to the engine's, replacing entries with the same key.
 *
 * Example:
 * ```cpp
 * OptionOverrides o;
 * o.conflict_resolution = ConflictResolution::Sum;
 * create_config_merger().merge(sources, o);  // preset mergers still apply
 * ```
 */
struct OptionOverrides {
    std::optional<MergeStrategy> strategy;
    std::optional<ConflictResolution> conflict_resolution;
    std::optional<ArrayMerge> array_merge;
    std::optional<bool> preserve_order;
    std::optional<bool> remove_duplicates;
    std::optional<bool> ignore_null;
    std::optional<bool> ignore_empty;

    std::map<std::string, CustomMerger> custom_mergers;
    std::map<std::string, std::string> key_mappings;
    std::map<std::string, Transformer> transformers;
    std::map<std::string, Validator> validators;

    /// base with these overrides applied
    MergeOptions apply_to(MergeOptions base) const;
};

/// Prefix under which Custom-policy conflict resolvers are registered
inline const std::string kConflictResolverPrefix = "conflict:";

// ============================================================================
// Enum <-> text
// ============================================================================

std::string to_string(MergeStrategy strategy);
std::string to_string(ConflictResolution resolution);
std::string to_string(ArrayMerge array_merge);

/**
 * @brief Parse a policy name, returning nullopt for unknown text
 *
 * Names are the lowercase spellings used by to_string() ("deep",
 * "override", "union", ...), matched case-insensitively.
 */
std::optional<MergeStrategy> try_parse_strategy(const std::string& text);
std::optional<ConflictResolution> try_parse_conflict_resolution(const std::string& text);
std::optional<ArrayMerge> try_parse_array_merge(const std::string& text);

/**
 * @brief Parse a policy name, falling back to the default for unknown text
 *
 * Unknown names fall back to Deep / Override / Concat and log a warning.
 */
MergeStrategy parse_strategy(const std::string& text);
ConflictResolution parse_conflict_resolution(const std::string& text);
ArrayMerge parse_array_merge(const std::string& text);

// ============================================================================
// Options documents
// ============================================================================

/**
 * @brief Apply an options document on top of existing options
 *
 * Recognised keys (snake_case or camelCase):
 * - strategy, conflict_resolution, array_merge: policy names
 * - preserve_order, remove_duplicates, ignore_null, ignore_empty: booleans
 * - key_mappings: object of string -> string
 *
 * Keys absent from the document leave `base` untouched. Extension
 * functions cannot be expressed in a document and are kept from `base`.
 *
 * @param doc Options object (e.g. parsed from JSON or TOML)
 * @param base Options to start from
 * @return Updated options
 * @throws OptionsError if doc is not an object, a key is unknown, or a
 *         value has the wrong type
 *
 * Example:
 * ```cpp
 * Value doc = {{"conflict_resolution", "sum"}, {"array_merge", "union"}};
 * auto opts = options_from_value(doc);
 * // opts.conflict_resolution == ConflictResolution::Sum
 * ```
 */
MergeOptions options_from_value(const Value& doc, MergeOptions base = MergeOptions{});

/**
 * @brief Serialize the document-expressible part of options
 *
 * Produces the snake_case form accepted by options_from_value().
 */
Value options_to_value(const MergeOptions& options);

/**
 * @brief Load an options document from a .json or .toml file
 *
 * @throws FileNotFoundError, SourceParseError, OptionsError
 */
MergeOptions load_options_file(const std::string& path, MergeOptions base = MergeOptions{});

} // namespace datamerge

#endif // DATAMERGE_OPTIONS_HPP
