/**
 * @file Options.cpp
 * @brief Implementation of policy names and options documents
 */

#include "datamerge/Options.hpp"
#include "datamerge/Errors.hpp"
#include "datamerge/Loader.hpp"
#include "datamerge/Log.hpp"
#include "datamerge/Util.hpp"

#include <cctype>
#include <utility>

namespace datamerge {

namespace {

const std::pair<MergeStrategy, const char*> kStrategyNames[] = {
    {MergeStrategy::Append, "append"},
    {MergeStrategy::Merge, "merge"},
    {MergeStrategy::Replace, "replace"},
    {MergeStrategy::Join, "join"},
    {MergeStrategy::Deep, "deep"},
    {MergeStrategy::Array, "array"},
};

const std::pair<ConflictResolution, const char*> kResolutionNames[] = {
    {ConflictResolution::Original, "original"},
    {ConflictResolution::New, "new"},
    {ConflictResolution::Custom, "custom"},
    {ConflictResolution::Override, "override"},
    {ConflictResolution::Preserve, "preserve"},
    {ConflictResolution::Error, "error"},
    {ConflictResolution::Array, "array"},
    {ConflictResolution::Concat, "concat"},
    {ConflictResolution::Sum, "sum"},
    {ConflictResolution::Average, "average"},
    {ConflictResolution::Min, "min"},
    {ConflictResolution::Max, "max"},
};

const std::pair<ArrayMerge, const char*> kArrayMergeNames[] = {
    {ArrayMerge::Concat, "concat"},
    {ArrayMerge::Replace, "replace"},
    {ArrayMerge::Merge, "merge"},
    {ArrayMerge::Unique, "unique"},
    {ArrayMerge::Union, "union"},
    {ArrayMerge::Intersection, "intersection"},
    {ArrayMerge::Override, "override"},
    {ArrayMerge::Combine, "combine"},
    {ArrayMerge::Zip, "zip"},
};

template <typename E, std::size_t N>
std::string name_of(const std::pair<E, const char*> (&table)[N], E value) {
    for (const auto& entry : table) {
        if (entry.first == value) {
            return entry.second;
        }
    }
    return "unknown";
}

template <typename E, std::size_t N>
std::optional<E> lookup(const std::pair<E, const char*> (&table)[N], const std::string& text) {
    const std::string lower = to_lower(text);
    for (const auto& entry : table) {
        if (lower == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

/**
 * @brief Canonical snake_case spelling of an options document key
 */
std::string normalize_key(const std::string& key) {
    std::string out;
    for (char c : key) {
        if (std::isupper(static_cast<unsigned char>(c))) {
            out += '_';
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            out += c;
        }
    }
    return out;
}

bool require_bool(const std::string& key, const Value& val) {
    if (!val.is_boolean()) {
        throw OptionsError(key, "expected boolean, got " + type_name(val));
    }
    return val.get<bool>();
}

std::string require_string(const std::string& key, const Value& val) {
    if (!val.is_string()) {
        throw OptionsError(key, "expected string, got " + type_name(val));
    }
    return val.get<std::string>();
}

} // anonymous namespace

std::string to_string(MergeStrategy strategy) {
    return name_of(kStrategyNames, strategy);
}

std::string to_string(ConflictResolution resolution) {
    return name_of(kResolutionNames, resolution);
}

std::string to_string(ArrayMerge array_merge) {
    return name_of(kArrayMergeNames, array_merge);
}

std::optional<MergeStrategy> try_parse_strategy(const std::string& text) {
    return lookup(kStrategyNames, text);
}

std::optional<ConflictResolution> try_parse_conflict_resolution(const std::string& text) {
    return lookup(kResolutionNames, text);
}

std::optional<ArrayMerge> try_parse_array_merge(const std::string& text) {
    return lookup(kArrayMergeNames, text);
}

MergeStrategy parse_strategy(const std::string& text) {
    if (auto parsed = try_parse_strategy(text)) {
        return *parsed;
    }
    DATAMERGE_WARN("unknown merge strategy '{}', using deep", text);
    return MergeStrategy::Deep;
}

ConflictResolution parse_conflict_resolution(const std::string& text) {
    if (auto parsed = try_parse_conflict_resolution(text)) {
        return *parsed;
    }
    DATAMERGE_WARN("unknown conflict resolution '{}', using override", text);
    return ConflictResolution::Override;
}

ArrayMerge parse_array_merge(const std::string& text) {
    if (auto parsed = try_parse_array_merge(text)) {
        return *parsed;
    }
    DATAMERGE_WARN("unknown array merge '{}', using concat", text);
    return ArrayMerge::Concat;
}

MergeOptions OptionOverrides::apply_to(MergeOptions base) const {
    if (strategy) base.strategy = *strategy;
    if (conflict_resolution) base.conflict_resolution = *conflict_resolution;
    if (array_merge) base.array_merge = *array_merge;
    if (preserve_order) base.preserve_order = *preserve_order;
    if (remove_duplicates) base.remove_duplicates = *remove_duplicates;
    if (ignore_null) base.ignore_null = *ignore_null;
    if (ignore_empty) base.ignore_empty = *ignore_empty;

    for (const auto& [path, merger] : custom_mergers) base.custom_mergers[path] = merger;
    for (const auto& [from, to] : key_mappings) base.key_mappings[from] = to;
    for (const auto& [path, transformer] : transformers) base.transformers[path] = transformer;
    for (const auto& [path, validator] : validators) base.validators[path] = validator;
    return base;
}

MergeOptions options_from_value(const Value& doc, MergeOptions base) {
    if (!doc.is_object()) {
        throw OptionsError("<root>", "expected object, got " + type_name(doc));
    }

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const std::string key = normalize_key(it.key());
        const Value& val = it.value();

        if (key == "strategy") {
            base.strategy = parse_strategy(require_string(it.key(), val));
        } else if (key == "conflict_resolution") {
            base.conflict_resolution = parse_conflict_resolution(require_string(it.key(), val));
        } else if (key == "array_merge") {
            base.array_merge = parse_array_merge(require_string(it.key(), val));
        } else if (key == "preserve_order") {
            base.preserve_order = require_bool(it.key(), val);
        } else if (key == "remove_duplicates") {
            base.remove_duplicates = require_bool(it.key(), val);
        } else if (key == "ignore_null") {
            base.ignore_null = require_bool(it.key(), val);
        } else if (key == "ignore_empty") {
            base.ignore_empty = require_bool(it.key(), val);
        } else if (key == "key_mappings") {
            if (!val.is_object()) {
                throw OptionsError(it.key(), "expected object, got " + type_name(val));
            }
            for (auto m = val.begin(); m != val.end(); ++m) {
                base.key_mappings[m.key()] = require_string(it.key() + "." + m.key(), m.value());
            }
        } else {
            throw OptionsError(it.key(), "unknown option");
        }
    }

    return base;
}

Value options_to_value(const MergeOptions& options) {
    Value doc = Value::object();
    doc["strategy"] = to_string(options.strategy);
    doc["conflict_resolution"] = to_string(options.conflict_resolution);
    doc["array_merge"] = to_string(options.array_merge);
    doc["preserve_order"] = options.preserve_order;
    doc["remove_duplicates"] = options.remove_duplicates;
    doc["ignore_null"] = options.ignore_null;
    doc["ignore_empty"] = options.ignore_empty;

    Value mappings = Value::object();
    for (const auto& [from, to] : options.key_mappings) {
        mappings[from] = to;
    }
    doc["key_mappings"] = mappings;
    return doc;
}

MergeOptions load_options_file(const std::string& path, MergeOptions base) {
    return options_from_value(load_source_file(path), std::move(base));
}

} // namespace datamerge
