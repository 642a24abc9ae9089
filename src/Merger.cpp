/**
 * @file Merger.cpp
 * @brief Implementation of the merge engine
 */

#include "datamerge/Merger.hpp"
#include "datamerge/Dispatcher.hpp"
#include "datamerge/Errors.hpp"
#include "datamerge/Log.hpp"
#include "datamerge/Path.hpp"

#include <utility>

namespace datamerge {

namespace {

/**
 * @brief RULE M1
 */
std::vector<Value> filter_sources(const std::vector<Value>& sources, const MergeOptions& options) {
    std::vector<Value> kept;
    kept.reserve(sources.size());
    for (const auto& source : sources) {
        if (source.is_null()) {
            if (!options.ignore_null) {
                kept.push_back(source);
            }
            continue;
        }
        if (options.ignore_empty && is_empty_value(source)) {
            continue;
        }
        kept.push_back(source);
    }
    return kept;
}

/**
 * @brief RULE M4
 */
void run_validators(const Value& result, const MergeOptions& options, MergeMetadata& metadata) {
    for (const auto& [path, validator] : options.validators) {
        if (!validator) {
            continue;
        }
        try {
            const Value* found = get_by_path(result, path);
            const Value value = found ? *found : Value(nullptr);
            if (!validator(value, path)) {
                metadata.validation_errors.push_back("Validation failed for path: " + path);
            }
        } catch (const std::exception& e) {
            metadata.validation_errors.push_back("Validation error at " + path + ": " + e.what());
        } catch (...) {
            metadata.validation_errors.push_back("Validation error at " + path + ": Unknown error");
        }
    }
}

} // anonymous namespace

MergeResult DataMerger::merge(const std::vector<Value>& sources) const {
    return merge(sources, options_);
}

MergeResult DataMerger::merge(const std::vector<Value>& sources, const MergeOptions& options) const {
    MergeResult out;
    const std::vector<Value> valid = filter_sources(sources, options);
    out.metadata.source_count = valid.size();

    // RULE M2
    if (valid.empty()) {
        out.result = options.strategy == MergeStrategy::Array ? Value::array() : Value::object();
        DATAMERGE_DEBUG("no sources left to merge out of {}", sources.size());
        return out;
    }

    // RULE M3
    Dispatcher dispatcher(options, out.metadata);
    Value result = valid.front();
    try {
        for (std::size_t i = 1; i < valid.size(); ++i) {
            result = dispatcher.dispatch(result, valid[i], "");
        }
    } catch (const MergeConflictError& e) {
        DATAMERGE_ERROR("merge aborted: {}", e.what());
        throw;
    }

    if (!options.validators.empty()) {
        run_validators(result, options, out.metadata);
    }

    out.result = std::move(result);
    out.conflicts = dispatcher.take_conflicts();
    out.success = out.metadata.validation_errors.empty();

    DATAMERGE_DEBUG("merged {} sources: {} conflicts, {} paths, {} validation errors",
                    valid.size(), out.conflicts.size(), out.metadata.merged_paths.size(),
                    out.metadata.validation_errors.size());
    return out;
}

MergeResult DataMerger::merge(const std::vector<Value>& sources,
                              const OptionOverrides& overrides) const {
    return merge(sources, overrides.apply_to(options_));
}

Value DataMerger::merge_with(const Value& a, const Value& b, MergeStrategy strategy) const {
    return merge_with(a, b, strategy, options_);
}

Value DataMerger::merge_with(const Value& a, const Value& b, MergeStrategy strategy,
                             MergeOptions options) const {
    options.strategy = strategy;
    return merge({a, b}, options).result;
}

MergeResult DataMerger::merge_with_validation(const std::vector<Value>& sources,
                                              const Schema& schema) const {
    return merge_with_validation(sources, schema, options_);
}

MergeResult DataMerger::merge_with_validation(const std::vector<Value>& sources,
                                              const Schema& schema,
                                              MergeOptions options) const {
    for (const auto& [path, rule] : schema) {
        options.validators[path] = make_validator(rule);
    }
    return merge(sources, options);
}

MergePlan DataMerger::create_merge_plan(const std::vector<Value>& sources) const {
    return create_merge_plan(sources, options_);
}

MergePlan DataMerger::create_merge_plan(const std::vector<Value>& sources,
                                        const MergeOptions& options) const {
    MergePlan plan = analyze_merge(sources, options);
    DATAMERGE_DEBUG("planned {} operations with {} conflicts over {} sources",
                    plan.operations.size(), plan.conflicts.size(), sources.size());
    return plan;
}

std::future<MergeResult> DataMerger::merge_async(std::vector<Value> sources) const {
    return merge_async(std::move(sources), options_);
}

std::future<MergeResult> DataMerger::merge_async(std::vector<Value> sources,
                                                 MergeOptions options) const {
    return std::async(std::launch::async,
                      [engine = *this, sources = std::move(sources), options = std::move(options)]() {
                          return engine.merge(sources, options);
                      });
}

std::future<MergePlan> DataMerger::create_merge_plan_async(std::vector<Value> sources,
                                                           MergeOptions options) const {
    return std::async(std::launch::async,
                      [engine = *this, sources = std::move(sources), options = std::move(options)]() {
                          return engine.create_merge_plan(sources, options);
                      });
}

void DataMerger::register_custom_merger(const std::string& path, CustomMerger merger) {
    options_.custom_mergers[path] = std::move(merger);
    DATAMERGE_DEBUG("registered custom merger for path: {}", path);
}

void DataMerger::register_key_mapping(const std::string& from_key, const std::string& to_key) {
    options_.key_mappings[from_key] = to_key;
    DATAMERGE_DEBUG("registered key mapping: {} -> {}", from_key, to_key);
}

void DataMerger::register_transformer(const std::string& path, Transformer transformer) {
    options_.transformers[path] = std::move(transformer);
    DATAMERGE_DEBUG("registered transformer for path: {}", path);
}

void DataMerger::register_validator(const std::string& path, Validator validator) {
    options_.validators[path] = std::move(validator);
    DATAMERGE_DEBUG("registered validator for path: {}", path);
}

void DataMerger::register_conflict_resolver(const std::string& path, CustomMerger resolver) {
    register_custom_merger(kConflictResolverPrefix + path, std::move(resolver));
}

} // namespace datamerge
