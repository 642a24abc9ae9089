/**
 * @file test_plan.cpp
 * @brief Tests for merge plans (GoogleTest)
 */

#include <gtest/gtest.h>
#include "datamerge/Merger.hpp"
#include "datamerge/Plan.hpp"

using namespace datamerge;

// ============================================================================
// Classification
// ============================================================================

class PlanTest : public ::testing::Test {
protected:
    std::vector<Value> sources = {
        Value{{"a", 1}, {"b", {{"c", 1}}}},
        Value{{"a", 2}, {"b", {{"c", 1}}}, {"d", 3}}
    };
};

TEST_F(PlanTest, OperationsInFirstSeenOrder) {
    MergePlan plan = analyze_merge(sources, MergeOptions{});
    ASSERT_EQ(plan.operations.size(), 4u);

    EXPECT_EQ(plan.operations[0].path, "a");
    EXPECT_EQ(plan.operations[0].action, PlanAction::Conflict);
    EXPECT_EQ(plan.operations[1].path, "b");
    EXPECT_EQ(plan.operations[1].action, PlanAction::Update);
    EXPECT_EQ(plan.operations[2].path, "b.c");
    EXPECT_EQ(plan.operations[2].action, PlanAction::Update);
    EXPECT_EQ(plan.operations[3].path, "d");
    EXPECT_EQ(plan.operations[3].action, PlanAction::Add);
}

TEST_F(PlanTest, UpdateCarriesOneValue) {
    MergePlan plan = analyze_merge(sources, MergeOptions{});
    ASSERT_EQ(plan.operations[2].values.size(), 1u);
    EXPECT_EQ(plan.operations[2].values[0], 1);
    EXPECT_FALSE(plan.operations[2].resolution.has_value());
}

TEST_F(PlanTest, ConflictCarriesSuggestion) {
    MergePlan plan = analyze_merge(sources, MergeOptions{});
    ASSERT_EQ(plan.conflicts.size(), 1u);
    EXPECT_EQ(plan.conflicts[0].path, "a");
    EXPECT_EQ(plan.conflicts[0].values.size(), 2u);
    EXPECT_EQ(plan.conflicts[0].suggested_resolution, 2);
    ASSERT_TRUE(plan.operations[0].resolution.has_value());
    EXPECT_EQ(*plan.operations[0].resolution, 2);
}

TEST_F(PlanTest, SuggestionFollowsPolicy) {
    MergeOptions options;
    options.conflict_resolution = ConflictResolution::Preserve;
    EXPECT_EQ(analyze_merge(sources, options).conflicts[0].suggested_resolution, 1);

    options.conflict_resolution = ConflictResolution::Sum;
    EXPECT_EQ(analyze_merge(sources, options).conflicts[0].suggested_resolution, 3);
}

TEST_F(PlanTest, ErrorPolicyDoesNotThrow) {
    MergeOptions options;
    options.conflict_resolution = ConflictResolution::Error;
    MergePlan plan;
    EXPECT_NO_THROW(plan = analyze_merge(sources, options));
    ASSERT_EQ(plan.conflicts.size(), 1u);
    EXPECT_EQ(plan.conflicts[0].suggested_resolution, 2);
}

TEST_F(PlanTest, TransformOperationAdded) {
    MergeOptions options;
    options.transformers["d"] = [](const Value& v, const std::string&) { return v; };
    MergePlan plan = analyze_merge(sources, options);
    ASSERT_EQ(plan.operations.size(), 5u);
    EXPECT_EQ(plan.operations[4].path, "d");
    EXPECT_EQ(plan.operations[4].action, PlanAction::Transform);
    EXPECT_TRUE(plan.operations[4].values.empty());
}

TEST_F(PlanTest, SourcesUntouched) {
    const std::vector<Value> before = sources;
    analyze_merge(sources, MergeOptions{});
    EXPECT_EQ(sources, before);
}

// ============================================================================
// Edge cases
// ============================================================================

TEST(PlanEdges, NoSources) {
    MergePlan plan = analyze_merge({}, MergeOptions{});
    EXPECT_TRUE(plan.operations.empty());
    EXPECT_TRUE(plan.conflicts.empty());
}

TEST(PlanEdges, NullAndScalarSourcesContributeNothing) {
    MergePlan plan = analyze_merge({Value(nullptr), Value(5), Value{{"x", 1}}}, MergeOptions{});
    ASSERT_EQ(plan.operations.size(), 1u);
    EXPECT_EQ(plan.operations[0].path, "x");
    EXPECT_EQ(plan.operations[0].action, PlanAction::Add);
}

TEST(PlanEdges, ArrayElementsHaveIndexPaths) {
    MergePlan plan = analyze_merge({Value{{"l", {1, 2}}}, Value{{"l", {1, 3}}}}, MergeOptions{});
    ASSERT_EQ(plan.operations.size(), 3u);
    EXPECT_EQ(plan.operations[0].path, "l");
    EXPECT_EQ(plan.operations[0].action, PlanAction::Conflict);
    EXPECT_EQ(plan.operations[1].path, "l[0]");
    EXPECT_EQ(plan.operations[1].action, PlanAction::Update);
    EXPECT_EQ(plan.operations[2].path, "l[1]");
    EXPECT_EQ(plan.operations[2].action, PlanAction::Conflict);
}

TEST(PlanEdges, KeysWithSeparatorsAreNotReparsed) {
    MergePlan plan = analyze_merge({Value{{"a.b", 1}}, Value{{"a[0]", 2}}}, MergeOptions{});
    ASSERT_EQ(plan.operations.size(), 2u);
    EXPECT_EQ(plan.operations[0].path, "a.b");
    EXPECT_EQ(plan.operations[1].path, "a[0]");
}

TEST(PlanEdges, CustomResolverConsulted) {
    MergeOptions options;
    options.conflict_resolution = ConflictResolution::Custom;
    options.custom_mergers[kConflictResolverPrefix + "v"] =
        [](const std::vector<Value>& values, const std::string&) { return Value(values.size()); };
    MergePlan plan = analyze_merge({Value{{"v", 1}}, Value{{"v", 2}}, Value{{"v", 3}}}, options);
    ASSERT_EQ(plan.conflicts.size(), 1u);
    EXPECT_EQ(plan.conflicts[0].suggested_resolution, 3);
}

// ============================================================================
// Engine entry points and serialization
// ============================================================================

TEST(PlanEngine, CreateMergePlanUsesEngineOptions) {
    MergeOptions defaults;
    defaults.conflict_resolution = ConflictResolution::Max;
    DataMerger merger(defaults);
    MergePlan plan = merger.create_merge_plan({Value{{"n", 9}}, Value{{"n", 4}}});
    ASSERT_EQ(plan.conflicts.size(), 1u);
    EXPECT_EQ(plan.conflicts[0].suggested_resolution, 9);
}

TEST(PlanEngine, AsyncPlan) {
    DataMerger merger;
    auto future = merger.create_merge_plan_async({Value{{"n", 1}}, Value{{"n", 2}}}, merger.options());
    MergePlan plan = future.get();
    EXPECT_EQ(plan.conflicts.size(), 1u);
}

TEST(PlanValue, Serialization) {
    MergePlan plan = analyze_merge({Value{{"a", 1}}, Value{{"a", 2}, {"b", true}}}, MergeOptions{});
    Value doc = plan.to_value();

    ASSERT_EQ(doc["operations"].size(), 2u);
    EXPECT_EQ(doc["operations"][0]["path"], "a");
    EXPECT_EQ(doc["operations"][0]["action"], "conflict");
    EXPECT_EQ(doc["operations"][0]["resolution"], 2);
    EXPECT_EQ(doc["operations"][1]["action"], "add");
    EXPECT_FALSE(doc["operations"][1].contains("resolution"));

    ASSERT_EQ(doc["conflicts"].size(), 1u);
    EXPECT_EQ(doc["conflicts"][0]["suggestedResolution"], 2);
    EXPECT_EQ(doc["conflicts"][0]["values"], (Value{1, 2}));
}

TEST(PlanValue, ActionNames) {
    EXPECT_EQ(to_string(PlanAction::Add), "add");
    EXPECT_EQ(to_string(PlanAction::Update), "update");
    EXPECT_EQ(to_string(PlanAction::Conflict), "conflict");
    EXPECT_EQ(to_string(PlanAction::Transform), "transform");
}
