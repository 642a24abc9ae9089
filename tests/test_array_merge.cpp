/**
 * @file test_array_merge.cpp
 * @brief Tests for array merge strategies (GoogleTest)
 */

#include <gtest/gtest.h>
#include "datamerge/ArrayMerge.hpp"
#include "datamerge/Equality.hpp"

using namespace datamerge;

namespace {

// Element merger that records the paths it was called with and keeps b
struct RecordingMerger {
    std::vector<std::string>* paths;

    Value operator()(const Value&, const Value& b, const std::string& path) const {
        paths->push_back(path);
        return b;
    }
};

Value merge_with(ArrayMerge kind, const Value& a, const Value& b,
                 bool remove_dups = true, bool preserve_order = true) {
    MergeOptions options;
    options.array_merge = kind;
    options.remove_duplicates = remove_dups;
    options.preserve_order = preserve_order;
    std::vector<std::string> paths;
    return merge_arrays(a, b, "arr", options, RecordingMerger{&paths});
}

} // anonymous namespace

// ============================================================================
// Primitive algorithms
// ============================================================================

TEST(ArrayAlgorithms, Concat) {
    Value expected = {1, 2, 2, 3};
    EXPECT_EQ(concat_arrays(Value{1, 2}, Value{2, 3}), expected);
}

TEST(ArrayAlgorithms, Union) {
    Value expected = {1, 2, 3, 4};
    EXPECT_EQ(union_arrays(Value{1, 2, 3}, Value{2, 3, 4}), expected);
}

TEST(ArrayAlgorithms, UnionUsesDeepEquality) {
    Value a = Value::array({Value{{"x", 1}, {"y", 2}}});
    Value b = Value::array({Value{{"y", 2}, {"x", 1}}});
    EXPECT_EQ(union_arrays(a, b).size(), 1u);
}

TEST(ArrayAlgorithms, Intersection) {
    Value expected = {2, 3};
    EXPECT_EQ(intersect_arrays(Value{1, 2, 3}, Value{2, 3, 4}), expected);
}

TEST(ArrayAlgorithms, IntersectionKeepsDuplicatesOfA) {
    Value expected = {2, 2};
    EXPECT_EQ(intersect_arrays(Value{2, 1, 2}, Value{2}), expected);
}

TEST(ArrayAlgorithms, ZipRaggedTail) {
    Value result = zip_arrays(Value{1, 2, 3}, Value{"a"});
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], (Value{1, "a"}));
    EXPECT_EQ(result[1], Value::array({2}));
    EXPECT_EQ(result[2], Value::array({3}));
}

TEST(ArrayAlgorithms, CombineMergesByIndex) {
    std::vector<std::string> paths;
    Value result = combine_arrays(Value{1, 2, 3}, Value{10, 20}, "rows", RecordingMerger{&paths});

    Value expected = {10, 20, 3};
    EXPECT_EQ(result, expected);
    std::vector<std::string> expected_paths = {"rows[0]", "rows[1]"};
    EXPECT_EQ(paths, expected_paths);
}

TEST(ArrayAlgorithms, CombineKeepsLongerTailOfB) {
    std::vector<std::string> paths;
    Value result = combine_arrays(Value{1}, Value{5, 6}, "", RecordingMerger{&paths});
    Value expected = {5, 6};
    EXPECT_EQ(result, expected);
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0], "[0]");
}

TEST(ArrayAlgorithms, RemoveDuplicatesByIdentity) {
    Value arr = Value::array({
        Value{{"id", 1}, {"v", "a"}},
        Value{{"id", 2}},
        Value{{"id", 1}, {"v", "b"}},
        Value(3), Value(3)
    });
    Value result = remove_duplicates(arr);
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0]["v"], "a");
    EXPECT_EQ(result[1]["id"], 2);
    EXPECT_EQ(result[2], 3);
}

TEST(ArrayAlgorithms, PreserveOriginalOrder) {
    Value merged = {4, 3, 2, 1};
    Value result = preserve_original_order(merged, Value{1, 2}, Value{3, 4});
    Value expected = {1, 2, 3, 4};
    EXPECT_EQ(result, expected);
}

// ============================================================================
// merge_arrays
// ============================================================================

TEST(MergeArrays, UnionProperty) {
    Value expected = {1, 2, 3, 4};
    EXPECT_EQ(merge_with(ArrayMerge::Union, Value{1, 2, 3}, Value{2, 3, 4}), expected);
}

TEST(MergeArrays, IntersectionProperty) {
    Value expected = {2, 3};
    EXPECT_EQ(merge_with(ArrayMerge::Intersection, Value{1, 2, 3}, Value{2, 3, 4}), expected);
}

TEST(MergeArrays, IntersectionSkipsDeduplication) {
    Value expected = {2, 2};
    EXPECT_EQ(merge_with(ArrayMerge::Intersection, Value{2, 2}, Value{2}), expected);
}

TEST(MergeArrays, ConcatDeduplicatesByDefault) {
    Value expected = {1, 2, 3};
    EXPECT_EQ(merge_with(ArrayMerge::Concat, Value{1, 2}, Value{2, 3}), expected);
}

TEST(MergeArrays, ConcatKeepsDuplicatesWhenAsked) {
    Value expected = {1, 2, 2, 3};
    EXPECT_EQ(merge_with(ArrayMerge::Concat, Value{1, 2}, Value{2, 3}, false), expected);
}

TEST(MergeArrays, ReplaceMergeUniqueBehaveLikeConcat) {
    Value expected = {1, 2, 2, 3};
    for (ArrayMerge kind : {ArrayMerge::Replace, ArrayMerge::Merge, ArrayMerge::Unique}) {
        EXPECT_EQ(merge_with(kind, Value{1, 2}, Value{2, 3}, false), expected) << to_string(kind);
    }
}

TEST(MergeArrays, OverrideTakesSecond) {
    Value expected = {9};
    EXPECT_EQ(merge_with(ArrayMerge::Override, Value{1, 2}, Value{9}), expected);
}

TEST(MergeArrays, OverrideDeduplicates) {
    Value expected = {9};
    EXPECT_EQ(merge_with(ArrayMerge::Override, Value{1}, Value{9, 9}), expected);
}

TEST(MergeArrays, ZipPairs) {
    Value result = merge_with(ArrayMerge::Zip, Value{1, 2}, Value{3, 4});
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], (Value{1, 3}));
    EXPECT_EQ(result[1], (Value{2, 4}));
}

TEST(MergeArrays, CombinePassesElementPaths) {
    MergeOptions options;
    options.array_merge = ArrayMerge::Combine;
    std::vector<std::string> paths;
    merge_arrays(Value{1, 2}, Value{3}, "list", options, RecordingMerger{&paths});
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0], "list[0]");
}

// ============================================================================
// Strings that are not valid UTF-8
// ============================================================================

TEST(MergeArraysRawBytes, DeduplicatesWithoutThrowing) {
    const std::string latin1 = "caf\xE9";
    Value result;
    EXPECT_NO_THROW(result = merge_with(ArrayMerge::Concat,
                                        Value::array({latin1, "x"}),
                                        Value::array({latin1, "caf\xE8"})));
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], latin1);
    EXPECT_EQ(result[1], "x");
    EXPECT_EQ(result[2], "caf\xE8");
}

TEST(MergeArraysRawBytes, UnionKeepsDistinctByteStrings) {
    Value result = merge_with(ArrayMerge::Union, Value::array({"a\xFF"}), Value::array({"a\xFE", "a\xFF"}));
    EXPECT_EQ(result.size(), 2u);
}
