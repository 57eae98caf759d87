/**
 * @file test_dotpath.cpp
 * @brief Unit tests for dot-path helpers (GoogleTest)
 *
 * Tests cover rules D1-D4 from DotPath.hpp plus flattening and
 * ancestor/descendant helpers used by the merge engine.
 */

#include <gtest/gtest.h>
#include "expconf/DotPath.hpp"
#include "expconf/Errors.hpp"

using namespace expconf;

// ============================================================================
// get_by_dot (RULE D1/D2)
// ============================================================================

class GetByDotTest : public ::testing::Test {
protected:
    Value data = {
        {"DEFAULT", {{"EXPID", "a000"}, {"HPCARCH", "local"}}},
        {"JOBS", {
            {"SIM", {{"WALLCLOCK", "00:30"}, {"PROCESSORS", 4}}}
        }},
        {"members", {"fc0", "fc1"}},
        {"scalar", 42}
    };
};

TEST_F(GetByDotTest, SimpleKey) {
    auto* result = get_by_dot(data, "scalar");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(*result, 42);
}

TEST_F(GetByDotTest, DeeplyNested) {
    auto* result = get_by_dot(data, "JOBS.SIM.PROCESSORS");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(*result, 4);
}

TEST_F(GetByDotTest, EmptyPathReturnsRoot) {
    EXPECT_EQ(get_by_dot(data, ""), &data);
}

TEST_F(GetByDotTest, DoubledDotsAreIgnored) {
    auto* result = get_by_dot(data, "DEFAULT..EXPID");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(*result, "a000");
}

TEST_F(GetByDotTest, MissingKeyRaisesKeyError) {
    EXPECT_THROW(get_by_dot(data, "DEFAULT.MISSING"), KeyError);
}

TEST_F(GetByDotTest, TraverseIntoScalarRaisesTypeError) {
    EXPECT_THROW(get_by_dot(data, "scalar.sub"), TypeError);
}

TEST_F(GetByDotTest, ArraysAreNotTraversed) {
    EXPECT_THROW(get_by_dot(data, "members.0"), TypeError);
}

TEST_F(GetByDotTest, KeyErrorNamesSegment) {
    try {
        get_by_dot(data, "JOBS.POST.WALLCLOCK");
        FAIL() << "Expected KeyError";
    } catch (const KeyError& e) {
        EXPECT_EQ(e.segment(), "POST");
        EXPECT_NE(std::string(e.what()).find("JOBS.POST.WALLCLOCK"), std::string::npos);
    }
}

// ============================================================================
// find_by_dot (RULE D3)
// ============================================================================

TEST(FindByDot, ReturnsNullptrInsteadOfThrowing) {
    Value data = {{"a", {{"b", 1}}}, {"s", "text"}};
    EXPECT_EQ(find_by_dot(data, "a.c"), nullptr);
    EXPECT_EQ(find_by_dot(data, "s.x"), nullptr);
    ASSERT_NE(find_by_dot(data, "a.b"), nullptr);
    EXPECT_EQ(*find_by_dot(data, "a.b"), 1);
}

TEST(FindByDot, FindsSubtrees) {
    Value data = {{"a", {{"b", 1}}}};
    const Value* sub = find_by_dot(data, "a");
    ASSERT_NE(sub, nullptr);
    EXPECT_TRUE(sub->is_object());
}

// ============================================================================
// set_by_dot (RULE D4)
// ============================================================================

TEST(SetByDot, CreatesMissingIntermediates) {
    Value data = Value::object();
    set_by_dot(data, "model.version", "first");
    EXPECT_EQ(data, (Value{{"model", {{"version", "first"}}}}));
}

TEST(SetByDot, ReplacesScalarIntermediate) {
    Value data = {{"model", "plain"}};
    set_by_dot(data, "model.version", "first");
    EXPECT_EQ(data["model"]["version"], "first");
}

TEST(SetByDot, PreservesSiblings) {
    Value data = {{"server", {{"host", "localhost"}, {"port", 8080}}}};
    set_by_dot(data, "server.timeout", 30);
    EXPECT_EQ(data["server"]["host"], "localhost");
    EXPECT_EQ(data["server"]["port"], 8080);
    EXPECT_EQ(data["server"]["timeout"], 30);
}

TEST(SetByDot, ScalarReplacesSection) {
    Value data = {{"a", {{"b", 1}, {"c", 2}}}};
    set_by_dot(data, "a", "flat");
    EXPECT_EQ(data["a"], "flat");
}

TEST(SetByDot, EmptyPathReplacesRoot) {
    Value data = Value::object();
    set_by_dot(data, "", "replaced");
    EXPECT_EQ(data, "replaced");
}

// ============================================================================
// Path helpers
// ============================================================================

TEST(DotPathHelpers, SplitAndJoin) {
    EXPECT_EQ(split_dot_path("JOBS.SIM"), (std::vector<std::string>{"JOBS", "SIM"}));
    EXPECT_TRUE(split_dot_path("").empty());
    EXPECT_EQ(join_dot_path({"a", "b", "c"}), "a.b.c");
    EXPECT_EQ(join_dot_path({}), "");
    EXPECT_EQ(normalize_dot_path(".a..b."), "a.b");
}

TEST(DotPathHelpers, AncestorPaths) {
    EXPECT_EQ(ancestor_paths("a.b.c"), (std::vector<std::string>{"a", "a.b"}));
    EXPECT_TRUE(ancestor_paths("a").empty());
}

TEST(DotPathHelpers, DescendantPaths) {
    EXPECT_TRUE(is_descendant_path("a.b.c", "a.b"));
    EXPECT_TRUE(is_descendant_path("a.b.c", "a"));
    EXPECT_FALSE(is_descendant_path("a.bc", "a.b"));
    EXPECT_FALSE(is_descendant_path("a.b", "a.b"));
    EXPECT_FALSE(is_descendant_path("a", "a.b"));
}

// ============================================================================
// flatten_leaves
// ============================================================================

TEST(FlattenLeaves, ArraysAndEmptyObjectsAreLeaves) {
    Value data = {
        {"a", {{"b", 1}, {"c", {1, 2}}}},
        {"empty", Value::object()},
        {"n", nullptr}
    };
    auto flat = flatten_leaves(data);

    ASSERT_EQ(flat.size(), 4u);
    EXPECT_EQ(flat.at("a.b"), 1);
    EXPECT_EQ(flat.at("a.c"), (Value{1, 2}));
    EXPECT_EQ(flat.at("empty"), Value::object());
    EXPECT_TRUE(flat.at("n").is_null());
}

TEST(FlattenLeaves, OrderedByPath) {
    Value data = {{"z", 1}, {"a", {{"y", 2}, {"b", 3}}}};
    auto flat = flatten_leaves(data);
    std::vector<std::string> keys;
    for (const auto& [k, v] : flat) keys.push_back(k);
    EXPECT_EQ(keys, (std::vector<std::string>{"a.b", "a.y", "z"}));
}
