/**
 * @file test_placeholder.cpp
 * @brief Tests for placeholder scanning and substitution
 */

#include <gtest/gtest.h>
#include "expconf/Placeholder.hpp"
#include "expconf/Errors.hpp"

using namespace expconf;

namespace {
    const ResolutionContext kFragmentCtx{"frag.yml", UnresolvedPlaceholderError::Context::fragment};
}

// ============================================================================
// find_placeholders
// ============================================================================

TEST(FindPlaceholders, BothForms) {
    auto tokens = find_placeholders("%a%/%^b.c%");
    ASSERT_EQ(tokens.size(), 2u);

    EXPECT_EQ(tokens[0].offset, 0u);
    EXPECT_EQ(tokens[0].length, 3u);
    EXPECT_EQ(tokens[0].name, "a");
    EXPECT_EQ(tokens[0].form, PlaceholderForm::immediate);

    EXPECT_EQ(tokens[1].offset, 4u);
    EXPECT_EQ(tokens[1].length, 6u);
    EXPECT_EQ(tokens[1].name, "b.c");
    EXPECT_EQ(tokens[1].form, PlaceholderForm::deferred);
}

TEST(FindPlaceholders, DoublePercentIsLiteral) {
    EXPECT_TRUE(find_placeholders("100%% done").empty());
    EXPECT_TRUE(find_placeholders("%%").empty());
    EXPECT_TRUE(find_placeholders("date +%%Y%%m").empty());
}

TEST(FindPlaceholders, RejectsInvalidNames) {
    EXPECT_TRUE(find_placeholders("%a b%").empty());
    EXPECT_TRUE(find_placeholders("%^%").empty());
    EXPECT_TRUE(find_placeholders("50% of 100%").empty());
    EXPECT_TRUE(find_placeholders("%unterminated").empty());
}

TEST(FindPlaceholders, NameCharacters) {
    auto tokens = find_placeholders("%JOBS.SIM-1_x.WALLCLOCK%");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].name, "JOBS.SIM-1_x.WALLCLOCK");
}

TEST(FindPlaceholders, StrayPercentBeforeToken) {
    auto tokens = find_placeholders("5% %x%");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].name, "x");
}

// ============================================================================
// substitute_placeholders
// ============================================================================

class SubstituteTest : public ::testing::Test {
protected:
    Value snapshot = {
        {"other_variable", "something"},
        {"model", {{"version", "first"}}},
        {"count", 4},
        {"ratio", 1.5},
        {"flag", true},
        {"nothing", nullptr},
        {"list", {1, 2}}
    };
    SafePlaceholderSet safe;
};

TEST_F(SubstituteTest, ImmediateOnlyLeavesDeferredVerbatim) {
    auto out = substitute_placeholders("%other_variable%/%^model.version%",
                                       snapshot, safe, SubstitutionScope::immediate_only,
                                       kFragmentCtx);
    EXPECT_EQ(out, "something/%^model.version%");
}

TEST_F(SubstituteTest, DeferredOnlyLeavesImmediateVerbatim) {
    auto out = substitute_placeholders("%other_variable%/%^model.version%",
                                       snapshot, safe, SubstitutionScope::deferred_only,
                                       kFragmentCtx);
    EXPECT_EQ(out, "%other_variable%/first");
}

TEST_F(SubstituteTest, BothForms) {
    auto out = substitute_placeholders("%other_variable%/%^model.version%",
                                       snapshot, safe, SubstitutionScope::both, kFragmentCtx);
    EXPECT_EQ(out, "something/first");
}

TEST_F(SubstituteTest, Stringification) {
    auto out = substitute_placeholders("%count% %ratio% %flag% [%nothing%] %list%",
                                       snapshot, safe, SubstitutionScope::both, kFragmentCtx);
    EXPECT_EQ(out, "4 1.5 true [] [1,2]");
}

TEST_F(SubstituteTest, SafeNamesStayVerbatim) {
    safe.insert("CURRENT_PROJECT");
    auto out = substitute_placeholders("cd %CURRENT_PROJECT% && %^CURRENT_PROJECT%",
                                       snapshot, safe, SubstitutionScope::both, kFragmentCtx);
    EXPECT_EQ(out, "cd %CURRENT_PROJECT% && %^CURRENT_PROJECT%");
}

TEST_F(SubstituteTest, SafeCheckPrecedesLookup) {
    // A safe name that does exist is still not substituted
    safe.insert("count");
    auto out = substitute_placeholders("%count%", snapshot, safe,
                                       SubstitutionScope::both, kFragmentCtx);
    EXPECT_EQ(out, "%count%");
}

TEST_F(SubstituteTest, SubstitutedTextIsNotRescanned) {
    Value snap = {{"a", "%b%"}, {"b", "never"}};
    auto out = substitute_placeholders("%a%", snap, safe, SubstitutionScope::both, kFragmentCtx);
    EXPECT_EQ(out, "%b%");
}

TEST_F(SubstituteTest, CountsReplacements) {
    std::size_t n = 0;
    substitute_placeholders("%count% %^count% %%", snapshot, safe,
                            SubstitutionScope::immediate_only, kFragmentCtx, &n);
    EXPECT_EQ(n, 1u);
}

TEST_F(SubstituteTest, UnresolvedRaisesWithContext) {
    try {
        substitute_placeholders("x=%UNDEFINED_KEY%", snapshot, safe,
                                SubstitutionScope::both, kFragmentCtx);
        FAIL() << "Expected UnresolvedPlaceholderError";
    } catch (const UnresolvedPlaceholderError& e) {
        EXPECT_EQ(e.key(), "UNDEFINED_KEY");
        EXPECT_EQ(e.context(), "frag.yml");
        EXPECT_EQ(e.context_kind(), UnresolvedPlaceholderError::Context::fragment);
    }
}

TEST_F(SubstituteTest, OutOfScopeUnknownNamesAreIgnored) {
    auto out = substitute_placeholders("%^later%", snapshot, safe,
                                       SubstitutionScope::immediate_only, kFragmentCtx);
    EXPECT_EQ(out, "%^later%");
}

TEST_F(SubstituteTest, SectionReferenceInsertsJson) {
    auto out = substitute_placeholders("%model%", snapshot, safe,
                                       SubstitutionScope::both, kFragmentCtx);
    EXPECT_EQ(out, R"({"version":"first"})");
}

// ============================================================================
// substitute_in_value
// ============================================================================

TEST(SubstituteInValue, RecursesIntoContainers) {
    Value snapshot = {{"x", "X"}};
    Value v = {{"list", {"%x%", 1, "plain"}}, {"nested", {{"k", "a-%x%"}}}};
    auto n = substitute_in_value(v, snapshot, {}, SubstitutionScope::immediate_only, kFragmentCtx);

    EXPECT_EQ(n, 2u);
    EXPECT_EQ(v["list"], (Value{"X", 1, "plain"}));
    EXPECT_EQ(v["nested"]["k"], "a-X");
}

TEST(SubstituteInValue, NonStringsUntouched) {
    Value v = 42;
    EXPECT_EQ(substitute_in_value(v, Value::object(), {}, SubstitutionScope::both, kFragmentCtx), 0u);
    EXPECT_EQ(v, 42);
}
