/**
 * @file test_pipeline.cpp
 * @brief End-to-end tests: files and overrides to a resolved configuration
 */

#include <gtest/gtest.h>
#include "expconf/Errors.hpp"
#include "expconf/Parse.hpp"
#include "expconf/Pipeline.hpp"
#include "expconf/ScriptRenderer.hpp"
#include "test_helpers.hpp"

using namespace expconf;
using expconf_test::TempDir;

class PipelineTest : public ::testing::Test {
protected:
    TempDir dir;
    PipelineOptions options;

    void SetUp() override {
        options.fragment_paths = {
            dir.create_file("expdef.yml",
                "DEFAULT:\n"
                "  EXPID: a000\n"
                "model.version: first\n"
                "SAFE_PLACEHOLDERS: [CURRENT_PROJECT]\n"),
            dir.create_file("jobs.json",
                "{\"JOBS\": {\"SIM\": {\"WALLCLOCK\": \"00:30\","
                " \"LOG\": \"%^DEFAULT.EXPID%_%^model.version%\"}}}"),
            dir.create_file("platforms.toml",
                "[PLATFORMS.local]\n"
                "TYPE = \"ps\"\n"
                "PROJECT_DIR = \"%CURRENT_PROJECT%/%DEFAULT.EXPID%\"\n"),
        };
    }
};

TEST_F(PipelineTest, MergesAllFormats) {
    auto config = run_pipeline(options);
    EXPECT_EQ(config.at("JOBS.SIM.LOG"), "a000_first");
    EXPECT_EQ(config.at("PLATFORMS.local.PROJECT_DIR"), "%CURRENT_PROJECT%/a000");
    EXPECT_EQ(config.source_of("PLATFORMS.local.TYPE")->file, options.fragment_paths[2]);
    EXPECT_EQ(config.source_of("PLATFORMS.local.TYPE")->line, 2);
}

TEST_F(PipelineTest, OverridesWinAndFeedDeferredPass) {
    options.overrides = {"model.version=last", "JOBS.SIM.PROCESSORS=16"};
    auto config = run_pipeline(options);

    EXPECT_EQ(config.at("model.version"), "last");
    EXPECT_EQ(config.at("JOBS.SIM.LOG"), "a000_last");
    EXPECT_EQ(config.at("JOBS.SIM.PROCESSORS"), 16);
    EXPECT_EQ(config.source_of("model.version")->file, kOverridesFragmentId);
}

TEST_F(PipelineTest, OverridesCanReferenceEarlierKeys) {
    options.overrides = {"OUT=%DEFAULT.EXPID%/out"};
    auto config = run_pipeline(options);
    EXPECT_EQ(config.at("OUT"), "a000/out");
    EXPECT_EQ(config.source_of("OUT")->kind, ResolutionKind::immediate);
}

TEST_F(PipelineTest, ExtraSafeNames) {
    options.overrides = {"CMD=%RUNTIME_ONLY%"};
    options.safe_placeholders = {"RUNTIME_ONLY"};
    auto config = run_pipeline(options);
    EXPECT_EQ(config.at("CMD"), "%RUNTIME_ONLY%");
}

TEST_F(PipelineTest, MandatoryKeys) {
    options.mandatory = {"DEFAULT.EXPID", "DEFAULT.HPCARCH"};
    try {
        run_pipeline(options);
        FAIL() << "Expected MissingMandatoryConfig";
    } catch (const MissingMandatoryConfig& e) {
        EXPECT_EQ(e.missing_keys(), (std::vector<std::string>{"DEFAULT.HPCARCH"}));
    }
}

TEST_F(PipelineTest, MissingFileAborts) {
    options.fragment_paths.push_back(dir.path() + "/absent.yml");
    EXPECT_THROW(run_pipeline(options), FileNotFoundError);
}

TEST_F(PipelineTest, MalformedFragmentAborts) {
    options.fragment_paths.insert(options.fragment_paths.begin() + 1,
                                  dir.create_file("bad.yml", "- a\n- b\n"));
    EXPECT_THROW(run_pipeline(options), FragmentFormatError);
}

TEST_F(PipelineTest, CollectFragmentsAppendsOverrides) {
    options.overrides = {"x=1"};
    auto fragments = collect_fragments(options);
    ASSERT_EQ(fragments.size(), 4u);
    EXPECT_EQ(fragments.back().id, kOverridesFragmentId);
    EXPECT_EQ(fragments.back().position, 3u);
}

TEST_F(PipelineTest, RenderFromPipeline) {
    auto config = run_pipeline(options);
    ScriptRenderer renderer(config);
    auto script = renderer.render(
        Template{"sim.sh", "cd %PLATFORMS.local.PROJECT_DIR%\nsleep %^JOBS.SIM.WALLCLOCK%\n"},
        JobContext{"a000_SIM", dir.path(), "SIM"});

    EXPECT_NE(script.text.find("cd %CURRENT_PROJECT%/a000\n"), std::string::npos);
    EXPECT_NE(script.text.find("sleep 00:30\n"), std::string::npos);
    EXPECT_TRUE(check_exit_status_contract(script.text).empty());
}
