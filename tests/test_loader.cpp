/**
 * @file test_loader.cpp
 * @brief Tests for fragment and document loading
 *
 * Tests cover:
 * - RULE F1: format by extension
 * - RULE F2: empty documents
 * - RULE F3: malformed fragments
 * - RULE F4: missing files
 * - YAML typing and key locations
 */

#include <gtest/gtest.h>
#include "expconf/Loader.hpp"
#include "expconf/Errors.hpp"
#include "test_helpers.hpp"

using namespace expconf;
using expconf_test::TempDir;
using expconf_test::TempFile;

// ============================================================================
// YAML parsing
// ============================================================================

TEST(ParseYaml, CoreSchemaTyping) {
    Value v = parse_yaml_text(
        "i: 42\n"
        "f: 1.5\n"
        "b: true\n"
        "n: ~\n"
        "s: hello\n"
        "quoted: \"42\"\n"
        "single: 'true'\n"
        "time: 00:30\n"
        "list: [1, two]\n",
        "typing.yml");

    EXPECT_EQ(v["i"], 42);
    EXPECT_DOUBLE_EQ(v["f"].get<double>(), 1.5);
    EXPECT_EQ(v["b"], true);
    EXPECT_TRUE(v["n"].is_null());
    EXPECT_EQ(v["s"], "hello");
    EXPECT_EQ(v["quoted"], "42");
    EXPECT_EQ(v["single"], "true");
    EXPECT_EQ(v["time"], "00:30");
    EXPECT_EQ(v["list"], (Value{1, "two"}));
}

TEST(ParseYaml, RecordsKeyLocations) {
    std::map<std::string, SourceLocation> locations;
    parse_yaml_text(
        "DEFAULT:\n"
        "  EXPID: a000\n"
        "model.version: first\n",
        "loc.yml", &locations);

    ASSERT_TRUE(locations.count("DEFAULT.EXPID"));
    EXPECT_EQ(locations["DEFAULT.EXPID"].line, 2);
    EXPECT_EQ(locations["DEFAULT.EXPID"].column, 3);
    ASSERT_TRUE(locations.count("model.version"));
    EXPECT_EQ(locations["model.version"].line, 3);
    EXPECT_EQ(locations["model.version"].column, 1);
}

TEST(ParseYaml, SyntaxErrorCarriesPosition) {
    try {
        parse_yaml_text("a: b: c\n", "broken.yml");
        FAIL() << "Expected ConfigParseError";
    } catch (const ConfigParseError& e) {
        EXPECT_EQ(e.file(), "broken.yml");
        EXPECT_GE(e.line(), 1);
    }
}

// ============================================================================
// parse_fragment_text (RULE F2/F3)
// ============================================================================

TEST(ParseFragmentText, EmptyTextIsEmptyFragment) {
    Fragment f = parse_fragment_text("empty.yml", 0, "");
    EXPECT_TRUE(f.content.is_object());
    EXPECT_TRUE(f.content.empty());
}

TEST(ParseFragmentText, NonMappingIsFormatError) {
    EXPECT_THROW(parse_fragment_text("list.yml", 0, "- 1\n- 2\n"), FragmentFormatError);
    EXPECT_THROW(parse_fragment_text("scalar.yml", 0, "just text\n"), FragmentFormatError);
    EXPECT_THROW(parse_fragment_text("arr.json", 0, "[1, 2]", FragmentFormat::json),
                 FragmentFormatError);
}

TEST(ParseFragmentText, SyntaxErrorIsFormatError) {
    try {
        parse_fragment_text("bad.json", 0, "{\"a\": ", FragmentFormat::json);
        FAIL() << "Expected FragmentFormatError";
    } catch (const FragmentFormatError& e) {
        EXPECT_EQ(e.fragment(), "bad.json");
    }
}

TEST(ParseFragmentText, YamlLeavesCarryLocations) {
    Fragment f = parse_fragment_text("loc.yml", 0, "a: 1\nb:\n  c: 2\n");
    auto leaves = f.leaves();
    ASSERT_EQ(leaves.size(), 2u);
    ASSERT_TRUE(leaves[1].location.has_value());
    EXPECT_EQ(leaves[1].path, "b.c");
    EXPECT_EQ(leaves[1].location->line, 3);
}

// ============================================================================
// Files (RULE F1/F4)
// ============================================================================

TEST(LoadFragmentFile, ChoosesFormatByExtension) {
    TempDir dir;
    auto yml = dir.create_file("a.yml", "a: 1\n");
    auto json = dir.create_file("b.JSON", "{\"b\": 2}");

    Fragment fa = load_fragment_file(yml, 0);
    Fragment fb = load_fragment_file(json, 1);

    EXPECT_EQ(fa.id, yml);
    EXPECT_EQ(fa.position, 0u);
    EXPECT_EQ(fa.content["a"], 1);
    EXPECT_EQ(fb.content["b"], 2);
    EXPECT_EQ(fb.position, 1u);
}

TEST(LoadFragmentFile, MissingFileRaises) {
    EXPECT_THROW(load_fragment_file("/nonexistent/expconf/x.yml", 0), FileNotFoundError);
}

TEST(LoadFragmentFile, UnsupportedExtensionRaises) {
    TempFile file("a=1\n", ".ini");
    EXPECT_THROW(load_fragment_file(file.path(), 0), ConfigError);
}

TEST(LoadFragmentFiles, PositionsFollowOrder) {
    TempDir dir;
    auto first = dir.create_file("first.yml", "x: 1\n");
    auto second = dir.create_file("second.yaml", "x: 2\n");

    auto fragments = load_fragment_files({second, first});
    ASSERT_EQ(fragments.size(), 2u);
    EXPECT_EQ(fragments[0].id, second);
    EXPECT_EQ(fragments[0].position, 0u);
    EXPECT_EQ(fragments[1].id, first);
    EXPECT_EQ(fragments[1].position, 1u);
}

TEST(LoadDocumentFile, ReadsYamlAndJson) {
    TempFile yml("a: 1\n", ".yml");
    TempFile json("{\"a\": 1}", ".json");
    EXPECT_EQ(load_document_file(yml.path())["a"], 1);
    EXPECT_EQ(load_document_file(json.path())["a"], 1);
}

TEST(FileHelpers, ExtensionsAndFormats) {
    EXPECT_EQ(get_file_extension("/a/b/Conf.YML"), ".yml");
    EXPECT_EQ(format_for_path("x.yaml"), FragmentFormat::yaml);
    EXPECT_EQ(format_for_path("x.json"), FragmentFormat::json);
    EXPECT_EQ(format_for_path("x.toml"), FragmentFormat::toml);
    EXPECT_FALSE(format_for_path("x.txt").has_value());
}

TEST(FileHelpers, ReadTextFileMissing) {
    EXPECT_THROW(read_text_file("/nonexistent/expconf/file"), FileNotFoundError);
}
