/**
 * Cloak - Compiler Options Tests
 */

#include <gtest/gtest.h>
#include "common/json_parser.hpp"
#include "core/options.hpp"

#include <cstdio>
#include <fstream>

using namespace cloak;

TEST(OptionsTest, DefaultsAreAPlainCompile) {
    CompilerOptions options;

    EXPECT_FALSE(options.optimizing());
    EXPECT_FALSE(options.obfuscating());
    EXPECT_EQ(options.inline_threshold, 10);
    EXPECT_DOUBLE_EQ(options.dead_code_insertion_ratio, 0.2);
    EXPECT_TRUE(options.string_encryption);
    EXPECT_TRUE(options.preprocess);
    EXPECT_EQ(options.preprocessor.tool, "cpp");
}

TEST(OptionsTest, ParseLevels) {
    EXPECT_EQ(parseOptLevel("0"), OptLevel::None);
    EXPECT_EQ(parseOptLevel("Basic"), OptLevel::Basic);
    EXPECT_EQ(parseOptLevel("2"), OptLevel::Full);
    EXPECT_FALSE(parseOptLevel("3").has_value());

    EXPECT_EQ(parseObfLevel("aggressive"), ObfLevel::Aggressive);
    EXPECT_EQ(parseObfLevel("none"), ObfLevel::None);
    EXPECT_FALSE(parseObfLevel("extreme").has_value());

    EXPECT_EQ(parseRenameStyle("HEX"), RenameStyle::Hex);
    EXPECT_EQ(parseRenameStyle("confusable"), RenameStyle::Confusable);
    EXPECT_EQ(parsePredicateComplexity("high"), PredicateComplexity::High);
    EXPECT_FALSE(parsePredicateComplexity("extreme").has_value());
}

TEST(OptionsTest, LoadFullConfiguration) {
    auto json = JsonParser::parse(R"({
        "optimization": { "level": "full", "inline_threshold": 4,
                          "constant_folding": false },
        "obfuscation": { "level": "aggressive", "variable_rename_style": "sequential",
                         "string_encryption": false, "dead_code_insertion_ratio": 0.5,
                         "opaque_predicate_complexity": "low", "seed": 77,
                         "exclude_functions": ["main"] },
        "output": { "format": "c", "debug_info": true },
        "preprocessor": { "include_paths": ["inc"], "defines": {"DEBUG": null, "N": 3},
                          "keep_comments": true }
    })");

    CompilerOptions options;
    DiagnosticList diags;
    ASSERT_TRUE(options.loadFromJson(json, diags));
    EXPECT_TRUE(diags.empty());

    EXPECT_EQ(options.optimization, OptLevel::Full);
    EXPECT_EQ(options.inline_threshold, 4);
    EXPECT_FALSE(options.constant_folding);
    EXPECT_EQ(options.obfuscation, ObfLevel::Aggressive);
    EXPECT_EQ(options.rename_style, RenameStyle::Sequential);
    EXPECT_FALSE(options.string_encryption);
    EXPECT_DOUBLE_EQ(options.dead_code_insertion_ratio, 0.5);
    EXPECT_EQ(options.predicate_complexity, PredicateComplexity::Low);
    EXPECT_EQ(options.seed, 77u);
    ASSERT_EQ(options.exclude_functions.size(), 1u);
    EXPECT_TRUE(options.emit_source);
    EXPECT_TRUE(options.debug_info);

    ASSERT_EQ(options.preprocessor.include_paths.size(), 1u);
    ASSERT_EQ(options.preprocessor.defines.size(), 2u);
    EXPECT_EQ(options.preprocessor.defines[0].first, "DEBUG");
    EXPECT_FALSE(options.preprocessor.defines[0].second.has_value());
    EXPECT_EQ(options.preprocessor.defines[1].second, std::optional<std::string>("3"));
    ASSERT_EQ(options.preprocessor.extra_flags.size(), 1u);
    EXPECT_EQ(options.preprocessor.extra_flags[0], "-C");
}

TEST(OptionsTest, UnknownKeysAreWarnings) {
    auto json = JsonParser::parse(R"({
        "obfuscation": { "level": "basic", "turbo": true },
        "colors": {}
    })");

    CompilerOptions options;
    DiagnosticList diags;
    EXPECT_TRUE(options.loadFromJson(json, diags));
    EXPECT_EQ(options.obfuscation, ObfLevel::Basic);

    EXPECT_EQ(diags.count(Severity::Warning), 2u);
    EXPECT_FALSE(diags.hasErrors());
    EXPECT_TRUE(diags.contains(DiagCode::UnknownOption));
}

TEST(OptionsTest, WrongValueTypesKeepDefaults) {
    auto json = JsonParser::parse(R"({
        "optimization": { "level": 7, "inline_threshold": -1 },
        "obfuscation": { "dead_code_insertion_ratio": 1.5, "string_encryption": "yes" }
    })");

    CompilerOptions options;
    DiagnosticList diags;
    options.loadFromJson(json, diags);

    EXPECT_EQ(options.optimization, OptLevel::None);
    EXPECT_EQ(options.inline_threshold, 10);
    EXPECT_DOUBLE_EQ(options.dead_code_insertion_ratio, 0.2);
    EXPECT_TRUE(options.string_encryption);
    EXPECT_EQ(diags.count(Severity::Warning), 4u);
}

TEST(OptionsTest, NonObjectRootIsAnError) {
    CompilerOptions options;
    DiagnosticList diags;

    EXPECT_FALSE(options.loadFromJson(JsonParser::parse("[1, 2]"), diags));
    EXPECT_TRUE(diags.hasErrors());
}

TEST(OptionsTest, LoadFromFile) {
    std::string path = ::testing::TempDir() + "cloak_options_test.json";
    {
        std::ofstream out(path);
        out << R"({"obfuscation": {"level": "aggressive", "seed": 5}})";
    }

    CompilerOptions options;
    DiagnosticList diags;
    EXPECT_TRUE(options.loadFromFile(path, diags));
    EXPECT_EQ(options.obfuscation, ObfLevel::Aggressive);
    EXPECT_EQ(options.seed, 5u);
    std::remove(path.c_str());

    DiagnosticList missing;
    EXPECT_FALSE(options.loadFromFile(path, missing));
    EXPECT_TRUE(missing.contains(DiagCode::UnknownOption));
}
