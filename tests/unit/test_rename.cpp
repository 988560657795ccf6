/**
 * Cloak - Identifier Renaming Tests
 */

#include <gtest/gtest.h>
#include "fixtures/obfuscation_fixture.hpp"
#include "passes/rename/identifier_renaming.hpp"

#include <set>

using namespace cloak;
using namespace cloak::test;
using cloak::rename::NameGenerator;

// ============================================================================
// Name generation
// ============================================================================

TEST(NameGeneratorTest, ValidIdentifiers) {
    EXPECT_TRUE(NameGenerator::isValidIdentifier("x"));
    EXPECT_TRUE(NameGenerator::isValidIdentifier("_a1"));
    EXPECT_TRUE(NameGenerator::isValidIdentifier("lI1lI1"));

    EXPECT_FALSE(NameGenerator::isValidIdentifier(""));
    EXPECT_FALSE(NameGenerator::isValidIdentifier("1abc"));
    EXPECT_FALSE(NameGenerator::isValidIdentifier("a-b"));
    EXPECT_FALSE(NameGenerator::isValidIdentifier("int"));
    EXPECT_FALSE(NameGenerator::isValidIdentifier("while"));
}

TEST(NameGeneratorTest, EveryStyleIsInjective) {
    for (RenameStyle style : {RenameStyle::Random, RenameStyle::Hex,
                              RenameStyle::Sequential, RenameStyle::Confusable}) {
        NameGenerator gen(style);
        gen.reset({});
        Random rng(7);
        std::set<std::string> seen;
        for (int i = 0; i < 500; i++) {
            std::string name = gen.next(rng);
            EXPECT_TRUE(NameGenerator::isValidIdentifier(name)) << name;
            EXPECT_TRUE(seen.insert(name).second) << "repeated " << name;
        }
    }
}

TEST(NameGeneratorTest, StyleShapes) {
    Random rng(3);

    NameGenerator hex(RenameStyle::Hex);
    std::string h = hex.next(rng);
    ASSERT_EQ(h.size(), 11u);
    EXPECT_EQ(h.substr(0, 3), "_0x");
    EXPECT_EQ(h.find_first_not_of("0123456789abcdef", 3), std::string::npos) << h;

    NameGenerator seq(RenameStyle::Sequential);
    EXPECT_EQ(seq.next(rng), "v0");
    EXPECT_EQ(seq.next(rng), "v1");

    NameGenerator conf(RenameStyle::Confusable);
    std::string c = conf.next(rng);
    EXPECT_GE(c.size(), 8u);
    EXPECT_EQ(c.find_first_not_of("lI1"), std::string::npos) << c;
    EXPECT_NE(c[0], '1');

    NameGenerator rnd(RenameStyle::Random);
    EXPECT_EQ(rnd.next(rng).size(), 9u);
}

TEST(NameGeneratorTest, SkipsTakenNames) {
    NameGenerator seq(RenameStyle::Sequential);
    seq.reset({"v0", "v2"});
    Random rng(1);
    EXPECT_EQ(seq.next(rng), "v1");
    EXPECT_EQ(seq.next(rng), "v3");

    // reset restarts the sequence
    seq.reset({});
    EXPECT_EQ(seq.next(rng), "v0");
}

// ============================================================================
// Renaming pass
// ============================================================================

class RenamingTest : public ObfuscationFixture {
protected:
    static CompilerOptions renameOnly(RenameStyle style = RenameStyle::Random, uint64_t seed = 1) {
        CompilerOptions options = testOptions(OptLevel::None, ObfLevel::Basic, seed);
        options.string_encryption = false;
        options.rename_style = style;
        return options;
    }
};

namespace {

const char* kShadowing =
    "int g = 5;\n"
    "int f(int x) {\n"
    "    int y = x + g;\n"
    "    {\n"
    "        int y = 2;\n"
    "        x += y;\n"
    "    }\n"
    "    return x * 10 + y;\n"
    "}\n"
    "int main(void) { return f(3); }\n";

std::vector<std::string> localNames(const ast::Function& f) {
    std::vector<std::string> names;
    for (const auto& p : f.params) names.push_back(p.name);
    ast::visitBlockStmts(f.body, [&names](const ast::Stmt& s) {
        if (s.kind == ast::StmtKind::Decl) names.push_back(s.decl->name);
    });
    return names;
}

} // namespace

TEST_F(RenamingTest, OnlyPassScheduled) {
    auto plan = Compiler::plannedPasses(renameOnly());
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0], "identifier_renaming");
}

TEST_F(RenamingTest, RenamesLocalsAndParameters) {
    auto program = transform(kShadowing, renameOnly());
    ASSERT_TRUE(program.has_value());
    const ast::Function* f = program->findFunction("f");
    ASSERT_NE(f, nullptr);

    auto names = localNames(*f);
    ASSERT_EQ(names.size(), 3u);
    for (const auto& n : names) {
        EXPECT_NE(n, "x");
        EXPECT_NE(n, "y");
        EXPECT_NE(n, "g");
    }
    // the two y declarations get different names
    EXPECT_NE(names[1], names[2]);

    ASSERT_EQ(f->meta.rename_map.size(), 3u);
    EXPECT_EQ(f->meta.rename_map[0].first, "x");

    // globals and functions keep their names
    EXPECT_NE(program->findGlobal("g"), nullptr);
    EXPECT_NE(program->findFunction("main"), nullptr);
}

TEST_F(RenamingTest, ReferencesFollowTheirDeclaration) {
    for (RenameStyle style : {RenameStyle::Random, RenameStyle::Hex,
                              RenameStyle::Sequential, RenameStyle::Confusable}) {
        expectSameBehavior(kShadowing, renameOnly(style));
    }
}

TEST_F(RenamingTest, NewNamesNeverCaptureGlobals) {
    // sequential names would be v0, v1 ... unless the globals reserve them
    const char* src =
        "int v0 = 100;\n"
        "int v1 = 20;\n"
        "int f(int a, int b) { return a + b + v0 + v1; }\n"
        "int main(void) { return f(1, 2); }\n";
    expectSameBehavior(src, renameOnly(RenameStyle::Sequential));

    auto program = transform(src, renameOnly(RenameStyle::Sequential));
    ASSERT_TRUE(program.has_value());
    for (const auto& n : localNames(*program->findFunction("f"))) {
        EXPECT_NE(n, "v0");
        EXPECT_NE(n, "v1");
    }
}

TEST_F(RenamingTest, SameSeedSameOutput) {
    CompilerOptions options = renameOnly(RenameStyle::Random, 42);
    options.emit_source = true;
    CompileResult a = compileC(kShadowing, options);
    CompileResult b = compileC(kShadowing, options);
    ASSERT_TRUE(a.success);
    ASSERT_TRUE(b.success);
    EXPECT_EQ(a.output, b.output);

    options.seed = 43;
    CompileResult c = compileC(kShadowing, options);
    ASSERT_TRUE(c.success);
    EXPECT_NE(a.output, c.output);
}

TEST_F(RenamingTest, ExcludedFunctionsKeepTheirNames) {
    CompilerOptions options = renameOnly();
    options.exclude_functions = {"f"};
    auto program = transform(kShadowing, options);
    ASSERT_TRUE(program.has_value());
    auto names = localNames(*program->findFunction("f"));
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "x");
    EXPECT_EQ(names[1], "y");
}

TEST_F(RenamingTest, Statistics) {
    CompilerOptions options = renameOnly();
    options.emit_source = true;
    CompileResult result = compileC(kShadowing, options);
    ASSERT_TRUE(result.success) << describe(result.diagnostics);
    EXPECT_EQ(result.statistics.get("identifier_renaming.identifiers_renamed"), 3);
    // x in the first initializer, x and y in the block, x and y in the return
    EXPECT_EQ(result.statistics.get("identifier_renaming.references_rewritten"), 5);
}
