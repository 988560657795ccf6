/**
 * Cloak - Lexer, Parser and Preprocessor Tests
 */

#include <gtest/gtest.h>
#include "frontend/lexer.hpp"
#include "frontend/parser.hpp"
#include "frontend/preprocessor.hpp"

#include <algorithm>
#include <stdexcept>

using namespace cloak;
using namespace cloak::frontend;

namespace {

std::vector<Token> lex(const std::string& src) {
    return Lexer(src).tokenize();
}

const ast::Function& function(const ParseResult& r, const std::string& name) {
    const ast::Function* f = r.program.findFunction(name);
    if (!f) throw std::runtime_error("no function " + name);
    return *f;
}

} // namespace

// ============================================================================
// Lexer
// ============================================================================

TEST(LexerTest, KeywordsIdentifiersAndPunctuators) {
    auto toks = lex("int main(void) { return x >>= 2; }");

    ASSERT_EQ(toks.size(), 13u);
    EXPECT_TRUE(toks[0].isKeyword("int"));
    EXPECT_EQ(toks[1].kind, TokenKind::Identifier);
    EXPECT_EQ(toks[1].text, "main");
    EXPECT_TRUE(toks[3].isKeyword("void"));
    EXPECT_TRUE(toks[8].isPunct(">>="));
    EXPECT_EQ(toks.back().kind, TokenKind::End);
}

TEST(LexerTest, IntegerLiterals) {
    auto toks = lex("42 0x1F 017 7u 2147483648 0xFFFFFFFF");

    EXPECT_EQ(toks[0].value, 42);
    EXPECT_FALSE(toks[0].is_unsigned);
    EXPECT_EQ(toks[1].value, 31);
    EXPECT_EQ(toks[2].value, 15);
    EXPECT_TRUE(toks[3].is_unsigned);
    // values past INT_MAX are unsigned int on the target
    EXPECT_TRUE(toks[4].is_unsigned);
    EXPECT_EQ(toks[5].value, 0xFFFFFFFFll);
}

TEST(LexerTest, CharacterLiteralsAreSignedChar) {
    auto toks = lex(R"('a' '\n' '\x41' '\377' '\0')");

    EXPECT_EQ(toks[0].kind, TokenKind::CharLiteral);
    EXPECT_EQ(toks[0].value, 'a');
    EXPECT_EQ(toks[1].value, '\n');
    EXPECT_EQ(toks[2].value, 0x41);
    EXPECT_EQ(toks[3].value, -1);
    EXPECT_EQ(toks[4].value, 0);
}

TEST(LexerTest, StringLiteralsAreDecoded) {
    auto toks = lex(R"("a\tb\\c\"d\101")");

    ASSERT_EQ(toks[0].kind, TokenKind::StringLiteral);
    EXPECT_EQ(toks[0].text, "a\tb\\c\"dA");
}

TEST(LexerTest, CommentsAreSkipped) {
    auto toks = lex("a /* b */ c // d\n e");

    ASSERT_EQ(toks.size(), 4u);
    EXPECT_EQ(toks[1].text, "c");
    EXPECT_EQ(toks[2].text, "e");
    EXPECT_EQ(toks[2].loc.line, 2);
}

TEST(LexerTest, LineMarkersSetLocationAndSystemFlag) {
    auto toks = lex("# 40 \"/usr/include/stdio.h\" 1 3 4\nint printf;\n# 7 \"prog.c\" 2\nint x;\n");

    ASSERT_GE(toks.size(), 6u);
    EXPECT_EQ(toks[0].loc.line, 40);
    EXPECT_TRUE(toks[0].from_system_header);
    EXPECT_EQ(toks[3].loc.line, 7);
    EXPECT_FALSE(toks[3].from_system_header);
}

TEST(LexerTest, ExtensionKeywordsAreNormalized) {
    auto toks = lex("__inline__ __signed__ int __restrict p;");

    EXPECT_TRUE(toks[0].isKeyword("signed"));
    EXPECT_TRUE(toks[1].isKeyword("int"));
    EXPECT_EQ(toks[2].text, "p");
}

TEST(LexerTest, MalformedInputThrows) {
    EXPECT_THROW(lex("\"unterminated"), CompileError);
    EXPECT_THROW(lex("3.14"), CompileError);
    EXPECT_THROW(lex("089"), CompileError);
    EXPECT_THROW(lex("'ab'"), CompileError);
    EXPECT_THROW(lex("12abc"), CompileError);
    EXPECT_THROW(lex("99999999999"), CompileError);
    EXPECT_THROW(lex("a @ b"), CompileError);
}

TEST(LexerTest, KeywordQuery) {
    EXPECT_TRUE(Lexer::isKeyword("while"));
    EXPECT_TRUE(Lexer::isKeyword("sizeof"));
    EXPECT_FALSE(Lexer::isKeyword("main"));
}

// ============================================================================
// Parser
// ============================================================================

TEST(ParserTest, FunctionsAndGlobals) {
    auto r = parse(R"(
        int counter = 3;
        static char buf[16];
        int add(int a, int b);
        int add(int a, int b) { return a + b; }
    )");
    ASSERT_TRUE(r.success);

    const ast::VarDecl* counter = r.program.findGlobal("counter");
    ASSERT_NE(counter, nullptr);
    ASSERT_TRUE(counter->init.has_value());
    EXPECT_EQ(counter->init->int_value, 3);

    const ast::VarDecl* buf = r.program.findGlobal("buf");
    ASSERT_NE(buf, nullptr);
    EXPECT_TRUE(buf->is_static);
    EXPECT_EQ(buf->type.array_size, 16);

    const auto& add = function(r, "add");
    EXPECT_TRUE(add.is_definition);
    ASSERT_EQ(add.params.size(), 2u);
    EXPECT_EQ(add.params[1].name, "b");
    ASSERT_EQ(add.body.size(), 1u);
    EXPECT_EQ(add.body[0].kind, ast::StmtKind::Return);
}

TEST(ParserTest, EmptyParameterListMeansNoParameters) {
    auto r = parse("int f() { return 1; }");
    ASSERT_TRUE(r.success);
    EXPECT_TRUE(function(r, "f").params.empty());
    EXPECT_FALSE(function(r, "f").is_variadic);
}

TEST(ParserTest, PrecedenceAndAssociativity) {
    auto r = parse("int f(int a, int b, int c) { return a - b - c * 2 << 1 == 4 && !a; }");
    ASSERT_TRUE(r.success);

    const ast::Expr& e = *function(r, "f").body[0].expr;
    ASSERT_EQ(e.kind, ast::ExprKind::Binary);
    EXPECT_EQ(e.bop, ast::BinaryOp::LogAnd);

    const ast::Expr& eq = e.lhs();
    EXPECT_EQ(eq.bop, ast::BinaryOp::Eq);
    const ast::Expr& shl = eq.lhs();
    EXPECT_EQ(shl.bop, ast::BinaryOp::Shl);
    const ast::Expr& sub = shl.lhs();
    EXPECT_EQ(sub.bop, ast::BinaryOp::Sub);
    // (a - b) - (c * 2)
    EXPECT_EQ(sub.lhs().bop, ast::BinaryOp::Sub);
    EXPECT_EQ(sub.rhs().bop, ast::BinaryOp::Mul);
}

TEST(ParserTest, DeclarationsSplitIntoStatements) {
    auto r = parse("int f(void) { int a = 1, *p = &a, arr[3] = {1, 2}; return *p + arr[1]; }");
    ASSERT_TRUE(r.success);

    const auto& body = function(r, "f").body;
    ASSERT_EQ(body.size(), 4u);
    EXPECT_TRUE(body[1].decl->type.isPointer());
    EXPECT_TRUE(body[2].decl->type.isArray());
    ASSERT_EQ(body[2].decl->init->kind, ast::ExprKind::InitList);
    EXPECT_EQ(body[2].decl->init->args.size(), 2u);
}

TEST(ParserTest, StructsEnumsAndTypedefs) {
    auto r = parse(R"(
        struct point { int x; int y; };
        typedef struct point point_t;
        enum color { RED, GREEN = 5, BLUE };
        int f(point_t *p) { return p->y + BLUE; }
    )");
    ASSERT_TRUE(r.success);

    bool saw_enum = false;
    for (const auto& d : r.program.decls) {
        if (d.kind == ast::DeclKind::Enum) {
            saw_enum = true;
            ASSERT_EQ(d.enm.items.size(), 3u);
            EXPECT_EQ(d.enm.items[2].value, 6);
        }
    }
    EXPECT_TRUE(saw_enum);

    const auto& f = function(r, "f");
    ASSERT_TRUE(f.params[0].type.isPointer());
    EXPECT_EQ(f.params[0].type.pointee().tag, "point");
    const ast::Expr& sum = *f.body[0].expr;
    EXPECT_EQ(sum.lhs().kind, ast::ExprKind::Member);
    EXPECT_TRUE(sum.lhs().arrow);
}

TEST(ParserTest, AdjacentStringsConcatenate) {
    auto r = parse(R"(char *s = "ab" "cd";)");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.program.findGlobal("s")->init->text, "abcd");
}

TEST(ParserTest, ControlFlowStatements) {
    auto r = parse(R"(
        int f(int n) {
            int s = 0;
            for (int i = 0; i < n; i++) { if (i % 2) continue; s += i; }
            while (n > 0) n--;
            do { s++; } while (s < 3);
            switch (n) { case 0: s = 1; case 1: break; default: s = 2; }
            return s;
        }
    )");
    ASSERT_TRUE(r.success);

    const auto& body = function(r, "f").body;
    ASSERT_EQ(body.size(), 6u);
    EXPECT_EQ(body[1].kind, ast::StmtKind::For);
    EXPECT_EQ(body[1].init.size(), 1u);
    EXPECT_EQ(body[2].kind, ast::StmtKind::While);
    EXPECT_EQ(body[3].kind, ast::StmtKind::DoWhile);
    ASSERT_EQ(body[4].kind, ast::StmtKind::Switch);
    ASSERT_EQ(body[4].cases.size(), 3u);
    EXPECT_TRUE(body[4].cases[2].isDefault());
    EXPECT_EQ(body[4].cases[1].body.size(), 1u);
}

TEST(ParserTest, UnsupportedSyntaxIsReported) {
    const char* inputs[] = {
        "int f(void) { goto out; }",
        "int f(int a) { return a, a; }",
        "int f(void) { int x = 1 }",
        "int f(void) { extern int g; return g; }",
        "int a[2] = { [1] = 3 };",
    };
    for (const char* src : inputs) {
        auto r = parse(src);
        EXPECT_FALSE(r.success) << src;
        ASSERT_EQ(r.diagnostics.size(), 1u) << src;
        EXPECT_TRUE(r.diagnostics[0].isError());
        EXPECT_TRUE(r.diagnostics[0].loc.valid()) << src;
    }
}

TEST(ParserTest, StructReturnParses) {
    // rejected later, by the code generator
    auto r = parse("struct s { int a; }; struct s make(void) { struct s v; v.a = 1; return v; }");
    ASSERT_TRUE(r.success);
    const ast::Function& make = function(r, "make");
    EXPECT_TRUE(make.is_definition);
    EXPECT_TRUE(make.return_type.isRecord());
}

TEST(ParserTest, SystemHeaderDefinitionsBecomePrototypes) {
    auto r = parse("# 1 \"/usr/include/x.h\" 1 3\n"
                   "static inline int helper(int v) { return v * 2; }\n"
                   "# 3 \"prog.c\" 2\n"
                   "int main(void) { return helper(2); }\n");
    ASSERT_TRUE(r.success);
    EXPECT_FALSE(function(r, "helper").is_definition);
    EXPECT_TRUE(function(r, "main").is_definition);
}

// ============================================================================
// Preprocessor
// ============================================================================

TEST(PreprocessorTest, BuildCommand) {
    PreprocessorConfig config;
    config.include_paths = {"inc"};
    config.defines = {{"DEBUG", std::nullopt}, {"N", std::string("4")}};
    config.extra_flags = {"-C"};

    auto args = Preprocessor(config).buildCommand("in.c");
    std::vector<std::string> expected = {"cpp", "-m32", "-Iinc", "-DDEBUG", "-DN=4", "-C", "in.c"};
    EXPECT_EQ(args, expected);

    config.tool = "gcc";
    config.target_i386 = false;
    args = Preprocessor(config).buildCommand("in.c");
    EXPECT_EQ(args[0], "gcc");
    EXPECT_EQ(args[1], "-E");
    EXPECT_EQ(std::count(args.begin(), args.end(), "-m32"), 0);
}

TEST(PreprocessorTest, MissingToolIsExternalToolFailure) {
    PreprocessorConfig config;
    config.tool = "cloak-no-such-preprocessor";
    Preprocessor pp(config);

    EXPECT_FALSE(pp.isAvailable());
    auto result = pp.preprocessString("int x;\n");
    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].code, DiagCode::ExternalToolFailure);
    EXPECT_EQ(result.diagnostics[0].severity, Severity::Fatal);
}

TEST(PreprocessorTest, MissingInputFile) {
    auto result = Preprocessor().preprocessFile("/nonexistent/cloak/input.c");
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.diagnostics.contains(DiagCode::ExternalToolFailure));
}

TEST(PreprocessorTest, LostOutputIsNotSuccess) {
    Preprocessor pp;
    Preprocessor::ProcessOutput proc;
    proc.status = 0;
    proc.out = "int x";
    proc.io_error = "poll failed: Bad address";

    auto result = pp.interpret(proc, "in.c");
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.output.empty());
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].code, DiagCode::ExternalToolFailure);
    EXPECT_NE(result.diagnostics[0].message.find("poll failed"), std::string::npos);

    proc.io_error.clear();
    result = pp.interpret(proc, "in.c");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output, "int x");
}

TEST(PreprocessorTest, KilledOrFailingChildIsReported) {
    Preprocessor pp;
    Preprocessor::ProcessOutput proc;
    proc.timed_out = true;
    proc.status = 128 + 9;
    proc.out = "partial";
    auto result = pp.interpret(proc, "in.c");
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.diagnostics.contains(DiagCode::ExternalToolFailure));

    proc.timed_out = false;
    proc.status = 1;
    proc.err = "in.c:1:2: error: #error stop\nmore\n";
    result = pp.interpret(proc, "in.c");
    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_NE(result.diagnostics[0].message.find("#error stop"), std::string::npos);
}

TEST(PreprocessorTest, ExpandsMacros) {
    PreprocessorConfig config;
    config.target_i386 = false;
    config.defines = {{"VALUE", std::string("41")}};
    Preprocessor pp(config);
    if (!pp.isAvailable()) GTEST_SKIP() << "cpp is not installed";

    auto result = pp.preprocessString("#define INC(x) ((x) + 1)\nint v = INC(VALUE);\n");
    ASSERT_TRUE(result.success);
    auto parsed = parse(result.output);
    ASSERT_TRUE(parsed.success);
    const ast::VarDecl* v = parsed.program.findGlobal("v");
    ASSERT_NE(v, nullptr);
    EXPECT_NE(result.output.find("((41) + 1)"), std::string::npos);
}
