/**
 * Cloak - Obfuscating C Compiler
 *
 * parser.hpp - Recursive-descent parser for the supported C subset
 *
 * Typedef names are resolved while parsing, so the Program never
 * contains a typedef reference. Records and enums are appended to the
 * Program when first seen. Anything outside the subset (bitfields,
 * goto, the comma operator, designated initializers, floating-point
 * literals) is rejected with a SyntaxInput error rather than skipped.
 */

#ifndef CLOAK_PARSER_HPP
#define CLOAK_PARSER_HPP

#include "lexer.hpp"
#include "../ast/ast.hpp"
#include "../ast/const_eval.hpp"
#include "../ast/type_layout.hpp"
#include "../common/logging.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cloak {
namespace frontend {

struct ParseResult {
    bool success = false;
    ast::Program program;
    DiagnosticList diagnostics;
};

class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    /**
     * Parses a whole translation unit. Throws CompileError on the first
     * syntax error.
     */
    ast::Program parseProgram();

private:
    struct DeclSpec {
        ast::Type base;
        bool is_typedef = false;
        bool is_static = false;
        bool is_extern = false;
        SourceLoc loc;
    };

    struct Declarator {
        std::string name;
        ast::Type type;
        SourceLoc loc;
        std::vector<ast::Param> params;   // when the name is directly a function
        bool has_params = false;
    };

    struct Suffix {
        bool is_function = false;
        long array_size = -1;
        std::vector<ast::Param> params;
        bool is_variadic = false;
    };

    using TypedefScope = std::unordered_map<std::string, std::optional<ast::Type>>;

    std::vector<Token> tokens_;
    size_t pos_ = 0;
    ast::Program program_;
    std::vector<TypedefScope> typedefs_;
    std::unordered_map<std::string, int64_t> enum_values_;
    std::unordered_set<std::string> complete_records_;
    std::unordered_set<std::string> known_records_;
    std::unordered_set<std::string> known_enums_;
    ast::TypeLayout layout_;
    int anon_counter_ = 0;
    Logger logger_{"Parser"};

    // token cursor
    const Token& peek(size_t ahead = 0) const;
    const Token& advance();
    bool acceptPunct(const char* p);
    bool acceptKeyword(const char* k);
    void expectPunct(const char* p, const char* context);
    std::string expectIdentifier(const char* context);
    [[noreturn]] void fail(const std::string& msg) const;
    [[noreturn]] void fail(const std::string& msg, SourceLoc loc) const;
    void skipBalanced(const char* open, const char* close);
    void skipAttributes();

    // typedef scopes
    void pushScope() { typedefs_.emplace_back(); }
    void popScope() { typedefs_.pop_back(); }
    const ast::Type* lookupTypedef(const std::string& name) const;
    void declareOrdinary(const std::string& name);
    void declareTypedef(const std::string& name, const ast::Type& type);

    // declarations
    bool isTypeName(const Token& tok) const;
    bool isDeclarationStart() const;
    DeclSpec parseDeclSpecifiers(bool allow_storage);
    ast::Type parseRecordSpecifier(SourceLoc loc);
    ast::Type parseEnumSpecifier(SourceLoc loc);
    Declarator parseDeclarator(ast::Type base, bool abstract);
    ast::Type applySuffixes(ast::Type base, std::vector<Suffix> suffixes, Declarator* direct);
    Suffix parseParameterList();
    ast::Type parseTypeName();
    long parseArraySize();
    int64_t evaluateConstant(const ast::Expr& e, const char* what);
    std::string anonymousName();

    void parseExternalDeclaration();
    void parseFunctionDefinition(const DeclSpec& spec, Declarator d, bool from_system);
    void parseLocalDeclaration(ast::Block& out);

    // statements
    ast::Block parseCompound();
    void parseBlockItem(ast::Block& out);
    ast::Stmt parseStatement();
    ast::Block parseBody();
    ast::Stmt parseIf();
    ast::Stmt parseFor();
    ast::Stmt parseSwitch();

    // expressions
    ast::Expr parseExpression();
    ast::Expr parseAssignment();
    ast::Expr parseConditional();
    ast::Expr parseBinary(int min_prec);
    ast::Expr parseUnary();
    ast::Expr parsePostfix(ast::Expr e);
    ast::Expr parsePrimary();
    ast::Expr parseInitializer();
};

/**
 * Tokenizes and parses preprocessed source text
 */
ParseResult parse(const std::string& source);

} // namespace frontend
} // namespace cloak

#endif // CLOAK_PARSER_HPP
