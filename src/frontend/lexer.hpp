/**
 * Cloak - Obfuscating C Compiler
 *
 * lexer.hpp - Tokenizer for preprocessed C
 *
 * Understands the line markers cpp leaves behind ("# 12 \"file.h\" 1 3")
 * so that locations refer to the original file and tokens coming from
 * system headers are flagged.
 */

#ifndef CLOAK_LEXER_HPP
#define CLOAK_LEXER_HPP

#include "../core/diagnostics.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cloak {
namespace frontend {

enum class TokenKind {
    Identifier,
    Keyword,
    IntLiteral,
    CharLiteral,
    StringLiteral,
    Punct,
    End
};

struct Token {
    TokenKind kind = TokenKind::End;
    std::string text;            // spelling; decoded bytes for string literals
    int64_t value = 0;           // integer and character literals
    bool is_unsigned = false;
    SourceLoc loc;
    bool from_system_header = false;

    bool is(TokenKind k, const char* spelling) const {
        return kind == k && text == spelling;
    }
    bool isPunct(const char* p) const { return is(TokenKind::Punct, p); }
    bool isKeyword(const char* k) const { return is(TokenKind::Keyword, k); }
};

class Lexer {
public:
    explicit Lexer(const std::string& source) : src_(source) {}

    /**
     * Tokenizes the whole input; the last token is End.
     * Throws CompileError(SyntaxInput) on malformed input.
     */
    std::vector<Token> tokenize();

    static bool isKeyword(const std::string& word);

private:
    std::string src_;
    size_t pos_ = 0;
    int line_ = 1;
    int col_ = 1;
    bool at_line_start_ = true;
    bool system_header_ = false;

    char peek(size_t ahead = 0) const {
        return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
    }
    char advance();
    SourceLoc here() const { return SourceLoc{line_, col_}; }

    void skipWhitespaceAndComments();
    void lineMarker();
    Token number();
    Token charLiteral();
    Token stringLiteral();
    Token identifierOrKeyword();
    Token punctuator();
    int escape();

    [[noreturn]] void fail(const std::string& msg, SourceLoc loc) const;
};

} // namespace frontend
} // namespace cloak

#endif // CLOAK_LEXER_HPP
