/**
 * Cloak - Obfuscating C Compiler
 *
 * lexer.cpp - Tokenizer for preprocessed C
 */

#include "lexer.hpp"

#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace cloak {
namespace frontend {

namespace {

const std::unordered_set<std::string>& keywords() {
    static const std::unordered_set<std::string> words = {
        "void", "char", "short", "int", "long", "signed", "unsigned", "float", "double",
        "_Bool", "const", "static", "extern", "typedef", "struct", "union", "enum",
        "if", "else", "for", "while", "do", "switch", "case", "default", "break",
        "continue", "return", "sizeof", "goto", "__attribute__", "__asm__",
    };
    return words;
}

// GNU spellings found in system headers, mapped to what the parser knows.
// An empty mapping drops the word.
const std::unordered_map<std::string, std::string>& aliases() {
    static const std::unordered_map<std::string, std::string> table = {
        {"__extension__", ""}, {"__restrict", ""}, {"__restrict__", ""}, {"restrict", ""},
        {"__inline", ""}, {"__inline__", ""}, {"inline", ""}, {"volatile", ""},
        {"__volatile", ""}, {"__volatile__", ""}, {"register", ""}, {"auto", ""},
        {"_Noreturn", ""}, {"__signed", "signed"}, {"__signed__", "signed"},
        {"__const", "const"}, {"__asm", "__asm__"}, {"asm", "__asm__"},
        {"__attribute", "__attribute__"},
    };
    return table;
}

const char* const kPunctuators[] = {
    "...", "<<=", ">>=",
    "->", "++", "--", "<<", ">>", "<=", ">=", "==", "!=", "&&", "||",
    "+=", "-=", "*=", "/=", "%=", "&=", "^=", "|=",
    "+", "-", "*", "/", "%", "<", ">", "=", "!", "~", "&", "|", "^",
    "?", ":", ";", ",", ".", "(", ")", "[", "]", "{", "}",
};

bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace

bool Lexer::isKeyword(const std::string& word) {
    return keywords().count(word) != 0;
}

void Lexer::fail(const std::string& msg, SourceLoc loc) const {
    throw CompileError(DiagCode::SyntaxInput, msg, loc);
}

char Lexer::advance() {
    char c = src_[pos_++];
    if (c == '\n') {
        line_++;
        col_ = 1;
        at_line_start_ = true;
    } else {
        col_++;
    }
    return c;
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    while (true) {
        skipWhitespaceAndComments();
        if (pos_ >= src_.size()) break;

        char c = peek();
        if (c == '#' && at_line_start_) {
            lineMarker();
            continue;
        }
        at_line_start_ = false;

        Token tok;
        if (std::isdigit(static_cast<unsigned char>(c))) {
            tok = number();
        } else if (c == '\'') {
            tok = charLiteral();
        } else if (c == '"') {
            tok = stringLiteral();
        } else if (isIdentStart(c)) {
            tok = identifierOrKeyword();
            if (tok.text.empty()) continue;   // dropped alias
        } else {
            tok = punctuator();
        }
        tok.from_system_header = system_header_;
        tokens.push_back(std::move(tok));
    }

    Token end;
    end.kind = TokenKind::End;
    end.loc = here();
    tokens.push_back(end);
    return tokens;
}

void Lexer::skipWhitespaceAndComments() {
    while (pos_ < src_.size()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v') {
            advance();
        } else if (c == '\\' && peek(1) == '\n') {
            advance();
            advance();
        } else if (c == '/' && peek(1) == '/') {
            while (pos_ < src_.size() && peek() != '\n') advance();
        } else if (c == '/' && peek(1) == '*') {
            SourceLoc start = here();
            advance();
            advance();
            while (pos_ < src_.size() && !(peek() == '*' && peek(1) == '/')) advance();
            if (pos_ >= src_.size()) fail("unterminated comment", start);
            advance();
            advance();
        } else {
            break;
        }
    }
}

void Lexer::lineMarker() {
    size_t start = pos_;
    while (pos_ < src_.size() && peek() != '\n') advance();
    std::string text = src_.substr(start + 1, pos_ - start - 1);

    size_t i = 0;
    auto skipSpaces = [&]() {
        while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) i++;
    };
    skipSpaces();
    if (text.compare(i, 4, "line") == 0) {
        i += 4;
        skipSpaces();
    }
    if (i >= text.size() || !std::isdigit(static_cast<unsigned char>(text[i]))) {
        return;   // #pragma, #ident and friends
    }

    long number = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        number = number * 10 + (text[i] - '0');
        i++;
    }
    skipSpaces();
    if (i < text.size() && text[i] == '"') {
        i++;
        while (i < text.size() && text[i] != '"') {
            if (text[i] == '\\') i++;
            i++;
        }
        i++;
    }

    bool system = false;
    while (i < text.size()) {
        skipSpaces();
        if (i < text.size() && text[i] == '3') system = true;
        while (i < text.size() && text[i] != ' ' && text[i] != '\t') i++;
    }

    system_header_ = system;
    // the newline ending the marker advances to the marker's number
    line_ = static_cast<int>(number) - 1;
}

int Lexer::escape() {
    SourceLoc loc = here();
    if (pos_ >= src_.size()) fail("unterminated escape sequence", loc);
    char c = advance();
    switch (c) {
        case 'n': return '\n';
        case 't': return '\t';
        case 'r': return '\r';
        case 'a': return '\a';
        case 'b': return '\b';
        case 'f': return '\f';
        case 'v': return '\v';
        case 'e': return 27;
        case '\\': return '\\';
        case '\'': return '\'';
        case '"': return '"';
        case '?': return '?';
        case 'x': {
            int value = 0;
            int digits = 0;
            while (std::isxdigit(static_cast<unsigned char>(peek()))) {
                char h = advance();
                value = value * 16 + (std::isdigit(static_cast<unsigned char>(h))
                    ? h - '0' : std::tolower(static_cast<unsigned char>(h)) - 'a' + 10);
                value &= 0xFFF;
                digits++;
            }
            if (digits == 0) fail("\\x used with no following hex digits", loc);
            return value & 0xFF;
        }
        default:
            if (c >= '0' && c <= '7') {
                int value = c - '0';
                for (int i = 0; i < 2 && peek() >= '0' && peek() <= '7'; i++) {
                    value = value * 8 + (advance() - '0');
                }
                return value & 0xFF;
            }
            fail(std::string("unknown escape sequence '\\") + c + "'", loc);
    }
}

Token Lexer::number() {
    Token tok;
    tok.kind = TokenKind::IntLiteral;
    tok.loc = here();
    size_t start = pos_;

    uint64_t value = 0;
    bool overflow = false;
    auto accumulate = [&](unsigned base, unsigned digit) {
        value = value * base + digit;
        if (value > 0xFFFFFFFFull) overflow = true;
    };

    if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X')) {
        advance();
        advance();
        if (!std::isxdigit(static_cast<unsigned char>(peek()))) {
            fail("invalid hexadecimal constant", tok.loc);
        }
        while (std::isxdigit(static_cast<unsigned char>(peek()))) {
            char h = advance();
            accumulate(16, std::isdigit(static_cast<unsigned char>(h))
                ? h - '0' : std::tolower(static_cast<unsigned char>(h)) - 'a' + 10);
        }
    } else {
        bool octal = peek() == '0';
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            char d = advance();
            if (octal && d > '7') fail("invalid digit in octal constant", tok.loc);
            accumulate(octal ? 8 : 10, static_cast<unsigned>(d - '0'));
        }
        if (peek() == '.' || peek() == 'e' || peek() == 'E') {
            fail("floating-point constants are not supported", tok.loc);
        }
    }

    bool has_u = false;
    while (peek() == 'u' || peek() == 'U' || peek() == 'l' || peek() == 'L') {
        if (advance() == 'u' || src_[pos_ - 1] == 'U') has_u = true;
    }
    if (isIdentChar(peek())) {
        fail("invalid suffix on integer constant", tok.loc);
    }
    if (overflow) fail("integer constant is too large", tok.loc);

    tok.text = src_.substr(start, pos_ - start);
    tok.value = static_cast<int64_t>(value);
    tok.is_unsigned = has_u || value > 0x7FFFFFFFull;
    return tok;
}

Token Lexer::charLiteral() {
    Token tok;
    tok.kind = TokenKind::CharLiteral;
    tok.loc = here();
    advance();

    if (peek() == '\'' || peek() == '\n' || pos_ >= src_.size()) {
        fail("empty character constant", tok.loc);
    }
    int byte = peek() == '\\' ? (advance(), escape()) : static_cast<unsigned char>(advance());
    if (peek() != '\'') fail("multi-character constants are not supported", tok.loc);
    advance();

    // plain char is signed on the target
    tok.value = static_cast<int8_t>(static_cast<uint8_t>(byte));
    tok.text = std::string(1, static_cast<char>(byte));
    return tok;
}

Token Lexer::stringLiteral() {
    Token tok;
    tok.kind = TokenKind::StringLiteral;
    tok.loc = here();
    advance();

    while (true) {
        if (pos_ >= src_.size() || peek() == '\n') {
            fail("missing terminating '\"' character", tok.loc);
        }
        char c = advance();
        if (c == '"') break;
        if (c == '\\') {
            tok.text += static_cast<char>(escape());
        } else {
            tok.text += c;
        }
    }
    return tok;
}

Token Lexer::identifierOrKeyword() {
    Token tok;
    tok.loc = here();
    size_t start = pos_;
    while (isIdentChar(peek())) advance();
    std::string word = src_.substr(start, pos_ - start);

    if ((word == "L" || word == "u" || word == "U" || word == "u8") &&
        (peek() == '"' || peek() == '\'')) {
        fail("wide and unicode literals are not supported", tok.loc);
    }

    auto alias = aliases().find(word);
    if (alias != aliases().end()) {
        word = alias->second;
        if (word.empty()) return Token{};
    }

    tok.kind = isKeyword(word) ? TokenKind::Keyword : TokenKind::Identifier;
    tok.text = word;
    return tok;
}

Token Lexer::punctuator() {
    Token tok;
    tok.kind = TokenKind::Punct;
    tok.loc = here();
    for (const char* p : kPunctuators) {
        size_t n = std::char_traits<char>::length(p);
        if (src_.compare(pos_, n, p) == 0) {
            for (size_t i = 0; i < n; i++) advance();
            tok.text = p;
            return tok;
        }
    }
    fail(std::string("stray '") + peek() + "' in program", tok.loc);
}

} // namespace frontend
} // namespace cloak
