/**
 * Cloak - Obfuscating C Compiler
 *
 * parser.cpp - Recursive-descent parser for the supported C subset
 */

#include "parser.hpp"

namespace cloak {
namespace frontend {

using namespace ast;

namespace {

struct BinaryOpInfo {
    const char* spelling;
    BinaryOp op;
    int precedence;
};

const BinaryOpInfo kBinaryOps[] = {
    {"||", BinaryOp::LogOr, 1},
    {"&&", BinaryOp::LogAnd, 2},
    {"|", BinaryOp::BitOr, 3},
    {"^", BinaryOp::BitXor, 4},
    {"&", BinaryOp::BitAnd, 5},
    {"==", BinaryOp::Eq, 6},
    {"!=", BinaryOp::Ne, 6},
    {"<", BinaryOp::Lt, 7},
    {"<=", BinaryOp::Le, 7},
    {">", BinaryOp::Gt, 7},
    {">=", BinaryOp::Ge, 7},
    {"<<", BinaryOp::Shl, 8},
    {">>", BinaryOp::Shr, 8},
    {"+", BinaryOp::Add, 9},
    {"-", BinaryOp::Sub, 9},
    {"*", BinaryOp::Mul, 10},
    {"/", BinaryOp::Div, 10},
    {"%", BinaryOp::Mod, 10},
};

const BinaryOpInfo* binaryOpFor(const Token& tok) {
    if (tok.kind != TokenKind::Punct) return nullptr;
    for (const auto& info : kBinaryOps) {
        if (tok.text == info.spelling) return &info;
    }
    return nullptr;
}

struct AssignOpInfo {
    const char* spelling;
    BinaryOp op;
};

const AssignOpInfo kCompoundAssignOps[] = {
    {"+=", BinaryOp::Add}, {"-=", BinaryOp::Sub}, {"*=", BinaryOp::Mul},
    {"/=", BinaryOp::Div}, {"%=", BinaryOp::Mod}, {"<<=", BinaryOp::Shl},
    {">>=", BinaryOp::Shr}, {"&=", BinaryOp::BitAnd}, {"|=", BinaryOp::BitOr},
    {"^=", BinaryOp::BitXor},
};

bool isTypeKeyword(const std::string& word) {
    static const std::unordered_set<std::string> words = {
        "void", "char", "short", "int", "long", "signed", "unsigned", "float",
        "double", "_Bool", "const", "struct", "union", "enum",
    };
    return words.count(word) != 0;
}

bool isStorageKeyword(const std::string& word) {
    return word == "static" || word == "extern" || word == "typedef";
}

} // namespace

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || tokens_.back().kind != TokenKind::End) {
        Token end;
        end.kind = TokenKind::End;
        tokens_.push_back(end);
    }
    pushScope();
    // compiler-provided type names glibc headers rely on
    declareTypedef("__builtin_va_list", Type::pointerTo(Type::charType()));
    for (const char* name : {"_Float32", "_Float32x"}) {
        declareTypedef(name, Type::make(TypeKind::Float));
    }
    for (const char* name : {"_Float64", "_Float64x", "_Float128", "__float128"}) {
        declareTypedef(name, Type::make(TypeKind::Double));
    }
}

// ============================================================================
// Token cursor
// ============================================================================

const Token& Parser::peek(size_t ahead) const {
    size_t i = pos_ + ahead;
    return i < tokens_.size() ? tokens_[i] : tokens_.back();
}

const Token& Parser::advance() {
    const Token& tok = peek();
    if (pos_ < tokens_.size() - 1) pos_++;
    return tok;
}

bool Parser::acceptPunct(const char* p) {
    if (peek().isPunct(p)) {
        advance();
        return true;
    }
    return false;
}

bool Parser::acceptKeyword(const char* k) {
    if (peek().isKeyword(k)) {
        advance();
        return true;
    }
    return false;
}

void Parser::expectPunct(const char* p, const char* context) {
    if (!acceptPunct(p)) {
        const Token& tok = peek();
        std::string found = tok.kind == TokenKind::End ? "end of input" : "'" + tok.text + "'";
        fail(std::string("expected '") + p + "' " + context + ", found " + found);
    }
}

std::string Parser::expectIdentifier(const char* context) {
    if (peek().kind != TokenKind::Identifier) {
        fail(std::string("expected identifier ") + context);
    }
    return advance().text;
}

void Parser::fail(const std::string& msg) const {
    fail(msg, peek().loc);
}

void Parser::fail(const std::string& msg, SourceLoc loc) const {
    throw CompileError(DiagCode::SyntaxInput, msg, loc);
}

void Parser::skipBalanced(const char* open, const char* close) {
    SourceLoc start = peek().loc;
    expectPunct(open, "to open group");
    int depth = 1;
    while (depth > 0) {
        if (peek().kind == TokenKind::End) fail(std::string("unbalanced '") + open + "'", start);
        const Token& tok = advance();
        if (tok.isPunct(open)) depth++;
        else if (tok.isPunct(close)) depth--;
    }
}

void Parser::skipAttributes() {
    while (peek().isKeyword("__attribute__") || peek().isKeyword("__asm__")) {
        advance();
        skipBalanced("(", ")");
    }
}

// ============================================================================
// Typedef scopes
// ============================================================================

const Type* Parser::lookupTypedef(const std::string& name) const {
    for (auto it = typedefs_.rbegin(); it != typedefs_.rend(); ++it) {
        auto found = it->find(name);
        if (found != it->end()) {
            return found->second ? &*found->second : nullptr;
        }
    }
    return nullptr;
}

void Parser::declareOrdinary(const std::string& name) {
    typedefs_.back()[name] = std::nullopt;
}

void Parser::declareTypedef(const std::string& name, const Type& type) {
    typedefs_.back()[name] = type;
}

// ============================================================================
// Declarations
// ============================================================================

bool Parser::isTypeName(const Token& tok) const {
    if (tok.kind == TokenKind::Keyword) return isTypeKeyword(tok.text);
    if (tok.kind == TokenKind::Identifier) return lookupTypedef(tok.text) != nullptr;
    return false;
}

bool Parser::isDeclarationStart() const {
    const Token& tok = peek();
    if (tok.kind == TokenKind::Keyword) {
        return isTypeKeyword(tok.text) || isStorageKeyword(tok.text) ||
               tok.text == "__attribute__";
    }
    return isTypeName(tok);
}

std::string Parser::anonymousName() {
    return "__anon_" + std::to_string(anon_counter_++);
}

Parser::DeclSpec Parser::parseDeclSpecifiers(bool allow_storage) {
    DeclSpec spec;
    spec.loc = peek().loc;

    bool is_const = false;
    bool seen_signed = false, seen_unsigned = false;
    int longs = 0;
    bool seen_short = false, seen_char = false, seen_int = false, seen_void = false;
    bool seen_float = false, seen_double = false, seen_bool = false;
    std::optional<Type> named;   // struct/union/enum or typedef name

    while (true) {
        const Token& tok = peek();
        if (tok.kind == TokenKind::Keyword) {
            const std::string& w = tok.text;
            if (isStorageKeyword(w)) {
                if (!allow_storage) fail("storage class '" + w + "' not allowed here");
                if (w == "static") spec.is_static = true;
                else if (w == "extern") spec.is_extern = true;
                else spec.is_typedef = true;
                advance();
            } else if (w == "const") { is_const = true; advance(); }
            else if (w == "signed") { seen_signed = true; advance(); }
            else if (w == "unsigned") { seen_unsigned = true; advance(); }
            else if (w == "long") { longs++; advance(); }
            else if (w == "short") { seen_short = true; advance(); }
            else if (w == "char") { seen_char = true; advance(); }
            else if (w == "int") { seen_int = true; advance(); }
            else if (w == "void") { seen_void = true; advance(); }
            else if (w == "float") { seen_float = true; advance(); }
            else if (w == "double") { seen_double = true; advance(); }
            else if (w == "_Bool") { seen_bool = true; advance(); }
            else if (w == "struct" || w == "union") {
                if (named) fail("two or more data types in declaration specifiers");
                SourceLoc loc = tok.loc;
                named = parseRecordSpecifier(loc);
            } else if (w == "enum") {
                if (named) fail("two or more data types in declaration specifiers");
                SourceLoc loc = tok.loc;
                named = parseEnumSpecifier(loc);
            } else if (w == "__attribute__") {
                skipAttributes();
            } else {
                break;
            }
        } else if (tok.kind == TokenKind::Identifier && !named && !seen_int && !seen_char &&
                   !seen_short && !seen_void && !seen_float && !seen_double && !seen_bool &&
                   longs == 0 && !seen_signed && !seen_unsigned) {
            const Type* t = lookupTypedef(tok.text);
            if (!t) break;
            named = *t;
            advance();
        } else {
            break;
        }
    }

    Type base;
    if (named) {
        base = *named;
    } else if (seen_void) {
        base = Type::voidType();
    } else if (seen_bool) {
        base = Type::charType(true);
    } else if (seen_char) {
        base = Type::charType(seen_unsigned);
    } else if (seen_short) {
        base = Type::make(TypeKind::Short, seen_unsigned);
    } else if (seen_float) {
        base = Type::make(TypeKind::Float);
    } else if (seen_double) {
        base = Type::make(TypeKind::Double);
    } else if (longs >= 2) {
        base = Type::make(TypeKind::LongLong, seen_unsigned);
    } else if (longs == 1) {
        base = Type::make(TypeKind::Long, seen_unsigned);
    } else if (seen_int || seen_signed || seen_unsigned) {
        base = Type::intType(seen_unsigned);
    } else {
        fail("expected type specifier");
    }
    if (is_const) base.is_const = true;
    spec.base = base;
    return spec;
}

Type Parser::parseRecordSpecifier(SourceLoc loc) {
    bool is_union = advance().text == "union";
    skipAttributes();

    std::string name;
    if (peek().kind == TokenKind::Identifier) {
        name = advance().text;
    }
    skipAttributes();

    if (!peek().isPunct("{")) {
        if (name.empty()) fail("expected '{' after anonymous struct");
        if (!known_records_.count(name)) {
            RecordDef fwd;
            fwd.name = name;
            fwd.is_union = is_union;
            fwd.loc = loc;
            TopDecl d;
            d.kind = DeclKind::Record;
            d.record = std::move(fwd);
            program_.decls.push_back(std::move(d));
            known_records_.insert(name);
        }
        return Type::record(is_union, name);
    }

    if (typedefs_.size() > 1) {
        fail("struct and union definitions are only supported at file scope", loc);
    }
    if (name.empty()) name = anonymousName();
    if (complete_records_.count(name)) {
        throw CompileError(DiagCode::DuplicateSymbol, "redefinition of '" +
                           std::string(is_union ? "union " : "struct ") + name + "'", loc);
    }
    known_records_.insert(name);

    RecordDef rec;
    rec.name = name;
    rec.is_union = is_union;
    rec.is_complete = true;
    rec.loc = loc;

    expectPunct("{", "to open struct body");
    std::unordered_set<std::string> field_names;
    while (!acceptPunct("}")) {
        DeclSpec spec = parseDeclSpecifiers(false);
        if (acceptPunct(";")) {
            fail("anonymous struct members are not supported", spec.loc);
        }
        while (true) {
            Declarator d = parseDeclarator(spec.base, false);
            if (peek().isPunct(":")) fail("bit-fields are not supported");
            skipAttributes();
            if (d.type.isFunction()) fail("field '" + d.name + "' declared as a function", d.loc);
            if (d.type.isArray() && d.type.array_size < 0) {
                fail("flexible array members are not supported", d.loc);
            }
            if (d.type.isRecord() && !complete_records_.count(d.type.tag)) {
                fail("field '" + d.name + "' has incomplete type", d.loc);
            }
            if (!field_names.insert(d.name).second) {
                throw CompileError(DiagCode::DuplicateSymbol, "duplicate member '" + d.name + "'", d.loc);
            }
            rec.fields.push_back(Field{d.name, d.type});
            if (!acceptPunct(",")) break;
        }
        expectPunct(";", "after struct member");
    }
    if (rec.fields.empty()) fail("empty struct is not supported", loc);
    skipAttributes();

    layout_.addRecord(rec);
    complete_records_.insert(name);
    TopDecl d;
    d.kind = DeclKind::Record;
    d.record = std::move(rec);
    program_.decls.push_back(std::move(d));
    return Type::record(is_union, name);
}

Type Parser::parseEnumSpecifier(SourceLoc loc) {
    advance();   // enum
    skipAttributes();
    std::string name;
    if (peek().kind == TokenKind::Identifier) {
        name = advance().text;
    }
    if (!peek().isPunct("{")) {
        if (name.empty()) fail("expected '{' after anonymous enum");
        return Type::enumType(name);
    }
    if (typedefs_.size() > 1) {
        fail("enum definitions are only supported at file scope", loc);
    }
    if (name.empty()) name = anonymousName();
    if (!known_enums_.insert(name).second) {
        throw CompileError(DiagCode::DuplicateSymbol, "redefinition of 'enum " + name + "'", loc);
    }

    EnumDef def;
    def.name = name;
    def.loc = loc;
    expectPunct("{", "to open enum body");
    int64_t next = 0;
    while (!acceptPunct("}")) {
        Enumerator item;
        item.loc = peek().loc;
        item.name = expectIdentifier("in enumerator list");
        if (acceptPunct("=")) {
            Expr value = parseConditional();
            next = evaluateConstant(value, "enumerator value");
        }
        item.value = next;
        if (item.value < INT32_MIN || item.value > INT32_MAX) {
            fail("enumerator value for '" + item.name + "' is not an int", item.loc);
        }
        next = item.value + 1;
        enum_values_[item.name] = item.value;
        declareOrdinary(item.name);
        def.items.push_back(std::move(item));
        if (!acceptPunct(",")) {
            expectPunct("}", "to close enum body");
            break;
        }
    }
    skipAttributes();

    TopDecl d;
    d.kind = DeclKind::Enum;
    d.enm = std::move(def);
    program_.decls.push_back(std::move(d));
    return Type::enumType(name);
}

Parser::Declarator Parser::parseDeclarator(Type base, bool abstract) {
    while (acceptPunct("*")) {
        base = Type::pointerTo(std::move(base));
        while (true) {
            if (acceptKeyword("const")) base.is_const = true;
            else if (peek().isKeyword("__attribute__")) skipAttributes();
            else break;
        }
    }
    skipAttributes();

    Declarator d;
    d.loc = peek().loc;

    const Token& next = peek(1);
    bool nested = peek().isPunct("(") &&
        (next.isPunct("*") || next.isPunct("(") || next.isPunct("[") ||
         next.isKeyword("__attribute__") ||
         (next.kind == TokenKind::Identifier && !lookupTypedef(next.text)));

    if (nested) {
        // the suffixes after the parenthesized part bind tighter than it
        size_t inner = pos_;
        skipBalanced("(", ")");
        std::vector<Suffix> suffixes;
        while (peek().isPunct("[") || peek().isPunct("(")) {
            if (acceptPunct("[")) {
                Suffix s;
                s.array_size = parseArraySize();
                suffixes.push_back(std::move(s));
            } else {
                suffixes.push_back(parseParameterList());
            }
        }
        Type outer = applySuffixes(std::move(base), std::move(suffixes), nullptr);
        size_t after = pos_;
        pos_ = inner + 1;
        Declarator result = parseDeclarator(std::move(outer), abstract);
        expectPunct(")", "to close declarator");
        pos_ = after;
        return result;
    }

    if (peek().kind == TokenKind::Identifier && !(abstract && lookupTypedef(peek().text))) {
        d.name = advance().text;
    } else if (!abstract) {
        fail("expected identifier in declarator");
    }

    std::vector<Suffix> suffixes;
    while (peek().isPunct("[") || peek().isPunct("(")) {
        if (acceptPunct("[")) {
            Suffix s;
            s.array_size = parseArraySize();
            suffixes.push_back(std::move(s));
        } else {
            suffixes.push_back(parseParameterList());
        }
    }
    d.type = applySuffixes(std::move(base), std::move(suffixes), &d);
    return d;
}

Type Parser::applySuffixes(Type base, std::vector<Suffix> suffixes, Declarator* direct) {
    for (size_t i = suffixes.size(); i-- > 0;) {
        Suffix& s = suffixes[i];
        if (s.is_function) {
            if (base.isFunction()) fail("function cannot return a function");
            if (base.isArray()) fail("function cannot return an array");
            std::vector<Type> ptypes;
            for (const auto& p : s.params) ptypes.push_back(p.type);
            base = Type::function(std::move(base), std::move(ptypes), s.is_variadic);
            if (i == 0 && direct) {
                direct->params = std::move(s.params);
                direct->has_params = true;
            }
        } else {
            if (base.isFunction()) fail("declaration of an array of functions");
            if (base.isVoid()) fail("declaration of an array of voids");
            base = Type::arrayOf(std::move(base), s.array_size);
        }
    }
    return base;
}

long Parser::parseArraySize() {
    // "[" already consumed
    while (acceptKeyword("const") || acceptKeyword("static")) {}
    if (acceptPunct("]")) return -1;
    Expr size = parseConditional();
    int64_t n = evaluateConstant(size, "array size");
    if (n < 0) fail("array size is negative", size.loc);
    expectPunct("]", "after array size");
    return static_cast<long>(n);
}

Parser::Suffix Parser::parseParameterList() {
    Suffix s;
    s.is_function = true;
    expectPunct("(", "to open parameter list");
    if (acceptPunct(")")) return s;
    if (peek().isKeyword("void") && peek(1).isPunct(")")) {
        advance();
        advance();
        return s;
    }

    pushScope();
    while (true) {
        if (acceptPunct("...")) {
            s.is_variadic = true;
            break;
        }
        SourceLoc loc = peek().loc;
        DeclSpec spec = parseDeclSpecifiers(false);
        Declarator d = parseDeclarator(spec.base, true);
        skipAttributes();
        Type t = d.type;
        if (t.isArray()) {
            Type elem = t.element();
            t = Type::pointerTo(std::move(elem));
        } else if (t.isFunction()) {
            t = Type::pointerTo(std::move(t));
        }
        if (t.isVoid()) fail("parameter has type void", loc);
        if (!d.name.empty()) declareOrdinary(d.name);
        s.params.push_back(Param{d.name, std::move(t), d.name.empty() ? loc : d.loc});
        if (!acceptPunct(",")) break;
    }
    popScope();
    expectPunct(")", "to close parameter list");
    return s;
}

Type Parser::parseTypeName() {
    DeclSpec spec = parseDeclSpecifiers(false);
    Declarator d = parseDeclarator(spec.base, true);
    if (!d.name.empty()) fail("unexpected identifier '" + d.name + "' in type name", d.loc);
    return d.type;
}

int64_t Parser::evaluateConstant(const Expr& e, const char* what) {
    ConstEvaluator eval(&layout_, [this](const std::string& name) -> std::optional<int64_t> {
        auto it = enum_values_.find(name);
        if (it == enum_values_.end()) return std::nullopt;
        return it->second;
    });
    auto v = eval.evaluateInt(e);
    if (!v) fail(std::string(what) + " is not an integer constant", e.loc);
    return *v;
}

ast::Program Parser::parseProgram() {
    while (peek().kind != TokenKind::End) {
        parseExternalDeclaration();
    }
    logger_.debug("parsed {} top-level declarations", program_.decls.size());
    return std::move(program_);
}

void Parser::parseExternalDeclaration() {
    if (acceptPunct(";")) return;
    if (peek().isKeyword("__asm__")) {
        skipAttributes();
        expectPunct(";", "after top-level asm");
        return;
    }
    if (peek().kind == TokenKind::Identifier && peek().text == "_Static_assert") {
        advance();
        skipBalanced("(", ")");
        expectPunct(";", "after _Static_assert");
        return;
    }

    bool from_system = peek().from_system_header;
    DeclSpec spec = parseDeclSpecifiers(true);
    if (acceptPunct(";")) return;

    bool first = true;
    while (true) {
        Declarator d = parseDeclarator(spec.base, false);
        skipAttributes();

        if (spec.is_typedef) {
            declareTypedef(d.name, d.type);
            TopDecl td;
            td.kind = DeclKind::Typedef;
            td.tdef = TypedefDecl{d.name, d.type, d.loc};
            program_.decls.push_back(std::move(td));
        } else if (d.type.isFunction()) {
            if (first && peek().isPunct("{")) {
                parseFunctionDefinition(spec, std::move(d), from_system);
                return;
            }
            Function f;
            f.name = d.name;
            f.return_type = d.type.returnType();
            f.is_variadic = d.type.is_variadic;
            f.is_static = spec.is_static;
            f.loc = d.loc;
            for (size_t i = 0; i < d.type.paramCount(); i++) {
                std::string pname = i < d.params.size() ? d.params[i].name : std::string();
                f.params.push_back(Param{pname, d.type.param(i), d.loc});
            }
            declareOrdinary(d.name);
            program_.decls.push_back(make::functionDecl(std::move(f)));
        } else {
            VarDecl v;
            v.name = d.name;
            v.type = d.type;
            v.loc = d.loc;
            v.is_static = spec.is_static;
            v.is_extern = spec.is_extern;
            if (acceptPunct("=")) {
                v.init = parseInitializer();
            }
            declareOrdinary(d.name);
            program_.decls.push_back(make::globalDecl(std::move(v)));
        }

        first = false;
        if (!acceptPunct(",")) break;
    }
    expectPunct(";", "after declaration");
}

void Parser::parseFunctionDefinition(const DeclSpec& spec, Declarator d, bool from_system) {
    Function f;
    f.name = d.name;
    f.return_type = d.type.returnType();
    f.is_variadic = d.type.is_variadic;
    f.is_static = spec.is_static;
    f.loc = d.loc;
    declareOrdinary(d.name);

    if (from_system) {
        // inline definitions in system headers are kept as prototypes
        for (const auto& p : d.params) f.params.push_back(p);
        skipBalanced("{", "}");
        program_.decls.push_back(make::functionDecl(std::move(f)));
        return;
    }

    if (!d.has_params) fail("function definition without a parameter list", d.loc);
    if (spec.is_typedef) fail("typedef with a function body", d.loc);
    // struct returns parse; the code generator reports them
    if (f.return_type.isArray()) fail("function '" + f.name + "' returns an array", d.loc);
    for (const auto& p : d.params) {
        if (p.name.empty()) fail("parameter name omitted in definition of '" + f.name + "'", p.loc);
        f.params.push_back(p);
    }

    f.is_definition = true;
    pushScope();
    for (const auto& p : f.params) declareOrdinary(p.name);
    f.body = parseCompound();
    popScope();
    logger_.trace("parsed function '{}' ({} statements)", f.name, f.body.size());
    program_.decls.push_back(make::functionDecl(std::move(f)));
}

void Parser::parseLocalDeclaration(Block& out) {
    DeclSpec spec = parseDeclSpecifiers(true);
    if (acceptPunct(";")) return;
    if (spec.is_extern && !spec.is_typedef) {
        fail("block-scope extern declarations are not supported", spec.loc);
    }

    while (true) {
        Declarator d = parseDeclarator(spec.base, false);
        skipAttributes();
        if (spec.is_typedef) {
            declareTypedef(d.name, d.type);
        } else if (d.type.isFunction()) {
            // a local prototype declares a file-scope function
            if (!program_.findFunction(d.name)) {
                Function f;
                f.name = d.name;
                f.return_type = d.type.returnType();
                f.is_variadic = d.type.is_variadic;
                f.loc = d.loc;
                for (size_t i = 0; i < d.type.paramCount(); i++) {
                    f.params.push_back(Param{"", d.type.param(i), d.loc});
                }
                program_.decls.push_back(make::functionDecl(std::move(f)));
            }
            declareOrdinary(d.name);
        } else {
            VarDecl v;
            v.name = d.name;
            v.type = d.type;
            v.loc = d.loc;
            v.is_static = spec.is_static;
            // the name is in scope inside its own initializer
            declareOrdinary(d.name);
            if (acceptPunct("=")) {
                v.init = parseInitializer();
            }
            out.push_back(make::declStmt(std::move(v)));
        }
        if (!acceptPunct(",")) break;
    }
    expectPunct(";", "after declaration");
}

// ============================================================================
// Statements
// ============================================================================

Block Parser::parseCompound() {
    expectPunct("{", "to open block");
    pushScope();
    Block body;
    while (!peek().isPunct("}")) {
        if (peek().kind == TokenKind::End) fail("expected '}' at end of input");
        parseBlockItem(body);
    }
    advance();
    popScope();
    return body;
}

void Parser::parseBlockItem(Block& out) {
    // an identifier followed by ':' is a label, even if it names a type
    if (isDeclarationStart() && !peek(1).isPunct(":")) {
        parseLocalDeclaration(out);
    } else {
        out.push_back(parseStatement());
    }
}

Block Parser::parseBody() {
    if (peek().isPunct("{")) return parseCompound();
    if (isDeclarationStart()) fail("a declaration is not allowed as a statement body");
    Block body;
    body.push_back(parseStatement());
    return body;
}

Stmt Parser::parseStatement() {
    const Token& tok = peek();
    SourceLoc loc = tok.loc;

    if (tok.isPunct("{")) {
        Stmt s = make::compound(parseCompound());
        s.loc = loc;
        return s;
    }
    if (acceptPunct(";")) {
        Stmt s = make::empty();
        s.loc = loc;
        return s;
    }
    if (tok.kind == TokenKind::Identifier && peek(1).isPunct(":")) {
        fail("labels and goto are not supported");
    }
    if (tok.kind == TokenKind::Keyword) {
        const std::string w = tok.text;
        if (w == "if") return parseIf();
        if (w == "for") return parseFor();
        if (w == "switch") return parseSwitch();
        if (w == "while") {
            advance();
            expectPunct("(", "after 'while'");
            Expr c = parseExpression();
            expectPunct(")", "after while condition");
            Stmt s = make::whileStmt(std::move(c), parseBody());
            s.loc = loc;
            return s;
        }
        if (w == "do") {
            advance();
            Block body = parseBody();
            if (!acceptKeyword("while")) fail("expected 'while' after do body");
            expectPunct("(", "after 'while'");
            Expr c = parseExpression();
            expectPunct(")", "after do-while condition");
            expectPunct(";", "after do-while");
            Stmt s = make::doWhileStmt(std::move(body), std::move(c));
            s.loc = loc;
            return s;
        }
        if (w == "break" || w == "continue") {
            advance();
            expectPunct(";", w == "break" ? "after 'break'" : "after 'continue'");
            Stmt s = w == "break" ? make::breakStmt() : make::continueStmt();
            s.loc = loc;
            return s;
        }
        if (w == "return") {
            advance();
            std::optional<Expr> value;
            if (!peek().isPunct(";")) value = parseExpression();
            expectPunct(";", "after return");
            Stmt s = make::returnStmt(std::move(value));
            s.loc = loc;
            return s;
        }
        if (w == "case" || w == "default") {
            fail("'" + w + "' label not directly inside a switch body");
        }
        if (w == "goto") fail("labels and goto are not supported");
        if (w == "else") fail("'else' without a previous 'if'");
    }

    Expr e = parseExpression();
    if (peek().isPunct(",")) fail("the comma operator is not supported");
    expectPunct(";", "after expression");
    Stmt s = make::exprStmt(std::move(e));
    s.loc = loc;
    return s;
}

Stmt Parser::parseIf() {
    SourceLoc loc = advance().loc;
    expectPunct("(", "after 'if'");
    Expr c = parseExpression();
    expectPunct(")", "after if condition");
    Block then_body = parseBody();
    Stmt s;
    if (acceptKeyword("else")) {
        s = make::ifElseStmt(std::move(c), std::move(then_body), parseBody());
    } else {
        s = make::ifStmt(std::move(c), std::move(then_body));
    }
    s.loc = loc;
    return s;
}

Stmt Parser::parseFor() {
    SourceLoc loc = advance().loc;
    expectPunct("(", "after 'for'");
    pushScope();

    Block init;
    if (isDeclarationStart()) {
        parseLocalDeclaration(init);
        for (const auto& d : init) {
            if (d.decl->is_static) fail("static declaration in for-init", d.loc);
        }
    } else if (!acceptPunct(";")) {
        init.push_back(make::exprStmt(parseExpression()));
        if (peek().isPunct(",")) fail("the comma operator is not supported");
        expectPunct(";", "after for initializer");
    }

    std::optional<Expr> c;
    if (!peek().isPunct(";")) c = parseExpression();
    expectPunct(";", "after for condition");
    std::optional<Expr> step;
    if (!peek().isPunct(")")) step = parseExpression();
    if (peek().isPunct(",")) fail("the comma operator is not supported");
    expectPunct(")", "after for clauses");

    Block body = parseBody();
    popScope();
    Stmt s = make::forStmt(std::move(init), std::move(c), std::move(step), std::move(body));
    s.loc = loc;
    return s;
}

Stmt Parser::parseSwitch() {
    SourceLoc loc = advance().loc;
    expectPunct("(", "after 'switch'");
    Expr c = parseExpression();
    expectPunct(")", "after switch condition");
    if (!peek().isPunct("{")) fail("switch body must be a braced block");
    advance();
    pushScope();

    std::vector<SwitchCase> cases;
    while (!acceptPunct("}")) {
        if (peek().kind == TokenKind::End) fail("expected '}' at end of input");
        SourceLoc item_loc = peek().loc;
        if (acceptKeyword("case")) {
            SwitchCase sc;
            sc.loc = item_loc;
            sc.value = parseConditional();
            expectPunct(":", "after case value");
            cases.push_back(std::move(sc));
        } else if (acceptKeyword("default")) {
            SwitchCase sc;
            sc.loc = item_loc;
            expectPunct(":", "after 'default'");
            cases.push_back(std::move(sc));
        } else {
            if (cases.empty()) fail("statement before the first case label");
            parseBlockItem(cases.back().body);
        }
    }
    popScope();
    Stmt s = make::switchStmt(std::move(c), std::move(cases));
    s.loc = loc;
    return s;
}

// ============================================================================
// Expressions
// ============================================================================

Expr Parser::parseExpression() {
    return parseAssignment();
}

Expr Parser::parseAssignment() {
    Expr lhs = parseConditional();
    SourceLoc loc = peek().loc;
    if (acceptPunct("=")) {
        Expr e = make::assign(std::move(lhs), parseAssignment());
        e.loc = loc;
        return e;
    }
    for (const auto& info : kCompoundAssignOps) {
        if (acceptPunct(info.spelling)) {
            Expr e = make::compoundAssign(info.op, std::move(lhs), parseAssignment());
            e.loc = loc;
            return e;
        }
    }
    return lhs;
}

Expr Parser::parseConditional() {
    Expr c = parseBinary(1);
    SourceLoc loc = peek().loc;
    if (!acceptPunct("?")) return c;
    Expr t = parseExpression();
    expectPunct(":", "in conditional expression");
    Expr f = parseConditional();
    Expr e = make::ternary(std::move(c), std::move(t), std::move(f));
    e.loc = loc;
    return e;
}

Expr Parser::parseBinary(int min_prec) {
    Expr lhs = parseUnary();
    while (true) {
        const BinaryOpInfo* info = binaryOpFor(peek());
        if (!info || info->precedence < min_prec) break;
        SourceLoc loc = advance().loc;
        Expr rhs = parseBinary(info->precedence + 1);
        lhs = make::binary(info->op, std::move(lhs), std::move(rhs));
        lhs.loc = loc;
    }
    return lhs;
}

Expr Parser::parseUnary() {
    const Token& tok = peek();
    SourceLoc loc = tok.loc;

    struct Prefix { const char* spelling; UnaryOp op; };
    static const Prefix kPrefixes[] = {
        {"++", UnaryOp::PreInc}, {"--", UnaryOp::PreDec}, {"+", UnaryOp::Plus},
        {"-", UnaryOp::Neg}, {"!", UnaryOp::Not}, {"~", UnaryOp::BitNot},
        {"&", UnaryOp::AddrOf}, {"*", UnaryOp::Deref},
    };
    for (const auto& p : kPrefixes) {
        if (acceptPunct(p.spelling)) {
            Expr e = make::unary(p.op, parseUnary());
            e.loc = loc;
            return e;
        }
    }

    if (acceptKeyword("sizeof")) {
        if (peek().isPunct("(") && isTypeName(peek(1))) {
            advance();
            Type t = parseTypeName();
            expectPunct(")", "after sizeof type");
            Expr e = make::sizeofType(t);
            e.loc = loc;
            return e;
        }
        Expr e = make::sizeofExpr(parseUnary());
        e.loc = loc;
        return e;
    }

    if (tok.isPunct("(") && isTypeName(peek(1))) {
        advance();
        Type t = parseTypeName();
        expectPunct(")", "after cast type");
        if (peek().isPunct("{")) fail("compound literals are not supported");
        Expr e = make::cast(t, parseUnary());
        e.loc = loc;
        return e;
    }

    return parsePostfix(parsePrimary());
}

Expr Parser::parsePostfix(Expr e) {
    while (true) {
        SourceLoc loc = peek().loc;
        if (acceptPunct("[")) {
            Expr idx = parseExpression();
            expectPunct("]", "after array index");
            e = make::index(std::move(e), std::move(idx));
            e.loc = loc;
        } else if (acceptPunct("(")) {
            Expr call;
            call.kind = ExprKind::Call;
            call.loc = e.loc;
            call.args.push_back(std::move(e));
            if (!acceptPunct(")")) {
                while (true) {
                    call.args.push_back(parseAssignment());
                    if (acceptPunct(")")) break;
                    expectPunct(",", "between call arguments");
                }
            }
            e = std::move(call);
        } else if (acceptPunct(".")) {
            std::string field = expectIdentifier("after '.'");
            e = make::member(std::move(e), field, false);
            e.loc = loc;
        } else if (acceptPunct("->")) {
            std::string field = expectIdentifier("after '->'");
            e = make::member(std::move(e), field, true);
            e.loc = loc;
        } else if (acceptPunct("++")) {
            e = make::unary(UnaryOp::PostInc, std::move(e));
            e.loc = loc;
        } else if (acceptPunct("--")) {
            e = make::unary(UnaryOp::PostDec, std::move(e));
            e.loc = loc;
        } else {
            return e;
        }
    }
}

Expr Parser::parsePrimary() {
    const Token& tok = peek();
    SourceLoc loc = tok.loc;

    switch (tok.kind) {
        case TokenKind::IntLiteral: {
            Expr e = make::intLit(tok.value, tok.is_unsigned);
            e.loc = loc;
            advance();
            return e;
        }
        case TokenKind::CharLiteral: {
            Expr e;
            e.kind = ExprKind::CharLiteral;
            e.int_value = tok.value;
            e.loc = loc;
            advance();
            return e;
        }
        case TokenKind::StringLiteral: {
            std::string bytes;
            while (peek().kind == TokenKind::StringLiteral) {
                bytes += advance().text;
            }
            Expr e = make::strLit(bytes);
            e.loc = loc;
            return e;
        }
        case TokenKind::Identifier: {
            if (lookupTypedef(tok.text)) fail("unexpected type name '" + tok.text + "'");
            Expr e = make::ident(tok.text);
            e.loc = loc;
            advance();
            return e;
        }
        case TokenKind::Punct:
            if (acceptPunct("(")) {
                if (peek().isPunct("{")) fail("statement expressions are not supported");
                Expr e = parseExpression();
                if (peek().isPunct(",")) fail("the comma operator is not supported");
                expectPunct(")", "to close parenthesized expression");
                return e;
            }
            break;
        case TokenKind::Keyword:
        case TokenKind::End:
            break;
    }
    if (tok.kind == TokenKind::End) fail("expected expression at end of input");
    fail("expected expression before '" + tok.text + "'");
}

Expr Parser::parseInitializer() {
    SourceLoc loc = peek().loc;
    if (!acceptPunct("{")) return parseAssignment();

    std::vector<Expr> elements;
    while (!acceptPunct("}")) {
        if (peek().isPunct(".") || peek().isPunct("[")) {
            fail("designated initializers are not supported");
        }
        elements.push_back(parseInitializer());
        if (!acceptPunct(",")) {
            expectPunct("}", "to close initializer list");
            break;
        }
    }
    Expr e = make::initList(std::move(elements));
    e.loc = loc;
    return e;
}

// ============================================================================

ParseResult parse(const std::string& source) {
    ParseResult result;
    try {
        Lexer lexer(source);
        Parser parser(lexer.tokenize());
        result.program = parser.parseProgram();
        result.success = true;
    } catch (const CompileError& e) {
        result.diagnostics.add(e.diagnostic());
    }
    return result;
}

} // namespace frontend
} // namespace cloak
