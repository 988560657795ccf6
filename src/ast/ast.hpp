/**
 * Cloak - Obfuscating C Compiler
 *
 * ast.hpp - Program representation
 *
 * Nodes are plain tagged structs held by value: a Program owns its whole
 * tree, copying a Program deep-copies it, and every pass builds its
 * successor from a copy. Child expressions live in Expr::args in a fixed
 * order per kind (see the accessors).
 */

#ifndef CLOAK_AST_HPP
#define CLOAK_AST_HPP

#include "../core/diagnostics.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cloak {
namespace ast {

// ============================================================================
// Types
// ============================================================================

enum class TypeKind {
    Void,
    Char,
    Short,
    Int,
    Long,
    LongLong,   // parsed for system headers, not lowered
    Float,      // parsed for system headers, not lowered
    Double,     // parsed for system headers, not lowered
    Pointer,
    Array,
    Struct,
    Union,
    Enum,
    Function
};

struct Type {
    TypeKind kind = TypeKind::Int;
    bool is_unsigned = false;
    bool is_const = false;
    std::string tag;             // struct/union/enum name
    long array_size = -1;        // -1 while unknown (int a[] = {...})
    std::vector<Type> sub;       // pointee / element, or return type + params
    bool is_variadic = false;

    static Type make(TypeKind k, bool uns = false) {
        Type t;
        t.kind = k;
        t.is_unsigned = uns;
        return t;
    }
    static Type voidType() { return make(TypeKind::Void); }
    static Type charType(bool uns = false) { return make(TypeKind::Char, uns); }
    static Type intType(bool uns = false) { return make(TypeKind::Int, uns); }
    static Type pointerTo(Type pointee) {
        Type t = make(TypeKind::Pointer);
        t.sub.push_back(std::move(pointee));
        return t;
    }
    static Type arrayOf(Type element, long size) {
        Type t = make(TypeKind::Array);
        t.array_size = size;
        t.sub.push_back(std::move(element));
        return t;
    }
    static Type record(bool is_union, const std::string& name) {
        Type t = make(is_union ? TypeKind::Union : TypeKind::Struct);
        t.tag = name;
        return t;
    }
    static Type enumType(const std::string& name) {
        Type t = make(TypeKind::Enum);
        t.tag = name;
        return t;
    }
    static Type function(Type ret, std::vector<Type> params, bool variadic) {
        Type t = make(TypeKind::Function);
        t.sub.push_back(std::move(ret));
        for (auto& p : params) t.sub.push_back(std::move(p));
        t.is_variadic = variadic;
        return t;
    }

    bool isVoid() const { return kind == TypeKind::Void; }
    bool isPointer() const { return kind == TypeKind::Pointer; }
    bool isArray() const { return kind == TypeKind::Array; }
    bool isFunction() const { return kind == TypeKind::Function; }
    bool isRecord() const { return kind == TypeKind::Struct || kind == TypeKind::Union; }

    // char, short, int, long and enums; these are what the backend lowers
    bool isInteger() const {
        return kind == TypeKind::Char || kind == TypeKind::Short ||
               kind == TypeKind::Int || kind == TypeKind::Long || kind == TypeKind::Enum;
    }
    bool isArithmetic() const { return isInteger(); }
    bool isScalar() const { return isInteger() || isPointer(); }

    // 32-bit integer after promotion: what MBA and predicates operate on
    bool isWordInteger() const {
        return kind == TypeKind::Int || kind == TypeKind::Long || kind == TypeKind::Enum;
    }

    const Type& pointee() const { return sub.at(0); }
    const Type& element() const { return sub.at(0); }
    const Type& returnType() const { return sub.at(0); }
    size_t paramCount() const { return sub.empty() ? 0 : sub.size() - 1; }
    const Type& param(size_t i) const { return sub.at(i + 1); }

    std::string str() const;
};

/**
 * Structural equality. Qualifiers are compared only at the top level
 * when with_const is set.
 */
bool sameType(const Type& a, const Type& b, bool with_const = false);

/**
 * Array to pointer and function to pointer decay
 */
Type decay(const Type& t);

/**
 * Integer promotion (char, short, enum become int)
 */
Type promote(const Type& t);

/**
 * Usual arithmetic conversions for two promoted integer operands
 */
Type commonType(const Type& a, const Type& b);

/**
 * Drops const from the top level and from array elements
 */
Type withoutConst(Type t);

// ============================================================================
// Expressions
// ============================================================================

enum class ExprKind {
    IntLiteral,
    StringLiteral,
    CharLiteral,
    Identifier,
    Binary,
    Unary,
    Assign,
    Call,
    Index,
    Member,
    Ternary,
    Cast,
    SizeOf,
    InitList
};

enum class BinaryOp {
    Add, Sub, Mul, Div, Mod,
    Shl, Shr,
    BitAnd, BitOr, BitXor,
    Lt, Le, Gt, Ge, Eq, Ne,
    LogAnd, LogOr
};

enum class UnaryOp {
    Plus, Neg, Not, BitNot,
    AddrOf, Deref,
    PreInc, PreDec, PostInc, PostDec
};

enum class StorageKind {
    Unresolved,
    Global,
    Local,
    Param,
    Function,
    EnumConst
};

const char* binaryOpSpelling(BinaryOp op);
const char* unaryOpSpelling(UnaryOp op);
bool isComparison(BinaryOp op);

struct Expr {
    ExprKind kind = ExprKind::IntLiteral;
    SourceLoc loc;

    int64_t int_value = 0;      // literal value, or enum constant after analysis
    bool is_unsigned = false;   // 'u' suffix on an integer literal
    std::string text;           // identifier, string bytes, member name
    BinaryOp bop = BinaryOp::Add;
    UnaryOp uop = UnaryOp::Plus;
    std::optional<BinaryOp> assign_op;   // compound assignment
    bool arrow = false;                  // p->m
    bool sizeof_type = false;            // sizeof(type) rather than sizeof expr
    Type target_type;                    // cast target, sizeof(type) operand

    // Binary: lhs rhs | Unary: operand | Assign: target value
    // Call: callee args... | Index: base index | Member: object
    // Ternary: cond then else | Cast, SizeOf: operand | InitList: elements
    std::vector<Expr> args;

    // analysis annotations
    std::optional<Type> type;
    StorageKind storage = StorageKind::Unresolved;
    int scope_id = -1;

    const Expr& lhs() const { return args.at(0); }
    const Expr& rhs() const { return args.at(1); }
    const Expr& operand() const { return args.at(0); }
    const Expr& callee() const { return args.at(0); }
    size_t argCount() const { return args.empty() ? 0 : args.size() - 1; }
    const Expr& arg(size_t i) const { return args.at(i + 1); }
    const Expr& cond() const { return args.at(0); }

    Expr& lhs() { return args.at(0); }
    Expr& rhs() { return args.at(1); }
    Expr& operand() { return args.at(0); }

    bool isLiteral() const {
        return kind == ExprKind::IntLiteral || kind == ExprKind::CharLiteral;
    }

    // direct call to a named function
    bool isDirectCall() const {
        return kind == ExprKind::Call && !args.empty() &&
               args[0].kind == ExprKind::Identifier &&
               args[0].storage != StorageKind::Local &&
               args[0].storage != StorageKind::Param &&
               args[0].storage != StorageKind::Global;
    }
    const std::string& calleeName() const { return args.at(0).text; }

    const Type& typeOrThrow() const;
};

/**
 * Expression factories used by the parser and by passes synthesizing code
 */
namespace make {

Expr intLit(int64_t value, bool is_unsigned = false);
Expr uintLit(uint32_t value);
Expr strLit(const std::string& bytes);
Expr ident(const std::string& name);
Expr binary(BinaryOp op, Expr lhs, Expr rhs);
Expr unary(UnaryOp op, Expr operand);
Expr assign(Expr target, Expr value);
Expr compoundAssign(BinaryOp op, Expr target, Expr value);
Expr call(const std::string& callee, std::vector<Expr> args);
Expr index(Expr base, Expr idx);
Expr member(Expr object, const std::string& field, bool arrow);
Expr ternary(Expr c, Expr t, Expr e);
Expr cast(const Type& to, Expr operand);
Expr sizeofType(const Type& t);
Expr sizeofExpr(Expr operand);
Expr initList(std::vector<Expr> elements);

} // namespace make

// ============================================================================
// Statements
// ============================================================================

enum class StmtKind {
    Decl,
    Expr,
    If,
    For,
    While,
    DoWhile,
    Switch,
    Break,
    Continue,
    Return,
    Compound,
    Empty
};

struct VarDecl {
    std::string name;
    Type type;
    std::optional<Expr> init;
    SourceLoc loc;
    bool is_static = false;
    bool is_extern = false;
    int scope_id = -1;   // declaring scope, set by analysis
};

struct Stmt;
using Block = std::vector<Stmt>;

struct SwitchCase {
    std::optional<Expr> value;   // absent for default
    int64_t const_value = 0;     // folded label value, set by analysis
    Block body;
    SourceLoc loc;

    bool isDefault() const { return !value.has_value(); }
};

struct Stmt {
    StmtKind kind = StmtKind::Empty;
    SourceLoc loc;

    std::optional<VarDecl> decl;   // Decl
    std::optional<Expr> expr;      // Expr, Return value, If/loop/switch condition
    std::optional<Expr> step;      // For increment
    Block init;                    // For init: zero or more Decl/Expr statements
    Block body;                    // then-branch, loop body, compound contents
    Block else_body;
    bool has_else = false;
    std::vector<SwitchCase> cases;

    const Expr& condition() const { return *expr; }
};

namespace make {

Stmt declStmt(VarDecl d);
Stmt declStmt(const std::string& name, const Type& type, std::optional<Expr> init = std::nullopt);
Stmt exprStmt(Expr e);
Stmt ifStmt(Expr c, Block then_body);
Stmt ifElseStmt(Expr c, Block then_body, Block else_body);
Stmt whileStmt(Expr c, Block body);
Stmt doWhileStmt(Block body, Expr c);
Stmt forStmt(Block init, std::optional<Expr> c, std::optional<Expr> step, Block body);
Stmt switchStmt(Expr c, std::vector<SwitchCase> cases);
Stmt breakStmt();
Stmt continueStmt();
Stmt returnStmt(std::optional<Expr> value = std::nullopt);
Stmt compound(Block body);
Stmt empty();

} // namespace make

// ============================================================================
// Top-level declarations
// ============================================================================

enum class DeclKind {
    Function,
    Variable,
    Typedef,
    Record,
    Enum
};

struct Param {
    std::string name;
    Type type;
    SourceLoc loc;
    int scope_id = -1;   // the body's outermost scope, set by analysis
};

/**
 * Metadata written by passes
 */
struct FunctionMeta {
    std::vector<std::string> state_vars;                            // flattening
    std::vector<std::pair<std::string, std::string>> rename_map;    // original -> new
    bool synthetic = false;                                         // added by a pass
    bool constructor = false;                                       // run before main
};

struct Function {
    std::string name;
    Type return_type;
    std::vector<Param> params;
    bool is_variadic = false;
    bool is_definition = false;
    bool is_static = false;
    Block body;
    SourceLoc loc;
    FunctionMeta meta;

    Type signature() const;
};

struct Field {
    std::string name;
    Type type;
};

struct RecordDef {
    std::string name;
    bool is_union = false;
    bool is_complete = false;    // a body was given
    std::vector<Field> fields;
    SourceLoc loc;
};

struct Enumerator {
    std::string name;
    int64_t value = 0;
    SourceLoc loc;
};

struct EnumDef {
    std::string name;
    std::vector<Enumerator> items;
    SourceLoc loc;
};

struct TypedefDecl {
    std::string name;
    Type type;
    SourceLoc loc;
};

struct TopDecl {
    DeclKind kind = DeclKind::Variable;
    Function func;
    VarDecl var;
    TypedefDecl tdef;
    RecordDef record;
    EnumDef enm;

    SourceLoc loc() const;
};

struct Program {
    std::vector<TopDecl> decls;

    const Function* findFunction(const std::string& name) const;
    Function* findFunction(const std::string& name);
    const VarDecl* findGlobal(const std::string& name) const;

    template<typename F>
    void forEachFunction(F&& f) {
        for (auto& d : decls) {
            if (d.kind == DeclKind::Function) f(d.func);
        }
    }

    template<typename F>
    void forEachFunction(F&& f) const {
        for (const auto& d : decls) {
            if (d.kind == DeclKind::Function) f(d.func);
        }
    }
};

namespace make {

TopDecl functionDecl(Function f);
TopDecl globalDecl(VarDecl v);

} // namespace make

} // namespace ast
} // namespace cloak

#endif // CLOAK_AST_HPP
