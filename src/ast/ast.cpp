/**
 * Cloak - Obfuscating C Compiler
 *
 * ast.cpp - Type helpers and node factories
 */

#include "ast.hpp"

namespace cloak {
namespace ast {

std::string Type::str() const {
    std::string q = is_const ? "const " : "";
    std::string u = is_unsigned ? "unsigned " : "";
    switch (kind) {
        case TypeKind::Void:     return q + "void";
        case TypeKind::Char:     return q + u + "char";
        case TypeKind::Short:    return q + u + "short";
        case TypeKind::Int:      return q + u + "int";
        case TypeKind::Long:     return q + u + "long";
        case TypeKind::LongLong: return q + u + "long long";
        case TypeKind::Float:    return q + "float";
        case TypeKind::Double:   return q + "double";
        case TypeKind::Pointer:  return pointee().str() + (is_const ? " *const" : " *");
        case TypeKind::Array:
            return element().str() + "[" +
                   (array_size >= 0 ? std::to_string(array_size) : std::string()) + "]";
        case TypeKind::Struct:   return q + "struct " + tag;
        case TypeKind::Union:    return q + "union " + tag;
        case TypeKind::Enum:     return q + "enum " + tag;
        case TypeKind::Function: {
            std::string s = returnType().str() + " (";
            for (size_t i = 0; i < paramCount(); i++) {
                if (i) s += ", ";
                s += param(i).str();
            }
            if (is_variadic) s += paramCount() ? ", ..." : "...";
            return s + ")";
        }
    }
    return "?";
}

bool sameType(const Type& a, const Type& b, bool with_const) {
    if (a.kind != b.kind) return false;
    if (with_const && a.is_const != b.is_const) return false;
    switch (a.kind) {
        case TypeKind::Char:
        case TypeKind::Short:
        case TypeKind::Int:
        case TypeKind::Long:
        case TypeKind::LongLong:
            return a.is_unsigned == b.is_unsigned;
        case TypeKind::Struct:
        case TypeKind::Union:
        case TypeKind::Enum:
            return a.tag == b.tag;
        case TypeKind::Pointer:
            return sameType(a.pointee(), b.pointee(), true);
        case TypeKind::Array:
            if (a.array_size >= 0 && b.array_size >= 0 && a.array_size != b.array_size) {
                return false;
            }
            return sameType(a.element(), b.element(), true);
        case TypeKind::Function:
            if (a.is_variadic != b.is_variadic || a.sub.size() != b.sub.size()) return false;
            for (size_t i = 0; i < a.sub.size(); i++) {
                if (!sameType(a.sub[i], b.sub[i])) return false;
            }
            return true;
        default:
            return true;
    }
}

Type decay(const Type& t) {
    if (t.isArray()) return Type::pointerTo(t.element());
    if (t.isFunction()) return Type::pointerTo(t);
    Type out = t;
    out.is_const = false;
    return out;
}

Type promote(const Type& t) {
    switch (t.kind) {
        case TypeKind::Char:
        case TypeKind::Short:
        case TypeKind::Enum:
            return Type::intType();
        case TypeKind::Int:
        case TypeKind::Long: {
            Type out = Type::make(t.kind, t.is_unsigned);
            return out;
        }
        default:
            return decay(t);
    }
}

Type commonType(const Type& a, const Type& b) {
    Type pa = promote(a);
    Type pb = promote(b);
    bool uns = pa.is_unsigned || pb.is_unsigned;
    bool is_long = pa.kind == TypeKind::Long || pb.kind == TypeKind::Long;
    return Type::make(is_long ? TypeKind::Long : TypeKind::Int, uns);
}

Type withoutConst(Type t) {
    t.is_const = false;
    if (t.isArray()) {
        t.sub[0] = withoutConst(t.sub[0]);
    }
    return t;
}

const char* binaryOpSpelling(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add: return "+";
        case BinaryOp::Sub: return "-";
        case BinaryOp::Mul: return "*";
        case BinaryOp::Div: return "/";
        case BinaryOp::Mod: return "%";
        case BinaryOp::Shl: return "<<";
        case BinaryOp::Shr: return ">>";
        case BinaryOp::BitAnd: return "&";
        case BinaryOp::BitOr: return "|";
        case BinaryOp::BitXor: return "^";
        case BinaryOp::Lt: return "<";
        case BinaryOp::Le: return "<=";
        case BinaryOp::Gt: return ">";
        case BinaryOp::Ge: return ">=";
        case BinaryOp::Eq: return "==";
        case BinaryOp::Ne: return "!=";
        case BinaryOp::LogAnd: return "&&";
        case BinaryOp::LogOr: return "||";
    }
    return "?";
}

const char* unaryOpSpelling(UnaryOp op) {
    switch (op) {
        case UnaryOp::Plus: return "+";
        case UnaryOp::Neg: return "-";
        case UnaryOp::Not: return "!";
        case UnaryOp::BitNot: return "~";
        case UnaryOp::AddrOf: return "&";
        case UnaryOp::Deref: return "*";
        case UnaryOp::PreInc:
        case UnaryOp::PostInc: return "++";
        case UnaryOp::PreDec:
        case UnaryOp::PostDec: return "--";
    }
    return "?";
}

bool isComparison(BinaryOp op) {
    switch (op) {
        case BinaryOp::Lt:
        case BinaryOp::Le:
        case BinaryOp::Gt:
        case BinaryOp::Ge:
        case BinaryOp::Eq:
        case BinaryOp::Ne:
            return true;
        default:
            return false;
    }
}

const Type& Expr::typeOrThrow() const {
    if (!type) {
        throw InternalError("expression at line " + std::to_string(loc.line) +
                            " has no type annotation");
    }
    return *type;
}

namespace make {

Expr intLit(int64_t value, bool is_unsigned) {
    Expr e;
    e.kind = ExprKind::IntLiteral;
    e.int_value = value;
    e.is_unsigned = is_unsigned;
    return e;
}

Expr uintLit(uint32_t value) {
    return intLit(static_cast<int64_t>(value), true);
}

Expr strLit(const std::string& bytes) {
    Expr e;
    e.kind = ExprKind::StringLiteral;
    e.text = bytes;
    return e;
}

Expr ident(const std::string& name) {
    Expr e;
    e.kind = ExprKind::Identifier;
    e.text = name;
    return e;
}

Expr binary(BinaryOp op, Expr lhs, Expr rhs) {
    Expr e;
    e.kind = ExprKind::Binary;
    e.bop = op;
    e.loc = lhs.loc;
    e.args.push_back(std::move(lhs));
    e.args.push_back(std::move(rhs));
    return e;
}

Expr unary(UnaryOp op, Expr operand) {
    Expr e;
    e.kind = ExprKind::Unary;
    e.uop = op;
    e.loc = operand.loc;
    e.args.push_back(std::move(operand));
    return e;
}

Expr assign(Expr target, Expr value) {
    Expr e;
    e.kind = ExprKind::Assign;
    e.loc = target.loc;
    e.args.push_back(std::move(target));
    e.args.push_back(std::move(value));
    return e;
}

Expr compoundAssign(BinaryOp op, Expr target, Expr value) {
    Expr e = assign(std::move(target), std::move(value));
    e.assign_op = op;
    return e;
}

Expr call(const std::string& callee, std::vector<Expr> args) {
    Expr e;
    e.kind = ExprKind::Call;
    e.args.push_back(ident(callee));
    for (auto& a : args) e.args.push_back(std::move(a));
    return e;
}

Expr index(Expr base, Expr idx) {
    Expr e;
    e.kind = ExprKind::Index;
    e.loc = base.loc;
    e.args.push_back(std::move(base));
    e.args.push_back(std::move(idx));
    return e;
}

Expr member(Expr object, const std::string& field, bool arrow) {
    Expr e;
    e.kind = ExprKind::Member;
    e.loc = object.loc;
    e.text = field;
    e.arrow = arrow;
    e.args.push_back(std::move(object));
    return e;
}

Expr ternary(Expr c, Expr t, Expr f) {
    Expr e;
    e.kind = ExprKind::Ternary;
    e.loc = c.loc;
    e.args.push_back(std::move(c));
    e.args.push_back(std::move(t));
    e.args.push_back(std::move(f));
    return e;
}

Expr cast(const Type& to, Expr operand) {
    Expr e;
    e.kind = ExprKind::Cast;
    e.loc = operand.loc;
    e.target_type = to;
    e.args.push_back(std::move(operand));
    return e;
}

Expr sizeofType(const Type& t) {
    Expr e;
    e.kind = ExprKind::SizeOf;
    e.sizeof_type = true;
    e.target_type = t;
    return e;
}

Expr sizeofExpr(Expr operand) {
    Expr e;
    e.kind = ExprKind::SizeOf;
    e.loc = operand.loc;
    e.args.push_back(std::move(operand));
    return e;
}

Expr initList(std::vector<Expr> elements) {
    Expr e;
    e.kind = ExprKind::InitList;
    e.args = std::move(elements);
    return e;
}

Stmt declStmt(VarDecl d) {
    Stmt s;
    s.kind = StmtKind::Decl;
    s.loc = d.loc;
    s.decl = std::move(d);
    return s;
}

Stmt declStmt(const std::string& name, const Type& type, std::optional<Expr> init) {
    VarDecl d;
    d.name = name;
    d.type = type;
    d.init = std::move(init);
    return declStmt(std::move(d));
}

Stmt exprStmt(Expr e) {
    Stmt s;
    s.kind = StmtKind::Expr;
    s.loc = e.loc;
    s.expr = std::move(e);
    return s;
}

Stmt ifStmt(Expr c, Block then_body) {
    Stmt s;
    s.kind = StmtKind::If;
    s.loc = c.loc;
    s.expr = std::move(c);
    s.body = std::move(then_body);
    return s;
}

Stmt ifElseStmt(Expr c, Block then_body, Block else_body) {
    Stmt s = ifStmt(std::move(c), std::move(then_body));
    s.else_body = std::move(else_body);
    s.has_else = true;
    return s;
}

Stmt whileStmt(Expr c, Block body) {
    Stmt s;
    s.kind = StmtKind::While;
    s.loc = c.loc;
    s.expr = std::move(c);
    s.body = std::move(body);
    return s;
}

Stmt doWhileStmt(Block body, Expr c) {
    Stmt s;
    s.kind = StmtKind::DoWhile;
    s.loc = c.loc;
    s.expr = std::move(c);
    s.body = std::move(body);
    return s;
}

Stmt forStmt(Block init, std::optional<Expr> c, std::optional<Expr> step, Block body) {
    Stmt s;
    s.kind = StmtKind::For;
    s.init = std::move(init);
    s.expr = std::move(c);
    s.step = std::move(step);
    s.body = std::move(body);
    return s;
}

Stmt switchStmt(Expr c, std::vector<SwitchCase> cases) {
    Stmt s;
    s.kind = StmtKind::Switch;
    s.loc = c.loc;
    s.expr = std::move(c);
    s.cases = std::move(cases);
    return s;
}

Stmt breakStmt() {
    Stmt s;
    s.kind = StmtKind::Break;
    return s;
}

Stmt continueStmt() {
    Stmt s;
    s.kind = StmtKind::Continue;
    return s;
}

Stmt returnStmt(std::optional<Expr> value) {
    Stmt s;
    s.kind = StmtKind::Return;
    s.expr = std::move(value);
    return s;
}

Stmt compound(Block body) {
    Stmt s;
    s.kind = StmtKind::Compound;
    s.body = std::move(body);
    return s;
}

Stmt empty() {
    return Stmt();
}

TopDecl functionDecl(Function f) {
    TopDecl d;
    d.kind = DeclKind::Function;
    d.func = std::move(f);
    return d;
}

TopDecl globalDecl(VarDecl v) {
    TopDecl d;
    d.kind = DeclKind::Variable;
    d.var = std::move(v);
    return d;
}

} // namespace make

Type Function::signature() const {
    std::vector<Type> ps;
    for (const auto& p : params) ps.push_back(p.type);
    return Type::function(return_type, std::move(ps), is_variadic);
}

SourceLoc TopDecl::loc() const {
    switch (kind) {
        case DeclKind::Function: return func.loc;
        case DeclKind::Variable: return var.loc;
        case DeclKind::Typedef:  return tdef.loc;
        case DeclKind::Record:   return record.loc;
        case DeclKind::Enum:     return enm.loc;
    }
    return {};
}

const Function* Program::findFunction(const std::string& name) const {
    const Function* proto = nullptr;
    for (const auto& d : decls) {
        if (d.kind != DeclKind::Function || d.func.name != name) continue;
        if (d.func.is_definition) return &d.func;
        if (!proto) proto = &d.func;
    }
    return proto;
}

Function* Program::findFunction(const std::string& name) {
    const auto* self = this;
    return const_cast<Function*>(self->findFunction(name));
}

const VarDecl* Program::findGlobal(const std::string& name) const {
    for (const auto& d : decls) {
        if (d.kind == DeclKind::Variable && d.var.name == name) return &d.var;
    }
    return nullptr;
}

} // namespace ast
} // namespace cloak
