/**
 * Cloak - Obfuscating C Compiler
 *
 * semantic_analyzer.cpp - Name resolution and type checking
 */

#include "semantic_analyzer.hpp"

#include <unordered_set>

namespace cloak {
namespace sema {

using namespace ast;

namespace {

bool sameRecord(const Type& a, const Type& b) {
    return a.isRecord() && a.kind == b.kind && a.tag == b.tag;
}

std::string quoted(const Type& t) {
    return "'" + t.str() + "'";
}

} // namespace

AnalysisResult analyze(const Program& program) {
    SemanticAnalyzer analyzer;
    return analyzer.analyze(program);
}

AnalysisResult SemanticAnalyzer::analyze(const Program& input) {
    symbols_ = SymbolTable();
    layout_ = TypeLayout();
    diagnostics_ = DiagnosticList();
    function_ = nullptr;
    loop_depth_ = 0;
    break_depth_ = 0;

    AnalysisResult result;
    result.program = input;
    try {
        for (auto& d : result.program.decls) {
            switch (d.kind) {
                case DeclKind::Record:
                    if (d.record.is_complete) layout_.addRecord(d.record);
                    break;
                case DeclKind::Enum:
                    enumeration(d.enm);
                    break;
                case DeclKind::Typedef:
                    break;
                case DeclKind::Variable:
                    globalVariable(d.var);
                    break;
                case DeclKind::Function:
                    function(d.func);
                    break;
            }
        }
        result.success = true;
    } catch (const CompileError& e) {
        diagnostics_.add(e.diagnostic());
        logger_.debug("analysis failed: {}", e.what());
    }

    result.symbols = symbols_;
    result.diagnostics = diagnostics_;
    return result;
}

void SemanticAnalyzer::error(DiagCode code, const std::string& msg, SourceLoc loc) const {
    throw CompileError(code, msg, loc);
}

void SemanticAnalyzer::warning(DiagCode code, const std::string& msg, SourceLoc loc) {
    diagnostics_.warning(code, msg, loc);
}

// ============================================================================
// Declarations
// ============================================================================

void SemanticAnalyzer::enumeration(const EnumDef& e) {
    for (const auto& item : e.items) {
        Symbol s;
        s.name = item.name;
        s.type = Type::intType();
        s.storage = StorageKind::EnumConst;
        s.loc = item.loc;
        s.enum_value = item.value;
        s.is_defined = true;
        if (!symbols_.declare(s)) {
            error(DiagCode::DuplicateSymbol, "redeclaration of enumerator '" + item.name + "'", item.loc);
        }
    }
}

void SemanticAnalyzer::completeArraySize(VarDecl& v) {
    if (!v.type.isArray() || v.type.array_size >= 0 || !v.init) return;
    const Expr& init = *v.init;
    if (init.kind == ExprKind::InitList) {
        v.type.array_size = static_cast<long>(init.args.size());
    } else if (init.kind == ExprKind::StringLiteral && v.type.element().kind == TypeKind::Char) {
        v.type.array_size = static_cast<long>(init.text.size()) + 1;
    }
}

void SemanticAnalyzer::checkObjectType(const Type& t, const std::string& name, SourceLoc loc) {
    if (t.isVoid()) {
        error(DiagCode::TypeMismatch, "variable '" + name + "' declared void", loc);
    }
    if (t.isArray() && t.array_size < 0) {
        error(DiagCode::TypeMismatch, "array size missing in '" + name + "'", loc);
    }
    sizeOf(t, loc);
}

void SemanticAnalyzer::globalVariable(VarDecl& v) {
    completeArraySize(v);
    v.scope_id = SymbolTable::kFileScope;
    if (!v.is_extern || v.init) {
        checkObjectType(v.type, v.name, v.loc);
    }

    Symbol* existing = symbols_.lookupLocal(v.name);
    if (existing) {
        if (existing->storage != StorageKind::Global || !sameType(existing->type, v.type)) {
            error(DiagCode::DuplicateSymbol, "conflicting types for '" + v.name + "'", v.loc);
        }
        if (existing->is_defined && v.init) {
            error(DiagCode::DuplicateSymbol, "redefinition of '" + v.name + "'", v.loc);
        }
        if (v.init) existing->is_defined = true;
        if (existing->type.isArray() && existing->type.array_size < 0) existing->type = v.type;
    } else {
        Symbol s;
        s.name = v.name;
        s.type = v.type;
        s.storage = StorageKind::Global;
        s.loc = v.loc;
        s.is_defined = v.init.has_value();
        s.is_static = v.is_static;
        symbols_.declare(s);
    }

    if (v.init) {
        checkInitializer(v.type, *v.init, true, v.loc);
    }
}

void SemanticAnalyzer::function(Function& f) {
    Type sig = f.signature();
    Symbol* existing = symbols_.lookupLocal(f.name);
    if (existing) {
        if (existing->storage != StorageKind::Function) {
            error(DiagCode::DuplicateSymbol,
                  "'" + f.name + "' redeclared as a different kind of symbol", f.loc);
        }
        if (!sameType(existing->type, sig)) {
            error(DiagCode::DuplicateSymbol, "conflicting types for '" + f.name + "'", f.loc);
        }
        if (existing->is_defined && f.is_definition) {
            error(DiagCode::DuplicateSymbol, "redefinition of '" + f.name + "'", f.loc);
        }
        if (f.is_definition) existing->is_defined = true;
    } else {
        Symbol s;
        s.name = f.name;
        s.type = sig;
        s.storage = StorageKind::Function;
        s.loc = f.loc;
        s.is_defined = f.is_definition;
        s.is_static = f.is_static;
        symbols_.declare(s);
    }
    if (!f.is_definition) return;

    function_ = &f;
    loop_depth_ = 0;
    break_depth_ = 0;
    int body_scope = symbols_.pushScope();
    for (auto& p : f.params) {
        p.scope_id = body_scope;
        checkObjectType(p.type, p.name, p.loc);
        Symbol s;
        s.name = p.name;
        s.type = p.type;
        s.storage = StorageKind::Param;
        s.loc = p.loc;
        if (!symbols_.declare(s)) {
            error(DiagCode::DuplicateSymbol, "redefinition of parameter '" + p.name + "'", p.loc);
        }
    }
    block(f.body, false);
    symbols_.popScope();
    function_ = nullptr;
    logger_.trace("checked function '{}'", f.name);
}

void SemanticAnalyzer::localVariable(VarDecl& v) {
    completeArraySize(v);
    checkObjectType(v.type, v.name, v.loc);

    Symbol s;
    s.name = v.name;
    s.type = v.type;
    s.storage = StorageKind::Local;
    s.loc = v.loc;
    s.is_static = v.is_static;
    s.is_defined = true;
    if (!symbols_.declare(s)) {
        error(DiagCode::DuplicateSymbol, "redefinition of '" + v.name + "'", v.loc);
    }
    v.scope_id = symbols_.current();
    if (v.init) {
        checkInitializer(v.type, *v.init, v.is_static, v.loc);
    }
}

void SemanticAnalyzer::checkInitializer(const Type& t, Expr& init, bool constant_only, SourceLoc loc) {
    if (init.loc.valid()) loc = init.loc;

    if (init.kind == ExprKind::InitList) {
        if (t.isRecord()) {
            error(DiagCode::UnsupportedConstruct, "struct and union initializer lists are not supported", loc);
        }
        if (!t.isArray()) {
            error(DiagCode::TypeMismatch, "braces around scalar initializer", loc);
        }
        if (static_cast<long>(init.args.size()) > t.array_size) {
            error(DiagCode::TypeMismatch, "excess elements in array initializer", loc);
        }
        init.type = t;
        for (auto& el : init.args) {
            checkInitializer(t.element(), el, constant_only, loc);
        }
        return;
    }

    if (t.isArray()) {
        if (init.kind == ExprKind::StringLiteral && t.element().kind == TypeKind::Char) {
            expr(init);
            if (static_cast<long>(init.text.size()) > t.array_size) {
                error(DiagCode::TypeMismatch, "initializer-string for array is too long", loc);
            }
            return;
        }
        error(DiagCode::TypeMismatch, "array must be initialized with a brace-enclosed initializer", loc);
    }

    expr(init);
    checkAssignable(t, init, "initialization", loc);
    if (constant_only && !isConstantInitializer(t, init)) {
        error(DiagCode::TypeMismatch, "initializer element is not constant", loc);
    }
}

bool SemanticAnalyzer::isConstantInitializer(const Type& t, const Expr& init) const {
    if (t.isInteger()) return constant(init).has_value();
    if (!t.isPointer()) return false;

    const Expr* e = &init;
    while (e->kind == ExprKind::Cast && decay(e->target_type).isPointer()) {
        e = &e->operand();
    }
    if (isNullConstant(*e)) return true;
    switch (e->kind) {
        case ExprKind::StringLiteral:
            return true;
        case ExprKind::Identifier:
            return e->storage == StorageKind::Function ||
                   (e->storage == StorageKind::Global && e->type && e->type->isArray());
        case ExprKind::Unary: {
            if (e->uop != UnaryOp::AddrOf) return false;
            const Expr& o = e->operand();
            return o.kind == ExprKind::Identifier &&
                   (o.storage == StorageKind::Global || o.storage == StorageKind::Function);
        }
        default:
            return false;
    }
}

// ============================================================================
// Statements
// ============================================================================

void SemanticAnalyzer::block(Block& b, bool new_scope) {
    if (new_scope) symbols_.pushScope();
    for (auto& s : b) statement(s);
    if (new_scope) symbols_.popScope();
}

void SemanticAnalyzer::condition(Expr& e) {
    Type t = decay(expr(e));
    if (!t.isScalar()) {
        error(DiagCode::TypeMismatch, "used " + quoted(t) + " where a scalar is required", e.loc);
    }
}

void SemanticAnalyzer::statement(Stmt& s) {
    switch (s.kind) {
        case StmtKind::Decl:
            localVariable(*s.decl);
            break;
        case StmtKind::Expr:
            expr(*s.expr);
            break;
        case StmtKind::If:
            condition(*s.expr);
            block(s.body, true);
            if (s.has_else) block(s.else_body, true);
            break;
        case StmtKind::While:
            condition(*s.expr);
            loop_depth_++;
            break_depth_++;
            block(s.body, true);
            loop_depth_--;
            break_depth_--;
            break;
        case StmtKind::DoWhile:
            loop_depth_++;
            break_depth_++;
            block(s.body, true);
            loop_depth_--;
            break_depth_--;
            condition(*s.expr);
            break;
        case StmtKind::For:
            symbols_.pushScope();
            for (auto& i : s.init) statement(i);
            if (s.expr) condition(*s.expr);
            if (s.step) expr(*s.step);
            loop_depth_++;
            break_depth_++;
            block(s.body, true);
            loop_depth_--;
            break_depth_--;
            symbols_.popScope();
            break;
        case StmtKind::Switch:
            switchStatement(s);
            break;
        case StmtKind::Break:
            if (break_depth_ == 0) {
                error(DiagCode::InvalidControlFlow, "break statement not within loop or switch", s.loc);
            }
            break;
        case StmtKind::Continue:
            if (loop_depth_ == 0) {
                error(DiagCode::InvalidControlFlow, "continue statement not within a loop", s.loc);
            }
            break;
        case StmtKind::Return: {
            const Type& rt = function_->return_type;
            if (s.expr) {
                Type vt = expr(*s.expr);
                if (rt.isVoid()) {
                    if (!vt.isVoid()) {
                        error(DiagCode::TypeMismatch, "'return' with a value in void function '" +
                              function_->name + "'", s.loc);
                    }
                } else {
                    if (vt.isVoid()) {
                        error(DiagCode::TypeMismatch, "void value returned from '" + function_->name + "'", s.loc);
                    }
                    checkAssignable(rt, *s.expr, "return", s.loc);
                }
            } else if (!rt.isVoid()) {
                error(DiagCode::TypeMismatch, "'return' with no value in function '" +
                      function_->name + "' returning " + quoted(rt), s.loc);
            }
            break;
        }
        case StmtKind::Compound:
            block(s.body, true);
            break;
        case StmtKind::Empty:
            break;
    }
}

void SemanticAnalyzer::switchStatement(Stmt& s) {
    Type ct = expr(*s.expr);
    if (!ct.isInteger()) {
        error(DiagCode::TypeMismatch, "switch quantity is not an integer", s.loc);
    }
    Type promoted = promote(ct);

    symbols_.pushScope();
    break_depth_++;
    bool seen_default = false;
    std::unordered_set<uint32_t> seen;
    for (auto& c : s.cases) {
        if (c.isDefault()) {
            if (seen_default) {
                error(DiagCode::InvalidControlFlow, "multiple default labels in one switch", c.loc);
            }
            seen_default = true;
        } else {
            expr(*c.value);
            auto v = constant(*c.value);
            if (!v) {
                error(DiagCode::TypeMismatch, "case label does not reduce to an integer constant", c.loc);
            }
            uint32_t bits = convertTo(promoted, v->bits);
            if (!seen.insert(bits).second) {
                error(DiagCode::DuplicateSymbol, "duplicate case value " +
                      std::to_string(v->asInt64()), c.loc);
            }
            c.const_value = promoted.is_unsigned ? static_cast<int64_t>(bits)
                                                 : static_cast<int64_t>(static_cast<int32_t>(bits));
        }
        for (auto& st : c.body) statement(st);
    }
    break_depth_--;
    symbols_.popScope();
}

// ============================================================================
// Expressions
// ============================================================================

std::optional<IntValue> SemanticAnalyzer::constant(const Expr& e) const {
    ConstEvaluator eval(&layout_);
    try {
        return eval.evaluate(e);
    } catch (const CompileError&) {
        return std::nullopt;   // sizeof of an incomplete type
    }
}

bool SemanticAnalyzer::isNullConstant(const Expr& e) const {
    if (!e.type || !e.type->isInteger()) return false;
    auto v = constant(e);
    return v && v->isZero();
}

long SemanticAnalyzer::sizeOf(const Type& t, SourceLoc loc) const {
    try {
        return layout_.sizeOf(t);
    } catch (const CompileError& e) {
        error(e.diagnostic().code, e.diagnostic().message, loc);
    }
}

const Type& SemanticAnalyzer::pointeeChecked(const Type& ptr, const char* what, SourceLoc loc) const {
    const Type& p = ptr.pointee();
    if (p.isVoid() || p.isFunction()) {
        error(DiagCode::TypeMismatch, std::string(what) + " through pointer to " + quoted(p), loc);
    }
    if (p.isRecord() && !layout_.hasRecord(p.tag)) {
        error(DiagCode::TypeMismatch, std::string(what) + " through pointer to incomplete type " + quoted(p), loc);
    }
    return p;
}

bool SemanticAnalyzer::isLvalue(const Expr& e) const {
    switch (e.kind) {
        case ExprKind::Identifier:
            return e.storage == StorageKind::Local || e.storage == StorageKind::Param ||
                   e.storage == StorageKind::Global;
        case ExprKind::Unary:
            return e.uop == UnaryOp::Deref;
        case ExprKind::Index:
        case ExprKind::StringLiteral:
            return true;
        case ExprKind::Member:
            return e.arrow || isLvalue(e.operand());
        default:
            return false;
    }
}

void SemanticAnalyzer::checkAssignable(const Type& target, const Expr& value,
                                       const std::string& context, SourceLoc loc) {
    Type t = target;
    t.is_const = false;
    Type v = decay(value.typeOrThrow());

    if (t.isArithmetic() && v.isArithmetic()) return;
    if (t.isPointer()) {
        if (v.isPointer()) {
            const Type& tp = t.pointee();
            const Type& vp = v.pointee();
            if (tp.isVoid() || vp.isVoid() || sameType(tp, vp)) return;
            warning(DiagCode::TypeMismatch, "incompatible pointer types in " + context + " (" +
                    quoted(v) + " to " + quoted(t) + ")", loc);
            return;
        }
        if (v.isInteger()) {
            if (isNullConstant(value)) return;
            if (constant(value)) {
                warning(DiagCode::TypeMismatch, "integer to pointer conversion in " + context +
                        " makes " + quoted(t) + " from an integer constant", loc);
                return;
            }
        }
    }
    if (sameRecord(t, v)) return;
    error(DiagCode::TypeMismatch, "incompatible types in " + context + ": cannot convert " +
          quoted(v) + " to " + quoted(t), loc);
}

const Type& SemanticAnalyzer::expr(Expr& e) {
    Type t;
    switch (e.kind) {
        case ExprKind::IntLiteral:
            t = Type::intType(e.is_unsigned);
            break;
        case ExprKind::CharLiteral:
            t = Type::intType();
            break;
        case ExprKind::StringLiteral:
            t = Type::arrayOf(Type::charType(), static_cast<long>(e.text.size()) + 1);
            break;
        case ExprKind::Identifier: {
            const Symbol* s = symbols_.lookup(e.text);
            if (!s) {
                error(DiagCode::UnresolvedSymbol, "use of undeclared identifier '" + e.text + "'", e.loc);
            }
            e.storage = s->storage;
            e.scope_id = s->scope_id;
            if (s->storage == StorageKind::EnumConst) e.int_value = s->enum_value;
            t = s->type;
            break;
        }
        case ExprKind::Binary:
            t = binary(e);
            break;
        case ExprKind::Unary:
            t = unary(e);
            break;
        case ExprKind::Assign:
            t = assignment(e);
            break;
        case ExprKind::Call:
            t = call(e);
            break;
        case ExprKind::Index: {
            Type base = decay(expr(e.lhs()));
            Type idx = decay(expr(e.rhs()));
            if (base.isPointer() && idx.isInteger()) {
                t = pointeeChecked(base, "subscript", e.loc);
            } else if (idx.isPointer() && base.isInteger()) {
                t = pointeeChecked(idx, "subscript", e.loc);
            } else {
                error(DiagCode::TypeMismatch, "subscripted value is neither array nor pointer", e.loc);
            }
            break;
        }
        case ExprKind::Member: {
            Type object = expr(e.operand());
            Type rec;
            if (e.arrow) {
                Type p = decay(object);
                if (!p.isPointer() || !p.pointee().isRecord()) {
                    error(DiagCode::TypeMismatch, "invalid type argument of '->' (have " +
                          quoted(object) + ")", e.loc);
                }
                rec = p.pointee();
            } else {
                if (!object.isRecord()) {
                    error(DiagCode::TypeMismatch, "request for member '" + e.text +
                          "' in something not a structure or union", e.loc);
                }
                rec = object;
            }
            if (!layout_.hasRecord(rec.tag)) {
                error(DiagCode::TypeMismatch, "dereferencing incomplete type " + quoted(rec), e.loc);
            }
            const TypeLayout::FieldInfo* f = layout_.field(rec.tag, e.text);
            if (!f) {
                error(DiagCode::UnresolvedSymbol, quoted(rec) + " has no member named '" + e.text + "'", e.loc);
            }
            t = f->type;
            if (rec.is_const) t.is_const = true;
            break;
        }
        case ExprKind::Ternary:
            t = ternary(e);
            break;
        case ExprKind::Cast: {
            Type operand = decay(expr(e.operand()));
            const Type& target = e.target_type;
            if (!target.isVoid()) {
                if (!target.isScalar()) {
                    error(DiagCode::TypeMismatch, "conversion to non-scalar type " + quoted(target) +
                          " requested", e.loc);
                }
                if (!operand.isScalar()) {
                    error(DiagCode::TypeMismatch, "cannot convert " + quoted(operand) + " to " +
                          quoted(target), e.loc);
                }
            }
            t = target;
            t.is_const = false;
            break;
        }
        case ExprKind::SizeOf:
            if (e.sizeof_type) {
                sizeOf(e.target_type, e.loc);
            } else {
                Type operand = expr(e.operand());
                if (operand.isFunction()) {
                    error(DiagCode::TypeMismatch, "invalid application of 'sizeof' to a function type", e.loc);
                }
                sizeOf(operand, e.loc);
            }
            t = Type::intType(true);
            break;
        case ExprKind::InitList:
            error(DiagCode::TypeMismatch, "initializer list used as an expression", e.loc);
    }
    e.type = std::move(t);
    return *e.type;
}

Type SemanticAnalyzer::arithmeticResult(BinaryOp op, const Type& l, const Type& r, const Expr& e) {
    bool arith = l.isArithmetic() && r.isArithmetic();
    switch (op) {
        case BinaryOp::Add:
            if (arith) return commonType(l, r);
            if (l.isPointer() && r.isInteger()) {
                pointeeChecked(l, "arithmetic", e.loc);
                return l;
            }
            if (r.isPointer() && l.isInteger()) {
                pointeeChecked(r, "arithmetic", e.loc);
                return r;
            }
            break;
        case BinaryOp::Sub:
            if (arith) return commonType(l, r);
            if (l.isPointer() && r.isInteger()) {
                pointeeChecked(l, "arithmetic", e.loc);
                return l;
            }
            if (l.isPointer() && r.isPointer() && sameType(l.pointee(), r.pointee())) {
                pointeeChecked(l, "arithmetic", e.loc);
                return Type::intType();
            }
            break;
        case BinaryOp::Mul:
        case BinaryOp::Div:
        case BinaryOp::Mod:
        case BinaryOp::BitAnd:
        case BinaryOp::BitOr:
        case BinaryOp::BitXor:
            if (arith) return commonType(l, r);
            break;
        case BinaryOp::Shl:
        case BinaryOp::Shr:
            if (arith) return promote(l);
            break;
        default:
            throw InternalError(std::string("arithmeticResult called for '") +
                                binaryOpSpelling(op) + "'");
    }
    error(DiagCode::TypeMismatch, std::string("invalid operands to binary '") + binaryOpSpelling(op) +
          "' (have " + quoted(l) + " and " + quoted(r) + ")", e.loc);
}

Type SemanticAnalyzer::binary(Expr& e) {
    Type l = decay(expr(e.lhs()));
    Type r = decay(expr(e.rhs()));
    BinaryOp op = e.bop;

    if (op == BinaryOp::LogAnd || op == BinaryOp::LogOr) {
        if (!l.isScalar() || !r.isScalar()) {
            error(DiagCode::TypeMismatch, std::string("invalid operands to '") + binaryOpSpelling(op) + "'", e.loc);
        }
        return Type::intType();
    }

    if (isComparison(op)) {
        if (l.isArithmetic() && r.isArithmetic()) return Type::intType();
        if (l.isPointer() && r.isPointer()) {
            if (!l.pointee().isVoid() && !r.pointee().isVoid() && !sameType(l.pointee(), r.pointee())) {
                warning(DiagCode::TypeMismatch, "comparison of distinct pointer types (" +
                        quoted(l) + " and " + quoted(r) + ")", e.loc);
            }
            return Type::intType();
        }
        if ((l.isPointer() && isNullConstant(e.rhs())) || (r.isPointer() && isNullConstant(e.lhs()))) {
            return Type::intType();
        }
        error(DiagCode::TypeMismatch, "comparison between " + quoted(l) + " and " + quoted(r), e.loc);
    }

    return arithmeticResult(op, l, r, e);
}

Type SemanticAnalyzer::unary(Expr& e) {
    switch (e.uop) {
        case UnaryOp::Plus:
        case UnaryOp::Neg:
        case UnaryOp::BitNot: {
            Type o = decay(expr(e.operand()));
            if (!o.isArithmetic()) {
                error(DiagCode::TypeMismatch, std::string("wrong type argument to unary '") +
                      unaryOpSpelling(e.uop) + "'", e.loc);
            }
            return promote(o);
        }
        case UnaryOp::Not: {
            Type o = decay(expr(e.operand()));
            if (!o.isScalar()) {
                error(DiagCode::TypeMismatch, "wrong type argument to unary '!'", e.loc);
            }
            return Type::intType();
        }
        case UnaryOp::AddrOf: {
            Type o = expr(e.operand());
            if (!o.isFunction() && !isLvalue(e.operand())) {
                error(DiagCode::TypeMismatch, "lvalue required as unary '&' operand", e.loc);
            }
            return Type::pointerTo(o);
        }
        case UnaryOp::Deref: {
            Type o = decay(expr(e.operand()));
            if (!o.isPointer()) {
                error(DiagCode::TypeMismatch, "invalid type argument of unary '*' (have " + quoted(o) + ")", e.loc);
            }
            if (o.pointee().isFunction()) return o.pointee();
            return pointeeChecked(o, "dereference", e.loc);
        }
        case UnaryOp::PreInc:
        case UnaryOp::PreDec:
        case UnaryOp::PostInc:
        case UnaryOp::PostDec: {
            Type o = expr(e.operand());
            if (!isLvalue(e.operand()) || o.isArray() || o.isFunction()) {
                error(DiagCode::TypeMismatch, "lvalue required as increment operand", e.loc);
            }
            if (o.is_const) {
                error(DiagCode::TypeMismatch, "increment of read-only location", e.loc);
            }
            if (!o.isScalar()) {
                error(DiagCode::TypeMismatch, "wrong type argument to increment", e.loc);
            }
            if (o.isPointer()) pointeeChecked(o, "increment", e.loc);
            o.is_const = false;
            return o;
        }
    }
    throw InternalError("unknown unary operator");
}

Type SemanticAnalyzer::assignment(Expr& e) {
    Type target = expr(e.lhs());
    if (!isLvalue(e.lhs()) || target.isFunction()) {
        error(DiagCode::TypeMismatch, "lvalue required as left operand of assignment", e.loc);
    }
    if (target.isArray()) {
        error(DiagCode::TypeMismatch, "assignment to expression with array type", e.loc);
    }
    if (target.is_const) {
        error(DiagCode::TypeMismatch, "assignment of read-only location", e.loc);
    }
    expr(e.rhs());

    if (!e.assign_op) {
        checkAssignable(target, e.rhs(), "assignment", e.loc);
    } else {
        BinaryOp op = *e.assign_op;
        Type r = decay(*e.rhs().type);
        Type result = arithmeticResult(op, target, r, e);
        bool ok = target.isPointer()
            ? (r.isInteger() && (op == BinaryOp::Add || op == BinaryOp::Sub))
            : result.isArithmetic();
        if (!ok) {
            error(DiagCode::TypeMismatch, std::string("invalid operands to '") + binaryOpSpelling(op) +
                  "=' (have " + quoted(target) + " and " + quoted(r) + ")", e.loc);
        }
    }
    target.is_const = false;
    return target;
}

Type SemanticAnalyzer::call(Expr& e) {
    Expr& callee = e.args[0];
    if (callee.kind == ExprKind::Identifier && !symbols_.lookup(callee.text)) {
        error(DiagCode::UnresolvedSymbol, "implicit declaration of function '" + callee.text + "'", callee.loc);
    }
    Type ct = decay(expr(callee));
    if (!ct.isPointer() || !ct.pointee().isFunction()) {
        error(DiagCode::TypeMismatch, "called object is not a function or function pointer", e.loc);
    }
    const Type fn = ct.pointee();
    std::string name = callee.kind == ExprKind::Identifier ? callee.text : std::string("function pointer");

    size_t n = e.argCount();
    if (n < fn.paramCount() || (n > fn.paramCount() && !fn.is_variadic)) {
        error(DiagCode::TypeMismatch, std::string(n < fn.paramCount() ? "too few" : "too many") +
              " arguments to '" + name + "' (expected " + std::to_string(fn.paramCount()) +
              ", have " + std::to_string(n) + ")", e.loc);
    }
    for (size_t i = 0; i < n; i++) {
        Expr& a = e.args[i + 1];
        Type at = expr(a);
        SourceLoc loc = a.loc.valid() ? a.loc : e.loc;
        if (i < fn.paramCount()) {
            checkAssignable(fn.param(i), a, "argument " + std::to_string(i + 1) + " of '" + name + "'", loc);
        } else if (!decay(at).isScalar()) {
            error(DiagCode::TypeMismatch, "cannot pass " + quoted(at) + " through '...'", loc);
        }
    }
    Type r = fn.returnType();
    r.is_const = false;
    return r;
}

Type SemanticAnalyzer::ternary(Expr& e) {
    condition(e.args[0]);
    Type a = decay(expr(e.args[1]));
    Type b = decay(expr(e.args[2]));

    if (a.isArithmetic() && b.isArithmetic()) return commonType(a, b);
    if (a.isVoid() && b.isVoid()) return a;
    if (a.isPointer() && b.isPointer()) {
        if (a.pointee().isVoid()) return a;
        if (b.pointee().isVoid()) return b;
        if (!sameType(a.pointee(), b.pointee())) {
            warning(DiagCode::TypeMismatch, "pointer type mismatch in conditional expression", e.loc);
        }
        return a;
    }
    if (a.isPointer() && isNullConstant(e.args[2])) return a;
    if (b.isPointer() && isNullConstant(e.args[1])) return b;
    if (sameRecord(a, b)) return a;
    error(DiagCode::TypeMismatch, "type mismatch in conditional expression (" + quoted(a) +
          " and " + quoted(b) + ")", e.loc);
}

} // namespace sema
} // namespace cloak
