/**
 * Cloak - Reference Interpreter
 */

#include "reference_interpreter.hpp"

#include "ast/const_eval.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>

namespace cloak {
namespace test {

using namespace ast;

namespace {

const Expr& stripCasts(const Expr& e) {
    const Expr* x = &e;
    while (x->kind == ExprKind::Cast) x = &x->operand();
    return *x;
}

bool unsignedComparison(const Expr& e) {
    Type l = decay(e.lhs().typeOrThrow());
    Type r = decay(e.rhs().typeOrThrow());
    if (l.isPointer() || r.isPointer()) return true;
    return commonType(promote(l), promote(r)).is_unsigned;
}

bool compare(BinaryOp op, uint32_t a, uint32_t b, bool is_unsigned) {
    if (!is_unsigned) {
        int32_t x = static_cast<int32_t>(a);
        int32_t y = static_cast<int32_t>(b);
        switch (op) {
            case BinaryOp::Lt: return x < y;
            case BinaryOp::Le: return x <= y;
            case BinaryOp::Gt: return x > y;
            case BinaryOp::Ge: return x >= y;
            default: break;
        }
    } else {
        switch (op) {
            case BinaryOp::Lt: return a < b;
            case BinaryOp::Le: return a <= b;
            case BinaryOp::Gt: return a > b;
            case BinaryOp::Ge: return a >= b;
            default: break;
        }
    }
    return op == BinaryOp::Eq ? a == b : a != b;
}

} // namespace

ReferenceInterpreter::ReferenceInterpreter(const Program& program)
    : program_(program), layout_(program), memory_(kMemorySize, 0) {
    program_.forEachFunction([this](const Function& f) {
        if (f.is_definition) functions_[f.name] = &f;
    });
    try {
        initializeGlobals();
        program_.forEachFunction([this](const Function& f) {
            if (f.is_definition && f.meta.constructor) invoke(f.name, {});
        });
        initialized_ = true;
    } catch (const std::exception& ex) {
        init_error_ = ex.what();
    }
}

RunResult ReferenceInterpreter::call(const std::string& function, const std::vector<int32_t>& args) {
    RunResult result;
    if (!initialized_) {
        result.error = "initialization failed: " + init_error_;
        return result;
    }
    std::vector<uint32_t> raw;
    for (int32_t a : args) raw.push_back(static_cast<uint32_t>(a));
    try {
        result.value = static_cast<int32_t>(invoke(function, raw));
        result.ok = true;
    } catch (const std::exception& ex) {
        result.error = ex.what();
    }
    result.output = output_;
    output_.clear();
    frames_.clear();
    stack_top_ = kStackBase;
    return result;
}

// ============================================================================
// Memory
// ============================================================================

uint32_t ReferenceInterpreter::allocate(uint32_t& top, uint32_t limit, long size, long align) {
    uint32_t addr = static_cast<uint32_t>(TypeLayout::alignUp(top, std::max(align, 1L)));
    if (size < 0 || addr + static_cast<uint32_t>(size) > limit) {
        throw InterpreterError(&top == &stack_top_ ? "stack overflow" : "out of static memory");
    }
    top = addr + static_cast<uint32_t>(std::max(size, 1L));
    std::fill(memory_.begin() + addr, memory_.begin() + addr + size, 0);
    return addr;
}

void ReferenceInterpreter::check(uint32_t addr, long size) const {
    if (addr < 16) throw InterpreterError("null pointer dereference");
    if (static_cast<uint64_t>(addr) + static_cast<uint64_t>(size) > kMemorySize) {
        throw InterpreterError("access outside memory at " + std::to_string(addr));
    }
}

uint32_t ReferenceInterpreter::load(const Type& t, uint32_t addr) const {
    long size = t.isPointer() ? 4 : layout_.sizeOf(t);
    check(addr, size);
    uint32_t v = 0;
    for (long i = size; i-- > 0;) v = (v << 8) | memory_[addr + i];
    return t.isInteger() ? convertTo(t, v) : v;
}

void ReferenceInterpreter::store(const Type& t, uint32_t addr, uint32_t value) {
    long size = t.isPointer() ? 4 : layout_.sizeOf(t);
    check(addr, size);
    for (long i = 0; i < size; i++) {
        memory_[addr + i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

std::string ReferenceInterpreter::readString(uint32_t addr) const {
    std::string s;
    for (;; addr++) {
        check(addr, 1);
        if (memory_[addr] == 0) return s;
        s.push_back(static_cast<char>(memory_[addr]));
    }
}

uint32_t ReferenceInterpreter::internString(const std::string& bytes) {
    auto it = strings_.find(bytes);
    if (it != strings_.end()) return it->second;
    uint32_t addr = allocate(heap_top_, kStackBase, static_cast<long>(bytes.size()) + 1, 1);
    std::copy(bytes.begin(), bytes.end(), memory_.begin() + addr);
    strings_[bytes] = addr;
    return addr;
}

uint32_t ReferenceInterpreter::convert(const Type& t, uint32_t value) const {
    return t.isInteger() ? convertTo(t, value) : value;
}

long ReferenceInterpreter::scale(const Type& pointer) const {
    Type p = decay(pointer);
    if (!p.isPointer() || p.pointee().isVoid() || p.pointee().isFunction()) return 1;
    return layout_.sizeOf(p.pointee());
}

// ============================================================================
// Program setup
// ============================================================================

std::string ReferenceInterpreter::staticKey(const std::string& function, int scope, const std::string& name) {
    return function + "/" + std::to_string(scope) + "/" + name;
}

uint32_t ReferenceInterpreter::functionAddress(const std::string& name) {
    auto it = std::find(function_ids_.begin(), function_ids_.end(), name);
    if (it != function_ids_.end()) {
        return kFunctionBase + static_cast<uint32_t>(it - function_ids_.begin());
    }
    function_ids_.push_back(name);
    return kFunctionBase + static_cast<uint32_t>(function_ids_.size() - 1);
}

void ReferenceInterpreter::initializeGlobals() {
    // the definition of each name: the declaration with an initializer, else the first one
    std::vector<const VarDecl*> defs;
    std::unordered_map<std::string, size_t> index;
    for (const auto& d : program_.decls) {
        if (d.kind != DeclKind::Variable) continue;
        auto it = index.find(d.var.name);
        if (it == index.end()) {
            index[d.var.name] = defs.size();
            defs.push_back(&d.var);
        } else if (d.var.init && !defs[it->second]->init) {
            defs[it->second] = &d.var;
        }
    }
    for (const VarDecl* v : defs) {
        globals_[v->name] = allocate(heap_top_, kStackBase, layout_.sizeOf(v->type), layout_.alignOf(v->type));
    }

    std::vector<std::pair<const Function*, const VarDecl*>> statics;
    program_.forEachFunction([&](const Function& f) {
        if (!f.is_definition) return;
        visitBlockStmts(f.body, [&](const Stmt& s) {
            if (s.kind == StmtKind::Decl && s.decl->is_static) {
                const VarDecl& v = *s.decl;
                static_locals_[staticKey(f.name, v.scope_id, v.name)] =
                    allocate(heap_top_, kStackBase, layout_.sizeOf(v.type), layout_.alignOf(v.type));
                statics.emplace_back(&f, &v);
            }
        });
    });

    for (const VarDecl* v : defs) {
        if (v->init) initializeObject(v->type, globals_[v->name], *v->init);
    }
    for (const auto& [f, v] : statics) {
        init_function_ = f;
        if (v->init) {
            initializeObject(v->type, static_locals_[staticKey(f->name, v->scope_id, v->name)], *v->init);
        }
    }
    init_function_ = nullptr;
}

void ReferenceInterpreter::initializeObject(const Type& t, uint32_t addr, const Expr& init) {
    if (t.isArray()) {
        const Type& elem = t.element();
        long esize = layout_.sizeOf(elem);
        long size = layout_.sizeOf(t);
        if (init.kind == ExprKind::StringLiteral) {
            for (long i = 0; i < size && i < static_cast<long>(init.text.size()); i++) {
                memory_[addr + i] = static_cast<uint8_t>(init.text[static_cast<size_t>(i)]);
            }
            return;
        }
        if (init.kind != ExprKind::InitList) throw InterpreterError("array initializer");
        long offset = 0;
        for (const auto& el : init.args) {
            store(elem, addr + static_cast<uint32_t>(offset), constantValue(elem, el));
            offset += esize;
        }
        return;
    }
    if (t.isRecord()) throw InterpreterError("struct initializer");
    store(t, addr, constantValue(t, init));
}

uint32_t ReferenceInterpreter::constantValue(const Type& t, const Expr& e) {
    const Expr& x = stripCasts(e);
    if (x.kind == ExprKind::StringLiteral) return internString(x.text);

    const Expr* target = nullptr;
    if (x.kind == ExprKind::Identifier && (x.storage == StorageKind::Function ||
                                           (x.type && x.type->isArray()))) {
        target = &x;
    } else if (x.kind == ExprKind::Unary && x.uop == UnaryOp::AddrOf &&
               x.operand().kind == ExprKind::Identifier) {
        target = &x.operand();
    }
    if (target) {
        if (target->storage == StorageKind::Function) return functionAddress(target->text);
        if (target->storage == StorageKind::Global) return globals_.at(target->text);
        if (init_function_) {
            auto it = static_locals_.find(staticKey(init_function_->name, target->scope_id, target->text));
            if (it != static_locals_.end()) return it->second;
        }
    }

    ConstEvaluator eval(&layout_);
    auto v = eval.evaluate(e);
    if (!v) throw InterpreterError("initializer element is not constant");
    return convert(t, v->bits);
}

// ============================================================================
// Statements
// ============================================================================

uint32_t ReferenceInterpreter::invoke(const std::string& name, const std::vector<uint32_t>& args) {
    auto it = functions_.find(name);
    if (it == functions_.end()) return builtin(name, args);
    const Function& f = *it->second;

    if (args.size() < f.params.size()) {
        throw InterpreterError("too few arguments to '" + name + "'");
    }
    if (frames_.size() > 2000) throw InterpreterError("stack overflow");

    uint32_t saved_top = stack_top_;
    frames_.emplace_back();
    frames_.back().function = &f;

    for (size_t i = 0; i < f.params.size(); i++) {
        uint32_t addr = allocate(stack_top_, kMemorySize, 4, 4);
        store(Type::intType(), addr, args[i]);
        frames_.back().slots[bindingOf(f.params[i])] = addr;
    }
    visitBlockStmts(f.body, [this](const Stmt& s) {
        if (s.kind != StmtKind::Decl || s.decl->is_static || s.decl->is_extern) return;
        const VarDecl& v = *s.decl;
        frames_.back().slots[bindingOf(v)] =
            allocate(stack_top_, kMemorySize, layout_.sizeOf(v.type), layout_.alignOf(v.type));
    });

    Flow flow = execBlock(f.body);
    uint32_t value = flow == Flow::Return ? frames_.back().return_value : 0;

    frames_.pop_back();
    stack_top_ = saved_top;
    return convert(f.return_type, value);
}

ReferenceInterpreter::Flow ReferenceInterpreter::execBlock(const Block& block) {
    for (const auto& s : block) {
        Flow f = exec(s);
        if (f != Flow::Normal) return f;
    }
    return Flow::Normal;
}

ReferenceInterpreter::Flow ReferenceInterpreter::exec(const Stmt& s) {
    if (++steps_ > kMaxSteps) throw InterpreterError("step limit exceeded");

    switch (s.kind) {
        case StmtKind::Decl:
            declare(*s.decl);
            return Flow::Normal;

        case StmtKind::Expr:
            eval(*s.expr);
            return Flow::Normal;

        case StmtKind::If:
            if (truth(s.condition())) return execBlock(s.body);
            return s.has_else ? execBlock(s.else_body) : Flow::Normal;

        case StmtKind::While:
            while (truth(s.condition())) {
                Flow f = execBlock(s.body);
                if (f == Flow::Break) break;
                if (f == Flow::Return) return f;
                if (++steps_ > kMaxSteps) throw InterpreterError("step limit exceeded");
            }
            return Flow::Normal;

        case StmtKind::DoWhile:
            do {
                Flow f = execBlock(s.body);
                if (f == Flow::Break) break;
                if (f == Flow::Return) return f;
                if (++steps_ > kMaxSteps) throw InterpreterError("step limit exceeded");
            } while (truth(s.condition()));
            return Flow::Normal;

        case StmtKind::For: {
            for (const auto& i : s.init) exec(i);
            for (;;) {
                if (s.expr && !truth(*s.expr)) break;
                Flow f = execBlock(s.body);
                if (f == Flow::Break) break;
                if (f == Flow::Return) return f;
                if (s.step) eval(*s.step);
                if (++steps_ > kMaxSteps) throw InterpreterError("step limit exceeded");
            }
            return Flow::Normal;
        }

        case StmtKind::Switch:
            return execSwitch(s);

        case StmtKind::Break:
            return Flow::Break;

        case StmtKind::Continue:
            return Flow::Continue;

        case StmtKind::Return:
            if (s.expr) {
                uint32_t v = eval(*s.expr);
                frames_.back().return_value = convert(frames_.back().function->return_type, v);
            }
            return Flow::Return;

        case StmtKind::Compound:
            return execBlock(s.body);

        case StmtKind::Empty:
            return Flow::Normal;
    }
    throw InterpreterError("unknown statement kind");
}

ReferenceInterpreter::Flow ReferenceInterpreter::execSwitch(const Stmt& s) {
    uint32_t v = eval(s.condition());
    size_t start = s.cases.size();
    for (size_t i = 0; i < s.cases.size(); i++) {
        if (!s.cases[i].isDefault() && static_cast<uint32_t>(s.cases[i].const_value) == v) {
            start = i;
            break;
        }
    }
    if (start == s.cases.size()) {
        for (size_t i = 0; i < s.cases.size(); i++) {
            if (s.cases[i].isDefault()) start = i;
        }
    }
    for (size_t i = start; i < s.cases.size(); i++) {
        Flow f = execBlock(s.cases[i].body);
        if (f == Flow::Break) return Flow::Normal;
        if (f != Flow::Normal) return f;
    }
    return Flow::Normal;
}

void ReferenceInterpreter::declare(const VarDecl& v) {
    if (v.is_static || v.is_extern || !v.init) return;

    auto it = frames_.back().slots.find(bindingOf(v));
    if (it == frames_.back().slots.end()) throw InterpreterError("no slot for '" + v.name + "'");
    uint32_t addr = it->second;
    const Type& t = v.type;
    const Expr& init = *v.init;

    if (!t.isArray()) {
        if (t.isRecord()) throw InterpreterError("struct initializer");
        store(t, addr, convert(t, eval(init)));
        return;
    }

    long size = layout_.sizeOf(t);
    std::fill(memory_.begin() + addr, memory_.begin() + addr + size, 0);
    if (init.kind == ExprKind::StringLiteral) {
        for (long i = 0; i < size && i < static_cast<long>(init.text.size()); i++) {
            memory_[addr + i] = static_cast<uint8_t>(init.text[static_cast<size_t>(i)]);
        }
        return;
    }
    if (init.kind != ExprKind::InitList) throw InterpreterError("array initializer");
    const Type& elem = t.element();
    long esize = layout_.sizeOf(elem);
    long offset = 0;
    for (const auto& el : init.args) {
        store(elem, addr + static_cast<uint32_t>(offset), convert(elem, eval(el)));
        offset += esize;
    }
}

bool ReferenceInterpreter::truth(const Expr& e) {
    return eval(e) != 0;
}

// ============================================================================
// Expressions
// ============================================================================

uint32_t ReferenceInterpreter::slot(const Expr& ident) {
    if (ident.storage == StorageKind::Global) {
        auto it = globals_.find(ident.text);
        if (it == globals_.end()) throw InterpreterError("unknown global '" + ident.text + "'");
        return it->second;
    }
    if (frames_.empty()) throw InterpreterError("'" + ident.text + "' outside a function");
    const Frame& frame = frames_.back();
    auto it = frame.slots.find(bindingOf(ident));
    if (it != frame.slots.end()) return it->second;
    auto st = static_locals_.find(staticKey(frame.function->name, ident.scope_id, ident.text));
    if (st != static_locals_.end()) return st->second;
    throw InterpreterError("'" + ident.text + "' has no storage");
}

uint32_t ReferenceInterpreter::address(const Expr& e) {
    switch (e.kind) {
        case ExprKind::Identifier:
            if (e.storage == StorageKind::Function) return functionAddress(e.text);
            return slot(e);
        case ExprKind::StringLiteral:
            return internString(e.text);
        case ExprKind::Unary:
            if (e.uop == UnaryOp::Deref) return eval(e.operand());
            break;
        case ExprKind::Index: {
            const Expr* base = &e.lhs();
            const Expr* idx = &e.rhs();
            if (!decay(base->typeOrThrow()).isPointer()) std::swap(base, idx);
            uint32_t b = eval(*base);
            uint32_t i = eval(*idx);
            return b + i * static_cast<uint32_t>(scale(base->typeOrThrow()));
        }
        case ExprKind::Member: {
            const Expr& object = e.operand();
            Type rec = e.arrow ? decay(object.typeOrThrow()).pointee() : object.typeOrThrow();
            const TypeLayout::FieldInfo* field = layout_.field(rec.tag, e.text);
            if (!field) throw InterpreterError("no field '" + e.text + "'");
            uint32_t base = e.arrow ? eval(object) : address(object);
            return base + static_cast<uint32_t>(field->offset);
        }
        default:
            break;
    }
    throw InterpreterError("expression is not addressable");
}

uint32_t ReferenceInterpreter::eval(const Expr& e) {
    const Type& t = e.typeOrThrow();
    switch (e.kind) {
        case ExprKind::IntLiteral:
        case ExprKind::CharLiteral:
            return literalBits(e);

        case ExprKind::StringLiteral:
            return internString(e.text);

        case ExprKind::Identifier:
            if (e.storage == StorageKind::EnumConst) return static_cast<uint32_t>(e.int_value);
            if (e.storage == StorageKind::Function || t.isArray() || t.isRecord()) return address(e);
            return load(t, slot(e));

        case ExprKind::Binary:
            return binary(e);

        case ExprKind::Unary:
            return unary(e);

        case ExprKind::Assign:
            return assign(e);

        case ExprKind::Call:
            return callExpr(e);

        case ExprKind::Index:
        case ExprKind::Member: {
            uint32_t addr = address(e);
            if (t.isArray() || t.isRecord()) return addr;
            return load(t, addr);
        }

        case ExprKind::Ternary:
            return truth(e.args[0]) ? eval(e.args[1]) : eval(e.args[2]);

        case ExprKind::Cast: {
            uint32_t v = eval(e.operand());
            if (e.target_type.isVoid()) return 0;
            return convert(e.target_type, v);
        }

        case ExprKind::SizeOf:
            return static_cast<uint32_t>(e.sizeof_type ? layout_.sizeOf(e.target_type)
                                                       : layout_.sizeOf(e.operand().typeOrThrow()));

        case ExprKind::InitList:
            break;
    }
    throw InterpreterError("initializer list used as a value");
}

uint32_t ReferenceInterpreter::binary(const Expr& e) {
    BinaryOp op = e.bop;
    if (op == BinaryOp::LogAnd) return truth(e.lhs()) && truth(e.rhs()) ? 1 : 0;
    if (op == BinaryOp::LogOr) return truth(e.lhs()) || truth(e.rhs()) ? 1 : 0;

    uint32_t a = eval(e.lhs());
    uint32_t b = eval(e.rhs());
    if (isComparison(op)) return compare(op, a, b, unsignedComparison(e)) ? 1 : 0;

    Type l = decay(e.lhs().typeOrThrow());
    Type r = decay(e.rhs().typeOrThrow());
    if (op == BinaryOp::Add || op == BinaryOp::Sub) {
        if (l.isPointer() && r.isPointer()) {
            int32_t diff = static_cast<int32_t>(a - b);
            return static_cast<uint32_t>(diff / static_cast<int32_t>(scale(l)));
        }
        if (l.isPointer()) b *= static_cast<uint32_t>(scale(l));
        else if (r.isPointer()) a *= static_cast<uint32_t>(scale(r));
    }
    if (op == BinaryOp::Shl || op == BinaryOp::Shr) b &= 31u;

    auto v = evalBinary32(op, a, b, e.typeOrThrow().is_unsigned);
    if (!v) throw InterpreterError("arithmetic trap in '" + std::string(binaryOpSpelling(op)) + "'");
    return *v;
}

uint32_t ReferenceInterpreter::unary(const Expr& e) {
    const Expr& x = e.operand();
    switch (e.uop) {
        case UnaryOp::Plus:
            return eval(x);
        case UnaryOp::Neg:
            return 0u - eval(x);
        case UnaryOp::BitNot:
            return ~eval(x);
        case UnaryOp::Not:
            return truth(x) ? 0 : 1;
        case UnaryOp::AddrOf:
            return address(x);
        case UnaryOp::Deref: {
            const Type& t = e.typeOrThrow();
            uint32_t p = eval(x);
            if (t.isFunction() || t.isArray() || t.isRecord()) return p;
            return load(t, p);
        }
        case UnaryOp::PreInc:
        case UnaryOp::PreDec:
        case UnaryOp::PostInc:
        case UnaryOp::PostDec: {
            const Type& t = x.typeOrThrow();
            uint32_t step = t.isPointer() ? static_cast<uint32_t>(scale(t)) : 1u;
            bool inc = e.uop == UnaryOp::PreInc || e.uop == UnaryOp::PostInc;
            bool post = e.uop == UnaryOp::PostInc || e.uop == UnaryOp::PostDec;
            uint32_t addr = address(x);
            uint32_t old = load(t, addr);
            uint32_t updated = convert(t, inc ? old + step : old - step);
            store(t, addr, updated);
            return post ? old : updated;
        }
    }
    throw InterpreterError("unknown unary operator");
}

uint32_t ReferenceInterpreter::assign(const Expr& e) {
    const Expr& target = e.lhs();
    const Expr& value = e.rhs();
    Type t = target.typeOrThrow();
    if (t.isRecord()) throw InterpreterError("struct assignment");

    if (!e.assign_op) {
        uint32_t addr = 0;
        uint32_t v = 0;
        if (target.kind == ExprKind::Identifier) {
            v = eval(value);
            addr = address(target);
        } else {
            addr = address(target);
            v = eval(value);
        }
        v = convert(t, v);
        store(t, addr, v);
        return v;
    }

    BinaryOp op = *e.assign_op;
    uint32_t addr = address(target);
    uint32_t v = eval(value);
    uint32_t cur = load(t, addr);
    uint32_t result = 0;
    if (t.isPointer()) {
        v *= static_cast<uint32_t>(scale(t));
        result = op == BinaryOp::Add ? cur + v : cur - v;
    } else {
        Type r = decay(value.typeOrThrow());
        bool uns = (op == BinaryOp::Shl || op == BinaryOp::Shr)
            ? promote(t).is_unsigned
            : commonType(promote(t), promote(r)).is_unsigned;
        if (op == BinaryOp::Shl || op == BinaryOp::Shr) v &= 31u;
        auto computed = evalBinary32(op, cur, v, uns);
        if (!computed) throw InterpreterError("arithmetic trap in compound assignment");
        result = *computed;
    }
    result = convert(t, result);
    store(t, addr, result);
    return result;
}

uint32_t ReferenceInterpreter::callExpr(const Expr& e) {
    size_t n = e.argCount();
    std::vector<uint32_t> args(n);
    for (size_t i = n; i-- > 0;) args[i] = eval(e.arg(i));

    std::string name;
    const Expr& callee = e.callee();
    if (callee.kind == ExprKind::Identifier && callee.storage == StorageKind::Function) {
        name = callee.text;
    } else {
        uint32_t p = eval(callee);
        if (p < kFunctionBase || p - kFunctionBase >= function_ids_.size()) {
            throw InterpreterError("call through an invalid function pointer");
        }
        name = function_ids_[p - kFunctionBase];
    }
    return convert(e.typeOrThrow(), invoke(name, args));
}

// ============================================================================
// Library
// ============================================================================

uint32_t ReferenceInterpreter::builtin(const std::string& name, const std::vector<uint32_t>& args) {
    auto need = [&](size_t n) {
        if (args.size() < n) throw InterpreterError("too few arguments to '" + name + "'");
    };

    if (name == "printf") {
        need(1);
        std::string text = format(args);
        output_ += text;
        return static_cast<uint32_t>(text.size());
    }
    if (name == "puts") {
        need(1);
        std::string s = readString(args[0]);
        output_ += s + "\n";
        return static_cast<uint32_t>(s.size() + 1);
    }
    if (name == "putchar") {
        need(1);
        output_.push_back(static_cast<char>(args[0] & 0xFFu));
        return args[0] & 0xFFu;
    }
    if (name == "strlen") {
        need(1);
        return static_cast<uint32_t>(readString(args[0]).size());
    }
    if (name == "strcmp" || name == "strncmp") {
        need(name == "strcmp" ? 2 : 3);
        uint32_t limit = name == "strcmp" ? 0xFFFFFFFFu : args[2];
        for (uint32_t i = 0; i < limit; i++) {
            check(args[0] + i, 1);
            check(args[1] + i, 1);
            int a = memory_[args[0] + i];
            int b = memory_[args[1] + i];
            if (a != b) return static_cast<uint32_t>(a - b);
            if (a == 0) break;
        }
        return 0;
    }
    if (name == "strcpy") {
        need(2);
        std::string s = readString(args[1]);
        check(args[0], static_cast<long>(s.size()) + 1);
        std::copy(s.begin(), s.end(), memory_.begin() + args[0]);
        memory_[args[0] + s.size()] = 0;
        return args[0];
    }
    if (name == "memset") {
        need(3);
        if (args[2]) check(args[0], args[2]);
        std::fill(memory_.begin() + args[0], memory_.begin() + args[0] + args[2],
                  static_cast<uint8_t>(args[1]));
        return args[0];
    }
    if (name == "memcpy") {
        need(3);
        if (args[2]) {
            check(args[0], args[2]);
            check(args[1], args[2]);
        }
        std::memmove(memory_.data() + args[0], memory_.data() + args[1], args[2]);
        return args[0];
    }
    if (name == "abs") {
        need(1);
        int32_t v = static_cast<int32_t>(args[0]);
        return static_cast<uint32_t>(v < 0 ? 0u - static_cast<uint32_t>(v) : static_cast<uint32_t>(v));
    }
    throw InterpreterError("call to unknown function '" + name + "'");
}

std::string ReferenceInterpreter::format(const std::vector<uint32_t>& args) {
    std::string fmt = readString(args[0]);
    std::string out;
    size_t next = 1;
    auto arg = [&]() -> uint32_t {
        if (next >= args.size()) throw InterpreterError("printf: missing argument");
        return args[next++];
    };

    for (size_t i = 0; i < fmt.size(); i++) {
        if (fmt[i] != '%') {
            out.push_back(fmt[i]);
            continue;
        }
        std::string spec = "%";
        i++;
        while (i < fmt.size() && std::strchr("-+ 0#", fmt[i])) spec.push_back(fmt[i++]);
        if (i < fmt.size() && fmt[i] == '*') {
            spec += std::to_string(static_cast<int32_t>(arg()));
            i++;
        }
        while (i < fmt.size() && fmt[i] >= '0' && fmt[i] <= '9') spec.push_back(fmt[i++]);
        if (i < fmt.size() && fmt[i] == '.') {
            spec.push_back(fmt[i++]);
            while (i < fmt.size() && fmt[i] >= '0' && fmt[i] <= '9') spec.push_back(fmt[i++]);
        }
        while (i < fmt.size() && (fmt[i] == 'l' || fmt[i] == 'h')) i++;
        if (i >= fmt.size()) throw InterpreterError("printf: truncated conversion");

        char conv = fmt[i];
        char buf[512];
        int n = 0;
        switch (conv) {
            case '%':
                out.push_back('%');
                continue;
            case 'd':
            case 'i':
                spec.push_back('d');
                n = std::snprintf(buf, sizeof(buf), spec.c_str(), static_cast<int>(static_cast<int32_t>(arg())));
                break;
            case 'u':
            case 'x':
            case 'X':
                spec.push_back(conv);
                n = std::snprintf(buf, sizeof(buf), spec.c_str(), static_cast<unsigned>(arg()));
                break;
            case 'c':
                spec.push_back('c');
                n = std::snprintf(buf, sizeof(buf), spec.c_str(), static_cast<int>(arg() & 0xFFu));
                break;
            case 's': {
                std::string s = readString(arg());
                spec.push_back('s');
                std::vector<char> big(s.size() + 512);
                n = std::snprintf(big.data(), big.size(), spec.c_str(), s.c_str());
                if (n > 0) out.append(big.data(), std::min(static_cast<size_t>(n), big.size() - 1));
                continue;
            }
            default:
                throw InterpreterError(std::string("printf: unsupported conversion '%") + conv + "'");
        }
        if (n > 0) out.append(buf, std::min(static_cast<size_t>(n), sizeof(buf) - 1));
    }
    return out;
}

} // namespace test
} // namespace cloak
