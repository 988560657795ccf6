/**
 * Cloak - Obfuscating C Compiler
 *
 * x86_codegen.cpp - i386 System V code generator
 */

#include "x86_codegen.hpp"

#include <algorithm>
#include <cstdio>
#include <set>
#include <sstream>

namespace cloak {
namespace codegen {

using namespace ast;

namespace {

std::string imm(int64_t v) {
    return "$" + std::to_string(static_cast<int32_t>(static_cast<uint32_t>(v)));
}

std::string frameOperand(long offset) {
    return std::to_string(offset) + "(%ebp)";
}

const char* dataDirective(long size) {
    switch (size) {
        case 1:  return ".byte";
        case 2:  return ".short";
        default: return ".long";
    }
}

std::string escapeBytes(const std::string& bytes) {
    std::string out;
    for (unsigned char c : bytes) {
        if (c == '"' || c == '\\') {
            out += '\\';
            out += static_cast<char>(c);
        } else if (c >= 0x20 && c < 0x7f) {
            out += static_cast<char>(c);
        } else {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\%03o", c);
            out += buf;
        }
    }
    return out;
}

// condition code for a comparison, signed or unsigned
const char* conditionCode(BinaryOp op, bool is_unsigned) {
    switch (op) {
        case BinaryOp::Eq: return "e";
        case BinaryOp::Ne: return "ne";
        case BinaryOp::Lt: return is_unsigned ? "b" : "l";
        case BinaryOp::Le: return is_unsigned ? "be" : "le";
        case BinaryOp::Gt: return is_unsigned ? "a" : "g";
        case BinaryOp::Ge: return is_unsigned ? "ae" : "ge";
        default:
            throw InternalError(std::string("no condition code for '") + binaryOpSpelling(op) + "'");
    }
}

BinaryOp invertComparison(BinaryOp op) {
    switch (op) {
        case BinaryOp::Eq: return BinaryOp::Ne;
        case BinaryOp::Ne: return BinaryOp::Eq;
        case BinaryOp::Lt: return BinaryOp::Ge;
        case BinaryOp::Le: return BinaryOp::Gt;
        case BinaryOp::Gt: return BinaryOp::Le;
        case BinaryOp::Ge: return BinaryOp::Lt;
        default:
            throw InternalError(std::string("cannot invert '") + binaryOpSpelling(op) + "'");
    }
}

bool isLoweredScalar(const Type& t) {
    return t.isInteger() || t.isPointer();
}

bool hasUnloweredType(const Type& t) {
    if (t.isArray()) return hasUnloweredType(t.element());
    return t.kind == TypeKind::LongLong || t.kind == TypeKind::Float || t.kind == TypeKind::Double;
}

// pointer comparisons and unsigned common types use the unsigned condition codes
bool unsignedComparison(const Expr& e) {
    Type l = decay(e.lhs().typeOrThrow());
    Type r = decay(e.rhs().typeOrThrow());
    if (l.isPointer() || r.isPointer()) return true;
    return commonType(promote(l), promote(r)).is_unsigned;
}

const Expr& stripCasts(const Expr& e) {
    const Expr* x = &e;
    while (x->kind == ExprKind::Cast) x = &x->operand();
    return *x;
}

} // namespace

// ============================================================================
// Unit
// ============================================================================

CodegenResult X86CodeGenerator::generate(const Program& program) {
    CodegenResult result;
    layout_ = TypeLayout(program);
    stats_.clear();
    text_.clear();
    data_.clear();
    bss_.clear();
    rodata_.clear();
    init_array_.clear();
    strings_.clear();
    string_counter_ = 0;

    static_functions_.clear();
    for (const auto& d : program.decls) {
        if (d.kind == DeclKind::Function && d.func.is_static) static_functions_.insert(d.func.name);
    }

    try {
        emitGlobals(program);
        for (const auto& d : program.decls) {
            if (d.kind != DeclKind::Function || !d.func.is_definition) continue;
            emitFunction(d.func);
            result.frames.push_back(frame_);
        }
    } catch (const CompileError& e) {
        logger_.error("code generation failed: {}", e.what());
        result.diagnostics.add(e.diagnostic());
        result.frames.clear();
        return result;
    } catch (const InternalError& e) {
        logger_.error("internal error during code generation: {}", e.what());
        result.diagnostics.add(e.toDiagnostic());
        result.frames.clear();
        return result;
    }

    result.assembly = assemble();
    result.stats = stats_;
    result.success = true;
    logger_.info("emitted {} functions, {} string literals", stats_["functions"],
                 stats_["string_literals"]);
    return result;
}

std::string X86CodeGenerator::assemble() const {
    std::ostringstream oss;
    auto section = [&](const char* header, const std::vector<std::string>& lines) {
        if (lines.empty()) return;
        oss << "\t" << header << "\n";
        for (const auto& l : lines) oss << l << "\n";
    };
    section(".text", text_);
    section(".data", data_);
    section(".bss", bss_);
    section(".section .rodata", rodata_);
    section(".section .init_array,\"aw\"", init_array_);
    oss << "\t.section .note.GNU-stack,\"\",@progbits\n";
    return oss.str();
}

std::string X86CodeGenerator::stringLabel(const std::string& bytes) {
    auto it = strings_.find(bytes);
    if (it != strings_.end()) return it->second;

    std::string label = ".LS" + std::to_string(string_counter_++);
    strings_[bytes] = label;
    rodata_.push_back(label + ":");
    rodata_.push_back("\t.string \"" + escapeBytes(bytes) + "\"");
    stats_["string_literals"]++;
    return label;
}

void X86CodeGenerator::emitGlobals(const Program& program) {
    // a global may be declared several times; the one with an initializer,
    // else the first non-extern one, defines it
    std::vector<std::string> order;
    std::unordered_map<std::string, const VarDecl*> definition;
    std::set<std::string> internal;

    for (const auto& d : program.decls) {
        if (d.kind != DeclKind::Variable) continue;
        const VarDecl& v = d.var;
        auto it = definition.find(v.name);
        if (it == definition.end()) {
            order.push_back(v.name);
            it = definition.emplace(v.name, nullptr).first;
        }
        if (v.is_static) internal.insert(v.name);
        if (v.init || (!v.is_extern && !it->second)) it->second = &v;
    }

    for (const auto& name : order) {
        const VarDecl* v = definition[name];
        if (!v) continue;     // only ever declared extern
        emitObject(name, *v, !internal.count(name));
        stats_["globals"]++;
    }
}

void X86CodeGenerator::emitObject(const std::string& label, const VarDecl& v, bool global) {
    const Type& t = v.type;
    if (hasUnloweredType(t)) {
        unsupported("object '" + v.name + "' of type '" + t.str() + "'", v.loc);
    }
    long size = layout_.sizeOf(t);
    long align = layout_.alignOf(t);

    std::vector<std::string>& out = v.init ? data_ : bss_;
    if (global) out.push_back("\t.globl " + label);
    out.push_back("\t.balign " + std::to_string(align));
    out.push_back("\t.type " + label + ", @object");
    out.push_back("\t.size " + label + ", " + std::to_string(size));
    out.push_back(label + ":");
    if (v.init) {
        emitInitializer(t, *v.init, out);
    } else {
        out.push_back("\t.zero " + std::to_string(std::max(size, 1L)));
    }
}

void X86CodeGenerator::emitInitializer(const Type& t, const Expr& init, std::vector<std::string>& out) {
    long size = layout_.sizeOf(t);

    if (t.isArray()) {
        const Type& elem = t.element();
        long esize = layout_.sizeOf(elem);
        long written = 0;

        if (init.kind == ExprKind::StringLiteral && elem.kind == TypeKind::Char) {
            std::string bytes = init.text;
            bytes.push_back('\0');
            if (static_cast<long>(bytes.size()) > size) bytes.resize(static_cast<size_t>(size));
            std::ostringstream line;
            line << "\t.byte ";
            for (size_t i = 0; i < bytes.size(); i++) {
                if (i) line << ",";
                line << static_cast<int>(static_cast<unsigned char>(bytes[i]));
            }
            if (!bytes.empty()) out.push_back(line.str());
            written = static_cast<long>(bytes.size());
        } else if (init.kind == ExprKind::InitList) {
            if (!isLoweredScalar(elem)) {
                unsupported("initializer list for an array of '" + elem.str() + "'", init.loc);
            }
            for (const auto& el : init.args) {
                emitScalarData(elem, el, out);
                written += esize;
            }
        } else {
            unsupported("array initializer", init.loc);
        }
        if (written < size) out.push_back("\t.zero " + std::to_string(size - written));
        return;
    }

    if (t.isRecord()) {
        unsupported("struct or union initializer", init.loc);
    }
    emitScalarData(t, init, out);
}

void X86CodeGenerator::emitScalarData(const Type& t, const Expr& init, std::vector<std::string>& out) {
    if (init.kind == ExprKind::InitList) {
        unsupported("nested initializer list", init.loc);
    }
    long size = layout_.sizeOf(t);

    if (t.isPointer()) {
        if (auto sym = addressConstant(init)) {
            out.push_back("\t.long " + *sym);
            return;
        }
    }
    ConstEvaluator eval(&layout_);
    auto v = eval.evaluate(init);
    if (!v) {
        throw CompileError(DiagCode::TypeMismatch, "initializer element is not constant", init.loc);
    }
    uint32_t bits = t.isInteger() ? convertTo(t, v->bits) : v->bits;
    out.push_back(std::string("\t") + dataDirective(size) + " " +
                  std::to_string(static_cast<int32_t>(bits)));
}

std::optional<std::string> X86CodeGenerator::addressConstant(const Expr& e) {
    const Expr& x = stripCasts(e);
    const Expr* target = nullptr;

    if (x.kind == ExprKind::StringLiteral) return stringLabel(x.text);
    if (x.kind == ExprKind::Identifier) {
        if (x.storage == StorageKind::Function) return x.text;
        if (x.type && x.type->isArray()) target = &x;
    } else if (x.kind == ExprKind::Unary && x.uop == UnaryOp::AddrOf &&
               x.operand().kind == ExprKind::Identifier) {
        target = &x.operand();
    }
    if (!target) return std::nullopt;

    if (target->storage == StorageKind::Global || target->storage == StorageKind::Function) {
        return target->text;
    }
    auto it = static_locals_.find(bindingOf(*target));
    if (it != static_locals_.end()) return it->second;
    return std::nullopt;
}

// ============================================================================
// Functions
// ============================================================================

std::string X86CodeGenerator::newLabel() {
    stats_["labels"]++;
    return ".L" + function_->name + "." + std::to_string(label_counter_++);
}

void X86CodeGenerator::push(const char* reg) {
    emit(std::string("pushl ") + reg);
    depth_ += 4;
}

void X86CodeGenerator::pop(const char* reg) {
    emit(std::string("popl ") + reg);
    depth_ -= 4;
}

void X86CodeGenerator::collectStaticLocals(const Function& f) {
    static_locals_.clear();
    visitBlockStmts(f.body, [&](const Stmt& s) {
        if (s.kind != StmtKind::Decl || !s.decl || !s.decl->is_static) return;
        const VarDecl& v = *s.decl;
        static_locals_[bindingOf(v)] = f.name + "." + v.name + "." + std::to_string(v.scope_id);
    });
    // emitted after the map is complete so initializers can refer to each other
    visitBlockStmts(f.body, [&](const Stmt& s) {
        if (s.kind != StmtKind::Decl || !s.decl || !s.decl->is_static) return;
        emitObject(static_locals_[bindingOf(*s.decl)], *s.decl, false);
        stats_["static_locals"]++;
    });
}

void X86CodeGenerator::emitFunction(const Function& f) {
    logger_.debug("lowering function '{}'", f.name);
    function_ = &f;
    out_.clear();
    tables_.clear();
    break_labels_.clear();
    continue_labels_.clear();
    label_counter_ = 0;
    depth_ = 0;

    const Type& ret = f.return_type;
    if (ret.isRecord()) unsupported("function '" + f.name + "' returning a struct or union", f.loc);
    if (!ret.isVoid()) checkValueType(ret, f.loc);

    FramePlanner planner(layout_);
    frame_ = planner.plan(f);
    collectStaticLocals(f);
    return_label_ = newLabel();

    if (!static_functions_.count(f.name)) out_.push_back("\t.globl " + f.name);
    out_.push_back("\t.type " + f.name + ", @function");
    placeLabel(f.name);
    emit("pushl %ebp");
    emit("movl %esp, %ebp");
    if (frame_.frame_size > 0) emit("subl " + imm(frame_.frame_size) + ", %esp");

    genBlock(f.body);

    // falling off the end returns 0
    emit("movl $0, %eax");
    placeLabel(return_label_);
    emit("leave");
    emit("ret");
    out_.push_back("\t.size " + f.name + ", .-" + f.name);

    for (const auto& t : tables_) {
        rodata_.push_back("\t.balign 4");
        rodata_.push_back(t.label + ":");
        for (const auto& target : t.targets) rodata_.push_back("\t.long " + target);
    }
    text_.insert(text_.end(), out_.begin(), out_.end());

    if (f.meta.constructor) {
        init_array_.push_back("\t.balign 4");
        init_array_.push_back("\t.long " + f.name);
        stats_["constructors"]++;
    }
    stats_["functions"]++;
    function_ = nullptr;
}

// ============================================================================
// Statements
// ============================================================================

void X86CodeGenerator::genBlock(const Block& block) {
    for (const auto& s : block) genStmt(s);
}

void X86CodeGenerator::genStmt(const Stmt& s) {
    switch (s.kind) {
        case StmtKind::Decl:
            genLocalDecl(*s.decl);
            break;

        case StmtKind::Expr:
            genExpr(*s.expr);
            break;

        case StmtKind::If: {
            std::string else_label = newLabel();
            branchIfFalse(s.condition(), else_label);
            genBlock(s.body);
            if (s.has_else) {
                std::string end = newLabel();
                emit("jmp " + end);
                placeLabel(else_label);
                genBlock(s.else_body);
                placeLabel(end);
            } else {
                placeLabel(else_label);
            }
            break;
        }

        case StmtKind::While: {
            std::string head = newLabel();
            std::string end = newLabel();
            placeLabel(head);
            branchIfFalse(s.condition(), end);
            break_labels_.push_back(end);
            continue_labels_.push_back(head);
            genBlock(s.body);
            break_labels_.pop_back();
            continue_labels_.pop_back();
            emit("jmp " + head);
            placeLabel(end);
            break;
        }

        case StmtKind::DoWhile: {
            std::string top = newLabel();
            std::string test = newLabel();
            std::string end = newLabel();
            placeLabel(top);
            break_labels_.push_back(end);
            continue_labels_.push_back(test);
            genBlock(s.body);
            break_labels_.pop_back();
            continue_labels_.pop_back();
            placeLabel(test);
            branchIfFalse(s.condition(), end);
            emit("jmp " + top);
            placeLabel(end);
            break;
        }

        case StmtKind::For: {
            genBlock(s.init);
            std::string head = newLabel();
            std::string step = newLabel();
            std::string end = newLabel();
            placeLabel(head);
            if (s.expr) branchIfFalse(*s.expr, end);
            break_labels_.push_back(end);
            continue_labels_.push_back(step);
            genBlock(s.body);
            break_labels_.pop_back();
            continue_labels_.pop_back();
            placeLabel(step);
            if (s.step) genExpr(*s.step);
            emit("jmp " + head);
            placeLabel(end);
            break;
        }

        case StmtKind::Switch:
            genSwitch(s);
            break;

        case StmtKind::Break:
            if (break_labels_.empty()) throw InternalError("break outside a loop or switch");
            emit("jmp " + break_labels_.back());
            break;

        case StmtKind::Continue:
            if (continue_labels_.empty()) throw InternalError("continue outside a loop");
            emit("jmp " + continue_labels_.back());
            break;

        case StmtKind::Return:
            if (s.expr) {
                genExpr(*s.expr);
                convert(function_->return_type);
            }
            emit("jmp " + return_label_);
            break;

        case StmtKind::Compound:
            genBlock(s.body);
            break;

        case StmtKind::Empty:
            break;
    }
    if (depth_ != 0) {
        throw InternalError("operand stack unbalanced after statement in '" + function_->name + "'");
    }
}

void X86CodeGenerator::genLocalDecl(const VarDecl& v) {
    if (v.is_static || v.is_extern || !v.init) return;

    const FrameSlot* slot = frame_.find(v.name, v.scope_id);
    if (!slot) throw InternalError("no frame slot for local '" + v.name + "'");
    const Type& t = v.type;
    const Expr& init = *v.init;

    if (t.isRecord()) unsupported("struct or union initializer for '" + v.name + "'", v.loc);

    if (!t.isArray()) {
        genExpr(init);
        convert(t);
        storeTo(t, frameOperand(slot->offset));
        return;
    }

    const Type& elem = t.element();
    if (!isLoweredScalar(elem)) {
        unsupported("initializer for an array of '" + elem.str() + "'", v.loc);
    }
    long esize = layout_.sizeOf(elem);
    long count = t.array_size;
    long done = 0;

    if (init.kind == ExprKind::StringLiteral) {
        for (; done < count && done <= static_cast<long>(init.text.size()); done++) {
            int byte = done < static_cast<long>(init.text.size())
                ? static_cast<unsigned char>(init.text[static_cast<size_t>(done)]) : 0;
            emit("movb " + imm(byte) + ", " + frameOperand(slot->offset + done));
        }
    } else if (init.kind == ExprKind::InitList) {
        for (const auto& el : init.args) {
            if (el.kind == ExprKind::InitList) unsupported("nested initializer list", el.loc);
            genExpr(el);
            convert(elem);
            storeTo(elem, frameOperand(slot->offset + done * esize));
            done++;
        }
    } else {
        unsupported("array initializer for '" + v.name + "'", v.loc);
    }

    if (done < count) {
        emit("xorl %eax, %eax");
        for (long i = done; i < count; i++) storeTo(elem, frameOperand(slot->offset + i * esize));
    }
}

void X86CodeGenerator::branchIfFalse(const Expr& cond, const std::string& target) {
    if (cond.isLiteral()) {
        if (cond.int_value == 0) emit("jmp " + target);
        return;
    }
    if (cond.kind == ExprKind::Binary && isComparison(cond.bop)) {
        genCompare(cond);
        emit(std::string("j") + conditionCode(invertComparison(cond.bop), unsignedComparison(cond)) +
             " " + target);
        return;
    }
    genExpr(cond);
    emit("testl %eax, %eax");
    emit("je " + target);
}

void X86CodeGenerator::genSwitch(const Stmt& s) {
    genExpr(s.condition());
    Type ct = promote(s.condition().typeOrThrow());

    std::string end = newLabel();
    std::string default_label = end;
    std::vector<std::string> case_labels;
    std::vector<std::pair<int64_t, std::string>> values;

    for (const auto& c : s.cases) {
        case_labels.push_back(newLabel());
        if (c.isDefault()) {
            default_label = case_labels.back();
        } else {
            uint32_t bits = static_cast<uint32_t>(c.const_value);
            int64_t v = ct.is_unsigned ? static_cast<int64_t>(bits)
                                       : static_cast<int64_t>(static_cast<int32_t>(bits));
            values.emplace_back(v, case_labels.back());
        }
    }
    std::sort(values.begin(), values.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    int64_t range = values.empty() ? 0 : values.back().first - values.front().first + 1;
    bool dense = values.size() >= kJumpTableMinCases &&
                 range <= 3 * static_cast<int64_t>(values.size()) &&
                 range <= kJumpTableMaxRange;

    if (dense) {
        int64_t low = values.front().first;
        SwitchTable table;
        table.label = newLabel();
        table.targets.assign(static_cast<size_t>(range), default_label);
        for (const auto& v : values) table.targets[static_cast<size_t>(v.first - low)] = v.second;

        if (low != 0) emit("subl " + imm(low) + ", %eax");
        emit("cmpl " + imm(range - 1) + ", %eax");
        emit("ja " + default_label);
        emit("jmp *" + table.label + "(,%eax,4)");
        tables_.push_back(std::move(table));
        stats_["jump_tables"]++;
    } else {
        for (const auto& v : values) {
            emit("cmpl " + imm(v.first) + ", %eax");
            emit("je " + v.second);
        }
        emit("jmp " + default_label);
        stats_["compare_chains"]++;
    }

    break_labels_.push_back(end);
    for (size_t i = 0; i < s.cases.size(); i++) {
        placeLabel(case_labels[i]);
        genBlock(s.cases[i].body);
    }
    break_labels_.pop_back();
    placeLabel(end);
}

// ============================================================================
// Expressions
// ============================================================================

void X86CodeGenerator::unsupported(const std::string& what, SourceLoc loc) const {
    throw CompileError(DiagCode::UnsupportedConstruct,
                       what + " is not supported by the code generator", loc);
}

void X86CodeGenerator::checkValueType(const Type& t, SourceLoc loc) const {
    switch (t.kind) {
        case TypeKind::LongLong:
        case TypeKind::Float:
        case TypeKind::Double:
            unsupported("a value of type '" + t.str() + "'", loc);
        case TypeKind::Struct:
        case TypeKind::Union:
            unsupported("a struct or union value", loc);
        default:
            break;
    }
}

long X86CodeGenerator::scaleOf(const Type& pointer) const {
    return layout_.sizeOf(decay(pointer).pointee());
}

void X86CodeGenerator::loadFrom(const Type& t, const std::string& operand) {
    switch (t.kind) {
        case TypeKind::Char:
            emit(std::string(t.is_unsigned ? "movzbl " : "movsbl ") + operand + ", %eax");
            break;
        case TypeKind::Short:
            emit(std::string(t.is_unsigned ? "movzwl " : "movswl ") + operand + ", %eax");
            break;
        case TypeKind::Int:
        case TypeKind::Long:
        case TypeKind::Enum:
        case TypeKind::Pointer:
            emit("movl " + operand + ", %eax");
            break;
        case TypeKind::Array:
        case TypeKind::Function:
        case TypeKind::Struct:
        case TypeKind::Union:
            // the value of an aggregate or function is its address
            if (operand != "(%eax)") emit("leal " + operand + ", %eax");
            break;
        case TypeKind::Void:
            break;
        default:
            unsupported("a value of type '" + t.str() + "'", {});
    }
}

void X86CodeGenerator::storeTo(const Type& t, const std::string& operand) {
    switch (t.kind) {
        case TypeKind::Char:
            emit("movb %al, " + operand);
            break;
        case TypeKind::Short:
            emit("movw %ax, " + operand);
            break;
        case TypeKind::Int:
        case TypeKind::Long:
        case TypeKind::Enum:
        case TypeKind::Pointer:
            emit("movl %eax, " + operand);
            break;
        default:
            throw InternalError("store of non-scalar type '" + t.str() + "'");
    }
}

void X86CodeGenerator::convert(const Type& t) {
    if (t.kind == TypeKind::Char) {
        emit(t.is_unsigned ? "movzbl %al, %eax" : "movsbl %al, %eax");
    } else if (t.kind == TypeKind::Short) {
        emit(t.is_unsigned ? "movzwl %ax, %eax" : "movswl %ax, %eax");
    }
}

std::optional<std::string> X86CodeGenerator::directOperand(const Expr& e) {
    if (e.kind != ExprKind::Identifier) return std::nullopt;
    switch (e.storage) {
        case StorageKind::Global:
            return e.text;
        case StorageKind::Local:
        case StorageKind::Param: {
            auto it = static_locals_.find(bindingOf(e));
            if (it != static_locals_.end()) return it->second;
            const FrameSlot* slot = frame_.find(e.text, e.scope_id);
            if (!slot) {
                throw InternalError("no frame slot for '" + e.text + "' in '" + function_->name + "'");
            }
            return frameOperand(slot->offset);
        }
        default:
            return std::nullopt;
    }
}

void X86CodeGenerator::genAddr(const Expr& e) {
    switch (e.kind) {
        case ExprKind::Identifier: {
            if (e.storage == StorageKind::Function || e.storage == StorageKind::Global) {
                emit("movl $" + e.text + ", %eax");
                return;
            }
            auto op = directOperand(e);
            if (!op) throw InternalError("'" + e.text + "' has no address");
            if (static_locals_.count(bindingOf(e))) emit("movl $" + *op + ", %eax");
            else emit("leal " + *op + ", %eax");
            return;
        }
        case ExprKind::StringLiteral:
            emit("movl $" + stringLabel(e.text) + ", %eax");
            return;
        case ExprKind::Unary:
            if (e.uop != UnaryOp::Deref) break;
            genExpr(e.operand());
            return;
        case ExprKind::Index: {
            const Expr* base = &e.lhs();
            const Expr* idx = &e.rhs();
            if (!decay(base->typeOrThrow()).isPointer()) std::swap(base, idx);
            long scale = scaleOf(base->typeOrThrow());
            genExpr(*base);
            push();
            genExpr(*idx);
            if (scale != 1) emit("imull " + imm(scale) + ", %eax, %eax");
            emit("movl %eax, %ecx");
            pop("%eax");
            emit("addl %ecx, %eax");
            return;
        }
        case ExprKind::Member: {
            const Expr& object = e.operand();
            Type rec = e.arrow ? decay(object.typeOrThrow()).pointee() : object.typeOrThrow();
            const TypeLayout::FieldInfo* field = layout_.field(rec.tag, e.text);
            if (!field) throw InternalError("no field '" + e.text + "' in '" + rec.str() + "'");
            if (e.arrow) genExpr(object);
            else genAddr(object);
            if (field->offset != 0) emit("addl " + imm(field->offset) + ", %eax");
            return;
        }
        default:
            break;
    }
    if (e.typeOrThrow().isRecord()) unsupported("a struct or union value", e.loc);
    throw InternalError("expression is not addressable");
}

void X86CodeGenerator::genExpr(const Expr& e) {
    const Type& t = e.typeOrThrow();
    if (e.kind != ExprKind::Identifier && e.kind != ExprKind::Member &&
        e.kind != ExprKind::Index && !(e.kind == ExprKind::Unary && e.uop == UnaryOp::Deref)) {
        checkValueType(t, e.loc);
    } else if (t.kind == TypeKind::LongLong || t.kind == TypeKind::Float ||
               t.kind == TypeKind::Double) {
        checkValueType(t, e.loc);
    }

    switch (e.kind) {
        case ExprKind::IntLiteral:
        case ExprKind::CharLiteral:
            emit("movl " + imm(e.int_value) + ", %eax");
            return;

        case ExprKind::StringLiteral:
            emit("movl $" + stringLabel(e.text) + ", %eax");
            return;

        case ExprKind::Identifier:
            if (e.storage == StorageKind::EnumConst) {
                emit("movl " + imm(e.int_value) + ", %eax");
                return;
            }
            if (e.storage == StorageKind::Function || t.isArray() || t.isRecord()) {
                genAddr(e);
                return;
            }
            if (auto op = directOperand(e)) {
                loadFrom(t, *op);
                return;
            }
            throw InternalError("identifier '" + e.text + "' was not resolved");

        case ExprKind::Binary:
            genBinary(e);
            return;

        case ExprKind::Unary:
            genUnary(e);
            return;

        case ExprKind::Assign:
            genAssign(e);
            return;

        case ExprKind::Call:
            genCall(e);
            return;

        case ExprKind::Index:
        case ExprKind::Member:
            genAddr(e);
            loadFrom(t, "(%eax)");
            return;

        case ExprKind::Ternary: {
            std::string other = newLabel();
            std::string end = newLabel();
            branchIfFalse(e.args[0], other);
            genExpr(e.args[1]);
            emit("jmp " + end);
            placeLabel(other);
            genExpr(e.args[2]);
            placeLabel(end);
            return;
        }

        case ExprKind::Cast:
            checkValueType(e.operand().typeOrThrow(), e.operand().loc);
            genExpr(e.operand());
            if (e.target_type.isInteger()) convert(e.target_type);
            return;

        case ExprKind::SizeOf: {
            long size = e.sizeof_type ? layout_.sizeOf(e.target_type)
                                      : layout_.sizeOf(e.operand().typeOrThrow());
            emit("movl " + imm(size) + ", %eax");
            return;
        }

        case ExprKind::InitList:
            unsupported("an initializer list used as a value", e.loc);
    }
    throw InternalError("unknown expression kind");
}

void X86CodeGenerator::genBinary(const Expr& e) {
    BinaryOp op = e.bop;
    if (op == BinaryOp::LogAnd || op == BinaryOp::LogOr) {
        genLogical(e);
        return;
    }
    if (isComparison(op)) {
        genCompare(e);
        emit(std::string("set") + conditionCode(op, unsignedComparison(e)) + " %al");
        emit("movzbl %al, %eax");
        return;
    }

    Type l = decay(e.lhs().typeOrThrow());
    Type r = decay(e.rhs().typeOrThrow());

    genExpr(e.lhs());
    push();
    genExpr(e.rhs());
    emit("movl %eax, %ecx");
    pop("%eax");

    if (op == BinaryOp::Add || op == BinaryOp::Sub) {
        if (l.isPointer() && r.isPointer()) {
            long size = scaleOf(l);
            emit("subl %ecx, %eax");
            if (size != 1) {
                emit("cltd");
                emit("movl " + imm(size) + ", %ecx");
                emit("idivl %ecx");
            }
            return;
        }
        if (l.isPointer()) {
            long size = scaleOf(l);
            if (size != 1) emit("imull " + imm(size) + ", %ecx, %ecx");
        } else if (r.isPointer()) {
            long size = scaleOf(r);
            if (size != 1) emit("imull " + imm(size) + ", %eax, %eax");
        }
    }
    genArith(op, e.typeOrThrow().is_unsigned);
}

void X86CodeGenerator::genArith(BinaryOp op, bool is_unsigned) {
    // %eax = %eax op %ecx
    switch (op) {
        case BinaryOp::Add:    emit("addl %ecx, %eax"); break;
        case BinaryOp::Sub:    emit("subl %ecx, %eax"); break;
        case BinaryOp::Mul:    emit("imull %ecx, %eax"); break;
        case BinaryOp::BitAnd: emit("andl %ecx, %eax"); break;
        case BinaryOp::BitOr:  emit("orl %ecx, %eax"); break;
        case BinaryOp::BitXor: emit("xorl %ecx, %eax"); break;
        case BinaryOp::Shl:    emit("sall %cl, %eax"); break;
        case BinaryOp::Shr:    emit(is_unsigned ? "shrl %cl, %eax" : "sarl %cl, %eax"); break;
        case BinaryOp::Div:
        case BinaryOp::Mod:
            if (is_unsigned) {
                emit("xorl %edx, %edx");
                emit("divl %ecx");
            } else {
                emit("cltd");
                emit("idivl %ecx");
            }
            if (op == BinaryOp::Mod) emit("movl %edx, %eax");
            break;
        default:
            throw InternalError(std::string("'") + binaryOpSpelling(op) + "' is not arithmetic");
    }
}

void X86CodeGenerator::genCompare(const Expr& e) {
    genExpr(e.lhs());
    push();
    genExpr(e.rhs());
    emit("movl %eax, %ecx");
    pop("%eax");
    emit("cmpl %ecx, %eax");
}

void X86CodeGenerator::genLogical(const Expr& e) {
    bool is_and = e.bop == BinaryOp::LogAnd;
    std::string shortcut = newLabel();
    std::string end = newLabel();

    genExpr(e.lhs());
    emit("testl %eax, %eax");
    emit((is_and ? "je " : "jne ") + shortcut);
    genExpr(e.rhs());
    emit("testl %eax, %eax");
    emit((is_and ? "je " : "jne ") + shortcut);
    emit(std::string("movl $") + (is_and ? "1" : "0") + ", %eax");
    emit("jmp " + end);
    placeLabel(shortcut);
    emit(std::string("movl $") + (is_and ? "0" : "1") + ", %eax");
    placeLabel(end);
}

void X86CodeGenerator::genUnary(const Expr& e) {
    const Expr& x = e.operand();
    switch (e.uop) {
        case UnaryOp::Plus:
            genExpr(x);
            return;
        case UnaryOp::Neg:
            genExpr(x);
            emit("negl %eax");
            return;
        case UnaryOp::BitNot:
            genExpr(x);
            emit("notl %eax");
            return;
        case UnaryOp::Not:
            genExpr(x);
            emit("testl %eax, %eax");
            emit("sete %al");
            emit("movzbl %al, %eax");
            return;
        case UnaryOp::AddrOf:
            genAddr(x);
            return;
        case UnaryOp::Deref:
            genExpr(x);
            loadFrom(e.typeOrThrow(), "(%eax)");
            return;
        case UnaryOp::PreInc:
        case UnaryOp::PreDec:
        case UnaryOp::PostInc:
        case UnaryOp::PostDec: {
            const Type& t = x.typeOrThrow();
            long step = t.isPointer() ? scaleOf(t) : 1;
            bool inc = e.uop == UnaryOp::PreInc || e.uop == UnaryOp::PostInc;
            bool post = e.uop == UnaryOp::PostInc || e.uop == UnaryOp::PostDec;

            genAddr(x);
            emit("movl %eax, %ecx");
            loadFrom(t, "(%ecx)");
            if (post) emit("movl %eax, %edx");
            emit(std::string(inc ? "addl " : "subl ") + imm(step) + ", %eax");
            convert(t);
            storeTo(t, "(%ecx)");
            if (post) emit("movl %edx, %eax");
            return;
        }
    }
    throw InternalError("unknown unary operator");
}

void X86CodeGenerator::genAssign(const Expr& e) {
    const Expr& target = e.lhs();
    const Expr& value = e.rhs();
    Type t = target.typeOrThrow();
    if (t.isRecord()) unsupported("struct or union assignment", e.loc);

    if (!e.assign_op) {
        if (auto op = directOperand(target)) {
            genExpr(value);
            convert(t);
            storeTo(t, *op);
            return;
        }
        genAddr(target);
        push();
        genExpr(value);
        pop("%ecx");
        convert(t);
        storeTo(t, "(%ecx)");
        return;
    }

    BinaryOp op = *e.assign_op;
    Type r = decay(value.typeOrThrow());
    bool uns = false;
    if (!t.isPointer()) {
        uns = (op == BinaryOp::Shl || op == BinaryOp::Shr)
            ? promote(t).is_unsigned
            : commonType(promote(t), promote(r)).is_unsigned;
    }

    genAddr(target);
    push();
    genExpr(value);
    emit("movl %eax, %ecx");
    if (t.isPointer()) {
        long size = scaleOf(t);
        if (size != 1) emit("imull " + imm(size) + ", %ecx, %ecx");
    }
    emit("movl (%esp), %edx");
    loadFrom(t, "(%edx)");
    genArith(op, uns);
    pop("%ecx");
    convert(t);
    storeTo(t, "(%ecx)");
}

void X86CodeGenerator::genCall(const Expr& e) {
    size_t n = e.argCount();
    for (size_t i = 0; i < n; i++) {
        checkValueType(decay(e.arg(i).typeOrThrow()), e.arg(i).loc);
    }

    long args_size = static_cast<long>(4 * n);
    long pad = ((8 - depth_ - args_size) % FramePlanner::kStackAlign + FramePlanner::kStackAlign) %
               FramePlanner::kStackAlign;
    if (pad) {
        emit("subl " + imm(pad) + ", %esp");
        depth_ += pad;
    }
    for (size_t i = n; i-- > 0;) {
        genExpr(e.arg(i));
        push();
    }

    const Expr& callee = e.callee();
    if (callee.kind == ExprKind::Identifier && callee.storage == StorageKind::Function) {
        emit("call " + callee.text);
    } else {
        genExpr(callee);
        emit("call *%eax");
        stats_["indirect_calls"]++;
    }

    long cleanup = args_size + pad;
    if (cleanup) {
        emit("addl " + imm(cleanup) + ", %esp");
        depth_ -= cleanup;
    }
    const Type& ret = e.typeOrThrow();
    if (ret.isInteger()) convert(ret);
}

CodegenResult generate(const Program& program) {
    X86CodeGenerator gen;
    return gen.generate(program);
}

} // namespace codegen
} // namespace cloak
