/**
 * Cloak - Obfuscating C Compiler
 *
 * string_encoding.cpp - String literal encryption
 */

#include "string_encoding.hpp"

#include "../../ast/ast_walk.hpp"
#include "../../core/diagnostics.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace cloak {
namespace data {

using namespace ast;

EncryptedString StringCipher::encrypt(const std::string& plain, uint8_t key, uint8_t step) {
    EncryptedString result;
    result.original = plain;
    result.key = key;
    result.step = step;
    result.bytes.reserve(plain.size() + 1);
    for (size_t i = 0; i <= plain.size(); i++) {
        uint8_t c = i < plain.size() ? static_cast<uint8_t>(plain[i]) : 0;
        result.bytes.push_back(static_cast<uint8_t>(c ^ keyStreamByte(key, step, i)));
    }
    return result;
}

EncryptedString StringCipher::encrypt(const std::string& plain, Random& rng) {
    uint8_t key = rng.nextNonZeroByte();
    uint8_t step = rng.nextNonZeroByte();
    return encrypt(plain, key, step);
}

std::string StringCipher::decrypt(const std::vector<uint8_t>& bytes, uint8_t key, uint8_t step) {
    std::string result;
    result.reserve(bytes.size());
    for (size_t i = 0; i < bytes.size(); i++) {
        result += static_cast<char>(bytes[i] ^ keyStreamByte(key, step, i));
    }
    return result;
}

// ============================================================================
// Pass
// ============================================================================

struct StringEncryptionPass::Unit {
    Unit(CompileContext& c, const Program& p) : ctx(c), program(p) {}

    CompileContext& ctx;
    const Program& program;
    // per callee: which parameters never outlive the call
    std::unordered_map<std::string, std::vector<bool>> borrowed;
    std::vector<TopDecl> globals;   // encrypted data and buffers, placed first
    Block startup;                  // body of the constructor
    Block prologue;                 // stack buffers of the current function
    int encrypted = 0;
    int bytes = 0;
};

namespace {

bool isCharArray(const Type& t) {
    return t.isArray() && t.element().kind == TypeKind::Char;
}

// the callee may hand back a pointer into its argument
bool returnsPointer(const Expr& call) {
    const Expr& callee = call.callee();
    if (!callee.type) return true;
    const Type* fn = &*callee.type;
    if (fn->isPointer()) fn = &fn->pointee();
    if (!fn->isFunction()) return true;
    return fn->returnType().isPointer();
}

// library functions that read their string arguments and keep nothing
const std::unordered_set<std::string>& nonRetainingLibrary() {
    static const std::unordered_set<std::string> names = {
        "printf", "fprintf", "sprintf", "snprintf", "puts", "fputs",
        "strcmp", "strncmp", "strlen", "memcmp", "atoi", "atol",
        "scanf", "sscanf", "perror"
    };
    return names;
}

bool isParamUse(const Expr& e, const std::string& param) {
    return e.kind == ExprKind::Identifier && e.storage == StorageKind::Param && e.text == param;
}

/**
 * True if the value of param may be kept beyond the call: stored, returned
 * or handed to a function that might keep it. safe is set when the
 * surrounding expression only reads through the pointer or compares it.
 */
bool mayRetain(const Expr& e, const std::string& param, bool safe) {
    switch (e.kind) {
        case ExprKind::Identifier:
            return isParamUse(e, param) && !safe;

        case ExprKind::SizeOf:
            return false;

        case ExprKind::Unary:
            switch (e.uop) {
                case UnaryOp::AddrOf: {
                    // &p[i] and &*p point into the argument again
                    const Expr& target = e.operand();
                    if (target.kind == ExprKind::Index) {
                        return mayRetain(target.args[0], param, safe) ||
                               mayRetain(target.args[1], param, true);
                    }
                    if (target.kind == ExprKind::Unary && target.uop == UnaryOp::Deref) {
                        return mayRetain(target.operand(), param, safe);
                    }
                    if (target.kind == ExprKind::Member && target.arrow) {
                        return mayRetain(target.args[0], param, safe);
                    }
                    return mayRetain(target, param, safe);
                }
                case UnaryOp::PreInc:
                case UnaryOp::PreDec:
                case UnaryOp::PostInc:
                case UnaryOp::PostDec:
                    return mayRetain(e.operand(), param, safe);
                default:
                    return mayRetain(e.operand(), param, true);
            }

        case ExprKind::Binary:
            if (e.bop == BinaryOp::Add || e.bop == BinaryOp::Sub) {
                // p + n still points into the argument
                return mayRetain(e.lhs(), param, safe) || mayRetain(e.rhs(), param, safe);
            }
            return mayRetain(e.lhs(), param, true) || mayRetain(e.rhs(), param, true);

        case ExprKind::Assign:
            // p = p + 1 keeps the pointer inside the parameter
            if (isParamUse(e.args[0], param)) return mayRetain(e.args[1], param, safe);
            return mayRetain(e.args[0], param, true) || mayRetain(e.args[1], param, false);

        case ExprKind::Ternary:
            return mayRetain(e.args[0], param, true) || mayRetain(e.args[1], param, safe) ||
                   mayRetain(e.args[2], param, safe);

        case ExprKind::Cast:
            return mayRetain(e.operand(), param, safe);

        case ExprKind::Call: {
            bool reads_only = e.isDirectCall() && nonRetainingLibrary().count(e.calleeName()) &&
                              !returnsPointer(e);
            if (mayRetain(e.args[0], param, true)) return true;
            for (size_t i = 1; i < e.args.size(); i++) {
                if (mayRetain(e.args[i], param, reads_only)) return true;
            }
            return false;
        }

        case ExprKind::InitList:
            for (const auto& a : e.args) {
                if (mayRetain(a, param, false)) return true;
            }
            return false;

        default:
            // Index, Member: read through the pointer
            for (const auto& a : e.args) {
                if (mayRetain(a, param, true)) return true;
            }
            return false;
    }
}

bool bodyMayRetain(const Block& body, const std::string& param) {
    bool retained = false;
    visitBlockStmts(body, [&](const Stmt& s) {
        if (retained) return;
        if (s.decl && s.decl->init && mayRetain(*s.decl->init, param, false)) retained = true;
        // a returned pointer outlives the call; a condition or a discarded value does not
        if (s.expr && mayRetain(*s.expr, param, s.kind != StmtKind::Return)) retained = true;
        if (s.step && mayRetain(*s.step, param, true)) retained = true;
    });
    return retained;
}

std::vector<bool> borrowedParams(const Program& program, const std::string& name) {
    const Function* f = program.findFunction(name);
    if (!f) return {};
    std::vector<bool> out(f->params.size(), false);
    if (!f->is_definition) {
        if (nonRetainingLibrary().count(name)) out.assign(f->params.size(), true);
        return out;
    }
    for (size_t i = 0; i < f->params.size(); i++) {
        const std::string& param = f->params[i].name;
        out[i] = !param.empty() && !bodyMayRetain(f->body, param);
    }
    return out;
}

} // namespace

// the literal may sit in the caller's frame only if the callee gives the
// pointer up when it returns
bool StringEncryptionPass::borrowsArgument(const Expr& call, size_t index, Unit& unit) const {
    if (!call.isDirectCall() || returnsPointer(call)) return false;
    const std::string& name = call.calleeName();
    auto it = unit.borrowed.find(name);
    if (it == unit.borrowed.end()) {
        it = unit.borrowed.emplace(name, borrowedParams(unit.program, name)).first;
    }
    const auto& params = it->second;
    if (index < params.size()) return params[index];
    // a variadic argument of a library function that keeps nothing
    const Function* f = unit.program.findFunction(name);
    return f && !f->is_definition && f->is_variadic && nonRetainingLibrary().count(name);
}

StringEncryptionPass::StringEncryptionPass(StringEncryptionConfig config)
    : enc_config_(std::move(config)), logger_("StringEncryption") {
    config_.enabled = enc_config_.enabled;
}

Function StringEncryptionPass::makeDecryptHelper() const {
    Type byte = Type::charType(true);
    byte.is_const = true;

    Function f;
    f.name = enc_config_.decrypt_function;
    f.return_type = Type::pointerTo(Type::charType());
    f.params = {
        Param{"dst", Type::pointerTo(Type::charType()), {}, -1},
        Param{"src", Type::pointerTo(byte), {}, -1},
        Param{"len", Type::intType(), {}, -1},
        Param{"key", Type::intType(), {}, -1},
        Param{"step", Type::intType(), {}, -1}
    };
    f.is_definition = true;
    f.is_static = true;
    f.meta.synthetic = true;

    // dst[i] = (char)(src[i] ^ ((key + i * step) & 255))
    Expr stream = make::binary(
        BinaryOp::BitAnd,
        make::binary(BinaryOp::Add, make::ident("key"),
                     make::binary(BinaryOp::Mul, make::ident("i"), make::ident("step"))),
        make::intLit(255));
    Expr plain = make::cast(Type::charType(),
                            make::binary(BinaryOp::BitXor,
                                         make::index(make::ident("src"), make::ident("i")),
                                         std::move(stream)));
    Block loop_body;
    loop_body.push_back(make::exprStmt(
        make::assign(make::index(make::ident("dst"), make::ident("i")), std::move(plain))));

    Block init;
    init.push_back(make::exprStmt(make::assign(make::ident("i"), make::intLit(0))));

    f.body.push_back(make::declStmt("i", Type::intType()));
    f.body.push_back(make::forStmt(std::move(init),
                                   make::binary(BinaryOp::Lt, make::ident("i"), make::ident("len")),
                                   make::unary(UnaryOp::PostInc, make::ident("i")),
                                   std::move(loop_body)));
    f.body.push_back(make::returnStmt(make::ident("dst")));
    return f;
}

std::string StringEncryptionPass::emitData(const std::string& text, Unit& unit,
                                           EncryptedString& out) {
    out = StringCipher::encrypt(text, unit.ctx.rng());

    Type byte = Type::charType(true);
    byte.is_const = true;

    std::vector<Expr> elements;
    elements.reserve(out.bytes.size());
    for (uint8_t b : out.bytes) elements.push_back(make::intLit(b));

    VarDecl v;
    v.name = unit.ctx.freshName("__cloak_str_");
    v.type = Type::arrayOf(byte, static_cast<long>(out.length()));
    v.init = make::initList(std::move(elements));
    v.is_static = true;
    unit.globals.push_back(make::globalDecl(v));

    unit.encrypted++;
    unit.bytes += static_cast<int>(out.length());
    return v.name;
}

std::string StringEncryptionPass::emitBuffer(const char* prefix, size_t len, Unit& unit) {
    VarDecl v;
    v.name = unit.ctx.freshName(prefix);
    v.type = Type::arrayOf(Type::charType(), static_cast<long>(len));
    v.is_static = true;
    unit.globals.push_back(make::globalDecl(v));
    return v.name;
}

Expr StringEncryptionPass::decryptCall(Expr dst, const std::string& data,
                                       const EncryptedString& enc, size_t len) const {
    std::vector<Expr> args;
    args.push_back(std::move(dst));
    args.push_back(make::ident(data));
    args.push_back(make::intLit(static_cast<int64_t>(len)));
    args.push_back(make::intLit(enc.key));
    args.push_back(make::intLit(enc.step));
    return make::call(enc_config_.decrypt_function, std::move(args));
}

void StringEncryptionPass::rewriteExpr(Expr& e, bool call_argument, Unit& unit) {
    switch (e.kind) {
        case ExprKind::SizeOf:
            return;

        case ExprKind::StringLiteral: {
            EncryptedString enc;
            std::string data = emitData(e.text, unit, enc);
            std::string buffer;
            if (call_argument) {
                buffer = unit.ctx.freshName("__cloak_buf_");
                unit.prologue.push_back(make::declStmt(
                    buffer, Type::arrayOf(Type::charType(), static_cast<long>(enc.length()))));
                incrementStat("stack_buffers");
            } else {
                buffer = emitBuffer("__cloak_sbuf_", enc.length(), unit);
                incrementStat("static_buffers");
            }
            SourceLoc loc = e.loc;
            e = decryptCall(make::ident(buffer), data, enc, enc.length());
            e.loc = loc;
            return;
        }

        case ExprKind::Call: {
            rewriteExpr(e.args[0], false, unit);
            for (size_t i = 1; i < e.args.size(); i++) {
                bool stack = enc_config_.stack_buffers_for_arguments &&
                             e.args[i].kind == ExprKind::StringLiteral &&
                             borrowsArgument(e, i - 1, unit);
                rewriteExpr(e.args[i], stack, unit);
            }
            return;
        }

        default:
            for (auto& a : e.args) rewriteExpr(a, false, unit);
            return;
    }
}

// initializers that must stay constant: the literal becomes a static
// buffer the constructor fills before main
void StringEncryptionPass::rewriteConstant(Expr& e, Unit& unit) {
    if (e.kind == ExprKind::SizeOf) return;
    if (e.kind != ExprKind::StringLiteral) {
        for (auto& a : e.args) rewriteConstant(a, unit);
        return;
    }

    EncryptedString enc;
    std::string data = emitData(e.text, unit, enc);
    std::string buffer = emitBuffer("__cloak_gbuf_", enc.length(), unit);
    unit.startup.push_back(make::exprStmt(decryptCall(make::ident(buffer), data, enc, enc.length())));
    incrementStat("startup_decryptions");

    SourceLoc loc = e.loc;
    e = make::ident(buffer);
    e.loc = loc;
}

bool StringEncryptionPass::rewriteCharArray(VarDecl& v, Unit& unit, Block& after) {
    if (!isCharArray(v.type) || !v.init || v.init->kind != ExprKind::StringLiteral) return false;
    if (v.type.array_size < 0) {
        throw InternalError("string encryption: char array '" + v.name + "' has no size");
    }

    EncryptedString enc;
    std::string data = emitData(v.init->text, unit, enc);
    size_t len = std::min(enc.length(), static_cast<size_t>(v.type.array_size));

    std::vector<Expr> zero;
    zero.push_back(make::intLit(0));
    v.init = make::initList(std::move(zero));
    after.push_back(make::exprStmt(decryptCall(make::ident(v.name), data, enc, len)));
    incrementStat("arrays_decrypted_in_place");
    return true;
}

void StringEncryptionPass::rewriteBlock(Block& block, Unit& unit) {
    Block out;
    for (auto& s : block) {
        Block after;
        if (s.kind == StmtKind::Decl && s.decl->init) {
            VarDecl& v = *s.decl;
            if (v.is_static) {
                // a static char array keeps its literal: its initializer runs once
                if (isCharArray(v.type) && v.init->kind == ExprKind::StringLiteral) {
                    incrementStat("strings_kept");
                } else {
                    rewriteConstant(*v.init, unit);
                }
            } else if (!rewriteCharArray(v, unit, after)) {
                rewriteExpr(*v.init, false, unit);
            }
        } else {
            if (s.expr) rewriteExpr(*s.expr, false, unit);
            if (s.step) rewriteExpr(*s.step, false, unit);
        }

        rewriteBlock(s.init, unit);
        rewriteBlock(s.body, unit);
        rewriteBlock(s.else_body, unit);
        for (auto& c : s.cases) rewriteBlock(c.body, unit);

        out.push_back(std::move(s));
        for (auto& a : after) out.push_back(std::move(a));
    }
    block = std::move(out);
}

void StringEncryptionPass::rewriteGlobal(VarDecl& v, Unit& unit) {
    if (isCharArray(v.type) && v.init->kind == ExprKind::StringLiteral) {
        EncryptedString enc;
        std::string data = emitData(v.init->text, unit, enc);
        size_t len = std::min(enc.length(), static_cast<size_t>(v.type.array_size));
        // written by the constructor, so it cannot live in .rodata
        v.type = withoutConst(v.type);
        v.init.reset();
        unit.startup.push_back(make::exprStmt(decryptCall(make::ident(v.name), data, enc, len)));
        incrementStat("startup_decryptions");
        return;
    }
    rewriteConstant(*v.init, unit);
}

Program StringEncryptionPass::run(const Program& program, CompileContext& ctx) {
    auto names = collectNames(program);
    for (const auto* helper : {&enc_config_.decrypt_function, &enc_config_.init_function}) {
        if (names.count(*helper)) {
            throw CompileError(DiagCode::DuplicateSymbol,
                               "identifier '" + *helper + "' is reserved for string encryption");
        }
    }
    ctx.reserve(names);
    ctx.claim(enc_config_.decrypt_function);
    ctx.claim(enc_config_.init_function);

    Program out = program;
    Unit unit(ctx, program);

    for (auto& d : out.decls) {
        if (d.kind == DeclKind::Variable) {
            if (d.var.init) rewriteGlobal(d.var, unit);
            continue;
        }
        if (d.kind != DeclKind::Function) continue;

        Function& f = d.func;
        if (!f.is_definition || f.meta.synthetic || !shouldProcessFunction(f.name)) continue;

        int before = unit.encrypted;
        unit.prologue.clear();
        rewriteBlock(f.body, unit);
        f.body.insert(f.body.begin(), std::make_move_iterator(unit.prologue.begin()),
                      std::make_move_iterator(unit.prologue.end()));

        if (unit.encrypted > before) {
            incrementStat("functions_transformed");
            logger_.debug("{}: encrypted {} literals", f.name, unit.encrypted - before);
        }
    }

    if (unit.encrypted == 0) return out;

    unit.globals.insert(unit.globals.begin(), make::functionDecl(makeDecryptHelper()));
    out.decls.insert(out.decls.begin(), std::make_move_iterator(unit.globals.begin()),
                     std::make_move_iterator(unit.globals.end()));

    if (!unit.startup.empty()) {
        Function init;
        init.name = enc_config_.init_function;
        init.return_type = Type::voidType();
        init.is_definition = true;
        init.is_static = true;
        init.body = std::move(unit.startup);
        init.meta.synthetic = true;
        init.meta.constructor = true;
        out.decls.push_back(make::functionDecl(std::move(init)));
    }

    incrementStat("strings_encrypted", unit.encrypted);
    incrementStat("bytes_encrypted", unit.bytes);
    logger_.info("Encrypted {} string literals ({} bytes)", unit.encrypted, unit.bytes);
    return out;
}

} // namespace data
} // namespace cloak
