/**
 * Cloak - Obfuscating C Compiler
 *
 * inlining.cpp - Call-site expansion of small functions
 */

#include "inlining.hpp"

#include <iterator>

namespace cloak {
namespace opt {

using namespace ast;

namespace {

using CallGraph = std::unordered_map<std::string, std::unordered_set<std::string>>;

bool isFileScope(const Expr& e) {
    return e.kind == ExprKind::Identifier &&
           (e.storage == StorageKind::Global || e.storage == StorageKind::Function ||
            e.storage == StorageKind::EnumConst);
}

// function names used other than as the callee of a direct call
void collectAddressTaken(const Expr& e, std::unordered_set<std::string>& out) {
    if (e.kind == ExprKind::Call) {
        const Expr& c = e.callee();
        if (c.kind != ExprKind::Identifier) collectAddressTaken(c, out);
        for (size_t i = 1; i < e.args.size(); i++) collectAddressTaken(e.args[i], out);
        return;
    }
    if (e.kind == ExprKind::Identifier && e.storage == StorageKind::Function) {
        out.insert(e.text);
        return;
    }
    for (const auto& a : e.args) collectAddressTaken(a, out);
}

bool reaches(const CallGraph& graph, const std::string& from, const std::string& target,
             std::unordered_set<std::string>& seen) {
    auto it = graph.find(from);
    if (it == graph.end()) return false;
    for (const auto& next : it->second) {
        if (next == target) return true;
        if (!seen.insert(next).second) continue;
        if (reaches(graph, next, target, seen)) return true;
    }
    return false;
}

bool returnNested(const Block& block, int depth) {
    for (const auto& s : block) {
        switch (s.kind) {
            case StmtKind::Return:
                if (depth > 0) return true;
                break;
            case StmtKind::While:
            case StmtKind::DoWhile:
            case StmtKind::For:
                if (returnNested(s.body, depth + 1)) return true;
                break;
            case StmtKind::Switch:
                for (const auto& c : s.cases) {
                    if (returnNested(c.body, depth + 1)) return true;
                }
                break;
            case StmtKind::If:
                if (returnNested(s.body, depth) || returnNested(s.else_body, depth)) return true;
                break;
            case StmtKind::Compound:
                if (returnNested(s.body, depth)) return true;
                break;
            default:
                break;
        }
    }
    return false;
}

bool hasStaticLocal(const Block& block) {
    bool found = false;
    visitBlockStmts(block, [&found](const Stmt& s) {
        if (s.kind == StmtKind::Decl && s.decl->is_static) found = true;
    });
    return found;
}

bool containsReturn(const Stmt& s) {
    bool found = false;
    visitStmt(s, [&found](const Stmt& c) {
        if (c.kind == StmtKind::Return) found = true;
    });
    return found;
}

// a single return as the last top-level statement needs no completion flag
bool needsDoneFlag(const Block& body) {
    int returns = 0;
    visitBlockStmts(body, [&returns](const Stmt& s) {
        if (s.kind == StmtKind::Return) returns++;
    });
    if (returns == 0) return false;
    return !(returns == 1 && body.back().kind == StmtKind::Return);
}

Block lowerReturns(Block block, const std::string& ret, const std::string& done) {
    Block out;
    for (size_t i = 0; i < block.size(); i++) {
        Stmt s = std::move(block[i]);

        if (s.kind == StmtKind::Return) {
            if (s.expr && !ret.empty()) {
                out.push_back(make::exprStmt(make::assign(make::ident(ret), std::move(*s.expr))));
            } else if (s.expr) {
                out.push_back(make::exprStmt(std::move(*s.expr)));
            }
            if (!done.empty()) {
                out.push_back(make::exprStmt(make::assign(make::ident(done), make::intLit(1))));
            }
            return out;
        }

        bool may_return = (s.kind == StmtKind::If || s.kind == StmtKind::Compound) && containsReturn(s);
        if (may_return) {
            s.body = lowerReturns(std::move(s.body), ret, done);
            s.else_body = lowerReturns(std::move(s.else_body), ret, done);
        }
        out.push_back(std::move(s));

        if (may_return && i + 1 < block.size()) {
            if (done.empty()) {
                throw InternalError("inliner: early return without a completion flag");
            }
            Block rest(std::make_move_iterator(block.begin() + static_cast<long>(i) + 1),
                       std::make_move_iterator(block.end()));
            out.push_back(make::ifStmt(make::unary(UnaryOp::Not, make::ident(done)),
                                       lowerReturns(std::move(rest), ret, done)));
            return out;
        }
    }
    return out;
}

} // namespace

InlineCandidates::InlineCandidates(const Program& program, int threshold) {
    CallGraph calls;

    for (size_t i = 0; i < program.decls.size(); i++) {
        const TopDecl& d = program.decls[i];
        switch (d.kind) {
            case DeclKind::Function:
                first_decl_.emplace(d.func.name, i);
                break;
            case DeclKind::Variable:
                first_decl_.emplace(d.var.name, i);
                if (d.var.init) collectAddressTaken(*d.var.init, address_taken_);
                break;
            case DeclKind::Enum:
                for (const auto& item : d.enm.items) first_decl_.emplace(item.name, i);
                if (!d.enm.name.empty()) first_record_.emplace("enum " + d.enm.name, i);
                break;
            case DeclKind::Record:
                first_record_.emplace(d.record.name, i);
                break;
            default:
                break;
        }

        if (d.kind != DeclKind::Function || !d.func.is_definition) continue;
        const Function& f = d.func;
        auto& edges = calls[f.name];
        visitBlockExprs(f.body, [&edges](const Expr& e) {
            if (e.isDirectCall()) edges.insert(e.calleeName());
        });
        visitBlockExprRoots(f.body, [this](const Expr& root) {
            collectAddressTaken(root, address_taken_);
        });
    }

    for (const auto& entry : calls) {
        std::unordered_set<std::string> seen;
        if (reaches(calls, entry.first, entry.first, seen)) recursive_.insert(entry.first);
    }

    program.forEachFunction([&](const Function& f) {
        if (!f.is_definition || f.is_variadic || f.meta.synthetic) return;
        if (f.name == "main") return;
        if (countStatements(f.body) > threshold) return;
        if (isRecursive(f.name) || isAddressTaken(f.name)) return;
        if (hasStaticLocal(f.body) || returnNested(f.body, 0)) return;
        if (!f.return_type.isVoid() && !f.return_type.isScalar()) return;
        for (const auto& p : f.params) {
            if (!p.type.isScalar()) return;
        }
        candidates_[f.name] = &f;
    });
}

const Function* InlineCandidates::callee(const std::string& name) const {
    auto it = candidates_.find(name);
    return it == candidates_.end() ? nullptr : it->second;
}

bool InlineCandidates::typeVisible(const Type& t, size_t index) const {
    if ((t.isRecord() || t.kind == TypeKind::Enum) && !t.tag.empty()) {
        std::string key = t.isRecord() ? t.tag : "enum " + t.tag;
        auto it = first_record_.find(key);
        if (it == first_record_.end() || it->second >= index) return false;
    }
    for (const auto& s : t.sub) {
        if (!typeVisible(s, index)) return false;
    }
    return true;
}

bool InlineCandidates::visibleAt(const Function& callee, size_t caller_index) const {
    bool visible = typeVisible(callee.return_type, caller_index);
    for (const auto& p : callee.params) visible = visible && typeVisible(p.type, caller_index);

    visitBlockStmts(callee.body, [&](const Stmt& s) {
        if (s.kind == StmtKind::Decl) visible = visible && typeVisible(s.decl->type, caller_index);
    });
    visitBlockExprs(callee.body, [&](const Expr& e) {
        if (!visible) return;
        if (e.kind == ExprKind::Cast || (e.kind == ExprKind::SizeOf && e.sizeof_type)) {
            visible = typeVisible(e.target_type, caller_index);
        } else if (isFileScope(e)) {
            auto it = first_decl_.find(e.text);
            visible = it != first_decl_.end() && it->second < caller_index;
        }
    });
    return visible;
}

ast::Program InliningPass::run(const ast::Program& program, CompileContext& ctx) {
    Program out = program;
    InlineCandidates candidates(program, threshold_);
    candidates_ = &candidates;
    ctx_ = &ctx;
    ctx.reserve(collectNames(program));

    for (size_t i = 0; i < out.decls.size(); i++) {
        TopDecl& d = out.decls[i];
        if (d.kind != DeclKind::Function || !d.func.is_definition || d.func.meta.synthetic) continue;
        Function& f = d.func;
        if (!shouldProcessFunction(f.name)) continue;

        caller_index_ = i;
        caller_locals_.clear();
        for (const auto& p : f.params) caller_locals_.insert(p.name);
        visitBlockStmts(f.body, [this](const Stmt& s) {
            if (s.kind == StmtKind::Decl) caller_locals_.insert(s.decl->name);
        });

        inlined_ = 0;
        inlineBlock(f.body);
        if (inlined_ > 0) {
            incrementStat("functions_transformed");
            logger_.debug("{}: inlined {} calls", f.name, inlined_);
        }
    }

    candidates_ = nullptr;
    ctx_ = nullptr;
    return out;
}

bool InliningPass::canInlineCall(const Expr& call) const {
    if (!call.isDirectCall() || call.callee().storage != StorageKind::Function) return false;
    const Function* callee = candidates_->callee(call.calleeName());
    if (!callee) return false;

    // reordering two effectful arguments would be observable
    int effectful = 0;
    for (size_t i = 1; i < call.args.size(); i++) {
        if (hasSideEffects(call.args[i])) effectful++;
    }
    if (effectful > 1) return false;

    bool shadowed = false;
    visitBlockExprs(callee->body, [&](const Expr& e) {
        if (isFileScope(e) && caller_locals_.count(e.text)) shadowed = true;
    });
    if (shadowed) return false;

    return candidates_->visibleAt(*callee, caller_index_);
}

void InliningPass::inlineBlock(Block& block) {
    Block out;
    for (auto& s : block) {
        switch (s.kind) {
            case StmtKind::If:
                inlineBlock(s.body);
                inlineBlock(s.else_body);
                break;
            case StmtKind::While:
            case StmtKind::DoWhile:
            case StmtKind::For:
            case StmtKind::Compound:
                inlineBlock(s.body);
                break;
            case StmtKind::Switch:
                for (auto& c : s.cases) inlineBlock(c.body);
                break;
            default:
                break;
        }

        Block expanded;
        switch (s.kind) {
            case StmtKind::Expr: {
                Expr& e = *s.expr;
                if (e.kind == ExprKind::Call && canInlineCall(e)) {
                    expanded = expand(e, std::nullopt, false);
                } else if (e.kind == ExprKind::Assign && !e.assign_op &&
                           e.lhs().kind == ExprKind::Identifier &&
                           e.rhs().kind == ExprKind::Call && canInlineCall(e.rhs())) {
                    expanded = expand(e.rhs(), e.lhs(), false);
                }
                break;
            }
            case StmtKind::Decl: {
                VarDecl& v = *s.decl;
                if (v.init && !v.is_static && !v.type.is_const && v.type.isScalar() &&
                    v.init->kind == ExprKind::Call && canInlineCall(*v.init)) {
                    Expr call = std::move(*v.init);
                    v.init.reset();
                    Expr target = make::ident(v.name);
                    out.push_back(std::move(s));
                    Block body = expand(call, std::move(target), false);
                    for (auto& b : body) out.push_back(std::move(b));
                    continue;
                }
                break;
            }
            case StmtKind::Return:
                if (s.expr && s.expr->kind == ExprKind::Call && canInlineCall(*s.expr)) {
                    expanded = expand(*s.expr, std::nullopt, true);
                }
                break;
            default:
                break;
        }

        if (expanded.empty()) {
            out.push_back(std::move(s));
        } else {
            for (auto& b : expanded) out.push_back(std::move(b));
        }
    }
    block = std::move(out);
}

Block InliningPass::expand(const Expr& call, std::optional<Expr> result_target, bool is_return) {
    const Function& callee = *candidates_->callee(call.calleeName());
    const std::string prefix = "__inl_" + callee.name + "_";
    std::unordered_map<BindingKey, std::string, BindingKeyHash> renames;
    Block body;

    for (size_t i = 0; i < callee.params.size(); i++) {
        const Param& p = callee.params[i];
        std::string name = ctx_->freshName(prefix + p.name + "_");
        renames[bindingOf(p)] = name;
        body.push_back(make::declStmt(name, p.type, call.arg(i)));
    }

    Block copy = callee.body;
    visitBlockStmts(copy, [&](Stmt& s) {
        if (s.kind != StmtKind::Decl) return;
        std::string name = ctx_->freshName(prefix + s.decl->name + "_");
        renames[bindingOf(*s.decl)] = name;
        s.decl->name = name;
    });
    visitBlockExprs(copy, [&renames](Expr& e) {
        if (!isLocalRef(e)) return;
        auto it = renames.find(bindingOf(e));
        if (it != renames.end()) e.text = it->second;
    });

    std::string ret;
    if (!callee.return_type.isVoid()) {
        ret = ctx_->freshName(prefix + "ret_");
        body.push_back(make::declStmt(ret, withoutConst(callee.return_type)));
    }
    std::string done;
    if (needsDoneFlag(callee.body)) {
        done = ctx_->freshName(prefix + "done_");
        body.push_back(make::declStmt(done, Type::intType(), make::intLit(0)));
    }

    for (auto& s : lowerReturns(std::move(copy), ret, done)) body.push_back(std::move(s));

    if (result_target) {
        if (ret.empty()) throw InternalError("inliner: void call used as a value");
        body.push_back(make::exprStmt(make::assign(std::move(*result_target), make::ident(ret))));
    }
    if (is_return) {
        std::optional<Expr> value;
        if (!ret.empty()) value = make::ident(ret);
        body.push_back(make::returnStmt(std::move(value)));
    }

    incrementStat("calls_inlined");
    inlined_++;
    Block result;
    result.push_back(make::compound(std::move(body)));
    return result;
}

} // namespace opt
} // namespace cloak
