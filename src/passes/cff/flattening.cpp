/**
 * Cloak - Control Flow Flattening
 *
 * Builds the dispatch machines. Segments are created with provisional ids
 * (their index); buildMachine() renumbers the reachable ones in pre-order
 * and patches every "s = k" transition to the final ids.
 */

#include "flattening.hpp"

#include "../../core/diagnostics.hpp"

#include <algorithm>

namespace cloak {
namespace cff {

using namespace ast;

struct ControlFlowFlattener::Machine {
    std::string state_var;
    std::vector<SegmentInfo> segments;
    bool is_loop = false;
    int continue_target = -1;

    int open() {
        segments.emplace_back();
        return static_cast<int>(segments.size()) - 1;
    }

    SegmentInfo& at(int id) { return segments.at(static_cast<size_t>(id)); }

    // s = to; continue;
    Block transition(int from, int to) {
        at(from).successors.push_back(to);
        Block b;
        b.push_back(make::exprStmt(make::assign(make::ident(state_var), make::intLit(to))));
        b.push_back(make::continueStmt());
        return b;
    }

    void jump(int from, int to) {
        Block b = transition(from, to);
        SegmentInfo& seg = at(from);
        for (auto& s : b) seg.code.push_back(std::move(s));
        seg.closed = true;
    }

    void exit(int from) {
        at(from).code.push_back(make::breakStmt());
        at(from).closed = true;
    }

    void branch(int from, Expr cond, Block taken, Block not_taken) {
        at(from).code.push_back(make::ifElseStmt(std::move(cond), std::move(taken),
                                                 std::move(not_taken)));
        at(from).closed = true;
    }
};

namespace {

Block leave() {
    Block b;
    b.push_back(make::breakStmt());
    return b;
}

long scalarSlots(const Type& t) {
    return t.isArray() ? t.array_size * scalarSlots(t.element()) : 1;
}

long initializedSlots(const Type& t, const Expr& init) {
    if (init.kind == ExprKind::InitList && t.isArray()) {
        long n = 0;
        for (const auto& el : init.args) n += initializedSlots(t.element(), el);
        return n;
    }
    if (init.kind == ExprKind::StringLiteral && t.isArray()) {
        return std::min(static_cast<long>(init.text.size()) + 1, t.array_size);
    }
    return 1;
}

} // namespace

std::string ControlFlowFlattener::newStateVar() {
    std::string name = ctx_->freshName(config_.state_var_prefix);
    hoisted_.push_back(make::declStmt(name, Type::intType()));
    result_->state_vars.push_back(name);
    return name;
}

Block ControlFlowFlattener::buildMachine(Machine& m) {
    // pre-order from the entry; whatever is not reached is dropped
    std::vector<int> order;
    std::vector<bool> seen(m.segments.size(), false);
    std::vector<int> pending{0};
    while (!pending.empty()) {
        int id = pending.back();
        pending.pop_back();
        if (seen[static_cast<size_t>(id)]) continue;
        seen[static_cast<size_t>(id)] = true;
        m.at(id).state_value = static_cast<int>(order.size());
        order.push_back(id);
        const auto& succ = m.at(id).successors;
        for (auto it = succ.rbegin(); it != succ.rend(); ++it) {
            if (!seen[static_cast<size_t>(*it)]) pending.push_back(*it);
        }
    }

    std::vector<SwitchCase> cases;
    for (int id : order) {
        SegmentInfo& seg = m.at(id);
        visitBlockExprs(seg.code, [&m](Expr& e) {
            if (e.kind == ExprKind::Assign && !e.assign_op &&
                e.lhs().kind == ExprKind::Identifier && e.lhs().text == m.state_var &&
                e.rhs().kind == ExprKind::IntLiteral) {
                e.rhs().int_value = m.at(static_cast<int>(e.rhs().int_value)).state_value;
            }
        });
        if (!seg.closed) seg.code.push_back(make::breakStmt());

        SwitchCase c;
        c.value = make::intLit(seg.state_value);
        c.body = std::move(seg.code);
        cases.push_back(std::move(c));
    }

    result_->machines++;
    result_->segments += static_cast<int>(order.size());
    result_->dropped_segments += static_cast<int>(m.segments.size() - order.size());

    Block dispatch;
    dispatch.push_back(make::switchStmt(make::ident(m.state_var), std::move(cases)));
    dispatch.push_back(make::breakStmt());

    Block out;
    out.push_back(make::exprStmt(make::assign(make::ident(m.state_var), make::intLit(0))));
    out.push_back(make::whileStmt(make::intLit(1), std::move(dispatch)));
    return out;
}

int ControlFlowFlattener::lowerList(Block& stmts, Machine& m, int cur) {
    for (auto& s : stmts) {
        // code after a transfer gets a segment nothing jumps to
        if (cur < 0) cur = m.open();
        cur = lowerStmt(s, m, cur);
    }
    return cur;
}

int ControlFlowFlattener::lowerStmt(Stmt& s, Machine& m, int cur) {
    switch (s.kind) {
        case StmtKind::Decl:
            lowerDecl(*s.decl, m.at(cur).code);
            return cur;

        case StmtKind::Expr:
            m.at(cur).code.push_back(std::move(s));
            return cur;

        case StmtKind::Empty:
            return cur;

        case StmtKind::Compound:
            return lowerList(s.body, m, cur);

        case StmtKind::If: {
            int then_seg = m.open();
            int else_seg = s.has_else ? m.open() : -1;
            int join = m.open();

            Block taken = m.transition(cur, then_seg);
            Block not_taken = m.transition(cur, s.has_else ? else_seg : join);
            m.branch(cur, std::move(*s.expr), std::move(taken), std::move(not_taken));

            int end = lowerList(s.body, m, then_seg);
            if (end >= 0) m.jump(end, join);
            if (s.has_else) {
                end = lowerList(s.else_body, m, else_seg);
                if (end >= 0) m.jump(end, join);
            }
            return join;
        }

        case StmtKind::While:
        case StmtKind::DoWhile:
        case StmtKind::For: {
            Block machine;
            lowerLoop(s, machine);
            for (auto& st : machine) m.at(cur).code.push_back(std::move(st));
            int tail = m.open();
            m.jump(cur, tail);
            return tail;
        }

        case StmtKind::Switch: {
            for (auto& c : s.cases) keepIntact(c.body, m, cur);
            m.at(cur).code.push_back(std::move(s));
            int next = m.open();
            m.jump(cur, next);
            return next;
        }

        case StmtKind::Break:
            if (!m.is_loop) throw InternalError("flattening: break outside of a loop machine");
            m.exit(cur);
            return -1;

        case StmtKind::Continue:
            if (m.continue_target < 0) throw InternalError("flattening: continue outside of a loop machine");
            m.jump(cur, m.continue_target);
            return -1;

        case StmtKind::Return:
            m.at(cur).code.push_back(std::move(s));
            m.at(cur).closed = true;
            return -1;
    }
    throw InternalError("flattening: unknown statement kind");
}

void ControlFlowFlattener::lowerLoop(Stmt& loop, Block& out) {
    Machine inner;
    inner.state_var = newStateVar();
    inner.is_loop = true;

    switch (loop.kind) {
        case StmtKind::While: {
            int head = inner.open();
            int body = inner.open();
            inner.continue_target = head;
            inner.branch(head, std::move(*loop.expr), inner.transition(head, body), leave());
            int end = lowerList(loop.body, inner, body);
            if (end >= 0) inner.jump(end, head);
            break;
        }

        case StmtKind::DoWhile: {
            int body = inner.open();
            int test = inner.open();
            inner.continue_target = test;
            int end = lowerList(loop.body, inner, body);
            if (end >= 0) inner.jump(end, test);
            inner.branch(test, std::move(*loop.expr), inner.transition(test, body), leave());
            break;
        }

        case StmtKind::For: {
            for (auto& s : loop.init) {
                if (s.kind == StmtKind::Decl) {
                    lowerDecl(*s.decl, out);
                } else if (s.kind == StmtKind::Expr) {
                    out.push_back(std::move(s));
                }
            }
            int head = inner.open();
            int body = inner.open();
            int step = inner.open();
            inner.continue_target = step;
            if (loop.expr) {
                inner.branch(head, std::move(*loop.expr), inner.transition(head, body), leave());
            } else {
                inner.jump(head, body);
            }
            int end = lowerList(loop.body, inner, body);
            if (end >= 0) inner.jump(end, step);
            if (loop.step) inner.at(step).code.push_back(make::exprStmt(std::move(*loop.step)));
            inner.jump(step, head);
            break;
        }

        default:
            throw InternalError("flattening: not a loop");
    }

    for (auto& s : buildMachine(inner)) out.push_back(std::move(s));
}

void ControlFlowFlattener::keepIntact(Block& block, Machine& m, int cur) {
    Block out;
    for (auto& s : block) {
        switch (s.kind) {
            case StmtKind::Decl:
                lowerDecl(*s.decl, out);
                break;
            case StmtKind::While:
            case StmtKind::DoWhile:
            case StmtKind::For:
                lowerLoop(s, out);
                break;
            case StmtKind::Continue: {
                if (m.continue_target < 0) {
                    throw InternalError("flattening: continue outside of a loop machine");
                }
                for (auto& t : m.transition(cur, m.continue_target)) out.push_back(std::move(t));
                break;
            }
            case StmtKind::If:
                keepIntact(s.body, m, cur);
                keepIntact(s.else_body, m, cur);
                out.push_back(std::move(s));
                break;
            case StmtKind::Compound:
                keepIntact(s.body, m, cur);
                out.push_back(std::move(s));
                break;
            case StmtKind::Switch:
                for (auto& c : s.cases) keepIntact(c.body, m, cur);
                out.push_back(std::move(s));
                break;
            default:
                out.push_back(std::move(s));
                break;
        }
    }
    block = std::move(out);
}

void ControlFlowFlattener::lowerDecl(VarDecl& v, Block& out) {
    std::string name = ctx_->freshName(config_.local_prefix);
    renamed_[bindingOf(v)] = name;
    result_->hoisted_locals++;

    VarDecl h;
    h.name = name;
    h.loc = v.loc;
    if (v.is_static) {
        // initialized once, before any code runs; nothing to do in place
        h.type = v.type;
        h.is_static = true;
        h.init = std::move(v.init);
        hoisted_.push_back(make::declStmt(std::move(h)));
        return;
    }

    h.type = withoutConst(v.type);
    hoisted_.push_back(make::declStmt(h));
    if (!v.init) return;

    if (!h.type.isArray()) {
        out.push_back(make::exprStmt(make::assign(make::ident(name), std::move(*v.init))));
        return;
    }
    if (initializedSlots(h.type, *v.init) < scalarSlots(h.type)) zeroFill(name, out);
    storeElements(make::ident(name), h.type, *v.init, out);
}

void ControlFlowFlattener::storeElements(const Expr& target, const Type& type, Expr& init,
                                         Block& out) {
    if (init.kind == ExprKind::InitList && type.isArray()) {
        for (size_t i = 0; i < init.args.size(); i++) {
            storeElements(make::index(target, make::intLit(static_cast<int64_t>(i))),
                          type.element(), init.args[i], out);
        }
        return;
    }
    if (init.kind == ExprKind::StringLiteral && type.isArray()) {
        size_t n = static_cast<size_t>(initializedSlots(type, init));
        for (size_t i = 0; i < n; i++) {
            int64_t c = i < init.text.size() ? static_cast<signed char>(init.text[i]) : 0;
            out.push_back(make::exprStmt(make::assign(
                make::index(target, make::intLit(static_cast<int64_t>(i))), make::intLit(c))));
        }
        return;
    }
    out.push_back(make::exprStmt(make::assign(target, std::move(init))));
}

// ((char *)a)[i] = 0 over every byte of a
void ControlFlowFlattener::zeroFill(const std::string& array, Block& out) {
    std::string i = ctx_->freshName(config_.local_prefix);
    hoisted_.push_back(make::declStmt(i, Type::intType()));

    Block init;
    init.push_back(make::exprStmt(make::assign(make::ident(i), make::intLit(0))));
    Expr bytes = make::cast(Type::pointerTo(Type::charType()), make::ident(array));
    Block body;
    body.push_back(make::exprStmt(
        make::assign(make::index(std::move(bytes), make::ident(i)), make::intLit(0))));
    out.push_back(make::forStmt(std::move(init),
                                make::binary(BinaryOp::Lt, make::ident(i),
                                             make::sizeofExpr(make::ident(array))),
                                make::unary(UnaryOp::PostInc, make::ident(i)),
                                std::move(body)));
}

CFFResult ControlFlowFlattener::flatten(Function& f, CompileContext& ctx) {
    CFFResult result;
    if (countStatements(f.body) < config_.min_statements) {
        result.error = "function body too small";
        return result;
    }

    ctx_ = &ctx;
    result_ = &result;
    hoisted_.clear();
    renamed_.clear();

    Machine top;
    top.state_var = newStateVar();
    int end = lowerList(f.body, top, top.open());
    if (end >= 0) top.exit(end);
    Block machine = buildMachine(top);

    auto rename = [&](Expr& e) {
        if (e.kind != ExprKind::Identifier || e.storage != StorageKind::Local) return;
        auto it = renamed_.find(bindingOf(e));
        if (it == renamed_.end()) {
            throw InternalError("flattening: local '" + e.text + "' in '" + f.name +
                                "' was never hoisted");
        }
        e.text = it->second;
    };
    visitBlockExprs(hoisted_, rename);
    visitBlockExprs(machine, rename);

    f.body = std::move(hoisted_);
    hoisted_ = Block();
    for (auto& s : machine) f.body.push_back(std::move(s));
    f.meta.state_vars.insert(f.meta.state_vars.end(), result.state_vars.begin(),
                             result.state_vars.end());

    ctx_ = nullptr;
    result_ = nullptr;

    if (config_.verify_states) {
        for (const auto& m : analyzer_.analyze(f)) {
            if (!DispatchAnalyzer::coversAllStates(m)) {
                throw InternalError("flattening: machine '" + m.state_var + "' in '" + f.name +
                                    "' has orphaned states");
            }
        }
    }

    result.success = true;
    logger_.trace("{}: {} machines, {} segments", f.name, result.machines, result.segments);
    return result;
}

TransformResult ControlFlowFlatteningPass::transformFunction(Function& f, CompileContext& ctx) {
    if (!shouldTransform(ctx)) return TransformResult::Skipped;

    CFFResult r = flattener_.flatten(f, ctx);
    if (!r.success) return TransformResult::NotApplicable;

    incrementStat("functions_flattened");
    incrementStat("dispatch_loops", r.machines);
    incrementStat("segments", r.segments);
    incrementStat("segments_dropped", r.dropped_segments);
    incrementStat("locals_hoisted", r.hoisted_locals);
    logger_.debug("Flattened {}: {} dispatch loops, {} segments", f.name, r.machines, r.segments);
    return TransformResult::Success;
}

} // namespace cff
} // namespace cloak
