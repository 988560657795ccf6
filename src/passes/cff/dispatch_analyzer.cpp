/**
 * Cloak - Dispatch loop analyzer
 *
 * Reads the state graph back out of flattened functions.
 */

#include "dispatch_analyzer.hpp"

#include <algorithm>

namespace cloak {
namespace cff {

using namespace ast;

namespace {

const Stmt* dispatchSwitch(const Stmt& s, const std::vector<std::string>& state_vars) {
    if (s.kind != StmtKind::While || !s.expr || s.expr->kind != ExprKind::IntLiteral ||
        s.expr->int_value == 0 || s.body.empty()) {
        return nullptr;
    }
    const Stmt& sw = s.body.front();
    if (sw.kind != StmtKind::Switch || sw.expr->kind != ExprKind::Identifier) return nullptr;
    if (std::find(state_vars.begin(), state_vars.end(), sw.expr->text) == state_vars.end()) {
        return nullptr;
    }
    return &sw;
}

} // namespace

std::vector<DispatchMachine> DispatchAnalyzer::analyze(const Function& f) const {
    std::vector<DispatchMachine> machines;
    const auto& state_vars = f.meta.state_vars;

    visitBlockStmts(f.body, [&](const Stmt& s) {
        const Stmt* sw = dispatchSwitch(s, state_vars);
        if (!sw) return;

        DispatchMachine m;
        m.state_var = sw->expr->text;
        for (const auto& c : sw->cases) {
            if (c.value) m.case_ids.insert(c.value->int_value);
            visitBlockExprs(c.body, [&](const Expr& e) {
                if (e.kind == ExprKind::Assign && !e.assign_op &&
                    e.lhs().kind == ExprKind::Identifier && e.lhs().text == m.state_var &&
                    e.rhs().kind == ExprKind::IntLiteral) {
                    m.targets.insert(e.rhs().int_value);
                }
            });
        }
        machines.push_back(std::move(m));
    });
    return machines;
}

bool DispatchAnalyzer::coversAllStates(const DispatchMachine& m) {
    if (!m.case_ids.count(0)) return false;
    for (int64_t id : m.case_ids) {
        if (id != 0 && !m.targets.count(id)) return false;
    }
    for (int64_t t : m.targets) {
        if (!m.case_ids.count(t)) return false;
    }
    return true;
}

} // namespace cff
} // namespace cloak
