/**
 * Cloak - Obfuscating C Compiler
 *
 * identifier_renaming.cpp - Local and parameter renaming
 */

#include "identifier_renaming.hpp"

#include "../../core/diagnostics.hpp"
#include "../../frontend/lexer.hpp"

#include <cctype>
#include <cstdio>
#include <unordered_map>

namespace cloak {
namespace rename {

using namespace ast;

namespace {

const char* const kLetters = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
const char* const kAlnum = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

constexpr int kMaxAttempts = 100000;

} // namespace

void NameGenerator::reset(std::unordered_set<std::string> taken) {
    taken_ = std::move(taken);
    sequence_ = 0;
}

bool NameGenerator::isValidIdentifier(const std::string& name) {
    if (name.empty()) return false;
    if (!std::isalpha(static_cast<unsigned char>(name[0])) && name[0] != '_') return false;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return !frontend::Lexer::isKeyword(name);
}

std::string NameGenerator::candidate(Random& rng, int attempt) {
    switch (style_) {
        case RenameStyle::Hex: {
            char buf[16];
            std::snprintf(buf, sizeof(buf), "_0x%08x", rng.nextUint32());
            return buf;
        }
        case RenameStyle::Sequential:
            return "v" + std::to_string(sequence_++);
        case RenameStyle::Confusable: {
            // grows by one character every 64 collisions
            size_t length = 7 + static_cast<size_t>(attempt / 64);
            return rng.nextString("lI", 1) + rng.nextString("lI1", length);
        }
        case RenameStyle::Random:
        default:
            return rng.nextString(kLetters, 1) + rng.nextString(kAlnum, 8);
    }
}

std::string NameGenerator::next(Random& rng) {
    for (int attempt = 0; attempt < kMaxAttempts; attempt++) {
        std::string name = candidate(rng, attempt);
        if (!isValidIdentifier(name)) continue;
        if (taken_.insert(name).second) return name;
    }
    throw InternalError("identifier renaming: name space exhausted");
}

void IdentifierRenamingPass::beginProgram(Program& program, CompileContext&) {
    file_scope_ = collectGlobalNames(program);
}

TransformResult IdentifierRenamingPass::transformFunction(Function& f, CompileContext& ctx) {
    // unique within the function and clear of every file-scope name, so
    // no new name can capture a global reference
    names_.reset(file_scope_);

    std::unordered_map<BindingKey, std::string, BindingKeyHash> renamed;
    auto bind = [&](const BindingKey& key) -> const std::string& {
        auto it = renamed.find(key);
        if (it == renamed.end()) {
            it = renamed.emplace(key, names_.next(ctx.rng())).first;
            f.meta.rename_map.emplace_back(key.name, it->second);
        }
        return it->second;
    };

    for (auto& p : f.params) {
        if (p.name.empty()) continue;
        p.name = bind(bindingOf(p));
    }
    visitBlockStmts(f.body, [&](Stmt& s) {
        if (s.kind == StmtKind::Decl) s.decl->name = bind(bindingOf(*s.decl));
    });

    int references = 0;
    visitBlockExprs(f.body, [&](Expr& e) {
        if (!isLocalRef(e)) return;
        auto it = renamed.find(bindingOf(e));
        if (it == renamed.end()) {
            throw InternalError("identifier renaming: '" + e.text + "' in '" + f.name +
                                "' resolves to no declaration");
        }
        e.text = it->second;
        references++;
    });

    if (renamed.empty()) return TransformResult::NotApplicable;

    incrementStat("identifiers_renamed", static_cast<int>(renamed.size()));
    incrementStat("references_rewritten", references);
    logger_.debug("{}: renamed {} bindings, {} references", f.name, renamed.size(), references);
    return TransformResult::Success;
}

} // namespace rename
} // namespace cloak
