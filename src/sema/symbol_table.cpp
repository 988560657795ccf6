/**
 * Cloak - Obfuscating C Compiler
 *
 * symbol_table.cpp - Scope tree
 */

#include "symbol_table.hpp"

namespace cloak {
namespace sema {

SymbolTable::SymbolTable() {
    Scope file;
    file.id = kFileScope;
    scopes_.push_back(std::move(file));
}

int SymbolTable::pushScope() {
    Scope s;
    s.id = static_cast<int>(scopes_.size());
    s.parent = current_;
    scopes_[static_cast<size_t>(current_)].children.push_back(s.id);
    scopes_.push_back(std::move(s));
    current_ = scopes_.back().id;
    return current_;
}

void SymbolTable::popScope() {
    int parent = scopes_[static_cast<size_t>(current_)].parent;
    if (parent < 0) {
        throw InternalError("popScope at file scope");
    }
    current_ = parent;
}

bool SymbolTable::declare(Symbol sym) {
    Scope& s = scopes_[static_cast<size_t>(current_)];
    if (s.symbols.count(sym.name)) return false;
    sym.scope_id = current_;
    s.order.push_back(sym.name);
    s.symbols.emplace(sym.name, std::move(sym));
    return true;
}

Symbol* SymbolTable::lookupLocal(const std::string& name) {
    Scope& s = scopes_[static_cast<size_t>(current_)];
    auto it = s.symbols.find(name);
    return it == s.symbols.end() ? nullptr : &it->second;
}

const Symbol* SymbolTable::lookup(const std::string& name) const {
    for (int id = current_; id >= 0; id = scopes_[static_cast<size_t>(id)].parent) {
        const Scope& s = scopes_[static_cast<size_t>(id)];
        auto it = s.symbols.find(name);
        if (it != s.symbols.end()) return &it->second;
    }
    return nullptr;
}

int SymbolTable::depth(int id) const {
    int d = 0;
    while (scopes_.at(static_cast<size_t>(id)).parent >= 0) {
        id = scopes_[static_cast<size_t>(id)].parent;
        d++;
    }
    return d;
}

} // namespace sema
} // namespace cloak
