/*
 * symbol_table.hpp
 *
 * scope tree for ordinary identifiers; scopes are kept after they are
 * left so the finished tree can be inspected
 */

#ifndef CLOAK_SYMBOL_TABLE_HPP
#define CLOAK_SYMBOL_TABLE_HPP

#include "../ast/ast.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace cloak {
namespace sema {

struct Symbol {
    std::string name;
    ast::Type type;
    ast::StorageKind storage = ast::StorageKind::Unresolved;
    int scope_id = 0;
    SourceLoc loc;
    bool is_defined = false;     // function body or initialized global
    bool is_static = false;
    int64_t enum_value = 0;
};

struct Scope {
    int id = 0;
    int parent = -1;             // -1 for file scope
    std::vector<int> children;
    std::unordered_map<std::string, Symbol> symbols;
    std::vector<std::string> order;   // declaration order
};

class SymbolTable {
public:
    static constexpr int kFileScope = 0;

    SymbolTable();

    int current() const { return current_; }

    /**
     * Opens a child of the current scope and makes it current
     */
    int pushScope();
    void popScope();

    /**
     * Adds a symbol to the current scope. Returns false (and leaves the
     * table unchanged) if the name is already declared there.
     */
    bool declare(Symbol sym);

    /**
     * Symbol declared directly in the current scope
     */
    Symbol* lookupLocal(const std::string& name);

    /**
     * Walks from the current scope to the file scope; first match wins
     */
    const Symbol* lookup(const std::string& name) const;

    const Scope& scope(int id) const { return scopes_.at(static_cast<size_t>(id)); }
    size_t scopeCount() const { return scopes_.size(); }

    /**
     * Depth of a scope below the file scope
     */
    int depth(int id) const;

private:
    std::vector<Scope> scopes_;
    int current_ = kFileScope;
};

} // namespace sema
} // namespace cloak

#endif // CLOAK_SYMBOL_TABLE_HPP
