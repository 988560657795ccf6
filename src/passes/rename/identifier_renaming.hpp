/*
 * identifier_renaming.hpp
 *
 * gives every local and parameter a meaningless name. bindings are told
 * apart by their declaring scope, so two shadowing declarations of the
 * same name get two different new names and every reference follows the
 * declaration it resolved to. file-scope names are kept.
 *
 * styles:
 *   random      _Qf3kZp9a
 *   hex         _0x3fa9c21e
 *   sequential  v0, v1, v2 ...
 *   confusable  lI1lI1Il   (only l, I and 1)
 */

#ifndef CLOAK_IDENTIFIER_RENAMING_HPP
#define CLOAK_IDENTIFIER_RENAMING_HPP

#include "../../core/transformation_base.hpp"
#include "../../core/options.hpp"
#include "../../common/logging.hpp"

#include <string>
#include <unordered_set>

namespace cloak {
namespace rename {

/**
 * Produces names in one style, never repeating a name it has handed out
 * or one marked taken
 */
class NameGenerator {
public:
    explicit NameGenerator(RenameStyle style) : style_(style) {}

    RenameStyle style() const { return style_; }

    void reset(std::unordered_set<std::string> taken);
    std::string next(Random& rng);

    static bool isValidIdentifier(const std::string& name);

private:
    RenameStyle style_;
    std::unordered_set<std::string> taken_;
    int sequence_ = 0;

    std::string candidate(Random& rng, int attempt);
};

class IdentifierRenamingPass : public FunctionPass {
public:
    explicit IdentifierRenamingPass(RenameStyle style = RenameStyle::Random)
        : names_(style) {}

    std::string getName() const override { return "identifier_renaming"; }
    std::string getDescription() const override {
        return "Renames locals and parameters to meaningless identifiers";
    }
    PassPriority getPriority() const override { return PassPriority::Renaming; }

protected:
    void beginProgram(ast::Program& program, CompileContext& ctx) override;
    TransformResult transformFunction(ast::Function& f, CompileContext& ctx) override;

private:
    NameGenerator names_;
    std::unordered_set<std::string> file_scope_;
    Logger logger_{"Renamer"};
};

} // namespace rename
} // namespace cloak

#endif // CLOAK_IDENTIFIER_RENAMING_HPP
