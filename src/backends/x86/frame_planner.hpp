/**
 * Cloak - Obfuscating C Compiler
 *
 * frame_planner.hpp - Stack frame layout for the i386 backend
 *
 * Frame after the prologue (push %ebp; mov %esp, %ebp; sub $N, %esp):
 *
 *   8+4i(%ebp)   parameter i, one 4-byte word each
 *   4(%ebp)      return address
 *   0(%ebp)      saved %ebp
 *   -k(%ebp)     locals, each aligned by its type
 *
 * N is a multiple of 16 so %esp keeps the 16-byte alignment the caller
 * established. Static locals live in the data section and take no slot.
 */

#ifndef CLOAK_FRAME_PLANNER_HPP
#define CLOAK_FRAME_PLANNER_HPP

#include "../../ast/ast.hpp"
#include "../../ast/ast_walk.hpp"
#include "../../ast/type_layout.hpp"
#include "../../common/logging.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace cloak {
namespace codegen {

struct FrameSlot {
    std::string name;
    ast::Type type;
    long offset = 0;     // from %ebp
    long size = 0;
    long align = 4;
    bool is_param = false;
    int scope_id = -1;
};

struct FrameLayout {
    std::string function;
    std::vector<FrameSlot> slots;
    long locals_size = 0;    // bytes below %ebp actually used
    long frame_size = 0;     // locals_size rounded up to 16

    const FrameSlot* find(const std::string& name, int scope_id) const;

    /**
     * True if any slot, in any scope, carries this name
     */
    bool contains(const std::string& name) const;

    std::string str() const;
};

class FramePlanner {
public:
    static constexpr long kStackAlign = 16;
    static constexpr long kFirstParamOffset = 8;

    explicit FramePlanner(const ast::TypeLayout& layout) : layout_(layout) {}

    /**
     * Throws CompileError(UnsupportedConstruct) for locals or parameters
     * of a type the backend does not lower
     */
    FrameLayout plan(const ast::Function& f);

private:
    const ast::TypeLayout& layout_;
    Logger logger_{"FramePlanner"};

    void checkLowered(const ast::Type& t, const std::string& name, SourceLoc loc) const;
};

} // namespace codegen
} // namespace cloak

#endif // CLOAK_FRAME_PLANNER_HPP
