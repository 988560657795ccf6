/**
 * Cloak - Obfuscating C Compiler
 *
 * x86_codegen.hpp - i386 System V code generator
 *
 * Lowers an analyzed Program to AT&T-syntax GNU assembler text for ELF.
 * cdecl throughout: arguments pushed right to left, caller pops, result
 * in %eax, frames addressed from %ebp.
 *
 * Expressions use %eax as the accumulator and the machine stack as the
 * operand stack (%ecx and %edx are scratch). Every call site pads the
 * stack so %esp is 16-byte aligned at the call instruction.
 *
 * Labels inside a function are .L<function>.<n>; string literals are
 * .LS<n> in .rodata. Static locals become file-local data labeled
 * <function>.<name>.<scope>.
 */

#ifndef CLOAK_X86_CODEGEN_HPP
#define CLOAK_X86_CODEGEN_HPP

#include "frame_planner.hpp"
#include "../../ast/ast.hpp"
#include "../../ast/ast_walk.hpp"
#include "../../ast/const_eval.hpp"
#include "../../ast/type_layout.hpp"
#include "../../common/logging.hpp"
#include "../../core/diagnostics.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace cloak {
namespace codegen {

struct CodegenResult {
    bool success = false;
    std::string assembly;            // empty unless every function lowered
    DiagnosticList diagnostics;
    std::vector<FrameLayout> frames; // one per emitted function, in order
    std::map<std::string, int> stats;

    const FrameLayout* frame(const std::string& function) const {
        for (const auto& f : frames) {
            if (f.function == function) return &f;
        }
        return nullptr;
    }
};

class X86CodeGenerator {
public:
    /**
     * A switch with at least this many cases whose values are dense
     * enough dispatches through a jump table
     */
    static constexpr size_t kJumpTableMinCases = 4;
    static constexpr int64_t kJumpTableMaxRange = 1024;

    CodegenResult generate(const ast::Program& program);

private:
    struct SwitchTable {
        std::string label;
        std::vector<std::string> targets;
    };

    Logger logger_{"X86Codegen"};
    ast::TypeLayout layout_;
    std::map<std::string, int> stats_;
    std::set<std::string> static_functions_;

    // sections
    std::vector<std::string> text_;
    std::vector<std::string> data_;
    std::vector<std::string> bss_;
    std::vector<std::string> rodata_;
    std::vector<std::string> init_array_;
    std::map<std::string, std::string> strings_;   // bytes -> label
    int string_counter_ = 0;

    // per function
    const ast::Function* function_ = nullptr;
    FrameLayout frame_;
    std::vector<std::string> out_;
    int label_counter_ = 0;
    std::string return_label_;
    long depth_ = 0;                               // bytes pushed below the frame
    std::vector<std::string> break_labels_;
    std::vector<std::string> continue_labels_;
    std::vector<SwitchTable> tables_;
    std::unordered_map<ast::BindingKey, std::string, ast::BindingKeyHash> static_locals_;

    // unit
    void emitGlobals(const ast::Program& program);
    void emitFunction(const ast::Function& f);
    void emitObject(const std::string& label, const ast::VarDecl& v, bool global);
    void emitInitializer(const ast::Type& t, const ast::Expr& init, std::vector<std::string>& out);
    void emitScalarData(const ast::Type& t, const ast::Expr& init, std::vector<std::string>& out);
    std::optional<std::string> addressConstant(const ast::Expr& e);
    std::string stringLabel(const std::string& bytes);
    std::string assemble() const;

    // function
    void emit(const std::string& line) { out_.push_back("\t" + line); }
    void placeLabel(const std::string& label) { out_.push_back(label + ":"); }
    std::string newLabel();
    void push(const char* reg = "%eax");
    void pop(const char* reg);
    void collectStaticLocals(const ast::Function& f);

    // statements
    void genBlock(const ast::Block& block);
    void genStmt(const ast::Stmt& s);
    void genLocalDecl(const ast::VarDecl& v);
    void genSwitch(const ast::Stmt& s);
    void branchIfFalse(const ast::Expr& cond, const std::string& target);

    // expressions
    void genExpr(const ast::Expr& e);
    void genAddr(const ast::Expr& e);
    void genBinary(const ast::Expr& e);
    void genUnary(const ast::Expr& e);
    void genAssign(const ast::Expr& e);
    void genCall(const ast::Expr& e);
    void genLogical(const ast::Expr& e);
    void genArith(ast::BinaryOp op, bool is_unsigned);
    void genCompare(const ast::Expr& e);
    std::optional<std::string> directOperand(const ast::Expr& e);

    void loadFrom(const ast::Type& t, const std::string& operand);
    void storeTo(const ast::Type& t, const std::string& operand);
    void convert(const ast::Type& t);
    long scaleOf(const ast::Type& pointer) const;
    void checkValueType(const ast::Type& t, SourceLoc loc) const;

    [[noreturn]] void unsupported(const std::string& what, SourceLoc loc) const;
};

/**
 * Convenience wrapper: generates with a fresh generator
 */
CodegenResult generate(const ast::Program& program);

} // namespace codegen
} // namespace cloak

#endif // CLOAK_X86_CODEGEN_HPP
