/**
 * Cloak - Reference Interpreter
 *
 * Executes an analyzed Program directly, with the target's data model:
 * 32-bit int and pointers, signed char, byte-addressed little-endian
 * memory. Used by the differential tests to run a program before and
 * after transformation without a 32-bit toolchain.
 *
 * Call arguments are evaluated right to left, as the code generator
 * does. A small libc subset is built in (printf, puts, putchar, strcmp,
 * strncmp, strlen, strcpy, memset, memcpy, abs).
 */

#ifndef CLOAK_REFERENCE_INTERPRETER_HPP
#define CLOAK_REFERENCE_INTERPRETER_HPP

#include "ast/ast.hpp"
#include "ast/ast_walk.hpp"
#include "ast/type_layout.hpp"

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace cloak {
namespace test {

class InterpreterError : public std::runtime_error {
public:
    explicit InterpreterError(const std::string& msg) : std::runtime_error(msg) {}
};

struct RunResult {
    bool ok = false;
    int32_t value = 0;
    std::string output;     // everything the program printed
    std::string error;
};

class ReferenceInterpreter {
public:
    static constexpr uint32_t kMemorySize = 1u << 21;
    static constexpr uint32_t kStackBase = 1u << 20;
    static constexpr uint32_t kFunctionBase = 0xFF000000u;
    static constexpr long kMaxSteps = 20000000;

    /**
     * The program must have been analyzed. Globals are initialized and
     * constructor functions run here.
     */
    explicit ReferenceInterpreter(const ast::Program& program);

    RunResult call(const std::string& function, const std::vector<int32_t>& args = {});
    RunResult runMain() { return call("main"); }

private:
    enum class Flow { Normal, Break, Continue, Return };

    struct Frame {
        const ast::Function* function = nullptr;
        std::unordered_map<ast::BindingKey, uint32_t, ast::BindingKeyHash> slots;
        uint32_t return_value = 0;
    };

    const ast::Program& program_;
    ast::TypeLayout layout_;
    std::vector<uint8_t> memory_;
    uint32_t heap_top_ = 16;
    uint32_t stack_top_ = kStackBase;
    std::unordered_map<std::string, uint32_t> globals_;
    std::unordered_map<std::string, uint32_t> static_locals_;   // function/scope/name
    std::map<std::string, uint32_t> strings_;
    std::unordered_map<std::string, const ast::Function*> functions_;
    std::vector<std::string> function_ids_;
    std::vector<Frame> frames_;
    std::string output_;
    long steps_ = 0;
    bool initialized_ = false;
    std::string init_error_;
    const ast::Function* init_function_ = nullptr;   // owner of the static being initialized

    // memory
    uint32_t allocate(uint32_t& top, uint32_t limit, long size, long align);
    void check(uint32_t addr, long size) const;
    uint32_t load(const ast::Type& t, uint32_t addr) const;
    void store(const ast::Type& t, uint32_t addr, uint32_t value);
    std::string readString(uint32_t addr) const;
    uint32_t internString(const std::string& bytes);

    // program setup
    void initializeGlobals();
    void initializeObject(const ast::Type& t, uint32_t addr, const ast::Expr& init);
    uint32_t constantValue(const ast::Type& t, const ast::Expr& e);
    static std::string staticKey(const std::string& function, int scope, const std::string& name);
    uint32_t functionAddress(const std::string& name);

    // execution
    uint32_t invoke(const std::string& name, const std::vector<uint32_t>& args);
    uint32_t builtin(const std::string& name, const std::vector<uint32_t>& args);
    std::string format(const std::vector<uint32_t>& args);
    Flow execBlock(const ast::Block& block);
    Flow exec(const ast::Stmt& s);
    Flow execSwitch(const ast::Stmt& s);
    void declare(const ast::VarDecl& v);
    bool truth(const ast::Expr& e);

    uint32_t eval(const ast::Expr& e);
    uint32_t address(const ast::Expr& e);
    uint32_t binary(const ast::Expr& e);
    uint32_t unary(const ast::Expr& e);
    uint32_t assign(const ast::Expr& e);
    uint32_t callExpr(const ast::Expr& e);
    uint32_t slot(const ast::Expr& ident);
    uint32_t convert(const ast::Type& t, uint32_t value) const;
    long scale(const ast::Type& pointer) const;
};

} // namespace test
} // namespace cloak

#endif // CLOAK_REFERENCE_INTERPRETER_HPP
