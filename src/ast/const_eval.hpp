/*
 * const_eval.hpp
 *
 * 32-bit integer arithmetic with target semantics, shared by constant
 * folding, constant expressions (array sizes, enum values, case labels)
 * and the global initializer emitter
 */

#ifndef CLOAK_CONST_EVAL_HPP
#define CLOAK_CONST_EVAL_HPP

#include "ast.hpp"
#include "type_layout.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace cloak {
namespace ast {

/**
 * A 32-bit value together with the signedness of its type
 */
struct IntValue {
    uint32_t bits = 0;
    bool is_unsigned = false;

    int64_t asInt64() const {
        return is_unsigned ? static_cast<int64_t>(bits)
                           : static_cast<int64_t>(static_cast<int32_t>(bits));
    }
    bool isZero() const { return bits == 0; }
};

/**
 * Evaluates a binary operator on operands already converted to the
 * operation type. Returns nullopt where the target would trap or the
 * result is undefined: division or modulo by zero, INT_MIN / -1,
 * INT_MIN % -1, and shift counts outside [0, 31].
 */
std::optional<uint32_t> evalBinary32(BinaryOp op, uint32_t a, uint32_t b, bool is_unsigned);

/**
 * + - ! ~ on a promoted operand
 */
uint32_t evalUnary32(UnaryOp op, uint32_t a);

/**
 * Converts a 32-bit value to an integer type (truncate, then sign or zero extend)
 */
uint32_t convertTo(const Type& t, uint32_t value);

/**
 * Literal value of an integer literal as its 32-bit pattern
 */
inline uint32_t literalBits(const Expr& e) {
    return static_cast<uint32_t>(e.int_value);
}

/**
 * Evaluates integer constant expressions. Works on annotated and on
 * freshly parsed trees; identifiers resolve through the enum lookup or
 * through an EnumConst annotation.
 */
class ConstEvaluator {
public:
    using EnumLookup = std::function<std::optional<int64_t>(const std::string&)>;

    explicit ConstEvaluator(const TypeLayout* layout = nullptr, EnumLookup lookup = {})
        : layout_(layout), lookup_(std::move(lookup)) {}

    std::optional<IntValue> evaluate(const Expr& e) const;

    std::optional<int64_t> evaluateInt(const Expr& e) const {
        auto v = evaluate(e);
        if (!v) return std::nullopt;
        return v->asInt64();
    }

private:
    const TypeLayout* layout_;
    EnumLookup lookup_;
};

} // namespace ast
} // namespace cloak

#endif // CLOAK_CONST_EVAL_HPP
