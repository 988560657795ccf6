/**
 * Cloak - Obfuscating C Compiler
 *
 * mba_base.hpp - Base definitions for MBA (Mixed Boolean Arithmetic) transformations
 *
 * MBA rewrites simple arithmetic/bitwise operations into equivalent but more
 * complex expressions built from boolean and arithmetic sub-terms. Every
 * identity here holds for all 32-bit inputs modulo 2^32. Operands arrive
 * already cast to unsigned int, so no intermediate signed overflow exists.
 */

#ifndef CLOAK_MBA_BASE_HPP
#define CLOAK_MBA_BASE_HPP

#include "../../ast/ast.hpp"
#include "../../common/random.hpp"
#include "../../common/logging.hpp"

#include <string>
#include <vector>

namespace cloak {
namespace mba {

/**
 * MBA variant descriptor
 * Each operation has several equivalent rewrites
 */
struct MBAVariant {
    std::string name;           // Human-readable name
    std::string expression;     // The identity (for documentation)
    double probability;         // Selection weight

    MBAVariant(const std::string& n, const std::string& expr, double prob = 1.0)
        : name(n), expression(expr), probability(prob) {}
};

struct MBAConfig {
    bool enabled = true;
    double probability = 0.5;       // Probability to rewrite one operation
    int max_operand_nodes = 12;     // Larger operands are not duplicated
    std::vector<double> variant_weights;
};

/**
 * Abstract base class for MBA transformations
 * Each operation (ADD, SUB, XOR, etc.) implements this
 */
class MBATransformation {
public:
    virtual ~MBATransformation() = default;

    virtual std::string getName() const = 0;

    /**
     * The operator this rewrites
     */
    virtual ast::BinaryOp getOperation() const = 0;

    virtual std::vector<MBAVariant> getVariants() const = 0;

    size_t getVariantCount() const { return getVariants().size(); }

    /**
     * Weighted random choice among the variants
     */
    size_t selectVariant(const MBAConfig& config, Random& rng) const {
        const auto variants = getVariants();
        if (!config.variant_weights.empty() && config.variant_weights.size() == variants.size()) {
            return rng.chooseWeighted(config.variant_weights);
        }
        std::vector<double> weights;
        for (const auto& v : variants) weights.push_back(v.probability);
        return rng.chooseWeighted(weights);
    }

    /**
     * Builds the rewritten expression for a (op) b. Both operands are
     * unsigned int and free of side effects; each may be copied.
     */
    virtual ast::Expr apply(size_t variant, const ast::Expr& a, const ast::Expr& b) const = 0;

protected:
    Logger logger_;

    explicit MBATransformation(const std::string& name) : logger_(name) {}
};

// unsigned building blocks shared by the transformations
namespace ops {

inline ast::Expr bin(ast::BinaryOp op, ast::Expr a, ast::Expr b) {
    return ast::make::binary(op, std::move(a), std::move(b));
}
inline ast::Expr add(ast::Expr a, ast::Expr b) { return bin(ast::BinaryOp::Add, std::move(a), std::move(b)); }
inline ast::Expr sub(ast::Expr a, ast::Expr b) { return bin(ast::BinaryOp::Sub, std::move(a), std::move(b)); }
inline ast::Expr mul(ast::Expr a, ast::Expr b) { return bin(ast::BinaryOp::Mul, std::move(a), std::move(b)); }
inline ast::Expr band(ast::Expr a, ast::Expr b) { return bin(ast::BinaryOp::BitAnd, std::move(a), std::move(b)); }
inline ast::Expr bor(ast::Expr a, ast::Expr b) { return bin(ast::BinaryOp::BitOr, std::move(a), std::move(b)); }
inline ast::Expr bxor(ast::Expr a, ast::Expr b) { return bin(ast::BinaryOp::BitXor, std::move(a), std::move(b)); }
inline ast::Expr shl1(ast::Expr a) { return bin(ast::BinaryOp::Shl, std::move(a), ast::make::uintLit(1)); }
inline ast::Expr bnot(ast::Expr a) { return ast::make::unary(ast::UnaryOp::BitNot, std::move(a)); }
inline ast::Expr neg(ast::Expr a) { return ast::make::unary(ast::UnaryOp::Neg, std::move(a)); }
inline ast::Expr two() { return ast::make::uintLit(2); }
inline ast::Expr one() { return ast::make::uintLit(1); }

} // namespace ops

} // namespace mba
} // namespace cloak

#endif // CLOAK_MBA_BASE_HPP
