/**
 * Cloak - Obfuscating C Compiler
 *
 * const_eval.cpp - 32-bit constant arithmetic
 */

#include "const_eval.hpp"

namespace cloak {
namespace ast {

namespace {

constexpr uint32_t kIntMin = 0x80000000u;
constexpr uint32_t kMinusOne = 0xFFFFFFFFu;

inline int32_t s32(uint32_t v) { return static_cast<int32_t>(v); }
inline uint32_t u32(int64_t v) { return static_cast<uint32_t>(v); }

} // namespace

std::optional<uint32_t> evalBinary32(BinaryOp op, uint32_t a, uint32_t b, bool is_unsigned) {
    switch (op) {
        case BinaryOp::Add: return a + b;
        case BinaryOp::Sub: return a - b;
        case BinaryOp::Mul: return a * b;
        case BinaryOp::Div:
            if (b == 0) return std::nullopt;
            if (is_unsigned) return a / b;
            if (a == kIntMin && b == kMinusOne) return std::nullopt;
            return u32(s32(a) / s32(b));
        case BinaryOp::Mod:
            if (b == 0) return std::nullopt;
            if (is_unsigned) return a % b;
            if (a == kIntMin && b == kMinusOne) return std::nullopt;
            return u32(s32(a) % s32(b));
        case BinaryOp::Shl:
            if (b >= 32) return std::nullopt;
            return a << b;
        case BinaryOp::Shr:
            if (b >= 32) return std::nullopt;
            if (is_unsigned) return a >> b;
            return u32(s32(a) >> b);
        case BinaryOp::BitAnd: return a & b;
        case BinaryOp::BitOr:  return a | b;
        case BinaryOp::BitXor: return a ^ b;
        case BinaryOp::Lt: return is_unsigned ? uint32_t(a < b) : uint32_t(s32(a) < s32(b));
        case BinaryOp::Le: return is_unsigned ? uint32_t(a <= b) : uint32_t(s32(a) <= s32(b));
        case BinaryOp::Gt: return is_unsigned ? uint32_t(a > b) : uint32_t(s32(a) > s32(b));
        case BinaryOp::Ge: return is_unsigned ? uint32_t(a >= b) : uint32_t(s32(a) >= s32(b));
        case BinaryOp::Eq: return uint32_t(a == b);
        case BinaryOp::Ne: return uint32_t(a != b);
        case BinaryOp::LogAnd: return uint32_t(a != 0 && b != 0);
        case BinaryOp::LogOr:  return uint32_t(a != 0 || b != 0);
    }
    return std::nullopt;
}

uint32_t evalUnary32(UnaryOp op, uint32_t a) {
    switch (op) {
        case UnaryOp::Plus:   return a;
        case UnaryOp::Neg:    return 0u - a;
        case UnaryOp::Not:    return a == 0 ? 1u : 0u;
        case UnaryOp::BitNot: return ~a;
        default:
            throw InternalError(std::string("evalUnary32: operator ") + unaryOpSpelling(op) +
                                " has no constant form");
    }
}

uint32_t convertTo(const Type& t, uint32_t value) {
    switch (t.kind) {
        case TypeKind::Char:
            return t.is_unsigned ? (value & 0xFFu)
                                 : u32(static_cast<int8_t>(static_cast<uint8_t>(value)));
        case TypeKind::Short:
            return t.is_unsigned ? (value & 0xFFFFu)
                                 : u32(static_cast<int16_t>(static_cast<uint16_t>(value)));
        default:
            return value;
    }
}

std::optional<IntValue> ConstEvaluator::evaluate(const Expr& e) const {
    switch (e.kind) {
        case ExprKind::IntLiteral:
            return IntValue{literalBits(e), e.is_unsigned};

        case ExprKind::CharLiteral:
            return IntValue{literalBits(e), false};

        case ExprKind::Identifier: {
            if (e.storage == StorageKind::EnumConst) {
                return IntValue{u32(e.int_value), false};
            }
            if (e.storage == StorageKind::Unresolved && lookup_) {
                if (auto v = lookup_(e.text)) return IntValue{u32(*v), false};
            }
            return std::nullopt;
        }

        case ExprKind::Unary: {
            if (e.uop != UnaryOp::Plus && e.uop != UnaryOp::Neg &&
                e.uop != UnaryOp::Not && e.uop != UnaryOp::BitNot) {
                return std::nullopt;
            }
            auto v = evaluate(e.operand());
            if (!v) return std::nullopt;
            IntValue out{evalUnary32(e.uop, v->bits), v->is_unsigned};
            if (e.uop == UnaryOp::Not) out.is_unsigned = false;
            return out;
        }

        case ExprKind::Binary: {
            auto a = evaluate(e.lhs());
            if (!a) return std::nullopt;
            // short-circuit forms only need the left side when it decides
            if (e.bop == BinaryOp::LogAnd && a->isZero()) return IntValue{0, false};
            if (e.bop == BinaryOp::LogOr && !a->isZero()) return IntValue{1, false};
            auto b = evaluate(e.rhs());
            if (!b) return std::nullopt;

            bool shift = e.bop == BinaryOp::Shl || e.bop == BinaryOp::Shr;
            bool uns = shift ? a->is_unsigned : (a->is_unsigned || b->is_unsigned);
            auto r = evalBinary32(e.bop, a->bits, b->bits, uns);
            if (!r) return std::nullopt;
            bool logical = isComparison(e.bop) || e.bop == BinaryOp::LogAnd ||
                           e.bop == BinaryOp::LogOr;
            return IntValue{*r, logical ? false : uns};
        }

        case ExprKind::Ternary: {
            auto c = evaluate(e.cond());
            if (!c) return std::nullopt;
            auto t = evaluate(e.args.at(1));
            auto f = evaluate(e.args.at(2));
            if (!t || !f) return std::nullopt;
            IntValue out = c->isZero() ? *f : *t;
            out.is_unsigned = t->is_unsigned || f->is_unsigned;
            return out;
        }

        case ExprKind::Cast: {
            if (!e.target_type.isInteger()) return std::nullopt;
            auto v = evaluate(e.operand());
            if (!v) return std::nullopt;
            Type promoted = promote(e.target_type);
            return IntValue{convertTo(e.target_type, v->bits), promoted.is_unsigned};
        }

        case ExprKind::SizeOf: {
            TypeLayout scalar_only;
            const TypeLayout& layout = layout_ ? *layout_ : scalar_only;
            if (e.sizeof_type) {
                return IntValue{u32(layout.sizeOf(e.target_type)), true};
            }
            const Expr& x = e.operand();
            if (x.type) return IntValue{u32(layout.sizeOf(*x.type)), true};
            if (x.kind == ExprKind::StringLiteral) {
                return IntValue{u32(static_cast<int64_t>(x.text.size()) + 1), true};
            }
            return std::nullopt;
        }

        default:
            return std::nullopt;
    }
}

} // namespace ast
} // namespace cloak
