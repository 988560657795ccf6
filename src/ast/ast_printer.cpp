/**
 * Cloak - Obfuscating C Compiler
 *
 * ast_printer.cpp - C source emitter
 *
 * Expressions are printed fully parenthesized so that rewritten trees
 * never depend on operator precedence in the output.
 */

#include "ast_printer.hpp"

#include <cstdio>

namespace cloak {
namespace ast {

std::string AstPrinter::print(const Program& program) {
    out_.str("");
    out_.clear();
    indent_ = 0;
    for (const auto& d : program.decls) {
        topDecl(d);
    }
    return out_.str();
}

void AstPrinter::line(const std::string& text) {
    out_ << std::string(static_cast<size_t>(indent_) * 4, ' ') << text << "\n";
}

std::string AstPrinter::quote(const std::string& bytes) {
    std::string s = "\"";
    for (unsigned char c : bytes) {
        switch (c) {
            case '"':  s += "\\\""; break;
            case '\\': s += "\\\\"; break;
            case '\n': s += "\\n"; break;
            case '\t': s += "\\t"; break;
            case '\r': s += "\\r"; break;
            default:
                if (c >= 0x20 && c < 0x7F && c != '?') {
                    s += static_cast<char>(c);
                } else {
                    // three octal digits never swallow a following digit
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\%03o", c);
                    s += buf;
                }
        }
    }
    return s + "\"";
}

std::string AstPrinter::baseSpelling(const Type& t) const {
    std::string q = t.is_const ? "const " : "";
    std::string u = t.is_unsigned ? "unsigned " : "";
    switch (t.kind) {
        case TypeKind::Void:     return q + "void";
        case TypeKind::Char:     return q + u + "char";
        case TypeKind::Short:    return q + u + "short";
        case TypeKind::Int:      return q + u + "int";
        case TypeKind::Long:     return q + u + "long";
        case TypeKind::LongLong: return q + u + "long long";
        case TypeKind::Float:    return q + "float";
        case TypeKind::Double:   return q + "double";
        case TypeKind::Struct:   return q + "struct " + t.tag;
        case TypeKind::Union:    return q + "union " + t.tag;
        case TypeKind::Enum:     return q + "enum " + t.tag;
        default:
            throw InternalError("baseSpelling called on derived type " + t.str());
    }
}

std::string AstPrinter::declarator(const Type& t, const std::string& inner) const {
    switch (t.kind) {
        case TypeKind::Pointer: {
            std::string s = std::string("*") + (t.is_const ? "const " : "") + inner;
            const Type& p = t.pointee();
            if (p.isArray() || p.isFunction()) s = "(" + s + ")";
            return declarator(p, s);
        }
        case TypeKind::Array: {
            std::string size = t.array_size >= 0 ? std::to_string(t.array_size) : "";
            return declarator(t.element(), inner + "[" + size + "]");
        }
        case TypeKind::Function: {
            std::string ps;
            for (size_t i = 0; i < t.paramCount(); i++) {
                if (i) ps += ", ";
                ps += declarator(t.param(i), "");
            }
            if (t.is_variadic) ps += t.paramCount() ? ", ..." : "...";
            if (ps.empty()) ps = "void";
            return declarator(t.returnType(), inner + "(" + ps + ")");
        }
        default: {
            std::string base = baseSpelling(t);
            return inner.empty() ? base : base + " " + inner;
        }
    }
}

std::string AstPrinter::declaration(const Type& t, const std::string& name) const {
    return declarator(t, name);
}

std::string AstPrinter::literal(const Expr& e) const {
    if (e.is_unsigned) {
        return std::to_string(static_cast<uint32_t>(e.int_value)) + "u";
    }
    int32_t v = static_cast<int32_t>(e.int_value);
    if (v == INT32_MIN) return "(-2147483647 - 1)";
    if (v < 0) return "(" + std::to_string(v) + ")";
    return std::to_string(v);
}

std::string AstPrinter::expr(const Expr& e) const {
    switch (e.kind) {
        case ExprKind::IntLiteral:
            return literal(e);
        case ExprKind::CharLiteral: {
            int v = static_cast<int>(e.int_value);
            if (v >= 0x20 && v < 0x7F && v != '\'' && v != '\\') {
                return std::string("'") + static_cast<char>(v) + "'";
            }
            return literal(e);
        }
        case ExprKind::StringLiteral:
            return quote(e.text);
        case ExprKind::Identifier:
            return e.text;
        case ExprKind::Binary:
            return "(" + expr(e.lhs()) + " " + binaryOpSpelling(e.bop) + " " +
                   expr(e.rhs()) + ")";
        case ExprKind::Unary:
            switch (e.uop) {
                case UnaryOp::PostInc: return "(" + expr(e.operand()) + "++)";
                case UnaryOp::PostDec: return "(" + expr(e.operand()) + "--)";
                default:
                    // the space keeps "- -x" from becoming a decrement
                    return std::string("(") + unaryOpSpelling(e.uop) + " " +
                           expr(e.operand()) + ")";
            }
        case ExprKind::Assign: {
            std::string op = e.assign_op ? std::string(binaryOpSpelling(*e.assign_op)) + "="
                                         : std::string("=");
            return "(" + expr(e.lhs()) + " " + op + " " + expr(e.rhs()) + ")";
        }
        case ExprKind::Call: {
            std::string s = expr(e.callee()) + "(";
            for (size_t i = 0; i < e.argCount(); i++) {
                if (i) s += ", ";
                s += expr(e.arg(i));
            }
            return s + ")";
        }
        case ExprKind::Index:
            return expr(e.lhs()) + "[" + expr(e.rhs()) + "]";
        case ExprKind::Member:
            return expr(e.operand()) + (e.arrow ? "->" : ".") + e.text;
        case ExprKind::Ternary:
            return "(" + expr(e.args.at(0)) + " ? " + expr(e.args.at(1)) + " : " +
                   expr(e.args.at(2)) + ")";
        case ExprKind::Cast:
            return "((" + typeName(e.target_type) + ")" + expr(e.operand()) + ")";
        case ExprKind::SizeOf:
            if (e.sizeof_type) return "sizeof(" + typeName(e.target_type) + ")";
            return "sizeof(" + expr(e.operand()) + ")";
        case ExprKind::InitList: {
            std::string s = "{";
            for (size_t i = 0; i < e.args.size(); i++) {
                if (i) s += ", ";
                s += expr(e.args[i]);
            }
            return s + "}";
        }
    }
    return "?";
}

std::string AstPrinter::varDecl(const VarDecl& v) const {
    std::string s;
    if (v.is_static) s += "static ";
    if (v.is_extern) s += "extern ";
    s += declaration(v.type, v.name);
    if (v.init) s += " = " + expr(*v.init);
    return s;
}

std::string AstPrinter::forClause(const Block& init) const {
    if (init.empty()) return "";
    if (init.size() == 1 && init[0].kind == StmtKind::Expr) return expr(*init[0].expr);
    if (init.size() == 1 && init[0].kind == StmtKind::Decl) return varDecl(*init[0].decl);
    throw InternalError("for-init with " + std::to_string(init.size()) + " statements");
}

void AstPrinter::topDecl(const TopDecl& d) {
    switch (d.kind) {
        case DeclKind::Function:
            function(d.func);
            break;
        case DeclKind::Variable:
            line(varDecl(d.var) + ";");
            break;
        case DeclKind::Typedef:
            line("typedef " + declaration(d.tdef.type, d.tdef.name) + ";");
            break;
        case DeclKind::Record: {
            std::string head = std::string(d.record.is_union ? "union " : "struct ") + d.record.name;
            if (!d.record.is_complete) {
                line(head + ";");
                break;
            }
            line(head + " {");
            indent_++;
            for (const auto& f : d.record.fields) line(declaration(f.type, f.name) + ";");
            indent_--;
            line("};");
            break;
        }
        case DeclKind::Enum: {
            line("enum " + d.enm.name + " {");
            indent_++;
            for (const auto& item : d.enm.items) {
                line(item.name + " = " + std::to_string(item.value) + ",");
            }
            indent_--;
            line("};");
            break;
        }
    }
}

void AstPrinter::function(const Function& f) {
    std::string ps;
    for (size_t i = 0; i < f.params.size(); i++) {
        if (i) ps += ", ";
        ps += declaration(f.params[i].type, f.params[i].name);
    }
    if (f.is_variadic) ps += f.params.empty() ? "..." : ", ...";
    if (ps.empty()) ps = "void";

    std::string head = std::string(f.meta.constructor ? "__attribute__((constructor)) " : "") +
                       (f.is_static ? "static " : "") +
                       declaration(f.return_type, f.name + "(" + ps + ")");
    if (!f.is_definition) {
        line(head + ";");
        return;
    }
    line(head);
    line("{");
    indent_++;
    for (const auto& s : f.body) stmt(s);
    indent_--;
    line("}");
    line("");
}

void AstPrinter::block(const Block& b) {
    indent_++;
    for (const auto& s : b) stmt(s);
    indent_--;
}

void AstPrinter::stmt(const Stmt& s) {
    switch (s.kind) {
        case StmtKind::Decl:
            line(varDecl(*s.decl) + ";");
            break;
        case StmtKind::Expr:
            line(expr(*s.expr) + ";");
            break;
        case StmtKind::If:
            line("if (" + expr(*s.expr) + ") {");
            block(s.body);
            if (s.has_else) {
                line("} else {");
                block(s.else_body);
            }
            line("}");
            break;
        case StmtKind::While:
            line("while (" + expr(*s.expr) + ") {");
            block(s.body);
            line("}");
            break;
        case StmtKind::DoWhile:
            line("do {");
            block(s.body);
            line("} while (" + expr(*s.expr) + ");");
            break;
        case StmtKind::For: {
            std::string c = s.expr ? expr(*s.expr) : "";
            std::string st = s.step ? expr(*s.step) : "";
            if (s.init.size() > 1) {
                // several declarators: hoist them into an enclosing block
                line("{");
                indent_++;
                for (const auto& i : s.init) stmt(i);
                line("for (; " + c + "; " + st + ") {");
                block(s.body);
                line("}");
                indent_--;
                line("}");
                break;
            }
            line("for (" + forClause(s.init) + "; " + c + "; " + st + ") {");
            block(s.body);
            line("}");
            break;
        }
        case StmtKind::Switch:
            line("switch (" + expr(*s.expr) + ") {");
            for (const auto& c : s.cases) {
                line(c.isDefault() ? "default:" : "case " + expr(*c.value) + ":");
                if (!c.body.empty() && c.body.front().kind == StmtKind::Decl) {
                    // a label cannot prefix a declaration in C
                    indent_++;
                    line(";");
                    indent_--;
                }
                block(c.body);
            }
            line("}");
            break;
        case StmtKind::Break:
            line("break;");
            break;
        case StmtKind::Continue:
            line("continue;");
            break;
        case StmtKind::Return:
            line(s.expr ? "return " + expr(*s.expr) + ";" : "return;");
            break;
        case StmtKind::Compound:
            line("{");
            block(s.body);
            line("}");
            break;
        case StmtKind::Empty:
            line(";");
            break;
    }
}

} // namespace ast
} // namespace cloak
