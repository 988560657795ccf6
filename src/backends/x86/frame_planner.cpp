/**
 * Cloak - Obfuscating C Compiler
 *
 * frame_planner.cpp - Stack frame layout for the i386 backend
 */

#include "frame_planner.hpp"

#include <sstream>

namespace cloak {
namespace codegen {

using namespace ast;

const FrameSlot* FrameLayout::find(const std::string& name, int scope_id) const {
    for (const auto& s : slots) {
        if (s.name == name && s.scope_id == scope_id) return &s;
    }
    return nullptr;
}

bool FrameLayout::contains(const std::string& name) const {
    for (const auto& s : slots) {
        if (s.name == name) return true;
    }
    return false;
}

std::string FrameLayout::str() const {
    std::ostringstream oss;
    oss << function << ": frame " << frame_size << " bytes\n";
    for (const auto& s : slots) {
        oss << "  " << (s.offset >= 0 ? "+" : "") << s.offset << "  " << s.name
            << " (" << s.type.str() << ", " << s.size << " bytes"
            << (s.is_param ? ", param" : "") << ")\n";
    }
    return oss.str();
}

void FramePlanner::checkLowered(const Type& t, const std::string& name, SourceLoc loc) const {
    switch (t.kind) {
        case TypeKind::LongLong:
        case TypeKind::Float:
        case TypeKind::Double:
            throw CompileError(DiagCode::UnsupportedConstruct,
                               "variable '" + name + "' of type '" + t.str() +
                               "' is not supported by the code generator", loc);
        case TypeKind::Array:
            checkLowered(t.element(), name, loc);
            break;
        default:
            break;
    }
}

FrameLayout FramePlanner::plan(const Function& f) {
    FrameLayout frame;
    frame.function = f.name;

    long offset = kFirstParamOffset;
    for (const auto& p : f.params) {
        checkLowered(p.type, p.name, p.loc);
        if (p.type.isRecord()) {
            throw CompileError(DiagCode::UnsupportedConstruct,
                               "struct or union parameter '" + p.name + "' passed by value", p.loc);
        }
        FrameSlot slot;
        slot.name = p.name;
        slot.type = p.type;
        slot.offset = offset;
        slot.size = TypeLayout::kWordSize;
        slot.is_param = true;
        slot.scope_id = p.scope_id;
        frame.slots.push_back(std::move(slot));
        offset += TypeLayout::kWordSize;
    }

    long used = 0;
    visitBlockStmts(f.body, [&](const Stmt& s) {
        if (s.kind != StmtKind::Decl || !s.decl) return;
        const VarDecl& v = *s.decl;
        if (v.is_static || v.is_extern) return;
        checkLowered(v.type, v.name, v.loc);

        FrameSlot slot;
        slot.name = v.name;
        slot.type = v.type;
        slot.size = layout_.sizeOf(v.type);
        slot.align = layout_.alignOf(v.type);
        slot.scope_id = v.scope_id;
        used = TypeLayout::alignUp(used + slot.size, slot.align);
        slot.offset = -used;
        frame.slots.push_back(std::move(slot));
    });

    frame.locals_size = used;
    frame.frame_size = TypeLayout::alignUp(used, kStackAlign);
    logger_.debug("{}: {} slots, {} bytes of locals", f.name, frame.slots.size(), frame.frame_size);
    return frame;
}

} // namespace codegen
} // namespace cloak
