/*
 * type_layout.hpp
 *
 * sizes, alignments and field offsets for the i386 System V target
 */

#ifndef CLOAK_TYPE_LAYOUT_HPP
#define CLOAK_TYPE_LAYOUT_HPP

#include "ast.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

namespace cloak {
namespace ast {

class TypeLayout {
public:
    static constexpr long kPointerSize = 4;
    static constexpr long kWordSize = 4;

    struct FieldInfo {
        std::string name;
        Type type;
        long offset = 0;
    };

    TypeLayout() = default;

    explicit TypeLayout(const Program& program) {
        for (const auto& d : program.decls) {
            if (d.kind == DeclKind::Record && d.record.is_complete) {
                addRecord(d.record);
            }
        }
    }

    /**
     * Lays out a complete struct or union. A later definition with the
     * same tag replaces the earlier one.
     */
    void addRecord(const RecordDef& rec) {
        RecordInfo info;
        info.is_union = rec.is_union;
        long offset = 0;
        long align = 1;
        long size = 0;
        for (const auto& f : rec.fields) {
            long fa = alignOf(f.type);
            long fs = sizeOf(f.type);
            FieldInfo fi;
            fi.name = f.name;
            fi.type = f.type;
            if (rec.is_union) {
                fi.offset = 0;
                size = std::max(size, fs);
            } else {
                offset = alignUp(offset, fa);
                fi.offset = offset;
                offset += fs;
                size = offset;
            }
            align = std::max(align, fa);
            info.fields.push_back(std::move(fi));
        }
        info.align = align;
        info.size = alignUp(size, align);
        records_[rec.name] = std::move(info);
    }

    bool hasRecord(const std::string& tag) const {
        return records_.count(tag) != 0;
    }

    /**
     * Size in bytes; throws CompileError(TypeMismatch) for incomplete types
     */
    long sizeOf(const Type& t) const {
        switch (t.kind) {
            case TypeKind::Char:     return 1;
            case TypeKind::Short:    return 2;
            case TypeKind::Int:
            case TypeKind::Long:
            case TypeKind::Enum:
            case TypeKind::Float:    return 4;
            case TypeKind::LongLong:
            case TypeKind::Double:   return 8;
            case TypeKind::Pointer:  return kPointerSize;
            case TypeKind::Array:
                if (t.array_size < 0) {
                    throw CompileError(DiagCode::TypeMismatch,
                                       "array '" + t.str() + "' has unknown size");
                }
                return t.array_size * sizeOf(t.element());
            case TypeKind::Struct:
            case TypeKind::Union:
                return record(t.tag).size;
            case TypeKind::Void:
            case TypeKind::Function:
                throw CompileError(DiagCode::TypeMismatch,
                                   "invalid application of sizeof to '" + t.str() + "'");
        }
        return kWordSize;
    }

    long alignOf(const Type& t) const {
        switch (t.kind) {
            case TypeKind::Char:     return 1;
            case TypeKind::Short:    return 2;
            case TypeKind::Array:    return alignOf(t.element());
            case TypeKind::Struct:
            case TypeKind::Union:    return record(t.tag).align;
            default:                 return kWordSize;
        }
    }

    const FieldInfo* field(const std::string& tag, const std::string& name) const {
        auto it = records_.find(tag);
        if (it == records_.end()) return nullptr;
        for (const auto& f : it->second.fields) {
            if (f.name == name) return &f;
        }
        return nullptr;
    }

    static long alignUp(long value, long align) {
        return align <= 1 ? value : (value + align - 1) / align * align;
    }

private:
    struct RecordInfo {
        std::vector<FieldInfo> fields;
        long size = 0;
        long align = 1;
        bool is_union = false;
    };

    std::unordered_map<std::string, RecordInfo> records_;

    const RecordInfo& record(const std::string& tag) const {
        auto it = records_.find(tag);
        if (it == records_.end()) {
            throw CompileError(DiagCode::TypeMismatch, "incomplete type 'struct " + tag + "'");
        }
        return it->second;
    }
};

} // namespace ast
} // namespace cloak

#endif // CLOAK_TYPE_LAYOUT_HPP
