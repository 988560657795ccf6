/**
 * Cloak - Obfuscating C Compiler
 *
 * diagnostics.hpp - Diagnostic records and the exceptions that carry them
 *
 * Stages return result structs with a DiagnosticList. Inside a stage a
 * hard failure is thrown as CompileError (user input at fault) or
 * InternalError (a pass produced something inconsistent); the stage
 * boundary catches it and appends the diagnostic.
 */

#ifndef CLOAK_DIAGNOSTICS_HPP
#define CLOAK_DIAGNOSTICS_HPP

#include <string>
#include <vector>
#include <sstream>
#include <stdexcept>
#include <algorithm>

namespace cloak {

enum class Severity {
    Note,
    Warning,
    Error,
    Fatal
};

enum class DiagCode {
    SyntaxInput,
    UnresolvedSymbol,
    DuplicateSymbol,
    TypeMismatch,
    InvalidControlFlow,
    UnsupportedConstruct,
    InternalInconsistency,
    ExternalToolFailure,
    UnknownOption
};

inline const char* severityToString(Severity s) {
    switch (s) {
        case Severity::Note:    return "note";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
        case Severity::Fatal:   return "fatal error";
    }
    return "unknown";
}

inline const char* diagCodeToString(DiagCode c) {
    switch (c) {
        case DiagCode::SyntaxInput:           return "SyntaxInput";
        case DiagCode::UnresolvedSymbol:      return "UnresolvedSymbol";
        case DiagCode::DuplicateSymbol:       return "DuplicateSymbol";
        case DiagCode::TypeMismatch:          return "TypeMismatch";
        case DiagCode::InvalidControlFlow:    return "InvalidControlFlow";
        case DiagCode::UnsupportedConstruct:  return "UnsupportedConstruct";
        case DiagCode::InternalInconsistency: return "InternalInconsistency";
        case DiagCode::ExternalToolFailure:   return "ExternalToolFailure";
        case DiagCode::UnknownOption:         return "UnknownOption";
    }
    return "Unknown";
}

/**
 * Position in the (preprocessed) source; line 0 means "no location"
 */
struct SourceLoc {
    int line = 0;
    int column = 0;

    bool valid() const { return line > 0; }
};

struct Diagnostic {
    Severity severity = Severity::Error;
    DiagCode code = DiagCode::SyntaxInput;
    std::string message;
    SourceLoc loc;

    Diagnostic() = default;
    Diagnostic(Severity s, DiagCode c, std::string msg, SourceLoc l = {})
        : severity(s), code(c), message(std::move(msg)), loc(l) {}

    bool isError() const {
        return severity == Severity::Error || severity == Severity::Fatal;
    }

    /**
     * file:line:col: severity: [Code] message
     */
    std::string format(const std::string& file = "") const {
        std::ostringstream oss;
        if (!file.empty()) {
            oss << file << ":";
        }
        if (loc.valid()) {
            oss << loc.line << ":" << loc.column << ":";
        }
        if (!file.empty() || loc.valid()) {
            oss << " ";
        }
        oss << severityToString(severity) << ": [" << diagCodeToString(code) << "] " << message;
        return oss.str();
    }
};

/**
 * Ordered diagnostic collection
 */
class DiagnosticList {
public:
    void add(Diagnostic d) { items_.push_back(std::move(d)); }

    void note(DiagCode c, const std::string& msg, SourceLoc loc = {}) {
        add(Diagnostic(Severity::Note, c, msg, loc));
    }

    void warning(DiagCode c, const std::string& msg, SourceLoc loc = {}) {
        add(Diagnostic(Severity::Warning, c, msg, loc));
    }

    void error(DiagCode c, const std::string& msg, SourceLoc loc = {}) {
        add(Diagnostic(Severity::Error, c, msg, loc));
    }

    void fatal(DiagCode c, const std::string& msg, SourceLoc loc = {}) {
        add(Diagnostic(Severity::Fatal, c, msg, loc));
    }

    void append(const DiagnosticList& other) {
        items_.insert(items_.end(), other.items_.begin(), other.items_.end());
    }

    bool hasErrors() const {
        return std::any_of(items_.begin(), items_.end(),
                           [](const Diagnostic& d) { return d.isError(); });
    }

    bool contains(DiagCode code) const {
        return std::any_of(items_.begin(), items_.end(),
                           [code](const Diagnostic& d) { return d.code == code; });
    }

    size_t count(Severity s) const {
        return static_cast<size_t>(std::count_if(items_.begin(), items_.end(),
            [s](const Diagnostic& d) { return d.severity == s; }));
    }

    const Diagnostic* firstError() const {
        for (const auto& d : items_) {
            if (d.isError()) return &d;
        }
        return nullptr;
    }

    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    const Diagnostic& operator[](size_t i) const { return items_[i]; }

    std::vector<Diagnostic>::const_iterator begin() const { return items_.begin(); }
    std::vector<Diagnostic>::const_iterator end() const { return items_.end(); }

private:
    std::vector<Diagnostic> items_;
};

/**
 * Thrown for problems in the user's program
 */
class CompileError : public std::runtime_error {
public:
    explicit CompileError(Diagnostic d)
        : std::runtime_error(d.message), diagnostic_(std::move(d)) {}

    CompileError(DiagCode code, const std::string& msg, SourceLoc loc = {})
        : CompileError(Diagnostic(Severity::Error, code, msg, loc)) {}

    const Diagnostic& diagnostic() const { return diagnostic_; }

private:
    Diagnostic diagnostic_;
};

/**
 * Thrown when a transformation breaks an invariant it promised to keep
 */
class InternalError : public std::logic_error {
public:
    explicit InternalError(const std::string& msg) : std::logic_error(msg) {}

    Diagnostic toDiagnostic() const {
        return Diagnostic(Severity::Fatal, DiagCode::InternalInconsistency, what());
    }
};

} // namespace cloak

#endif // CLOAK_DIAGNOSTICS_HPP
