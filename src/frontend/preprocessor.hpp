/**
 * Cloak - Obfuscating C Compiler
 *
 * preprocessor.hpp - Bridge to the system C preprocessor
 *
 * Runs cpp (or "gcc -E") as a child process and collects its output.
 * A missing tool, a non-zero exit status, a timeout or a failure to read
 * the child's output is reported as a fatal ExternalToolFailure; nothing
 * is retried.
 */

#ifndef CLOAK_PREPROCESSOR_HPP
#define CLOAK_PREPROCESSOR_HPP

#include "../core/diagnostics.hpp"
#include "../common/logging.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cloak {
namespace frontend {

struct PreprocessorConfig {
    std::vector<std::string> include_paths;
    // NAME or NAME=VALUE
    std::vector<std::pair<std::string, std::optional<std::string>>> defines;
    std::vector<std::string> extra_flags;
    std::string tool = "cpp";     // "gcc" or "cc" runs with -E
    bool target_i386 = true;      // pass -m32 so headers match the target
    int timeout_ms = 30000;
};

struct PreprocessResult {
    bool success = false;
    std::string output;
    DiagnosticList diagnostics;
};

class Preprocessor {
public:
    explicit Preprocessor(PreprocessorConfig config = {});

    PreprocessResult preprocessFile(const std::string& path) const;

    /**
     * Writes the text to a temporary file and preprocesses that
     */
    PreprocessResult preprocessString(const std::string& source) const;

    /**
     * The argument vector used for an input file
     */
    std::vector<std::string> buildCommand(const std::string& input) const;

    /**
     * True if the configured tool can be executed
     */
    bool isAvailable() const;

    const PreprocessorConfig& config() const { return config_; }

    struct ProcessOutput {
        int status = -1;
        bool timed_out = false;
        bool exec_failed = false;
        std::string io_error;   // set when the child's output could not be collected
        std::string out;
        std::string err;
    };

    /**
     * Turns a finished child process into a result; output is accepted
     * only from a clean exit with everything read
     */
    PreprocessResult interpret(ProcessOutput proc, const std::string& path) const;

private:
    PreprocessorConfig config_;
    // written to from the const run methods
    mutable Logger logger_{"Preprocessor"};

    ProcessOutput runProcess(const std::vector<std::string>& args) const;
};

} // namespace frontend
} // namespace cloak

#endif // CLOAK_PREPROCESSOR_HPP
