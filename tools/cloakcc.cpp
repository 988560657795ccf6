/**
 * Cloak - Obfuscating C Compiler
 *
 * cloakcc.cpp - Command line driver
 *
 *   cloakcc [options] <input.c>
 *
 * Exit status: 0 on success, 1 when compilation failed, 2 on bad usage.
 */

#include "cloak.hpp"

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace cloak;

namespace {

void printUsage(const char* program) {
    std::cout << getBanner() << std::endl;
    std::cout << "Usage: " << program << " [options] <input.c>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -o <file>                  Output file (default: stdout)" << std::endl;
    std::cout << "  -O<level>, -O <level>      Optimization: 0/none, 1/basic, 2/full" << std::endl;
    std::cout << "  --obfuscate <level>        Obfuscation: none, basic, aggressive" << std::endl;
    std::cout << "  --config <file>            Configuration file (JSON)" << std::endl;
    std::cout << "  --seed <n>                 Seed for every random choice" << std::endl;
    std::cout << "  --emit-source              Write the transformed C instead of assembly" << std::endl;
    std::cout << std::endl;
    std::cout << "  --no-string-encryption     Keep string literals in plaintext" << std::endl;
    std::cout << "  --no-flattening            Skip control flow flattening" << std::endl;
    std::cout << "  --no-opaque-predicates     Skip opaque predicate insertion" << std::endl;
    std::cout << "  --no-mba                   Skip expression complication" << std::endl;
    std::cout << "  --dead-code-ratio <r>      Dead code insertion ratio in [0, 1]" << std::endl;
    std::cout << "  --rename-style <s>         random, hex, sequential, confusable" << std::endl;
    std::cout << "  --predicate-complexity <c> low, medium, high" << std::endl;
    std::cout << "  --inline-threshold <n>     Largest function inlined (statements)" << std::endl;
    std::cout << "  --no-constant-folding      Skip constant folding" << std::endl;
    std::cout << "  --no-dce                   Skip dead code elimination" << std::endl;
    std::cout << std::endl;
    std::cout << "  -I <dir>, -I<dir>          Preprocessor include path" << std::endl;
    std::cout << "  -D <name[=value]>          Preprocessor macro" << std::endl;
    std::cout << "  --no-preprocess            Input is already preprocessed" << std::endl;
    std::cout << std::endl;
    std::cout << "  --stats                    Print pass statistics to stderr" << std::endl;
    std::cout << "  -v, --verbose              Log progress (repeat for more)" << std::endl;
    std::cout << "  --quiet                    Print errors only" << std::endl;
    std::cout << "  --version                  Print the version" << std::endl;
    std::cout << "  --help                     Show this help" << std::endl;
}

bool parseNumber(const std::string& text, double& out) {
    try {
        size_t used = 0;
        out = std::stod(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

void addDefine(CompilerOptions& options, const std::string& spec) {
    auto eq = spec.find('=');
    if (eq == std::string::npos) {
        options.preprocessor.defines.emplace_back(spec, std::nullopt);
    } else {
        options.preprocessor.defines.emplace_back(spec.substr(0, eq), spec.substr(eq + 1));
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    CompilerOptions options;
    DiagnosticList option_diags;

    // the configuration file comes first so flags override it
    for (size_t i = 0; i + 1 < args.size(); i++) {
        if (args[i] == "--config" && !options.loadFromFile(args[i + 1], option_diags)) {
            for (const auto& d : option_diags) std::cerr << d.format() << std::endl;
            return 2;
        }
    }

    std::string input_file;
    std::string output_file;
    bool print_stats = false;
    bool quiet = false;
    int verbosity = 0;

    auto value = [&](size_t& i, const std::string& flag) -> const std::string* {
        if (i + 1 >= args.size()) {
            std::cerr << "cloakcc: missing value after '" << flag << "'" << std::endl;
            return nullptr;
        }
        return &args[++i];
    };

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version") {
            std::cout << "cloakcc " << getVersion() << std::endl;
            return 0;
        } else if (arg == "--config") {
            i++;
        } else if (arg == "-o") {
            const std::string* v = value(i, arg);
            if (!v) return 2;
            output_file = *v;
        } else if (arg.rfind("-O", 0) == 0) {
            std::string level = arg.size() > 2 ? arg.substr(2) : "";
            if (level.empty()) {
                const std::string* v = value(i, arg);
                if (!v) return 2;
                level = *v;
            }
            auto parsed = parseOptLevel(level);
            if (!parsed) {
                std::cerr << "cloakcc: unknown optimization level '" << level << "'" << std::endl;
                return 2;
            }
            options.optimization = *parsed;
        } else if (arg == "--obfuscate") {
            const std::string* v = value(i, arg);
            if (!v) return 2;
            auto parsed = parseObfLevel(*v);
            if (!parsed) {
                std::cerr << "cloakcc: unknown obfuscation level '" << *v << "'" << std::endl;
                return 2;
            }
            options.obfuscation = *parsed;
        } else if (arg == "--seed") {
            const std::string* v = value(i, arg);
            double n = 0;
            if (!v || !parseNumber(*v, n) || n < 0) {
                std::cerr << "cloakcc: --seed expects a non-negative number" << std::endl;
                return 2;
            }
            options.seed = static_cast<uint64_t>(n);
        } else if (arg == "--emit-source") {
            options.emit_source = true;
        } else if (arg == "--no-string-encryption") {
            options.string_encryption = false;
        } else if (arg == "--no-flattening") {
            options.control_flow_flattening = false;
        } else if (arg == "--no-opaque-predicates") {
            options.opaque_predicates = false;
        } else if (arg == "--no-mba") {
            options.expression_complication = false;
        } else if (arg == "--dead-code-ratio") {
            const std::string* v = value(i, arg);
            double r = 0;
            if (!v || !parseNumber(*v, r) || r < 0.0 || r > 1.0) {
                std::cerr << "cloakcc: --dead-code-ratio expects a number in [0, 1]" << std::endl;
                return 2;
            }
            options.dead_code_insertion_ratio = r;
        } else if (arg == "--rename-style") {
            const std::string* v = value(i, arg);
            auto parsed = v ? parseRenameStyle(*v) : std::nullopt;
            if (!parsed) {
                std::cerr << "cloakcc: unknown rename style" << std::endl;
                return 2;
            }
            options.rename_style = *parsed;
        } else if (arg == "--predicate-complexity") {
            const std::string* v = value(i, arg);
            auto parsed = v ? parsePredicateComplexity(*v) : std::nullopt;
            if (!parsed) {
                std::cerr << "cloakcc: unknown predicate complexity" << std::endl;
                return 2;
            }
            options.predicate_complexity = *parsed;
        } else if (arg == "--inline-threshold") {
            const std::string* v = value(i, arg);
            double n = 0;
            if (!v || !parseNumber(*v, n) || n < 0) {
                std::cerr << "cloakcc: --inline-threshold expects a non-negative number" << std::endl;
                return 2;
            }
            options.inline_threshold = static_cast<int>(n);
        } else if (arg == "--no-constant-folding") {
            options.constant_folding = false;
        } else if (arg == "--no-dce") {
            options.dead_code_elimination = false;
        } else if (arg.rfind("-I", 0) == 0) {
            std::string dir = arg.substr(2);
            if (dir.empty()) {
                const std::string* v = value(i, arg);
                if (!v) return 2;
                dir = *v;
            }
            options.preprocessor.include_paths.push_back(dir);
        } else if (arg.rfind("-D", 0) == 0) {
            std::string def = arg.substr(2);
            if (def.empty()) {
                const std::string* v = value(i, arg);
                if (!v) return 2;
                def = *v;
            }
            addDefine(options, def);
        } else if (arg == "--no-preprocess") {
            options.preprocess = false;
        } else if (arg == "--stats") {
            print_stats = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verbosity++;
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (!arg.empty() && arg[0] != '-') {
            if (!input_file.empty()) {
                std::cerr << "cloakcc: only one input file is supported" << std::endl;
                return 2;
            }
            input_file = arg;
        } else {
            std::cerr << "cloakcc: unknown option '" << arg << "'" << std::endl;
            return 2;
        }
    }

    if (input_file.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    if (quiet) {
        LogConfig::get().setLevel(LogLevel::Error);
    } else if (verbosity > 0) {
        LogConfig::get().setLevel(verbosity == 1 ? LogLevel::Info
                                  : verbosity == 2 ? LogLevel::Debug : LogLevel::Trace);
    }

    for (const auto& d : option_diags) {
        if (!quiet || d.isError()) std::cerr << d.format() << std::endl;
    }

    LOG_INFO("compiling {}", input_file);
    Compiler compiler(options);
    CompileResult result = compiler.compileFile(input_file);

    for (const auto& d : result.diagnostics) {
        if (!quiet || d.isError()) std::cerr << d.format(input_file) << std::endl;
    }
    if (print_stats) {
        std::cerr << result.statistics.format();
    }
    if (!result.success) return 1;

    if (output_file.empty() || output_file == "-") {
        std::cout << result.output;
        return 0;
    }
    std::ofstream out(output_file);
    if (!out.is_open()) {
        LOG_ERROR("Cannot create output file: {}", output_file);
        std::cerr << "cloakcc: cannot write '" << output_file << "'" << std::endl;
        return 1;
    }
    out << result.output;
    LOG_INFO("Wrote {} bytes to {}", result.output.size(), output_file);
    return 0;
}
