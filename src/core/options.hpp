/**
 * Cloak - Obfuscating C Compiler
 *
 * options.hpp - Compiler configuration
 *
 * Defaults match a plain compile: no optimization, no obfuscation.
 * A JSON file may carry four sections:
 *
 *   {
 *     "optimization": { "level": "basic", "inline_threshold": 10,
 *                       "constant_folding": true, "dead_code_elimination": true },
 *     "obfuscation":  { "level": "aggressive", "variable_rename_style": "hex",
 *                       "string_encryption": true, "control_flow_flattening": true,
 *                       "opaque_predicates": true, "dead_code_insertion_ratio": 0.2,
 *                       "opaque_predicate_complexity": "medium", "seed": 42 },
 *     "output":       { "format": "asm", "debug_info": false },
 *     "preprocessor": { "include_paths": ["inc"], "defines": {"DEBUG": null},
 *                       "keep_comments": false }
 *   }
 *
 * Unknown keys and values of the wrong type are UnknownOption warnings.
 */

#ifndef CLOAK_OPTIONS_HPP
#define CLOAK_OPTIONS_HPP

#include "diagnostics.hpp"
#include "../common/json_parser.hpp"
#include "../common/logging.hpp"
#include "../frontend/preprocessor.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cloak {

enum class OptLevel { None, Basic, Full };
enum class ObfLevel { None, Basic, Aggressive };
enum class RenameStyle { Random, Hex, Sequential, Confusable };
enum class PredicateComplexity { Low, Medium, High };

namespace detail {

inline std::string lowered(const std::string& s) {
    std::string out;
    for (char c : s) out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

} // namespace detail

inline std::optional<OptLevel> parseOptLevel(const std::string& s) {
    std::string v = detail::lowered(s);
    if (v == "none" || v == "0") return OptLevel::None;
    if (v == "basic" || v == "1") return OptLevel::Basic;
    if (v == "full" || v == "2") return OptLevel::Full;
    return std::nullopt;
}

inline std::optional<ObfLevel> parseObfLevel(const std::string& s) {
    std::string v = detail::lowered(s);
    if (v == "none" || v == "0") return ObfLevel::None;
    if (v == "basic" || v == "1") return ObfLevel::Basic;
    if (v == "aggressive" || v == "2") return ObfLevel::Aggressive;
    return std::nullopt;
}

inline std::optional<RenameStyle> parseRenameStyle(const std::string& s) {
    std::string v = detail::lowered(s);
    if (v == "random") return RenameStyle::Random;
    if (v == "hex") return RenameStyle::Hex;
    if (v == "sequential") return RenameStyle::Sequential;
    if (v == "confusable") return RenameStyle::Confusable;
    return std::nullopt;
}

inline std::optional<PredicateComplexity> parsePredicateComplexity(const std::string& s) {
    std::string v = detail::lowered(s);
    if (v == "low") return PredicateComplexity::Low;
    if (v == "medium") return PredicateComplexity::Medium;
    if (v == "high") return PredicateComplexity::High;
    return std::nullopt;
}

struct CompilerOptions {
    // optimization
    OptLevel optimization = OptLevel::None;
    int inline_threshold = 10;
    bool constant_folding = true;
    bool dead_code_elimination = true;

    // obfuscation
    ObfLevel obfuscation = ObfLevel::None;
    RenameStyle rename_style = RenameStyle::Random;
    bool string_encryption = true;
    bool control_flow_flattening = true;
    bool opaque_predicates = true;
    bool expression_complication = true;
    double dead_code_insertion_ratio = 0.2;
    PredicateComplexity predicate_complexity = PredicateComplexity::Medium;
    double complication_probability = 0.5;
    double opaque_predicate_probability = 0.3;
    std::vector<std::string> include_functions;   // only these, when non-empty
    std::vector<std::string> exclude_functions;

    uint64_t seed = 0;

    // output
    bool emit_source = false;
    bool debug_info = false;   // accepted for compatibility; no debug sections are emitted

    // preprocessor
    bool preprocess = true;
    frontend::PreprocessorConfig preprocessor;

    bool optimizing() const { return optimization != OptLevel::None; }
    bool obfuscating() const { return obfuscation != ObfLevel::None; }

    /**
     * Reads a JSON configuration file. Parse failures are logged and
     * reported as an UnknownOption error; the options keep their values.
     */
    bool loadFromFile(const std::string& path, DiagnosticList& diags) {
        try {
            JsonValue json = JsonParser::parseFile(path);
            return loadFromJson(json, diags);
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to load config: {}", e.what());
            diags.error(DiagCode::UnknownOption, "cannot load configuration '" + path + "': " + e.what());
            return false;
        }
    }

    bool loadFromJson(const JsonValue& json, DiagnosticList& diags) {
        if (!json.isObject()) {
            diags.error(DiagCode::UnknownOption, "configuration must be a JSON object");
            return false;
        }
        for (const auto& key : json.keys()) {
            const JsonValue& section = json[key];
            if (key == "optimization") {
                loadOptimization(section, diags);
            } else if (key == "obfuscation") {
                loadObfuscation(section, diags);
            } else if (key == "output") {
                loadOutput(section, diags);
            } else if (key == "preprocessor") {
                loadPreprocessor(section, diags);
            } else {
                unknown(diags, key);
            }
        }
        return true;
    }

private:
    static void unknown(DiagnosticList& diags, const std::string& key) {
        diags.warning(DiagCode::UnknownOption, "unknown configuration option '" + key + "'");
    }

    static void badValue(DiagnosticList& diags, const std::string& key, const char* expected) {
        diags.warning(DiagCode::UnknownOption, "ignoring '" + key + "': expected " + expected);
    }

    static bool readBool(const JsonValue& v, const std::string& key, bool& out, DiagnosticList& diags) {
        if (!v.isBool()) {
            badValue(diags, key, "a boolean");
            return false;
        }
        out = v.bool_value;
        return true;
    }

    template<typename T, typename Parse>
    static void readEnum(const JsonValue& v, const std::string& key, T& out, Parse parse,
                         DiagnosticList& diags) {
        auto parsed = v.isString() ? parse(v.string_value) : std::nullopt;
        if (!parsed) {
            badValue(diags, key, "a known level or style name");
            return;
        }
        out = *parsed;
    }

    bool checkSection(const JsonValue& section, const std::string& name, DiagnosticList& diags) {
        if (!section.isObject()) {
            badValue(diags, name, "an object");
            return false;
        }
        return true;
    }

    void loadOptimization(const JsonValue& section, DiagnosticList& diags) {
        if (!checkSection(section, "optimization", diags)) return;
        for (const auto& key : section.keys()) {
            const JsonValue& v = section[key];
            std::string full = "optimization." + key;
            if (key == "level") {
                readEnum(v, full, optimization, parseOptLevel, diags);
            } else if (key == "inline_threshold") {
                if (v.isNumber() && v.number_value >= 0) inline_threshold = v.asInt();
                else badValue(diags, full, "a non-negative number");
            } else if (key == "constant_folding") {
                readBool(v, full, constant_folding, diags);
            } else if (key == "dead_code_elimination") {
                readBool(v, full, dead_code_elimination, diags);
            } else {
                unknown(diags, full);
            }
        }
    }

    void loadObfuscation(const JsonValue& section, DiagnosticList& diags) {
        if (!checkSection(section, "obfuscation", diags)) return;
        for (const auto& key : section.keys()) {
            const JsonValue& v = section[key];
            std::string full = "obfuscation." + key;
            if (key == "level") {
                readEnum(v, full, obfuscation, parseObfLevel, diags);
            } else if (key == "variable_rename_style") {
                readEnum(v, full, rename_style, parseRenameStyle, diags);
            } else if (key == "opaque_predicate_complexity") {
                readEnum(v, full, predicate_complexity, parsePredicateComplexity, diags);
            } else if (key == "string_encryption") {
                readBool(v, full, string_encryption, diags);
            } else if (key == "control_flow_flattening") {
                readBool(v, full, control_flow_flattening, diags);
            } else if (key == "opaque_predicates") {
                readBool(v, full, opaque_predicates, diags);
            } else if (key == "expression_complication") {
                readBool(v, full, expression_complication, diags);
            } else if (key == "dead_code_insertion_ratio" || key == "complication_probability" ||
                       key == "opaque_predicate_probability") {
                if (!v.isNumber() || v.number_value < 0.0 || v.number_value > 1.0) {
                    badValue(diags, full, "a number in [0, 1]");
                    continue;
                }
                if (key == "dead_code_insertion_ratio") dead_code_insertion_ratio = v.number_value;
                else if (key == "complication_probability") complication_probability = v.number_value;
                else opaque_predicate_probability = v.number_value;
            } else if (key == "seed") {
                if (v.isNumber() && v.number_value >= 0) seed = static_cast<uint64_t>(v.number_value);
                else badValue(diags, full, "a non-negative number");
            } else if (key == "include_functions") {
                include_functions = v.asStringArray();
            } else if (key == "exclude_functions") {
                exclude_functions = v.asStringArray();
            } else {
                unknown(diags, full);
            }
        }
    }

    void loadOutput(const JsonValue& section, DiagnosticList& diags) {
        if (!checkSection(section, "output", diags)) return;
        for (const auto& key : section.keys()) {
            const JsonValue& v = section[key];
            std::string full = "output." + key;
            if (key == "format") {
                std::string f = detail::lowered(v.asString());
                if (f == "asm" || f == "assembly") emit_source = false;
                else if (f == "c" || f == "source") emit_source = true;
                else badValue(diags, full, "\"asm\" or \"c\"");
            } else if (key == "debug_info") {
                readBool(v, full, debug_info, diags);
            } else {
                unknown(diags, full);
            }
        }
    }

    void loadPreprocessor(const JsonValue& section, DiagnosticList& diags) {
        if (!checkSection(section, "preprocessor", diags)) return;
        for (const auto& key : section.keys()) {
            const JsonValue& v = section[key];
            std::string full = "preprocessor." + key;
            if (key == "include_paths") {
                auto paths = v.asStringArray();
                preprocessor.include_paths.insert(preprocessor.include_paths.end(),
                                                  paths.begin(), paths.end());
            } else if (key == "defines") {
                if (!v.isObject()) {
                    badValue(diags, full, "an object");
                    continue;
                }
                for (const auto& name : v.keys()) {
                    const JsonValue& value = v[name];
                    if (value.isNull()) {
                        preprocessor.defines.emplace_back(name, std::nullopt);
                    } else if (value.isString()) {
                        preprocessor.defines.emplace_back(name, value.string_value);
                    } else if (value.isNumber()) {
                        preprocessor.defines.emplace_back(name, std::to_string(value.asInt()));
                    } else {
                        badValue(diags, full + "." + name, "a string, number or null");
                    }
                }
            } else if (key == "keep_comments") {
                bool keep = false;
                if (readBool(v, full, keep, diags) && keep) {
                    preprocessor.extra_flags.push_back("-C");
                }
            } else if (key == "enabled") {
                readBool(v, full, preprocess, diags);
            } else if (key == "tool") {
                if (v.isString() && !v.string_value.empty()) preprocessor.tool = v.string_value;
                else badValue(diags, full, "a program name");
            } else if (key == "timeout_ms") {
                if (v.isNumber() && v.number_value > 0) preprocessor.timeout_ms = v.asInt();
                else badValue(diags, full, "a positive number");
            } else {
                unknown(diags, full);
            }
        }
    }
};

} // namespace cloak

#endif // CLOAK_OPTIONS_HPP
