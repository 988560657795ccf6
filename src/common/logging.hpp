/**
 * Cloak - Obfuscating C Compiler
 *
 * logging.hpp - Component loggers with verbosity levels
 *
 * The library never prints on its own: the default level is Silent and
 * the host (cloakcc, a test) raises it when it wants to see pass traces.
 *
 * Features:
 *   - Levels Trace through Error, plus Silent
 *   - stderr, file or callback sinks
 *   - Colored level tags for terminals
 *   - {} placeholder formatting
 */

#ifndef CLOAK_LOGGING_HPP
#define CLOAK_LOGGING_HPP

#include <string>
#include <sstream>
#include <iostream>
#include <fstream>
#include <functional>
#include <mutex>
#include <memory>
#include <chrono>
#include <ctime>
#include <cctype>
#include <iomanip>

namespace cloak {

/**
 * Log levels in order of severity
 */
enum class LogLevel {
    Trace = 0,    // per-node decisions inside a pass
    Debug = 1,    // per-function decisions, chosen variants
    Info = 2,     // stage started/completed
    Warn = 3,     // recoverable oddities
    Error = 4,    // stage failures
    Silent = 5
};

inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Silent: return "SILENT";
    }
    return "UNKNOWN";
}

namespace colors {
    constexpr const char* Reset   = "\033[0m";
    constexpr const char* Red     = "\033[31m";
    constexpr const char* Green   = "\033[32m";
    constexpr const char* Yellow  = "\033[33m";
    constexpr const char* Cyan    = "\033[36m";
    constexpr const char* Bold    = "\033[1m";
    constexpr const char* Dim     = "\033[2m";
}

inline const char* logLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return colors::Dim;
        case LogLevel::Debug: return colors::Cyan;
        case LogLevel::Info:  return colors::Green;
        case LogLevel::Warn:  return colors::Yellow;
        case LogLevel::Error: return colors::Red;
        default: return colors::Reset;
    }
}

/**
 * Process-wide logging configuration
 *
 * Only presentation lives here. Compilation state (seeds, counters)
 * is per CompileContext.
 */
class LogConfig {
public:
    static LogConfig& get() {
        static LogConfig instance;
        return instance;
    }

    LogLevel minLevel = LogLevel::Silent;
    bool useColors = false;
    bool showTimestamp = false;
    bool showLevel = true;
    bool showSource = true;
    std::ostream* output = &std::cerr;
    std::unique_ptr<std::ofstream> fileOutput;
    std::function<void(LogLevel, const std::string&, const std::string&)> callback;

    void setLevel(LogLevel level) {
        minLevel = level;
    }

    /**
     * 0=Trace ... 5=Silent, clamped
     */
    void setLevel(int level) {
        if (level < 0) level = 0;
        if (level > 5) level = 5;
        minLevel = static_cast<LogLevel>(level);
    }

    /**
     * Accepts the lowercase or uppercase level name. Returns false and
     * leaves the level alone for anything else.
     */
    bool setLevel(const std::string& level) {
        static const std::pair<const char*, LogLevel> names[] = {
            {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug},
            {"info", LogLevel::Info},   {"warn", LogLevel::Warn},
            {"error", LogLevel::Error}, {"silent", LogLevel::Silent},
        };
        std::string lower;
        for (char c : level) {
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        for (const auto& [name, value] : names) {
            if (lower == name) {
                minLevel = value;
                return true;
            }
        }
        return false;
    }

    bool setOutputFile(const std::string& path) {
        fileOutput = std::make_unique<std::ofstream>(path);
        if (fileOutput->is_open()) {
            output = fileOutput.get();
            useColors = false;
            return true;
        }
        fileOutput.reset();
        return false;
    }

    /**
     * Back to the library defaults (silent, stderr, no callback)
     */
    void reset() {
        minLevel = LogLevel::Silent;
        useColors = false;
        showTimestamp = false;
        showLevel = true;
        showSource = true;
        fileOutput.reset();
        output = &std::cerr;
        callback = nullptr;
    }

private:
    LogConfig() = default;
};

/**
 * Logger - one per component or pass
 */
class Logger {
public:
    explicit Logger(const std::string& source = "cloak")
        : source_(source) {}

    template<typename... Args>
    void log(LogLevel level, const std::string& format, Args&&... args) {
        auto& config = LogConfig::get();
        if (level < config.minLevel) return;

        writeLog(level, formatString(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void trace(const std::string& format, Args&&... args) {
        log(LogLevel::Trace, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        log(LogLevel::Debug, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        log(LogLevel::Info, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& format, Args&&... args) {
        log(LogLevel::Warn, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        log(LogLevel::Error, format, std::forward<Args>(args)...);
    }

    bool enabled(LogLevel level) const {
        return level >= LogConfig::get().minLevel;
    }

    const std::string& source() const { return source_; }

    void setSource(const std::string& source) {
        source_ = source;
    }

private:
    std::string source_;
    static std::mutex mutex_;

    template<typename T>
    static std::string toString(const T& value) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }

    static std::string formatString(const std::string& format) {
        return format;
    }

    // replaces the next {} with value, recursing on the remainder
    template<typename T, typename... Rest>
    static std::string formatString(const std::string& format, T&& value, Rest&&... rest) {
        size_t placeholder = format.find("{}");
        if (placeholder == std::string::npos) {
            return format;
        }

        std::string result = format.substr(0, placeholder);
        result += toString(std::forward<T>(value));
        result += formatString(format.substr(placeholder + 2), std::forward<Rest>(rest)...);
        return result;
    }

    void writeLog(LogLevel level, const std::string& message) {
        auto& config = LogConfig::get();
        std::ostringstream oss;

        if (config.showTimestamp) {
            auto now = std::chrono::system_clock::now();
            auto time = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;

            oss << std::put_time(std::localtime(&time), "%H:%M:%S");
            oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << " ";
        }

        if (config.showLevel) {
            if (config.useColors) oss << logLevelColor(level);
            oss << "[" << std::setw(5) << std::setfill(' ') << logLevelToString(level) << "]";
            if (config.useColors) oss << colors::Reset;
            oss << " ";
        }

        if (config.showSource && !source_.empty()) {
            if (config.useColors) oss << colors::Bold;
            oss << "[" << source_ << "]";
            if (config.useColors) oss << colors::Reset;
            oss << " ";
        }

        oss << message;

        std::lock_guard<std::mutex> lock(mutex_);
        if (config.output) {
            *config.output << oss.str() << std::endl;
        }
        if (config.callback) {
            config.callback(level, source_, message);
        }
    }
};

inline std::mutex Logger::mutex_;

#define CLOAK_LOG(logger, level, ...) \
    logger.log(level, __VA_ARGS__)

#define CLOAK_TRACE(logger, ...) logger.trace(__VA_ARGS__)
#define CLOAK_DEBUG(logger, ...) logger.debug(__VA_ARGS__)
#define CLOAK_INFO(logger, ...)  logger.info(__VA_ARGS__)
#define CLOAK_WARN(logger, ...)  logger.warn(__VA_ARGS__)
#define CLOAK_ERROR(logger, ...) logger.error(__VA_ARGS__)

/**
 * Shared logger for code that has no component of its own
 */
inline Logger& globalLogger() {
    static Logger instance("cloak");
    return instance;
}

#define LOG_TRACE(...) cloak::globalLogger().trace(__VA_ARGS__)
#define LOG_DEBUG(...) cloak::globalLogger().debug(__VA_ARGS__)
#define LOG_INFO(...)  cloak::globalLogger().info(__VA_ARGS__)
#define LOG_WARN(...)  cloak::globalLogger().warn(__VA_ARGS__)
#define LOG_ERROR(...) cloak::globalLogger().error(__VA_ARGS__)

} // namespace cloak

#endif // CLOAK_LOGGING_HPP
