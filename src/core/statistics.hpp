/**
 * Cloak - Obfuscating C Compiler
 *
 * statistics.hpp - Per-compilation counters and timings
 *
 * Counters are named "<pass>.<what>" (e.g. "flatten.functions_flattened");
 * pass timings are kept as "<pass>" in the timing table. Storage is
 * ordered so reports come out the same on every run.
 */

#ifndef CLOAK_STATISTICS_HPP
#define CLOAK_STATISTICS_HPP

#include <chrono>
#include <iomanip>
#include <map>
#include <sstream>
#include <string>

namespace cloak {

/**
 * Wall-clock stopwatch in milliseconds
 */
class Timer {
public:
    void start() {
        start_time_ = std::chrono::steady_clock::now();
        running_ = true;
    }

    void stop() {
        if (running_) {
            end_time_ = std::chrono::steady_clock::now();
            running_ = false;
        }
    }

    double elapsedMs() const {
        auto end = running_ ? std::chrono::steady_clock::now() : end_time_;
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(end - start_time_);
        return static_cast<double>(us.count()) / 1000.0;
    }

private:
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point end_time_;
    bool running_ = false;
};

/**
 * Adds the lifetime of the scope to a millisecond accumulator
 */
class ScopedTimer {
public:
    explicit ScopedTimer(double& target) : target_(target) {
        timer_.start();
    }

    ~ScopedTimer() {
        timer_.stop();
        target_ += timer_.elapsedMs();
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Timer timer_;
    double& target_;
};

class Statistics {
public:
    void set(const std::string& name, int value) { counters_[name] = value; }

    void increment(const std::string& name, int amount = 1) {
        counters_[name] += amount;
    }

    // returns 0 for counters never touched
    int get(const std::string& name) const {
        auto it = counters_.find(name);
        return it != counters_.end() ? it->second : 0;
    }

    bool has(const std::string& name) const {
        return counters_.count(name) != 0;
    }

    /**
     * Accumulator for a timing row; pair with ScopedTimer
     */
    double& timing(const std::string& name) { return timings_[name]; }

    double getTiming(const std::string& name) const {
        auto it = timings_.find(name);
        return it != timings_.end() ? it->second : 0.0;
    }

    const std::map<std::string, int>& counters() const { return counters_; }
    const std::map<std::string, double>& timings() const { return timings_; }

    bool empty() const { return counters_.empty() && timings_.empty(); }

    /**
     * Counters add up, timings add up
     */
    void merge(const Statistics& other) {
        for (const auto& [name, value] : other.counters_) {
            counters_[name] += value;
        }
        for (const auto& [name, value] : other.timings_) {
            timings_[name] += value;
        }
    }

    /**
     * Folds a pass-local counter set in under "<prefix>.<name>"
     */
    void mergePrefixed(const std::string& prefix, const std::map<std::string, int>& local) {
        for (const auto& [name, value] : local) {
            counters_[prefix + "." + name] += value;
        }
    }

    void clear() {
        counters_.clear();
        timings_.clear();
    }

    /**
     * Sum of every prefixed counter
     */
    int totalTransformations() const {
        int total = 0;
        for (const auto& [name, value] : counters_) {
            if (name.find('.') != std::string::npos) total += value;
        }
        return total;
    }

    /**
     * Human-readable report grouped by pass
     */
    std::string format() const {
        std::ostringstream oss;
        oss << "=== Cloak Compilation Statistics ===\n";

        std::string current;
        for (const auto& [name, value] : counters_) {
            size_t dot = name.find('.');
            std::string group = dot == std::string::npos ? "general" : name.substr(0, dot);
            std::string field = dot == std::string::npos ? name : name.substr(dot + 1);
            if (group != current) {
                oss << "\n[" << group << "]\n";
                current = group;
            }
            oss << "  " << std::setw(32) << std::left << field << ": " << value << "\n";
        }

        if (!timings_.empty()) {
            oss << "\n[timing]\n";
            for (const auto& [name, ms] : timings_) {
                oss << "  " << std::setw(32) << std::left << name << ": "
                    << std::fixed << std::setprecision(2) << ms << " ms\n";
            }
        }

        oss << "\nTotal transformations: " << totalTransformations() << "\n";
        return oss.str();
    }

    std::string toJson() const {
        std::ostringstream oss;
        oss << "{\n  \"counters\": {";
        bool first = true;
        for (const auto& [name, value] : counters_) {
            oss << (first ? "\n" : ",\n") << "    \"" << name << "\": " << value;
            first = false;
        }
        oss << (first ? "}" : "\n  }") << ",\n  \"timings_ms\": {";
        first = true;
        for (const auto& [name, ms] : timings_) {
            oss << (first ? "\n" : ",\n") << "    \"" << name << "\": "
                << std::fixed << std::setprecision(4) << ms;
            first = false;
        }
        oss << (first ? "}" : "\n  }") << "\n}\n";
        return oss.str();
    }

private:
    std::map<std::string, int> counters_;
    std::map<std::string, double> timings_;
};

} // namespace cloak

#endif // CLOAK_STATISTICS_HPP
