/*
 * random.hpp
 *
 * seedable RNG; every compilation owns one through its CompileContext,
 * so the same seed and input always give the same output
 */

#ifndef CLOAK_RANDOM_HPP
#define CLOAK_RANDOM_HPP

#include <random>
#include <mutex>
#include <cstdint>
#include <string>
#include <vector>
#include <stdexcept>

namespace cloak {

class Random {
public:
    explicit Random(uint64_t seed = 0) : rng_(seed), seed_(seed) {}

    Random(const Random&) = delete;
    Random& operator=(const Random&) = delete;

    uint64_t getSeed() const { return seed_; }

    void seed(uint64_t new_seed) {
        std::lock_guard<std::mutex> lock(mutex_);
        seed_ = new_seed;
        rng_.seed(new_seed);
    }

    // [min, max] inclusive
    int nextInt(int min, int max) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_int_distribution<int> dist(min, max);
        return dist(rng_);
    }

    // [0, max) exclusive
    int nextInt(int max) {
        return nextInt(0, max - 1);
    }

    size_t nextSize(size_t max) {
        if (max == 0) {
            throw std::invalid_argument("nextSize: empty range");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_int_distribution<size_t> dist(0, max - 1);
        return dist(rng_);
    }

    uint32_t nextUint32() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_int_distribution<uint32_t> dist;
        return dist(rng_);
    }

    // [0.0, 1.0)
    double nextDouble() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(rng_);
    }

    // true with the given probability; 0 and 1 never consume entropy
    bool decide(double probability) {
        if (probability <= 0.0) return false;
        if (probability >= 1.0) return true;
        return nextDouble() < probability;
    }

    template<typename T>
    const T& choose(const std::vector<T>& items) {
        if (items.empty()) {
            throw std::runtime_error("Cannot choose from empty vector");
        }
        return items[nextSize(items.size())];
    }

    // weighted index; weights need not sum to 1
    size_t chooseWeighted(const std::vector<double>& weights) {
        if (weights.empty()) {
            throw std::runtime_error("Cannot choose from empty weights");
        }

        double total = 0.0;
        for (double w : weights) total += w;
        if (total <= 0.0) return nextSize(weights.size());

        double rand_val = nextDouble() * total;
        double cumulative = 0.0;
        for (size_t i = 0; i < weights.size(); i++) {
            cumulative += weights[i];
            if (rand_val < cumulative) return i;
        }
        return weights.size() - 1;
    }

    uint8_t nextNonZeroByte() {
        return static_cast<uint8_t>(nextInt(1, 255));
    }

    // identifier body drawn from alphabet; the caller supplies a valid first char
    std::string nextString(const std::string& alphabet, size_t length) {
        std::string out;
        out.reserve(length);
        for (size_t i = 0; i < length; i++) {
            out += alphabet[nextSize(alphabet.size())];
        }
        return out;
    }

private:
    std::mt19937_64 rng_;
    uint64_t seed_ = 0;
    std::mutex mutex_;
};

} // namespace cloak

#endif // CLOAK_RANDOM_HPP
