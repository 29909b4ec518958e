// File: src/core/random_source.hpp
#pragma once

#include <cstdint>
#include <random>
#include <stdexcept>

namespace engram {

/// Seedable random source passed explicitly to everything that samples.
///
/// One instance belongs to one MemoryEngine; it is not thread-safe and is
/// only used while the engine lock is held.
class RandomSource {
public:
    using Engine = std::mt19937_64;

    static constexpr uint64_t kDefaultSeed = 42;

    explicit RandomSource(uint64_t seed = kDefaultSeed) : engine_(seed) {}

    /// Uniform index in [0, n)
    /// @throws std::invalid_argument if n == 0
    size_t UniformIndex(size_t n) {
        if (n == 0) {
            throw std::invalid_argument("UniformIndex requires n > 0");
        }
        std::uniform_int_distribution<size_t> dist(0, n - 1);
        return dist(engine_);
    }

private:
    Engine engine_;
};

} // namespace engram
