#pragma once

/// @file random_source.hpp
/// @brief Seedable random source injected into every randomized operation.

#include <cstddef>
#include <cstdint>
#include <random>

namespace lbx::game {

/// Deterministic pseudo-random generator (mt19937_64) with an explicit seed.
///
/// Nothing in the game layer touches global random state; every draw
/// takes a RandomSource& so a fixed seed reproduces a whole session.
class RandomSource {
public:
    explicit RandomSource(uint64_t seed) : seed_(seed), engine_(seed) {}

    /// Seed from std::random_device (non-reproducible sessions).
    [[nodiscard]] static RandomSource FromEntropy();

    /// Uniform real in [0, 1).
    [[nodiscard]] double NextUnit();

    /// Uniform index in [0, count).  @pre count > 0.
    [[nodiscard]] std::size_t NextIndex(std::size_t count);

    /// Fair coin.
    [[nodiscard]] bool NextBool() { return NextUnit() < 0.5; }

    [[nodiscard]] uint64_t Seed() const noexcept { return seed_; }

    /// Restart the sequence from @p seed.
    void Reseed(uint64_t seed);

private:
    uint64_t seed_;
    std::mt19937_64 engine_;
};

}  // namespace lbx::game
