/// @file random_source.cpp
/// @brief RandomSource implementation.

#include "lbx/game/random_source.hpp"

#include <cassert>

namespace lbx::game {

RandomSource RandomSource::FromEntropy() {
    std::random_device device;
    const uint64_t seed = (static_cast<uint64_t>(device()) << 32) | device();
    return RandomSource(seed == 0 ? 1 : seed);
}

double RandomSource::NextUnit() {
    // 53 random mantissa bits; avoids the libstdc++ generate_canonical
    // edge case that can return exactly 1.0.
    return static_cast<double>(engine_() >> 11) * 0x1.0p-53;
}

std::size_t RandomSource::NextIndex(std::size_t count) {
    assert(count > 0 && "NextIndex requires a non-empty range");
    std::uniform_int_distribution<std::size_t> dist(0, count - 1);
    return dist(engine_);
}

void RandomSource::Reseed(uint64_t seed) {
    seed_ = seed;
    engine_.seed(seed);
}

}  // namespace lbx::game
