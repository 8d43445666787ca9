#include "random_source.hpp"

#include <chrono>

namespace monotower::core {

SeededRandomSource::SeededRandomSource(std::uint32_t seed)
    : seed_(seed)
    , rng_(seed) {
}

float SeededRandomSource::next_unit() {
    float v = dist_(rng_);
    // Some standard libraries can return exactly 1.0f for float distributions.
    if (v >= 1.0f) v = 0.0f;
    return v;
}

std::uint32_t seed_from_clock() {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
    const auto seed = static_cast<std::uint32_t>(ms);
    return seed == 0 ? 1u : seed;
}

} // namespace monotower::core
