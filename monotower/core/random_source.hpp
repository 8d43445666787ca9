#pragma once

#include <cstdint>
#include <random>

namespace monotower::core {

// Randomness consumed by the level generator. Injected so generation is reproducible.
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /// Uniform value in [0, 1).
    virtual float next_unit() = 0;
};

class SeededRandomSource final : public IRandomSource {
public:
    explicit SeededRandomSource(std::uint32_t seed);

    std::uint32_t seed() const { return seed_; }

    float next_unit() override;

private:
    std::uint32_t seed_{0};
    std::mt19937 rng_;
    std::uniform_real_distribution<float> dist_{0.0f, 1.0f};
};

// Seed for drivers that were not given one.
std::uint32_t seed_from_clock();

} // namespace monotower::core
