#pragma once

/// @file random_source.hpp
/// @brief Seedable random source injected into every component that draws.

#include <cstdint>
#include <random>

namespace cce::foundation {

/// Deterministic pseudo-random source.
///
/// Two sources built with the same seed produce the same sequence, so a
/// battle or crafting run can be replayed exactly. Methods are virtual so
/// tests can substitute scripted draws.
class RandomSource {
public:
    explicit RandomSource(uint64_t seed = kDefaultSeed);
    virtual ~RandomSource() = default;

    RandomSource(const RandomSource&) = delete;
    RandomSource& operator=(const RandomSource&) = delete;

    /// Uniform real in [0, 1).
    virtual double nextUnit();

    /// Uniform integer in [lo, hi] (inclusive). Returns lo when hi < lo.
    virtual int32_t uniformInt(int32_t lo, int32_t hi);

    /// True with probability @p p (`nextUnit() < p`). p >= 1 always succeeds,
    /// p <= 0 never does.
    bool chance(double p) { return nextUnit() < p; }

    void reseed(uint64_t seed);

    [[nodiscard]] uint64_t seed() const noexcept { return seed_; }

    static constexpr uint64_t kDefaultSeed = 0x5EEDC0DEULL;

private:
    uint64_t seed_;
    std::mt19937_64 engine_;
};

} // namespace cce::foundation
