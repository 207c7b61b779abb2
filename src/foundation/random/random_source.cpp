#include "cce/foundation/random_source.hpp"

namespace cce::foundation {

RandomSource::RandomSource(uint64_t seed) : seed_(seed), engine_(seed) {}

double RandomSource::nextUnit() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(engine_);
}

int32_t RandomSource::uniformInt(int32_t lo, int32_t hi) {
    if (hi < lo) {
        return lo;
    }
    std::uniform_int_distribution<int32_t> dist(lo, hi);
    return dist(engine_);
}

void RandomSource::reseed(uint64_t seed) {
    seed_ = seed;
    engine_.seed(seed);
}

} // namespace cce::foundation
