#pragma once

/// @file scripted_random.hpp
/// @brief RandomSource returning queued draws, for deterministic tests.

#include <cstdint>
#include <deque>
#include <initializer_list>

#include "cce/foundation/random_source.hpp"

namespace cce::testing {

/// Pops queued values; once a queue is empty, nextUnit() returns
/// fallbackUnit and uniformInt() returns its lower bound.
class ScriptedRandom : public foundation::RandomSource {
public:
    ScriptedRandom() = default;

    ScriptedRandom(std::initializer_list<double> units) : units_(units) {}

    void pushUnits(std::initializer_list<double> units) {
        units_.insert(units_.end(), units);
    }

    void pushInts(std::initializer_list<int32_t> ints) {
        ints_.insert(ints_.end(), ints);
    }

    double nextUnit() override {
        ++unitDraws;
        if (units_.empty()) {
            return fallbackUnit;
        }
        auto value = units_.front();
        units_.pop_front();
        return value;
    }

    int32_t uniformInt(int32_t lo, int32_t hi) override {
        ++intDraws;
        if (ints_.empty()) {
            return lo;
        }
        auto value = ints_.front();
        ints_.pop_front();
        if (value < lo) {
            return lo;
        }
        return value > hi ? hi : value;
    }

    [[nodiscard]] std::size_t pendingUnits() const { return units_.size(); }

    double fallbackUnit = 0.0;
    int unitDraws = 0;
    int intDraws = 0;

private:
    std::deque<double> units_;
    std::deque<int32_t> ints_;
};

}  // namespace cce::testing
