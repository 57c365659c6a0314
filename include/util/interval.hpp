#pragma once

#include <algorithm>
#include <limits>

namespace pconstraints {

/**
 * Value that a maximum bound is set to when it should be considered infinite.
 * It lies in the middle of the negative range so that adding or subtracting
 * from it does not easily roll over into a valid bound.
 */
constexpr int infinity = std::numeric_limits<int>::min() / 2;

/**
 * The admissible values of one dimension: [low, high], where high can be infinity.
 */
struct interval {
    int low;
    int high;

    bool bounded() const { return high != infinity; }
    bool fixed() const { return high == low; }

    bool contains(int value) const {
        return value >= low && (!bounded() || value <= high);
    }

    int coerce(int value) const {
        auto result = std::max(value, low);
        if (bounded()) {
            result = std::min(result, high);
        }
        return result;
    }

    // as coerce, but bound can itself be infinity
    int coerce_bound(int bound) const {
        if (bound == infinity) {
            return high;
        }
        return coerce(bound);
    }
};

} // namespace pconstraints
