#pragma once

#include <cstddef>

namespace pconstraints {

enum class size_mode : int { uniform, tiered };

/**
 * Settings of a synthetic layout pass.
 */
struct options {
    size_t nodes_per_processor = 1000;
    // largest bound or size that is generated
    int max_size = 4096;
    // fraction of the generated maxima that is infinity
    double unbounded_fraction = 0.1;
    unsigned seed = 1;

    size_mode mode = size_mode::uniform;
};

} // namespace pconstraints
