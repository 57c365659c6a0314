#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

#include "constraints/constraints.hpp"
#include "constraints/scheme.hpp"
#include "util/random_constraints.hpp"
#include "util/read_constraints.hpp"

namespace pconstraints {

namespace {

// largest magnitude that still fits in the given number of bits
int largest_for(int bits) { return (1 << bits) - 2; }

interval random_interval(std::mt19937& rng, int limit, double unbounded_fraction) {
    auto pick = std::uniform_int_distribution<int>(0, limit);
    auto a = pick(rng);
    auto b = pick(rng);
    auto unbounded = std::bernoulli_distribution(unbounded_fraction);
    if (unbounded(rng)) {
        return {std::min(a, b), infinity};
    }
    return {std::min(a, b), std::max(a, b)};
}

} // namespace

packed_constraints random_constraints(std::mt19937& rng, const pconstraints::options& opts) {
    auto width_limit = std::min(opts.max_size, bits::max_bound);
    if (opts.mode == size_mode::tiered) {
        const std::array<int, 4> tiers = {bits::max_non_focus, bits::min_non_focus,
                                          bits::min_focus, bits::max_focus};
        width_limit = largest_for(tiers[rng() % tiers.size()]);
    }
    auto width = random_interval(rng, width_limit, opts.unbounded_fraction);

    // the height gets what the width leaves
    auto height_bits = bits::dimension_bits - bits_for(magnitude(width.low, width.high));
    auto height_limit = largest_for(height_bits);
    if (opts.mode == size_mode::uniform) {
        height_limit = std::min(height_limit, opts.max_size);
    }
    auto height = random_interval(rng, height_limit, opts.unbounded_fraction);

    return packed_constraints(width.low, width.high, height.low, height.high);
}

int_size random_size(std::mt19937& rng, const pconstraints::options& opts) {
    auto pick = std::uniform_int_distribution<int>(0, opts.max_size);
    auto width = pick(rng);
    auto height = pick(rng);
    return {width, height};
}

bool create_random_constraints(std::string file, long n, const pconstraints::options& opts) {
    std::mt19937 rng(opts.seed);

    std::ofstream out(file);
    if (out.fail()) {
        std::cerr << "Error: " << std::strerror(errno);
        return false;
    }
    out << "%%Constraints list\n";
    out << n << "\n";
    for (long i = 0; i < n; i++) {
        write_bounds(out, random_constraints(rng, opts).unpack());
        out << "\n";
    }
    out.close();
    return true;
}

} // namespace pconstraints
