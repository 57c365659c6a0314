#pragma once

#include <array>
#include <random>
#include <vector>

#include <bulk/bulk.hpp>
#ifdef BACKEND_MPI
#include <bulk/backends/mpi/mpi.hpp>
#else
#include <bulk/backends/thread/thread.hpp>
#endif

#include "constraints/constraints.hpp"
#include "options.hpp"

namespace pconstraints {

/**
 * Counters of a layout pass, summed over all processors.
 */
struct pass_statistics {
    long measured = 0;
    // measured sizes that satisfy the parent constraints
    long satisfied = 0;
    // preferred sizes that had to be changed by the child constraints
    long coerced = 0;
    // child constraints with an infinite maximum after enforcing
    long unbounded = 0;
    // children that could not be enforced into their parent in one word
    long rejected = 0;
    std::array<long, 4> schemes = {0, 0, 0, 0};
};

/**
 * Runs a synthetic measure pass on every processor: for each node, random child
 * constraints are enforced into random parent constraints, and a random preferred
 * size is constrained by the result. Children whose enforced bounds cannot be
 * packed are counted as rejected and not measured.
 */
pass_statistics
layout_pass(bulk::world& world, const pconstraints::options& opts, std::mt19937& rng);

/**
 * Encodes list independently on every processor and checks that all processors
 * obtain the same words.
 */
bool canonical_across_processors(bulk::world& world, const std::vector<pconstraints::bounds>& list);

/**
 * Logs the statistics on processor 0.
 */
void log_statistics(bulk::world& world, const pass_statistics& stats);

} // namespace pconstraints
