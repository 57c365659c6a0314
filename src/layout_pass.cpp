#include <random>
#include <vector>

#include <bulk/bulk.hpp>
#ifdef BACKEND_MPI
#include <bulk/backends/mpi/mpi.hpp>
#else
#include <bulk/backends/thread/thread.hpp>
#endif

#include <boost/functional/hash.hpp>

#include "constraints/constraints.hpp"
#include "constraints/errors.hpp"
#include "constraints/operations.hpp"
#include "layout_pass.hpp"
#include "options.hpp"
#include "util/random_constraints.hpp"

namespace pconstraints {

pass_statistics
layout_pass(bulk::world& world, const pconstraints::options& opts, std::mt19937& rng) {
    auto local = pass_statistics();
    for (size_t i = 0; i < opts.nodes_per_processor; i++) {
        auto parent = random_constraints(rng, opts);
        auto own = random_constraints(rng, opts);
        auto preferred = random_size(rng, opts);

        auto child = packed_constraints();
        try {
            child = enforce(own, parent);
        } catch (const constraints_error&) {
            local.rejected++;
            continue;
        }
        auto measured = constrain(child, preferred);

        local.measured++;
        if (satisfied_by(parent, measured)) {
            local.satisfied++;
        }
        if (measured != preferred) {
            local.coerced++;
        }
        if (!child.has_bounded_width() || !child.has_bounded_height()) {
            local.unbounded++;
        }
        local.schemes[static_cast<int>(child.focus())]++;
    }

    auto stats = pass_statistics();
    stats.measured = bulk::sum(world, local.measured);
    stats.satisfied = bulk::sum(world, local.satisfied);
    stats.coerced = bulk::sum(world, local.coerced);
    stats.unbounded = bulk::sum(world, local.unbounded);
    stats.rejected = bulk::sum(world, local.rejected);
    for (auto s = 0u; s < stats.schemes.size(); s++) {
        stats.schemes[s] = bulk::sum(world, local.schemes[s]);
    }
    return stats;
}

bool canonical_across_processors(bulk::world& world, const std::vector<pconstraints::bounds>& list) {
    std::size_t seed = 0;
    for (const auto& b : list) {
        auto c = make(b.min_width, b.max_width, b.min_height, b.max_height);
        boost::hash_combine(seed, c);
    }

    auto images = bulk::gather_all(world, seed);
    auto canonical = true;
    for (int t = 1; t < world.active_processors(); t++) {
        if (images[t] != images[0]) {
            if (world.rank() == 0) {
                world.log("s %d: constraints hash %zu differs from %zu on processor 0",
                          t, images[t], images[0]);
            }
            canonical = false;
        }
    }
    return canonical;
}

void log_statistics(bulk::world& world, const pass_statistics& stats) {
    if (world.rank() != 0) {
        return;
    }
    world.log("Measured %ld nodes on %d processors", stats.measured,
              world.active_processors());
    world.log("Sizes satisfying the parent constraints: %ld", stats.satisfied);
    world.log("Preferred sizes coerced: %ld", stats.coerced);
    world.log("Unbounded child constraints: %ld", stats.unbounded);
    world.log("Children rejected, not representable: %ld", stats.rejected);
    for (auto s = 0u; s < stats.schemes.size(); s++) {
        world.log("Scheme %s: %ld", to_string(static_cast<pconstraints::scheme>(s)),
                  stats.schemes[s]);
    }
}

} // namespace pconstraints
