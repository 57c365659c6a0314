#include "pconstraints.hpp"

#include <random>
#include <vector>

#include "gtest/gtest.h"

#include <bulk/bulk.hpp>
#ifdef BACKEND_MPI
#include <bulk/backends/mpi/mpi.hpp>
using environment = bulk::mpi::environment;
#else
#include <bulk/backends/thread/thread.hpp>
using environment = bulk::thread::environment;
#endif

namespace pconstraints {
namespace {

TEST(LayoutPass, MeasuredSizesSatisfyParents) {
    environment env;
    env.spawn(2, [](bulk::world& world) {
        auto opts = pconstraints::options();
        opts.nodes_per_processor = 200;
        opts.max_size = 1000;
        std::mt19937 rng(opts.seed + world.rank());
        auto stats = layout_pass(world, opts, rng);
        ASSERT_EQ(stats.rejected, 0);
        ASSERT_EQ(stats.measured, 400);
        ASSERT_EQ(stats.satisfied, stats.measured);
        ASSERT_EQ(stats.schemes[static_cast<int>(scheme::max_focus_height)], 400);
    });
}

TEST(LayoutPass, TieredCountsAddUp) {
    environment env;
    env.spawn(2, [](bulk::world& world) {
        auto opts = pconstraints::options();
        opts.nodes_per_processor = 300;
        opts.mode = size_mode::tiered;
        opts.unbounded_fraction = 0.3;
        std::mt19937 rng(opts.seed + world.rank());
        auto stats = layout_pass(world, opts, rng);
        ASSERT_EQ(stats.measured + stats.rejected, 600);
        ASSERT_EQ(stats.satisfied, stats.measured);
        long total = 0;
        for (auto count : stats.schemes) {
            total += count;
        }
        ASSERT_EQ(total, stats.measured);
    });
}

TEST(LayoutPass, CanonicalAcrossProcessors) {
    environment env;
    env.spawn(3, [](bulk::world& world) {
        auto list = std::vector<bounds>{{0, infinity, 0, infinity},
                                        {100, 100, 50, 50},
                                        {10, 70000, 3, 8000},
                                        {8191, infinity, 0, 65534}};
        ASSERT_TRUE(canonical_across_processors(world, list));
    });
}

} // namespace
} // namespace pconstraints
