#pragma once

#include <random>
#include <string>

#include "constraints/constraints.hpp"
#include "options.hpp"
#include "util/size.hpp"

namespace pconstraints {

/**
 * Draws valid constraints. In tiered mode the width tier is drawn first so that
 * every scheme is produced; max_size is ignored then.
 */
packed_constraints random_constraints(std::mt19937& rng, const pconstraints::options& opts);

/**
 * Draws a preferred size in [0, max_size] in both dimensions.
 */
int_size random_size(std::mt19937& rng, const pconstraints::options& opts);

/**
 * Writes n random constraints to file in the constraints list format.
 */
bool create_random_constraints(std::string file, long n, const pconstraints::options& opts);

} // namespace pconstraints
