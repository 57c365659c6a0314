#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "constraints/constraints.hpp"

namespace pconstraints {

/**
 * Reads a list of constraints. The format is
 *   %% header line
 *   % comments
 *   count
 *   minWidth maxWidth minHeight maxHeight
 *   ...
 * where a maximum can be written as inf.
 */
std::optional<std::vector<packed_constraints>> read_constraints_istream(std::istream& fin);

/**
 * Reads a list of constraints from a file.
 */
std::optional<std::vector<packed_constraints>> read_constraints(std::string file);

/**
 * Writes the bounds as one line of the constraints list format, without newline.
 */
void write_bounds(std::ostream& out, const pconstraints::bounds& b);

} // namespace pconstraints
