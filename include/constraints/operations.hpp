#pragma once

#include "constraints/constraints.hpp"
#include "util/size.hpp"

namespace pconstraints {

/**
 * Creates constraints for fixed size in both dimensions.
 */
packed_constraints fixed(int width, int height);

/**
 * Creates constraints for fixed width and unspecified height.
 */
packed_constraints fixed_width(int width);

/**
 * Creates constraints for fixed height and unspecified width.
 */
packed_constraints fixed_height(int height);

/**
 * Whether there is exactly one width value that satisfies the constraints.
 */
bool has_fixed_width(const packed_constraints& c);

/**
 * Whether there is exactly one height value that satisfies the constraints.
 */
bool has_fixed_height(const packed_constraints& c);

/**
 * Whether the area of a node respecting these constraints will definitely be 0.
 */
bool is_zero(const packed_constraints& c);

/**
 * Returns the result of coercing c into other. The result always satisfies other.
 */
packed_constraints enforce(const packed_constraints& c, const packed_constraints& other);

/**
 * Takes a size and returns the closest size to it that satisfies the constraints.
 */
int_size constrain(const packed_constraints& c, int_size size);

/**
 * Takes a size and returns whether it satisfies the constraints.
 */
bool satisfied_by(const packed_constraints& c, int_size size);

/**
 * Returns the constraints obtained by translating all bounds of c. Bounds stop
 * at 0, infinite maxima stay infinite.
 */
packed_constraints offset(const packed_constraints& c, int horizontal = 0, int vertical = 0);

} // namespace pconstraints
