#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>

#include "constraints/errors.hpp"
#include "constraints/operations.hpp"

namespace pconstraints {

namespace {

int translate(int bound, int delta) {
    if (bound == infinity) {
        return infinity;
    }
    auto result = std::max<std::int64_t>(0, static_cast<std::int64_t>(bound) + delta);
    if (result > bits::max_bound) {
        throw magnitude_overflow(static_cast<int>(
        std::min<std::int64_t>(result, std::numeric_limits<int>::max())));
    }
    return static_cast<int>(result);
}

} // namespace

packed_constraints fixed(int width, int height) {
    if (width < 0 || height < 0) {
        throw invalid_bounds("width(" + std::to_string(width) + ") and height(" +
                             std::to_string(height) + ") must be >= 0");
    }
    return packed_constraints(width, width, height, height);
}

packed_constraints fixed_width(int width) {
    if (width < 0) {
        throw invalid_bounds("width(" + std::to_string(width) + ") must be >= 0");
    }
    return packed_constraints(width, width, 0, infinity);
}

packed_constraints fixed_height(int height) {
    if (height < 0) {
        throw invalid_bounds("height(" + std::to_string(height) + ") must be >= 0");
    }
    return packed_constraints(0, infinity, height, height);
}

bool has_fixed_width(const packed_constraints& c) { return c.width().fixed(); }

bool has_fixed_height(const packed_constraints& c) { return c.height().fixed(); }

bool is_zero(const packed_constraints& c) {
    return c.max_width() == 0 || c.max_height() == 0;
}

packed_constraints enforce(const packed_constraints& c, const packed_constraints& other) {
    auto b = c.unpack();
    auto width = other.width();
    auto height = other.height();
    return packed_constraints(width.coerce(b.min_width), width.coerce_bound(b.max_width),
                              height.coerce(b.min_height), height.coerce_bound(b.max_height));
}

int_size constrain(const packed_constraints& c, int_size size) {
    return {c.width().coerce(size.width), c.height().coerce(size.height)};
}

bool satisfied_by(const packed_constraints& c, int_size size) {
    return c.width().contains(size.width) && c.height().contains(size.height);
}

packed_constraints offset(const packed_constraints& c, int horizontal, int vertical) {
    auto b = c.unpack();
    return packed_constraints(translate(b.min_width, horizontal),
                              translate(b.max_width, horizontal),
                              translate(b.min_height, vertical),
                              translate(b.max_height, vertical));
}

} // namespace pconstraints
