#include <algorithm>

#include "constraints/errors.hpp"
#include "constraints/scheme.hpp"

namespace pconstraints {

int bits_for(int size) {
    // the all zero pattern is reserved for infinity in the max fields
    if (size < (1 << bits::max_non_focus) - 1) {
        return bits::max_non_focus;
    }
    if (size < (1 << bits::min_non_focus) - 1) {
        return bits::min_non_focus;
    }
    if (size < (1 << bits::min_focus) - 1) {
        return bits::min_focus;
    }
    if (size < (1 << bits::max_focus) - 1) {
        return bits::max_focus;
    }
    throw magnitude_overflow(size);
}

int magnitude(int min, int max) { return std::max(min, max); }

pconstraints::scheme
select_scheme(int min_width, int max_width, int min_height, int max_height) {
    auto width = magnitude(min_width, max_width);
    auto width_bits = bits_for(width);

    auto height = magnitude(min_height, max_height);
    auto height_bits = bits_for(height);

    if (width_bits + height_bits > bits::dimension_bits) {
        throw scheme_unsatisfiable(width, height);
    }

    switch (width_bits) {
    case bits::max_non_focus:
        return scheme::max_focus_height;
    case bits::min_non_focus:
        return scheme::min_focus_height;
    case bits::min_focus:
        return scheme::min_focus_width;
    default:
        return scheme::max_focus_width;
    }
}

const char* to_string(pconstraints::scheme s) {
    switch (s) {
    case scheme::min_focus_width:
        return "min_focus_width";
    case scheme::max_focus_width:
        return "max_focus_width";
    case scheme::min_focus_height:
        return "min_focus_height";
    case scheme::max_focus_height:
        return "max_focus_height";
    }
    return "unknown";
}

} // namespace pconstraints
