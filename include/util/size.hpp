#pragma once

namespace pconstraints {

/**
 * A measured or preferred size of a layout node.
 */
struct int_size {
    int width;
    int height;
};

inline bool operator==(const int_size& lhs, const int_size& rhs) {
    return lhs.width == rhs.width && lhs.height == rhs.height;
}

inline bool operator!=(const int_size& lhs, const int_size& rhs) {
    return !(lhs == rhs);
}

} // namespace pconstraints
