#pragma once

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>

#include "constraints/scheme.hpp"
#include "util/interval.hpp"

namespace pconstraints {

/**
 * The four bounds a caller reasons about. max_width and max_height are either
 * at least the corresponding minimum or infinity.
 */
struct bounds {
    int min_width;
    int max_width;
    int min_height;
    int max_height;
};

bool operator==(const bounds& lhs, const bounds& rhs);
inline bool operator!=(const bounds& lhs, const bounds& rhs) {
    return !(lhs == rhs);
}

/**
 * Immutable constraints for measuring a layout node, packed in one 64 bit word:
 * - minWidth <= chosenWidth <= maxWidth
 * - minHeight <= chosenHeight <= maxHeight
 * The maxima can be infinity, meaning the node is free to pick its own size in
 * that dimension.
 *
 * The two lowest bits hold the scheme, which decides how the remaining bits are
 * divided: minWidth starts at bit 2, maxWidth + 1 at bit 33 (0 meaning infinity),
 * and the height fields follow their width field. Depending on the needs one
 * dimension gets up to 18 bits and the other 13, or 16 and 15. Bounds that do
 * not fit are refused at construction.
 */
class packed_constraints {
  public:
    /**
     * Unbounded constraints: [0, infinity] in both dimensions.
     */
    packed_constraints();

    /**
     * Creates constraints from the given bounds. min_width and min_height must
     * be >= 0, max_width and max_height must be >= than the minimum or infinity.
     * Throws invalid_bounds, magnitude_overflow or scheme_unsatisfiable.
     */
    packed_constraints(int min_width, int max_width, int min_height, int max_height);

    pconstraints::scheme focus() const {
        return static_cast<pconstraints::scheme>(value_ & bits::tag_mask);
    }

    int min_width() const;
    int max_width() const;
    int min_height() const;
    int max_height() const;

    // whether maxWidth is finite
    bool has_bounded_width() const;
    // whether maxHeight is finite
    bool has_bounded_height() const;

    pconstraints::bounds unpack() const;
    pconstraints::interval width() const { return {min_width(), max_width()}; }
    pconstraints::interval height() const { return {min_height(), max_height()}; }

    /**
     * Copies the constraints, replacing the given bounds. The result is
     * validated like a newly constructed value.
     */
    packed_constraints copy(std::optional<int> min_width = std::nullopt,
                            std::optional<int> max_width = std::nullopt,
                            std::optional<int> min_height = std::nullopt,
                            std::optional<int> max_height = std::nullopt) const;

    std::uint64_t value() const { return value_; }

    bool operator==(const packed_constraints& other) const {
        return value_ == other.value_;
    }
    bool operator!=(const packed_constraints& other) const {
        return value_ != other.value_;
    }

  private:
    // packs checked bounds, throws when they do not fit in the word
    static std::uint64_t
    encode(int min_width, int max_width, int min_height, int max_height);

    std::uint64_t value_;
};

/**
 * Creates constraints after checking the bounds, see packed_constraints.
 */
packed_constraints make(int min_width, int max_width, int min_height, int max_height);

/**
 * Returns the four bounds of c.
 */
pconstraints::bounds unpack(const packed_constraints& c);

std::size_t hash_value(const packed_constraints& c);

std::ostream& operator<<(std::ostream& os, const packed_constraints& c);
std::ostream& operator<<(std::ostream& os, const bounds& b);

} // namespace pconstraints

namespace std {
template <>
struct hash<pconstraints::packed_constraints> {
    std::size_t operator()(const pconstraints::packed_constraints& c) const {
        return pconstraints::hash_value(c);
    }
};
} // namespace std
