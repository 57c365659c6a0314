#include <iostream>
#include <string>

#include <boost/functional/hash.hpp>

#include "constraints/constraints.hpp"
#include "constraints/errors.hpp"
#include "constraints/scheme.hpp"

namespace pconstraints {

namespace {

std::string bound_to_string(int value) {
    return value == infinity ? std::string("inf") : std::to_string(value);
}

void check_bounds(int min_width, int max_width, int min_height, int max_height) {
    if (max_width < min_width && max_width != infinity) {
        throw invalid_bounds("maxWidth(" + std::to_string(max_width) +
                             ") must be >= than minWidth(" + std::to_string(min_width) + ")");
    }
    if (max_height < min_height && max_height != infinity) {
        throw invalid_bounds("maxHeight(" + std::to_string(max_height) +
                             ") must be >= than minHeight(" +
                             std::to_string(min_height) + ")");
    }
    if (min_width < 0 || min_height < 0) {
        throw invalid_bounds("minWidth(" + std::to_string(min_width) + ") and minHeight(" +
                             std::to_string(min_height) + ") must be >= 0");
    }
}

// stored value of a maximum, 0 is reserved for infinity
std::uint64_t max_field(int max) {
    return max == infinity ? 0 : static_cast<std::uint64_t>(max) + 1;
}

int from_max_field(std::uint64_t field) {
    return field == 0 ? infinity : static_cast<int>(field) - 1;
}

} // namespace

bool operator==(const bounds& lhs, const bounds& rhs) {
    return lhs.min_width == rhs.min_width && lhs.max_width == rhs.max_width &&
           lhs.min_height == rhs.min_height && lhs.max_height == rhs.max_height;
}

packed_constraints::packed_constraints()
: value_(encode(0, infinity, 0, infinity)) {}

packed_constraints::packed_constraints(int min_width, int max_width, int min_height, int max_height)
: value_(0) {
    check_bounds(min_width, max_width, min_height, max_height);
    value_ = encode(min_width, max_width, min_height, max_height);
}

std::uint64_t
packed_constraints::encode(int min_width, int max_width, int min_height, int max_height) {
    auto focus = select_scheme(min_width, max_width, min_height, max_height);
    const auto& l = layout(focus);

    auto value = static_cast<std::uint64_t>(focus) |
                 (static_cast<std::uint64_t>(min_width) << bits::min_width_offset) |
                 (max_field(max_width) << bits::max_width_offset) |
                 (static_cast<std::uint64_t>(min_height) << l.min_height_offset) |
                 (max_field(max_height) << l.max_height_offset);
    return value;
}

int packed_constraints::min_width() const {
    const auto& l = layout(focus());
    return static_cast<int>((value_ >> bits::min_width_offset) & l.width_mask);
}

int packed_constraints::max_width() const {
    const auto& l = layout(focus());
    return from_max_field((value_ >> bits::max_width_offset) & l.width_mask);
}

int packed_constraints::min_height() const {
    const auto& l = layout(focus());
    return static_cast<int>((value_ >> l.min_height_offset) & l.height_mask);
}

int packed_constraints::max_height() const {
    const auto& l = layout(focus());
    return from_max_field((value_ >> l.max_height_offset) & l.height_mask);
}

bool packed_constraints::has_bounded_width() const {
    const auto& l = layout(focus());
    return ((value_ >> bits::max_width_offset) & l.width_mask) != 0;
}

bool packed_constraints::has_bounded_height() const {
    const auto& l = layout(focus());
    return ((value_ >> l.max_height_offset) & l.height_mask) != 0;
}

pconstraints::bounds packed_constraints::unpack() const {
    return {min_width(), max_width(), min_height(), max_height()};
}

packed_constraints packed_constraints::copy(std::optional<int> min_width,
                                            std::optional<int> max_width,
                                            std::optional<int> min_height,
                                            std::optional<int> max_height) const {
    return packed_constraints(min_width.value_or(this->min_width()),
                              max_width.value_or(this->max_width()),
                              min_height.value_or(this->min_height()),
                              max_height.value_or(this->max_height()));
}

packed_constraints make(int min_width, int max_width, int min_height, int max_height) {
    return packed_constraints(min_width, max_width, min_height, max_height);
}

pconstraints::bounds unpack(const packed_constraints& c) { return c.unpack(); }

std::size_t hash_value(const packed_constraints& c) {
    return boost::hash_value(c.value());
}

std::ostream& operator<<(std::ostream& os, const bounds& b) {
    os << "Constraints(minWidth = " << b.min_width
       << ", maxWidth = " << bound_to_string(b.max_width)
       << ", minHeight = " << b.min_height
       << ", maxHeight = " << bound_to_string(b.max_height) << ")";
    return os;
}

std::ostream& operator<<(std::ostream& os, const packed_constraints& c) {
    return os << c.unpack();
}

} // namespace pconstraints
