#pragma once

#include <stdexcept>
#include <string>

namespace pconstraints {

/**
 * Base of all errors raised while building constraints. Every one of them is
 * raised before a value exists, so no partially built constraints are observed.
 */
class constraints_error : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

/**
 * A minimum is negative, or a finite maximum is smaller than its minimum.
 */
class invalid_bounds : public constraints_error {
  public:
    using constraints_error::constraints_error;
};

/**
 * A finite bound does not fit in the largest (18 bit) tier.
 */
class magnitude_overflow : public constraints_error {
  public:
    explicit magnitude_overflow(int size)
    : constraints_error("Can't represent a size of " + std::to_string(size) + " in Constraints"),
      size_(size) {}

    int size() const { return size_; }

  private:
    int size_;
};

/**
 * Both dimensions are representable on their own, but not together in 31 bits.
 */
class scheme_unsatisfiable : public constraints_error {
  public:
    scheme_unsatisfiable(int width, int height)
    : constraints_error("Can't represent a width of " + std::to_string(width) +
                        " and height of " + std::to_string(height) + " in Constraints"),
      width_(width), height_(height) {}

    int width() const { return width_; }
    int height() const { return height_; }

  private:
    int width_;
    int height_;
};

} // namespace pconstraints
