#pragma once

#include <array>
#include <cstdint>

namespace pconstraints {

/**
 * Indicates how the 31 bits available per bound pair are split between width
 * and height. The value is the tag stored in the two lowest bits of the word.
 */
enum class scheme : int {
    min_focus_width = 0,  // 16 bits width, 15 bits height
    max_focus_width = 1,  // 18 bits width, 13 bits height
    min_focus_height = 2, // 15 bits width, 16 bits height
    max_focus_height = 3  // 13 bits width, 18 bits height
};

namespace bits {
constexpr int tag_bits = 2;
constexpr std::uint64_t tag_mask = 0x03;
// bits shared by width and height, for both the minimum and the maximum
constexpr int dimension_bits = 31;
constexpr int min_width_offset = tag_bits;
constexpr int max_width_offset = tag_bits + dimension_bits;

constexpr int max_non_focus = 13;
constexpr int min_non_focus = 15;
constexpr int min_focus = 16;
constexpr int max_focus = 18;

// largest finite bound that can be stored in the widest tier
constexpr int max_bound = (1 << max_focus) - 2;
} // namespace bits

/**
 * Field widths, masks and offsets of one scheme.
 */
struct scheme_layout {
    int width_bits;
    int height_bits;
    std::uint64_t width_mask;
    std::uint64_t height_mask;
    int min_height_offset;
    int max_height_offset;
};

/**
 * Layouts indexed by the tag. The width fields always start at bit 2 (minimum)
 * and bit 33 (maximum), the height fields right after their width field.
 */
constexpr std::array<scheme_layout, 4> scheme_layouts = {{
{16, 15, 0xFFFF, 0x7FFF, 2 + 16, 2 + 16 + 31},  // min_focus_width
{18, 13, 0x3FFFF, 0x1FFF, 2 + 18, 2 + 18 + 31}, // max_focus_width
{15, 16, 0x7FFF, 0xFFFF, 2 + 15, 2 + 15 + 31},  // min_focus_height
{13, 18, 0x1FFF, 0x3FFFF, 2 + 13, 2 + 13 + 31}  // max_focus_height
}};

inline const scheme_layout& layout(pconstraints::scheme s) {
    return scheme_layouts[static_cast<int>(s)];
}

/**
 * Returns the smallest tier (13, 15, 16 or 18 bits) that can store size and
 * size + 1. Throws magnitude_overflow when size does not fit in 18 bits.
 */
int bits_for(int size);

/**
 * The value a dimension needs to store. max can be infinity, which is smaller
 * than any finite value, so then min alone decides.
 */
int magnitude(int min, int max);

/**
 * Picks the scheme for the given bounds. The width tier decides the scheme,
 * the height has to fit in what remains. Throws magnitude_overflow or
 * scheme_unsatisfiable.
 */
pconstraints::scheme
select_scheme(int min_width, int max_width, int min_height, int max_height);

const char* to_string(pconstraints::scheme s);

} // namespace pconstraints
