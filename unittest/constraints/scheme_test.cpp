#include "constraints/errors.hpp"
#include "constraints/scheme.hpp"
#include "util/interval.hpp"

#include "gtest/gtest.h"

namespace pconstraints {
namespace {

TEST(Scheme, BitsForTiers) {
    ASSERT_EQ(bits_for(0), 13);
    ASSERT_EQ(bits_for(8190), 13);
    ASSERT_EQ(bits_for(8191), 15);
    ASSERT_EQ(bits_for(32766), 15);
    ASSERT_EQ(bits_for(32767), 16);
    ASSERT_EQ(bits_for(65534), 16);
    ASSERT_EQ(bits_for(65535), 18);
    ASSERT_EQ(bits_for(bits::max_bound), 18);
    ASSERT_THROW(bits_for(bits::max_bound + 1), magnitude_overflow);
}

TEST(Scheme, MagnitudeIgnoresInfinity) {
    ASSERT_EQ(magnitude(5, infinity), 5);
    ASSERT_EQ(magnitude(5, 70000), 70000);
    ASSERT_EQ(magnitude(0, infinity), 0);
}

TEST(Scheme, WidthTierDecides) {
    ASSERT_EQ(select_scheme(0, 8190, 0, 100), scheme::max_focus_height);
    ASSERT_EQ(select_scheme(0, 8191, 0, 100), scheme::min_focus_height);
    ASSERT_EQ(select_scheme(0, 32767, 0, 100), scheme::min_focus_width);
    ASSERT_EQ(select_scheme(0, 65535, 0, 100), scheme::max_focus_width);
    ASSERT_EQ(select_scheme(65535, infinity, 0, infinity), scheme::max_focus_width);
}

TEST(Scheme, HeightGetsTheRest) {
    ASSERT_EQ(select_scheme(0, 10, 0, bits::max_bound), scheme::max_focus_height);
    ASSERT_EQ(select_scheme(0, 8191, 0, 65534), scheme::min_focus_height);
    ASSERT_THROW(select_scheme(0, 8191, 0, 65535), scheme_unsatisfiable);
    ASSERT_EQ(select_scheme(0, 65534, 0, 32766), scheme::min_focus_width);
    ASSERT_THROW(select_scheme(0, 65534, 0, 32767), scheme_unsatisfiable);
    ASSERT_EQ(select_scheme(0, 65535, 0, 8190), scheme::max_focus_width);
    ASSERT_THROW(select_scheme(0, 65535, 0, 8191), scheme_unsatisfiable);
}

TEST(Scheme, TieFavoursWidth) {
    // both need 16 bits: width gets them, height does not fit in 15
    ASSERT_THROW(select_scheme(0, 40000, 0, 40000), scheme_unsatisfiable);
    // both need 15 bits: the 16 bit share goes to the height
    ASSERT_EQ(select_scheme(0, 10000, 0, 10000), scheme::min_focus_height);
}

TEST(Scheme, Overflow) {
    ASSERT_THROW(select_scheme(0, 300000, 0, 10), magnitude_overflow);
    ASSERT_THROW(select_scheme(0, 10, 300000, infinity), magnitude_overflow);
    ASSERT_THROW(select_scheme(0, 200000, 0, 200000), scheme_unsatisfiable);
}

TEST(Scheme, LayoutTable) {
    for (const auto& l : scheme_layouts) {
        ASSERT_EQ(l.width_bits + l.height_bits, bits::dimension_bits);
        ASSERT_EQ(l.width_mask, (1ull << l.width_bits) - 1);
        ASSERT_EQ(l.height_mask, (1ull << l.height_bits) - 1);
        ASSERT_EQ(l.min_height_offset, bits::min_width_offset + l.width_bits);
        ASSERT_EQ(l.max_height_offset, bits::max_width_offset + l.width_bits);
        ASSERT_EQ(l.max_height_offset + l.height_bits, 64);
    }
    ASSERT_EQ(layout(scheme::max_focus_width).width_bits, 18);
    ASSERT_EQ(layout(scheme::max_focus_height).height_bits, 18);
    ASSERT_STREQ(to_string(scheme::min_focus_width), "min_focus_width");
    ASSERT_STREQ(to_string(scheme::max_focus_width), "max_focus_width");
    ASSERT_STREQ(to_string(scheme::min_focus_height), "min_focus_height");
    ASSERT_STREQ(to_string(scheme::max_focus_height), "max_focus_height");
}

} // namespace
} // namespace pconstraints
