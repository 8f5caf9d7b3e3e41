#ifndef LINTREE_CORE_TESTING_HPP
#define LINTREE_CORE_TESTING_HPP

#include <boost/optional/optional_io.hpp>

#include <catch2/catch.hpp>

#include <lintree/core/diff.hpp>
#include <lintree/core/merge.hpp>

namespace lintree {

// Test that linear_value behaves as a regular value for :x.
inline void
test_regular_value(linear_value const& x)
{
    {
        INFO("Copy construction should produce an equal value.")
        linear_value y = x;
        REQUIRE(y == x);
    }

    {
        INFO("Assignment should produce an equal value.")
        linear_value y;
        y = x;
        REQUIRE(y == x);
    }

    {
        INFO("swap should swap values.")
        linear_value y = x;
        linear_value z;
        swap(y, z);
        REQUIRE(z == x);
        REQUIRE(y == linear_value());
        swap(y, z);
        REQUIRE(y == x);
        REQUIRE(z == linear_value());
    }
}

// Same as above, but also checks the ordering between two values.
// It assumes that :x < :y.
inline void
test_regular_value_pair(linear_value const& x, linear_value const& y)
{
    test_regular_value(x);
    test_regular_value(y);
    REQUIRE(x != y);
    REQUIRE(x < y);
    REQUIRE(!(y < x));
    REQUIRE(x <= y);
    REQUIRE(y > x);
    REQUIRE(y >= x);
}

// Diff :a against :b, check that the mask matches :expected_mask (none for
// identical records) and check that the diff leads from :a to :b and back.
inline record_diff
test_diff_round_trip(
    linear_record const& a,
    linear_record const& b,
    optional<update_mask> const& expected_mask)
{
    auto diff = diff_records(a, b);
    REQUIRE(diff.mask == expected_mask);
    if (diff.mask)
    {
        REQUIRE(merge_records(*diff.mask, a, diff.after) == b);
        REQUIRE(
            merge_records(invert_update_mask(*diff.mask), b, diff.before)
            == a);
    }
    return diff;
}

} // namespace lintree

#endif
