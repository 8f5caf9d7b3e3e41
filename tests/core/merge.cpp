#include <lintree/core/merge.hpp>

#include <lintree/core/testing.hpp>

using namespace lintree;

static update_mask
make_mask(std::initializer_list<std::pair<linear_value const, update_mask_entry>>
              entries)
{
    return update_mask{std::map<linear_value, update_mask_entry>(entries)};
}

TEST_CASE("record merges", "[core][merge]")
{
    auto current = make_record({{1, "a"}, {2, 5}, {3, true}});
    auto mask = make_mask(
        {{1, make_update_entry()},
         {3, make_remove_entry()},
         {4, make_add_entry()}});
    auto diff = make_record({{1, "b"}, {3, nil}, {4, 1.5}});
    REQUIRE(
        merge_records(mask, current, diff)
        == make_record({{1, "b"}, {2, 5}, {4, 1.5}}));
    // The original is left alone.
    REQUIRE(current == make_record({{1, "a"}, {2, 5}, {3, true}}));

    merge_records_in_place(mask, current, diff);
    REQUIRE(current == make_record({{1, "b"}, {2, 5}, {4, 1.5}}));
}

TEST_CASE("unmasked slots are untouched", "[core][merge]")
{
    // The diff tree may hold values that the mask doesn't mention.
    auto current = make_record({{1, "a"}, {2, "b"}});
    auto merged = merge_records(
        make_mask({{1, make_update_entry()}}),
        current,
        make_record({{1, "x"}, {2, "y"}, {3, "z"}}));
    REQUIRE(merged == make_record({{1, "x"}, {2, "b"}}));

    REQUIRE(merge_records(update_mask(), current, linear_record()) == current);
}

TEST_CASE("removing absent slots", "[core][merge]")
{
    auto current = make_record({{2, 5}});
    REQUIRE(
        merge_records(
            make_mask({{1, make_remove_entry()}}), current, linear_record())
        == current);

    auto sequence = make_record({{1, linear_sequence{1}}});
    REQUIRE(
        merge_records(
            make_mask(
                {{1,
                  make_update_entry(make_mask({{4, make_remove_entry()}}))}}),
            sequence,
            make_record({{1, linear_sequence{}}}))
        == sequence);

    auto dictionary = make_record({{1, make_dictionary({{"a", 1}})}});
    REQUIRE(
        merge_records(
            make_mask(
                {{1,
                  make_update_entry(make_mask({{"b", make_remove_entry()}}))}}),
            dictionary,
            make_record({{1, linear_dictionary()}}))
        == dictionary);
}

TEST_CASE("nested merges", "[core][merge]")
{
    auto current = make_record(
        {{1, make_record({{1, "a"}, {2, "b"}})},
         {2, linear_sequence{1, 2}},
         {3, make_dictionary({{"k", make_record({{1, 1}})}})}});
    auto mask = make_mask(
        {{1, make_update_entry(make_mask({{2, make_update_entry()}}))},
         {2, make_update_entry(make_mask({{2, make_add_entry()}}))},
         {3,
          make_update_entry(make_mask(
              {{"k",
                make_update_entry(make_mask({{1, make_update_entry()}}))}}))}});
    auto diff = make_record(
        {{1, make_record({{2, "c"}})},
         {2, linear_sequence{nil, nil, 3}},
         {3, make_dictionary({{"k", make_record({{1, 2}})}})}});
    REQUIRE(
        merge_records(mask, current, diff)
        == make_record(
            {{1, make_record({{1, "a"}, {2, "c"}})},
             {2, linear_sequence{1, 2, 3}},
             {3, make_dictionary({{"k", make_record({{1, 2}})}})}}));
}

TEST_CASE("sequence merges", "[core][merge]")
{
    auto current = make_record({{1, linear_sequence{1, 2, 3, 4}}});

    // Removals truncate the tail.
    REQUIRE(
        merge_records(
            make_mask(
                {{1,
                  make_update_entry(make_mask(
                      {{0, make_update_entry()},
                       {2, make_remove_entry()},
                       {3, make_remove_entry()}}))}}),
            current,
            make_record({{1, linear_sequence{9}}}))
        == make_record({{1, linear_sequence{9, 2}}}));

    // Removals with a gap between them don't describe a tail.
    try
    {
        merge_records(
            make_mask(
                {{1,
                  make_update_entry(make_mask(
                      {{0, make_update_entry()},
                       {1, make_remove_entry()},
                       {3, make_remove_entry()}}))}}),
            current,
            make_record({{1, linear_sequence{9}}}));
        FAIL("no exception thrown");
    }
    catch (structural_invariant_violation& e)
    {
        REQUIRE(
            get_required_error_info<value_path_info>(e)
            == std::list<linear_value>({linear_value(1), linear_value(3)}));
    }

    // Neither does a removal below an update.
    try
    {
        merge_records(
            make_mask(
                {{1,
                  make_update_entry(make_mask(
                      {{1, make_remove_entry()},
                       {2, make_update_entry()}}))}}),
            current,
            make_record({{1, linear_sequence{nil, nil, 9}}}));
        FAIL("no exception thrown");
    }
    catch (structural_invariant_violation& e)
    {
        REQUIRE(
            get_required_error_info<value_path_info>(e)
            == std::list<linear_value>({linear_value(1), linear_value(2)}));
    }

    // Additions append in order.
    REQUIRE(
        merge_records(
            make_mask(
                {{1,
                  make_update_entry(make_mask(
                      {{4, make_add_entry()}, {5, make_add_entry()}}))}}),
            current,
            make_record({{1, linear_sequence{nil, nil, nil, nil, 5, 6}}}))
        == make_record({{1, linear_sequence{1, 2, 3, 4, 5, 6}}}));

    // Adding beyond the end would leave a gap.
    try
    {
        merge_records(
            make_mask(
                {{1, make_update_entry(make_mask({{6, make_add_entry()}}))}}),
            current,
            make_record({{1, linear_sequence{nil, nil, nil, nil, nil, nil, 7}}}));
        FAIL("no exception thrown");
    }
    catch (structural_invariant_violation& e)
    {
        REQUIRE(
            get_required_error_info<value_path_info>(e)
            == std::list<linear_value>({linear_value(1), linear_value(6)}));
    }
}

TEST_CASE("idempotent merges", "[core][merge]")
{
    auto a = make_record(
        {{1, "a"}, {2, linear_sequence{1, 2}}, {3, make_dictionary({{1, 1}})}});
    auto b = make_record(
        {{2, linear_sequence{1, 2, 3}},
         {3, make_dictionary({{2, 2}})},
         {4, false}});
    auto diff = diff_records(a, b);
    REQUIRE(diff.mask);
    auto once = merge_records(*diff.mask, a, diff.after);
    auto twice = merge_records(*diff.mask, once, diff.after);
    REQUIRE(once == b);
    REQUIRE(twice == once);
}

TEST_CASE("repeated sequence truncations", "[core][merge]")
{
    auto diff = diff_records(
        make_record({{1, linear_sequence{"x", "y", "z"}}}),
        make_record({{1, linear_sequence{"x", "y"}}}));
    REQUIRE(
        diff.mask
        == make_mask(
            {{1,
              make_update_entry(make_mask({{2, make_remove_entry()}}))}}));

    // The mask is applied to a longer sequence than the one it came from.
    auto current = make_record({{1, linear_sequence{"a", "b", "c", "d"}}});
    auto once = merge_records(*diff.mask, current, diff.after);
    auto twice = merge_records(*diff.mask, once, diff.after);
    REQUIRE(once == make_record({{1, linear_sequence{"a", "b"}}}));
    REQUIRE(twice == once);
}

TEST_CASE("shape mismatches", "[core][merge]")
{
    auto mask = make_mask(
        {{2,
          make_update_entry(make_mask(
              {{"k",
                make_update_entry(
                    make_mask({{1, make_update_entry()}}))}}))}});
    auto diff = make_record(
        {{2, make_dictionary({{"k", make_record({{1, "x"}})}})}});

    // The current value at a nested slot is a scalar.
    try
    {
        merge_records(
            mask, make_record({{2, make_dictionary({{"k", 12}})}}), diff);
        FAIL("no exception thrown");
    }
    catch (shape_mismatch& e)
    {
        REQUIRE(
            get_required_error_info<value_path_info>(e)
            == std::list<linear_value>({linear_value(2), linear_value("k")}));
        REQUIRE(
            get_required_error_info<expected_value_kind_info>(e)
            == value_kind::RECORD);
        REQUIRE(
            get_required_error_info<actual_value_kind_info>(e)
            == value_kind::INTEGER);
    }

    // The current value at a nested slot is a different composite.
    try
    {
        merge_records(mask, make_record({{2, linear_sequence{}}}), diff);
        FAIL("no exception thrown");
    }
    catch (shape_mismatch& e)
    {
        REQUIRE(
            get_required_error_info<value_path_info>(e)
            == std::list<linear_value>({linear_value(2)}));
        REQUIRE(
            get_required_error_info<actual_value_kind_info>(e)
            == value_kind::SEQUENCE);
    }

    // The nested slot doesn't exist.
    try
    {
        merge_records(mask, linear_record(), diff);
        FAIL("no exception thrown");
    }
    catch (shape_mismatch& e)
    {
        REQUIRE(
            get_required_error_info<actual_value_kind_info>(e)
            == value_kind::NIL);
    }

    // The diff holds a scalar where the mask has a nested mask.
    try
    {
        merge_records(
            make_mask(
                {{1, make_update_entry(make_mask({{1, make_add_entry()}}))}}),
            make_record({{1, make_record({})}}),
            make_record({{1, 3}}));
        FAIL("no exception thrown");
    }
    catch (shape_mismatch& e)
    {
        REQUIRE(
            get_required_error_info<value_path_info>(e)
            == std::list<linear_value>({linear_value(1)}));
    }
}

TEST_CASE("missing delta values", "[core][merge]")
{
    try
    {
        merge_records(
            make_mask({{1, make_update_entry()}}),
            make_record({{1, "a"}}),
            linear_record());
        FAIL("no exception thrown");
    }
    catch (missing_delta_value& e)
    {
        REQUIRE(
            get_required_error_info<value_path_info>(e)
            == std::list<linear_value>({linear_value(1)}));
    }

    // A nil delta means the slot was absent, so it can't be added.
    try
    {
        merge_records(
            make_mask({{1, make_add_entry()}}),
            linear_record(),
            make_record({{1, nil}}));
        FAIL("no exception thrown");
    }
    catch (missing_delta_value&)
    {
    }
}

TEST_CASE("malformed masks", "[core][merge]")
{
    // Only UPDATE entries may be nested.
    update_mask_entry nested_add = make_update_entry(update_mask());
    nested_add.op = update_op::ADD;
    try
    {
        merge_records(
            make_mask({{1, nested_add}}),
            linear_record(),
            make_record({{1, make_record({})}}));
        FAIL("no exception thrown");
    }
    catch (structural_invariant_violation& e)
    {
        REQUIRE(
            get_required_error_info<value_path_info>(e)
            == std::list<linear_value>({linear_value(1)}));
    }

    // Record slots are addressed by field identifier.
    try
    {
        merge_records(
            make_mask({{"a", make_remove_entry()}}),
            linear_record(),
            linear_record());
        FAIL("no exception thrown");
    }
    catch (structural_invariant_violation& e)
    {
        REQUIRE(
            get_required_error_info<actual_value_kind_info>(e)
            == value_kind::STRING);
    }

    // Sequence positions can't be negative.
    try
    {
        merge_records(
            make_mask(
                {{1, make_update_entry(make_mask({{-1, make_remove_entry()}}))}}),
            make_record({{1, linear_sequence{1}}}),
            make_record({{1, linear_sequence{1}}}));
        FAIL("no exception thrown");
    }
    catch (structural_invariant_violation& e)
    {
        REQUIRE(
            get_required_error_info<value_path_info>(e)
            == std::list<linear_value>({linear_value(1), linear_value(-1)}));
    }
}

TEST_CASE("failed merges", "[core][merge]")
{
    auto current = make_record({{1, "a"}, {2, "b"}});
    auto mask
        = make_mask({{1, make_update_entry()}, {2, make_update_entry()}});
    auto diff = make_record({{1, "x"}});

    // The copying version leaves the current record alone.
    try
    {
        merge_records(mask, current, diff);
        FAIL("no exception thrown");
    }
    catch (missing_delta_value&)
    {
    }
    REQUIRE(current == make_record({{1, "a"}, {2, "b"}}));

    // The in-place version may have applied part of the mask.
    auto target = current;
    try
    {
        merge_records_in_place(mask, target, diff);
        FAIL("no exception thrown");
    }
    catch (missing_delta_value& e)
    {
        REQUIRE(
            get_required_error_info<value_path_info>(e)
            == std::list<linear_value>({linear_value(2)}));
    }
    REQUIRE(target.at(1) == linear_value("x"));
}
