#include <lintree/core/value.hpp>

#include <cmath>
#include <limits>
#include <sstream>

#include <lintree/core/testing.hpp>

using namespace lintree;

TEST_CASE("value kind strings", "[core][value]")
{
    std::ostringstream s;
    s << value_kind::NIL << " " << value_kind::INTEGER << " "
      << value_kind::DICTIONARY;
    REQUIRE(s.str() == "nil integer dictionary");

    try
    {
        std::ostringstream t;
        t << value_kind(99);
        FAIL("no exception thrown");
    }
    catch (invalid_enum_value& e)
    {
        REQUIRE(get_required_error_info<enum_id_info>(e) == "value_kind");
        REQUIRE(get_required_error_info<enum_value_info>(e) == 99);
    }
}

TEST_CASE("value kind classification", "[core][value]")
{
    REQUIRE(!is_scalar(value_kind::NIL));
    REQUIRE(is_scalar(value_kind::BOOLEAN));
    REQUIRE(is_scalar(value_kind::BLOB));
    REQUIRE(!is_scalar(value_kind::RECORD));
    REQUIRE(is_composite(value_kind::SEQUENCE));
    REQUIRE(is_composite(value_kind::DICTIONARY));
    REQUIRE(!is_composite(value_kind::STRING));
}

TEST_CASE("value construction", "[core][value]")
{
    REQUIRE(linear_value().kind() == value_kind::NIL);
    REQUIRE(linear_value(nil).kind() == value_kind::NIL);
    REQUIRE(linear_value(true).kind() == value_kind::BOOLEAN);
    REQUIRE(linear_value(1).kind() == value_kind::INTEGER);
    REQUIRE(linear_value(integer(1)).kind() == value_kind::INTEGER);
    REQUIRE(linear_value(1.5).kind() == value_kind::FLOAT);
    REQUIRE(linear_value("foo").kind() == value_kind::STRING);
    REQUIRE(linear_value(blob{{1, 2}}).kind() == value_kind::BLOB);
    REQUIRE(linear_value(linear_record()).kind() == value_kind::RECORD);
    REQUIRE(linear_value(linear_sequence()).kind() == value_kind::SEQUENCE);
    REQUIRE(
        linear_value(linear_dictionary()).kind() == value_kind::DICTIONARY);
}

TEST_CASE("regular value behavior", "[core][value]")
{
    test_regular_value_pair(linear_value(false), linear_value(true));
    test_regular_value_pair(linear_value(-4), linear_value(7));
    test_regular_value_pair(linear_value(0.5), linear_value(1.5));
    test_regular_value_pair(linear_value("bar"), linear_value("foo"));
    test_regular_value_pair(
        linear_value(blob{{1, 2}}), linear_value(blob{{1, 3}}));
    test_regular_value_pair(
        make_record({{1, "a"}}), make_record({{1, "b"}}));
    test_regular_value_pair(
        linear_sequence{1, 2}, linear_sequence{1, 2, 3});
    // Values of different kinds are ordered by kind.
    test_regular_value_pair(linear_value(true), linear_value(0));
    test_regular_value_pair(linear_value(), linear_value(false));
}

TEST_CASE("float identity", "[core][value]")
{
    double nan = std::numeric_limits<double>::quiet_NaN();
    REQUIRE(linear_value(nan) == linear_value(nan));
    REQUIRE(linear_value(0.0) != linear_value(-0.0));
    REQUIRE(linear_value(-0.0) < linear_value(0.0));
    REQUIRE(linear_value(-1.0) < linear_value(-0.5));
    REQUIRE(linear_value(1.0) == linear_value(1.0));
}

TEST_CASE("value casting", "[core][value]")
{
    linear_value v("foo");
    REQUIRE(cast<string>(v) == "foo");
    cast<string>(v) = "bar";
    REQUIRE(v == linear_value("bar"));
    string moved = cast<string>(std::move(v));
    REQUIRE(moved == "bar");

    try
    {
        cast<integer>(linear_value("foo"));
        FAIL("no exception thrown");
    }
    catch (shape_mismatch& e)
    {
        REQUIRE(
            get_required_error_info<expected_value_kind_info>(e)
            == value_kind::INTEGER);
        REQUIRE(
            get_required_error_info<actual_value_kind_info>(e)
            == value_kind::STRING);
    }
}

TEST_CASE("value streaming", "[core][value]")
{
    auto to_string = [](linear_value const& v) {
        std::ostringstream s;
        s << v;
        return s.str();
    };
    REQUIRE(to_string(nil) == "nil");
    REQUIRE(to_string(true) == "true");
    REQUIRE(to_string(12) == "12");
    REQUIRE(to_string("a\"b") == "\"a\\\"b\"");
    REQUIRE(to_string(blob{{0x01, 0xab}}) == "<blob:01ab>");
    REQUIRE(to_string(make_record({{1, "a"}, {3, 2}})) == "{1: \"a\", 3: 2}");
    REQUIRE(to_string(linear_sequence{1, nil}) == "[1, nil]");
    REQUIRE(to_string(make_dictionary({{"k", false}})) == "<\"k\": false>");

    std::ostringstream path;
    path << std::list<linear_value>({linear_value(1), linear_value("k")});
    REQUIRE(path.str() == "/1/\"k\"");
}

TEST_CASE("value path annotation", "[core][value]")
{
    try
    {
        try
        {
            try
            {
                cast<bool>(linear_value(1));
                FAIL("no exception thrown");
            }
            catch (boost::exception& e)
            {
                add_value_path_element(e, linear_value("key"));
                throw;
            }
        }
        catch (boost::exception& e)
        {
            add_value_path_element(e, linear_value(2));
            throw;
        }
    }
    catch (shape_mismatch& e)
    {
        REQUIRE(
            get_required_error_info<value_path_info>(e)
            == std::list<linear_value>(
                {linear_value(2), linear_value("key")}));
    }
}

TEST_CASE("missing error info", "[core][value]")
{
    try
    {
        try
        {
            LINTREE_THROW(shape_mismatch());
        }
        catch (shape_mismatch& e)
        {
            get_required_error_info<value_path_info>(e);
        }
        FAIL("no exception thrown");
    }
    catch (missing_error_info& e)
    {
        REQUIRE(
            get_required_error_info<wrapped_exception_diagnostics_info>(e)
            != "");
    }
}

TEST_CASE("record construction", "[core][value]")
{
    auto record = make_record({{2, "b"}, {1, "a"}});
    REQUIRE(record.size() == 2);
    REQUIRE(record.begin()->first == 1);

    try
    {
        make_record({{1, "a"}, {1, "b"}});
        FAIL("no exception thrown");
    }
    catch (structural_invariant_violation& e)
    {
        REQUIRE(
            get_required_error_info<value_path_info>(e)
            == std::list<linear_value>({linear_value(1)}));
    }
}

TEST_CASE("dictionary construction", "[core][value]")
{
    auto dictionary = make_dictionary({{"a", 1}, {2, "b"}, {true, 3.0}});
    REQUIRE(dictionary.size() == 3);
    REQUIRE(dictionary.at(linear_value("a")) == linear_value(1));
    REQUIRE(dictionary.at(linear_value(2)) == linear_value("b"));

    try
    {
        make_dictionary({{"a", 1}, {"a", 2}});
        FAIL("no exception thrown");
    }
    catch (structural_invariant_violation& e)
    {
        REQUIRE(
            get_required_error_info<value_path_info>(e)
            == std::list<linear_value>({linear_value("a")}));
    }

    try
    {
        make_dictionary({{linear_sequence{1}, 1}});
        FAIL("no exception thrown");
    }
    catch (structural_invariant_violation& e)
    {
        REQUIRE(
            get_required_error_info<actual_value_kind_info>(e)
            == value_kind::SEQUENCE);
    }
}

TEST_CASE("dictionary key order", "[core][value]")
{
    // Keys are ordered by checksum, so the order doesn't depend on the order
    // of insertion.
    auto a = make_dictionary({{"x", 1}, {"y", 2}, {"z", 3}, {4, 4}});
    auto b = make_dictionary({{4, 4}, {"z", 3}, {"y", 2}, {"x", 1}});
    REQUIRE(a == b);
    std::vector<linear_value> a_keys, b_keys;
    for (auto const& entry : a)
        a_keys.push_back(entry.first);
    for (auto const& entry : b)
        b_keys.push_back(entry.first);
    REQUIRE(a_keys == b_keys);

    // Iteration follows the checksums.
    uint32_t previous = 0;
    for (auto const& key : a_keys)
    {
        auto checksum = dictionary_key_checksum(key);
        REQUIRE(checksum >= previous);
        previous = checksum;
    }

    // The kind takes part in the checksum.
    REQUIRE(
        dictionary_key_checksum(linear_value(1))
        != dictionary_key_checksum(linear_value(1.0)));

    try
    {
        dictionary_key_checksum(linear_record());
        FAIL("no exception thrown");
    }
    catch (structural_invariant_violation&)
    {
    }
}

TEST_CASE("paired value application", "[core][value]")
{
    auto same_size = [](auto const& a, auto const& b) {
        if constexpr (std::is_same_v<
                          std::decay_t<decltype(a)>,
                          linear_sequence>)
        {
            return a.size() == b.size();
        }
        else
        {
            return false;
        }
    };
    REQUIRE(apply_to_value_pair(
        same_size, linear_sequence{1, 2}, linear_sequence{3, 4}));
    REQUIRE(!apply_to_value_pair(same_size, linear_value(1), linear_value(2)));

    try
    {
        apply_to_value_pair(same_size, linear_value(1), linear_value("a"));
        FAIL("no exception thrown");
    }
    catch (shape_mismatch& e)
    {
        REQUIRE(
            get_required_error_info<expected_value_kind_info>(e)
            == value_kind::INTEGER);
    }
}
