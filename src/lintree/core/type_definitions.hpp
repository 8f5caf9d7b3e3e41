#ifndef LINTREE_CORE_TYPE_DEFINITIONS_HPP
#define LINTREE_CORE_TYPE_DEFINITIONS_HPP

#include <any>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <boost/optional.hpp>

namespace lintree {

using std::string;

using boost::none;
using boost::optional;

// some(x) creates a boost::optional of the proper type with the value of :x.
template<class T>
auto
some(T&& x)
{
    return optional<std::remove_reference_t<T>>(std::forward<T>(x));
}

typedef int64_t integer;

// Records are keyed by field identifiers, which are assigned by the schema of
// the structured object that the record was linearized from.
typedef int32_t field_id;

// nil_t is a unit type. It has only one possible value, :nil.
// Inside a tree, nil marks a slot that is absent on one side of a delta.
struct nil_t
{
};
static nil_t nil;

// blob is an opaque byte sequence.
struct blob
{
    std::vector<std::uint8_t> bytes;
};

struct linear_value;

enum class value_kind
{
    NIL, // nil_t - absent
    BOOLEAN, // bool
    INTEGER, // integer
    FLOAT, // double
    STRING, // string
    BLOB, // blob - byte sequence
    RECORD, // linear_record - field_id-keyed composite
    SEQUENCE, // linear_sequence - position-keyed composite
    DICTIONARY, // linear_dictionary - key-keyed composite
};

// Records are represented as std::maps and can be manipulated as such.
typedef std::map<field_id, linear_value> linear_record;

// Sequences are represented as std::vectors and can be manipulated as such.
typedef std::vector<linear_value> linear_sequence;

// dictionary_key_less orders dictionary keys by the CRC-32 of their content,
// falling back to the natural key order when two checksums collide. This makes
// iteration order deterministic without depending on how keys compare.
struct dictionary_key_less
{
    bool
    operator()(linear_value const& a, linear_value const& b) const;
};

typedef std::map<linear_value, linear_value, dictionary_key_less>
    linear_dictionary;

struct linear_value
{
    // CONSTRUCTORS

    // Default construction creates a nil value.
    linear_value()
    {
        set(nil);
    }

    // Construct a linear_value from one of the base types.
    linear_value(nil_t v)
    {
        set(v);
    }
    linear_value(bool v)
    {
        set(v);
    }
    linear_value(integer v)
    {
        set(v);
    }
    // Plain int literals would otherwise be ambiguous.
    linear_value(int v)
    {
        set(integer(v));
    }
    linear_value(double v)
    {
        set(v);
    }
    linear_value(string const& v)
    {
        set(v);
    }
    linear_value(string&& v)
    {
        set(std::move(v));
    }
    linear_value(char const* v)
    {
        set(string(v));
    }
    linear_value(blob const& v)
    {
        set(v);
    }
    linear_value(blob&& v)
    {
        set(std::move(v));
    }
    linear_value(linear_record const& v)
    {
        set(v);
    }
    linear_value(linear_record&& v)
    {
        set(std::move(v));
    }
    linear_value(linear_sequence const& v)
    {
        set(v);
    }
    linear_value(linear_sequence&& v)
    {
        set(std::move(v));
    }
    linear_value(linear_dictionary const& v)
    {
        set(v);
    }
    linear_value(linear_dictionary&& v)
    {
        set(std::move(v));
    }

    // GETTERS

    // Get the kind of value stored here.
    value_kind
    kind() const
    {
        return kind_;
    }

    // Get the contents.
    // This should be used with caution.
    // cast<T>(linear_value) provides a safer interface to this.
    std::any const&
    contents() const&
    {
        return value_;
    }

    // Get a non-const reference to the contents.
    // This should be used with caution.
    // cast<T>(linear_value) provides a safer interface to this.
    std::any&
    contents() &
    {
        return value_;
    }

    // Get an r-value reference to the contents.
    std::any&&
    contents() &&
    {
        return std::move(value_);
    }

 private:
    void
    set(nil_t _);
    void
    set(bool v);
    void
    set(integer v);
    void
    set(double v);
    void
    set(string const& v);
    void
    set(string&& v);
    void
    set(blob const& v);
    void
    set(blob&& v);
    void
    set(linear_record const& v);
    void
    set(linear_record&& v);
    void
    set(linear_sequence const& v);
    void
    set(linear_sequence&& v);
    void
    set(linear_dictionary const& v);
    void
    set(linear_dictionary&& v);

    friend void
    swap(linear_value& a, linear_value& b);

    value_kind kind_;
    std::any value_;
};

} // namespace lintree

#endif
