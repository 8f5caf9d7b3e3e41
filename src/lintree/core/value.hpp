#ifndef LINTREE_CORE_VALUE_HPP
#define LINTREE_CORE_VALUE_HPP

#include <initializer_list>
#include <list>
#include <ostream>
#include <utility>

#include <lintree/core/exception.hpp>
#include <lintree/core/type_definitions.hpp>

namespace lintree {

// LINEAR VALUES - the generic tree that structured records are linearized
// into. A tree is made of scalars and three composite kinds: records (keyed by
// field identifier), sequences (keyed by position) and dictionaries (keyed by
// a scalar key).

std::ostream&
operator<<(std::ostream& s, value_kind k);

// Is :k one of the scalar kinds?
bool
is_scalar(value_kind k);

// Is :k one of the composite kinds (record, sequence, dictionary)?
bool
is_composite(value_kind k);

// Check that two value kinds match.
void
check_kind(value_kind expected, value_kind actual);

// If the above check fails, it throws this exception. The same exception is
// used wherever a value has a different shape than the one required.
LINTREE_DEFINE_EXCEPTION(shape_mismatch)
LINTREE_DEFINE_ERROR_INFO(value_kind, expected_value_kind)
LINTREE_DEFINE_ERROR_INFO(value_kind, actual_value_kind)

// Thrown when a tree or a mask breaks one of its structural rules (e.g.,
// duplicate identifiers or mask keys of the wrong kind).
LINTREE_DEFINE_EXCEPTION(structural_invariant_violation)
LINTREE_DEFINE_ERROR_INFO(string, invariant)

// Get the value_kind value for a C++ type.
template<class T>
struct value_kind_of
{
};
template<>
struct value_kind_of<nil_t>
{
    static value_kind const value = value_kind::NIL;
};
template<>
struct value_kind_of<bool>
{
    static value_kind const value = value_kind::BOOLEAN;
};
template<>
struct value_kind_of<integer>
{
    static value_kind const value = value_kind::INTEGER;
};
template<>
struct value_kind_of<double>
{
    static value_kind const value = value_kind::FLOAT;
};
template<>
struct value_kind_of<string>
{
    static value_kind const value = value_kind::STRING;
};
template<>
struct value_kind_of<blob>
{
    static value_kind const value = value_kind::BLOB;
};
template<>
struct value_kind_of<linear_record>
{
    static value_kind const value = value_kind::RECORD;
};
template<>
struct value_kind_of<linear_sequence>
{
    static value_kind const value = value_kind::SEQUENCE;
};
template<>
struct value_kind_of<linear_dictionary>
{
    static value_kind const value = value_kind::DICTIONARY;
};

// BLOBS

bool
operator==(blob const& a, blob const& b);
bool
operator!=(blob const& a, blob const& b);
bool
operator<(blob const& a, blob const& b);

std::ostream&
operator<<(std::ostream& os, blob const& b);

// PATHS

// When an error occurs in the processing of a tree, this provides the path to
// the slot where the error occurred. Path elements are field identifiers,
// sequence positions or dictionary keys.
LINTREE_DEFINE_ERROR_INFO(std::list<linear_value>, value_path)

// Given an exception :e, this will add :path_element to the beginning of the
// value_path info associated with :e. If there is currently no path info
// associated with :e, a path containing only :path_element is associated
// with it.
void
add_value_path_element(boost::exception& e, linear_value const& path_element);

// VALUES

// Cast a linear_value to one of the base types.
template<class T>
T const&
cast(linear_value const& v)
{
    check_kind(value_kind_of<T>::value, v.kind());
    return std::any_cast<T const&>(v.contents());
}
// Same, but with a non-const reference.
template<class T>
T&
cast(linear_value& v)
{
    check_kind(value_kind_of<T>::value, v.kind());
    return std::any_cast<T&>(v.contents());
}
// Same, but with move semantics.
template<class T>
T&&
cast(linear_value&& v)
{
    check_kind(value_kind_of<T>::value, v.kind());
    return std::any_cast<T&&>(std::move(v).contents());
}

std::ostream&
operator<<(std::ostream& os, linear_value const& v);

std::ostream&
operator<<(std::ostream& os, std::list<linear_value> const& path);

void
swap(linear_value& a, linear_value& b);

// Scalars compare by exact value. Floats compare by identity, so NaN equals
// itself and -0.0 differs from 0.0.
bool
operator==(linear_value const& a, linear_value const& b);
bool
operator!=(linear_value const& a, linear_value const& b);
bool
operator<(linear_value const& a, linear_value const& b);
bool
operator<=(linear_value const& a, linear_value const& b);
bool
operator>(linear_value const& a, linear_value const& b);
bool
operator>=(linear_value const& a, linear_value const& b);

// Get the checksum that dictionary_key_less orders keys by.
// It's computed over the kind and content of :key, which must be a scalar.
uint32_t
dictionary_key_checksum(linear_value const& key);

// Build a record from a list of (identifier, value) pairs.
// Unlike the std::map constructor, this refuses duplicate identifiers.
linear_record
make_record(std::initializer_list<std::pair<field_id const, linear_value>> fields);

// Build a dictionary from a list of (key, value) pairs.
// This refuses duplicate keys and keys that aren't scalars.
linear_dictionary
make_dictionary(
    std::initializer_list<std::pair<linear_value const, linear_value>> entries);

// Apply the functor fn to the value v.
// fn must have the function call operator overloaded for all supported
// types (including nil). If it doesn't, you'll get a compile-time error.
template<class Fn>
auto
apply_to_value(Fn&& fn, linear_value const& v)
{
    switch (v.kind())
    {
        case value_kind::NIL:
        default: // All cases are covered, so this is just to avoid warnings.
            return fn(nil);
        case value_kind::BOOLEAN:
            return fn(cast<bool>(v));
        case value_kind::INTEGER:
            return fn(cast<integer>(v));
        case value_kind::FLOAT:
            return fn(cast<double>(v));
        case value_kind::STRING:
            return fn(cast<string>(v));
        case value_kind::BLOB:
            return fn(cast<blob>(v));
        case value_kind::RECORD:
            return fn(cast<linear_record>(v));
        case value_kind::SEQUENCE:
            return fn(cast<linear_sequence>(v));
        case value_kind::DICTIONARY:
            return fn(cast<linear_dictionary>(v));
    }
}

// Apply the functor fn to two values of the same kind.
// If a and b are not the same kind, this throws a shape_mismatch exception.
template<class Fn>
auto
apply_to_value_pair(Fn&& fn, linear_value const& a, linear_value const& b)
{
    check_kind(a.kind(), b.kind());
    switch (a.kind())
    {
        case value_kind::NIL:
        default: // All cases are covered, so this is just to avoid warnings.
            return fn(nil, nil);
        case value_kind::BOOLEAN:
            return fn(cast<bool>(a), cast<bool>(b));
        case value_kind::INTEGER:
            return fn(cast<integer>(a), cast<integer>(b));
        case value_kind::FLOAT:
            return fn(cast<double>(a), cast<double>(b));
        case value_kind::STRING:
            return fn(cast<string>(a), cast<string>(b));
        case value_kind::BLOB:
            return fn(cast<blob>(a), cast<blob>(b));
        case value_kind::RECORD:
            return fn(cast<linear_record>(a), cast<linear_record>(b));
        case value_kind::SEQUENCE:
            return fn(cast<linear_sequence>(a), cast<linear_sequence>(b));
        case value_kind::DICTIONARY:
            return fn(cast<linear_dictionary>(a), cast<linear_dictionary>(b));
    }
}

} // namespace lintree

#endif
