#ifndef LINTREE_ADAPTER_LINEARIZE_HPP
#define LINTREE_ADAPTER_LINEARIZE_HPP

#include <boost/numeric/conversion/cast.hpp>

#include <lintree/adapter/schema.hpp>

// This file provides the conversions between structured objects (types with a
// structure_schema) and linear records, along with the conversions for the
// types that their fields can have.

namespace lintree {

// Convert a structured object to a record.
// Only populated fields are included: scalars that hold their default value,
// empty sequences and maps, unset optional messages and nested structures
// with no populated fields are all left out.
template<class T>
linear_record
linearize(T const& object);

// Same, but through a pointer. A null object yields the empty record.
template<class T>
linear_record
linearize(T* object);

// Convert a record back to a structured object.
// *object is reset to its default value first, so fields that aren't in the
// record (or hold nil) keep their default values.
// A record identifier that the schema doesn't declare causes an
// unknown_field_identifier exception, and a value of the wrong kind for its
// field causes a shape_mismatch exception. Either way, the exception carries
// the path to the offending value.
template<class T>
void
unlinearize(linear_record const& record, T* object);

// Get the linearized value of a single field, whether populated or not.
template<class T>
linear_value
get_field_value(T const& object, field_id id);

// Set a single field from its linearized value.
template<class T>
void
set_field_value(T* object, field_id id, linear_value const& value);

// FIELD CONVERSIONS
//
// to_linear(&v, x) converts a field value to a linear_value and
// from_linear(&x, v) converts back. All overloads are declared here so that
// the templates below can find each other.

void
to_linear(linear_value* v, bool x);
void
from_linear(bool* x, linear_value const& v);

void
to_linear(linear_value* v, double x);
void
from_linear(double* x, linear_value const& v);

void
to_linear(linear_value* v, float x);
void
from_linear(float* x, linear_value const& v);

void
to_linear(linear_value* v, string const& x);
void
from_linear(string* x, linear_value const& v);

void
to_linear(linear_value* v, blob const& x);
void
from_linear(blob* x, linear_value const& v);

// Integers are stored as 64-bit integers. Values that don't fit cause a
// boost::numeric::bad_numeric_cast exception.
template<
    class T,
    std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value, int> = 0>
void
to_linear(linear_value* v, T x);
template<
    class T,
    std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value, int> = 0>
void
from_linear(T* x, linear_value const& v);

// Enums are stored as their underlying integer values.
template<class T, std::enable_if_t<std::is_enum<T>::value, int> = 0>
void
to_linear(linear_value* v, T x);
template<class T, std::enable_if_t<std::is_enum<T>::value, int> = 0>
void
from_linear(T* x, linear_value const& v);

template<class T, std::enable_if_t<is_structure<T>::value, int> = 0>
void
to_linear(linear_value* v, T const& x);
template<class T, std::enable_if_t<is_structure<T>::value, int> = 0>
void
from_linear(T* x, linear_value const& v);

template<class T>
void
to_linear(linear_value* v, optional<T> const& x);
template<class T>
void
from_linear(optional<T>* x, linear_value const& v);

template<class T>
void
to_linear(linear_value* v, std::vector<T> const& x);
template<class T>
void
from_linear(std::vector<T>* x, linear_value const& v);

template<class Key, class Value>
void
to_linear(linear_value* v, std::map<Key, Value> const& x);
template<class Key, class Value>
void
from_linear(std::map<Key, Value>* x, linear_value const& v);

// INTEGERS

template<
    class T,
    std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value, int>>
void
to_linear(linear_value* v, T x)
{
    *v = boost::numeric_cast<integer>(x);
}

template<
    class T,
    std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value, int>>
void
from_linear(T* x, linear_value const& v)
{
    *x = boost::numeric_cast<T>(cast<integer>(v));
}

// ENUMS

template<class T, std::enable_if_t<std::is_enum<T>::value, int>>
void
to_linear(linear_value* v, T x)
{
    *v = integer(x);
}

template<class T, std::enable_if_t<std::is_enum<T>::value, int>>
void
from_linear(T* x, linear_value const& v)
{
    *x = static_cast<T>(cast<integer>(v));
}

// STRUCTURES

template<class T, std::enable_if_t<is_structure<T>::value, int>>
void
to_linear(linear_value* v, T const& x)
{
    *v = linearize(x);
}

template<class T, std::enable_if_t<is_structure<T>::value, int>>
void
from_linear(T* x, linear_value const& v)
{
    unlinearize(cast<linear_record>(v), x);
}

// OPTIONAL

template<class T>
void
to_linear(linear_value* v, optional<T> const& x)
{
    if (x)
        to_linear(v, *x);
    else
        *v = nil;
}

template<class T>
void
from_linear(optional<T>* x, linear_value const& v)
{
    if (v.kind() == value_kind::NIL)
    {
        *x = none;
    }
    else
    {
        T value;
        from_linear(&value, v);
        *x = std::move(value);
    }
}

// STD::VECTOR

template<class T>
void
to_linear(linear_value* v, std::vector<T> const& x)
{
    linear_sequence sequence;
    size_t n_items = x.size();
    sequence.resize(n_items);
    for (size_t i = 0; i != n_items; ++i)
    {
        to_linear(&sequence[i], x[i]);
    }
    *v = std::move(sequence);
}

template<class T>
void
from_linear(std::vector<T>* x, linear_value const& v)
{
    linear_sequence const& sequence = cast<linear_sequence>(v);
    size_t n_items = sequence.size();
    x->clear();
    x->reserve(n_items);
    for (size_t i = 0; i != n_items; ++i)
    {
        try
        {
            T item;
            from_linear(&item, sequence[i]);
            x->push_back(std::move(item));
        }
        catch (boost::exception& e)
        {
            add_value_path_element(e, integer(i));
            throw;
        }
    }
}

// STD::MAP

template<class Key, class Value>
void
to_linear(linear_value* v, std::map<Key, Value> const& x)
{
    static_assert(
        !is_structure<Key>::value, "dictionary keys must be scalars");
    linear_dictionary dictionary;
    for (auto const& [key, value] : x)
    {
        linear_value linear_key;
        to_linear(&linear_key, key);
        to_linear(&dictionary[std::move(linear_key)], value);
    }
    *v = std::move(dictionary);
}

template<class Key, class Value>
void
from_linear(std::map<Key, Value>* x, linear_value const& v)
{
    x->clear();
    for (auto const& [linear_key, linear_item] : cast<linear_dictionary>(v))
    {
        try
        {
            Key key;
            from_linear(&key, linear_key);
            from_linear(&(*x)[key], linear_item);
        }
        catch (boost::exception& e)
        {
            add_value_path_element(e, linear_key);
            throw;
        }
    }
}

// RECORDS

namespace detail {

template<class Field>
bool
holds_default_value(Field const& x)
{
    return x == Field();
}

template<class T>
bool
holds_default_value(optional<T> const& x)
{
    return !x;
}

template<class T>
bool
holds_default_value(std::vector<T> const& x)
{
    return x.empty();
}

template<class Key, class Value>
bool
holds_default_value(std::map<Key, Value> const& x)
{
    return x.empty();
}

struct field_writer
{
    linear_record* record;

    template<class Field>
    void
    operator()(field_id id, Field const& member) const
    {
        linear_value value;
        if constexpr (is_structure<Field>::value)
        {
            to_linear(&value, member);
            if (cast<linear_record>(value).empty())
                return;
        }
        else
        {
            if (holds_default_value(member))
                return;
            to_linear(&value, member);
        }
        if (!record->emplace(id, std::move(value)).second)
        {
            LINTREE_THROW(
                structural_invariant_violation()
                << invariant_info("duplicate field identifier in schema")
                << field_id_info(id));
        }
    }
};

} // namespace detail

template<class T>
linear_record
linearize(T const& object)
{
    linear_record record;
    structure_schema<T>::visit(object, detail::field_writer{&record});
    return record;
}

template<class T>
linear_record
linearize(T* object)
{
    return object ? linearize(*object) : linear_record();
}

template<class T>
void
unlinearize(linear_record const& record, T* object)
{
    *object = T();
    for (auto const& [id, value] : record)
    {
        try
        {
            set_field_value(object, id, value);
        }
        catch (boost::exception& e)
        {
            add_value_path_element(e, linear_value(id));
            throw;
        }
    }
}

template<class T>
linear_value
get_field_value(T const& object, field_id id)
{
    optional<linear_value> value;
    structure_schema<T>::visit(object, [&](field_id field, auto const& member) {
        if (field == id)
        {
            linear_value v;
            to_linear(&v, member);
            value = std::move(v);
        }
    });
    if (!value)
        LINTREE_THROW(unknown_field_identifier() << field_id_info(id));
    return std::move(*value);
}

template<class T>
void
set_field_value(T* object, field_id id, linear_value const& value)
{
    bool found = false;
    structure_schema<T>::visit(*object, [&](field_id field, auto& member) {
        if (field == id)
        {
            found = true;
            // nil means the field is absent, so it keeps its default.
            if (value.kind() != value_kind::NIL)
                from_linear(&member, value);
        }
    });
    if (!found)
        LINTREE_THROW(unknown_field_identifier() << field_id_info(id));
}

} // namespace lintree

#endif
