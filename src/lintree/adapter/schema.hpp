#ifndef LINTREE_ADAPTER_SCHEMA_HPP
#define LINTREE_ADAPTER_SCHEMA_HPP

#include <map>
#include <ostream>
#include <type_traits>
#include <vector>

#include <lintree/core/value.hpp>

namespace lintree {

// STRUCTURE SCHEMAS
//
// structure_schema<T> describes the fields of a structured type T to the
// object adapter. It must be specialized for every structured type, usually
// next to the type itself. The specialization provides a single function that
// presents each field to a visitor together with its field identifier:
//
//   template<>
//   struct structure_schema<point>
//   {
//       template<class Object, class Visitor>
//       static void
//       visit(Object& x, Visitor&& field)
//       {
//           field(1, x.x);
//           field(2, x.y);
//       }
//   };
//
// :Object is either T or T const, so the same description serves both
// directions of the conversion. Field identifiers must be unique within a
// structure; they're what identifies a field across versions of a record, so
// they shouldn't be reused once assigned.
//
template<class T>
struct structure_schema
{
};

// The kinds of fields that a structure can have.
enum class field_kind
{
    SCALAR,
    MESSAGE,
    REPEATED_SCALAR,
    REPEATED_MESSAGE,
    MAP
};

std::ostream&
operator<<(std::ostream& s, field_kind k);

// Thrown when a field identifier isn't declared by a structure's schema.
LINTREE_DEFINE_EXCEPTION(unknown_field_identifier)
LINTREE_DEFINE_ERROR_INFO(field_id, field_id)

namespace detail {

struct null_field_visitor
{
    template<class Field>
    void
    operator()(field_id, Field&) const
    {
    }
};

} // namespace detail

// is_structure<T>::value is true iff structure_schema is specialized for T.
template<class T, class = void>
struct is_structure : std::false_type
{
};
template<class T>
struct is_structure<
    T,
    std::void_t<decltype(structure_schema<T>::visit(
        std::declval<T&>(), std::declval<detail::null_field_visitor&>()))>>
    : std::true_type
{
};

// field_kind_of<Field>::value is the kind of field that a member of type
// Field represents.
template<class Field, class = void>
struct field_kind_of
{
    static constexpr field_kind value = field_kind::SCALAR;
};
template<class Field>
struct field_kind_of<Field, std::enable_if_t<is_structure<Field>::value>>
{
    static constexpr field_kind value = field_kind::MESSAGE;
};
template<class Field>
struct field_kind_of<optional<Field>> : field_kind_of<Field>
{
};
template<class Item>
struct field_kind_of<std::vector<Item>>
{
    static constexpr field_kind value = is_structure<Item>::value
                                        ? field_kind::REPEATED_MESSAGE
                                        : field_kind::REPEATED_SCALAR;
};
template<class Key, class Value>
struct field_kind_of<std::map<Key, Value>>
{
    static constexpr field_kind value = field_kind::MAP;
};

// Get the field identifiers that T's schema declares, in declaration order.
template<class T>
std::vector<field_id>
schema_field_ids()
{
    std::vector<field_id> ids;
    T prototype{};
    structure_schema<T>::visit(
        prototype, [&](field_id id, auto&) { ids.push_back(id); });
    return ids;
}

// Get the kind of the field with identifier :id in T's schema.
// If T has no such field, this throws unknown_field_identifier.
template<class T>
field_kind
schema_field_kind(field_id id)
{
    optional<field_kind> kind;
    T prototype{};
    structure_schema<T>::visit(prototype, [&](field_id field, auto& member) {
        if (field == id)
        {
            kind = field_kind_of<std::remove_const_t<
                std::remove_reference_t<decltype(member)>>>::value;
        }
    });
    if (!kind)
        LINTREE_THROW(unknown_field_identifier() << field_id_info(id));
    return *kind;
}

} // namespace lintree

#endif
