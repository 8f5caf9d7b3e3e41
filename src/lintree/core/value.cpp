#include <lintree/core/value.hpp>

#include <algorithm>
#include <cstring>
#include <iomanip>

#include <boost/crc.hpp>

namespace lintree {

std::ostream&
operator<<(std::ostream& s, value_kind k)
{
    switch (k)
    {
        case value_kind::NIL:
            s << "nil";
            break;
        case value_kind::BOOLEAN:
            s << "boolean";
            break;
        case value_kind::INTEGER:
            s << "integer";
            break;
        case value_kind::FLOAT:
            s << "float";
            break;
        case value_kind::STRING:
            s << "string";
            break;
        case value_kind::BLOB:
            s << "blob";
            break;
        case value_kind::RECORD:
            s << "record";
            break;
        case value_kind::SEQUENCE:
            s << "sequence";
            break;
        case value_kind::DICTIONARY:
            s << "dictionary";
            break;
        default:
            LINTREE_THROW(
                invalid_enum_value()
                << enum_id_info("value_kind") << enum_value_info(int(k)));
    }
    return s;
}

bool
is_scalar(value_kind k)
{
    switch (k)
    {
        case value_kind::BOOLEAN:
        case value_kind::INTEGER:
        case value_kind::FLOAT:
        case value_kind::STRING:
        case value_kind::BLOB:
            return true;
        default:
            return false;
    }
}

bool
is_composite(value_kind k)
{
    return k == value_kind::RECORD || k == value_kind::SEQUENCE
           || k == value_kind::DICTIONARY;
}

void
check_kind(value_kind expected, value_kind actual)
{
    if (expected != actual)
    {
        LINTREE_THROW(
            shape_mismatch() << expected_value_kind_info(expected)
                             << actual_value_kind_info(actual));
    }
}

void
linear_value::set(nil_t _)
{
    kind_ = value_kind::NIL;
    value_.reset();
}
void
linear_value::set(bool v)
{
    kind_ = value_kind::BOOLEAN;
    value_ = v;
}
void
linear_value::set(integer v)
{
    kind_ = value_kind::INTEGER;
    value_ = v;
}
void
linear_value::set(double v)
{
    kind_ = value_kind::FLOAT;
    value_ = v;
}
void
linear_value::set(string const& v)
{
    kind_ = value_kind::STRING;
    value_ = v;
}
void
linear_value::set(string&& v)
{
    kind_ = value_kind::STRING;
    value_ = std::move(v);
}
void
linear_value::set(blob const& v)
{
    kind_ = value_kind::BLOB;
    value_ = v;
}
void
linear_value::set(blob&& v)
{
    kind_ = value_kind::BLOB;
    value_ = std::move(v);
}
void
linear_value::set(linear_record const& v)
{
    kind_ = value_kind::RECORD;
    value_ = v;
}
void
linear_value::set(linear_record&& v)
{
    kind_ = value_kind::RECORD;
    value_ = std::move(v);
}
void
linear_value::set(linear_sequence const& v)
{
    kind_ = value_kind::SEQUENCE;
    value_ = v;
}
void
linear_value::set(linear_sequence&& v)
{
    kind_ = value_kind::SEQUENCE;
    value_ = std::move(v);
}
void
linear_value::set(linear_dictionary const& v)
{
    kind_ = value_kind::DICTIONARY;
    value_ = v;
}
void
linear_value::set(linear_dictionary&& v)
{
    kind_ = value_kind::DICTIONARY;
    value_ = std::move(v);
}

void
swap(linear_value& a, linear_value& b)
{
    using std::swap;
    swap(a.kind_, b.kind_);
    swap(a.value_, b.value_);
}

// BLOBS

bool
operator==(blob const& a, blob const& b)
{
    return a.bytes == b.bytes;
}
bool
operator!=(blob const& a, blob const& b)
{
    return !(a == b);
}
bool
operator<(blob const& a, blob const& b)
{
    return a.bytes < b.bytes;
}

std::ostream&
operator<<(std::ostream& os, blob const& b)
{
    os << "<blob:";
    auto flags = os.flags();
    for (auto byte : b.bytes)
        os << std::hex << std::setw(2) << std::setfill('0') << int(byte);
    os.flags(flags);
    os << ">";
    return os;
}

// STREAMING

namespace {

void
write_string(std::ostream& os, string const& s)
{
    os << '"';
    for (char c : s)
    {
        if (c == '"' || c == '\\')
            os << '\\';
        os << c;
    }
    os << '"';
}

struct value_writer
{
    std::ostream& os;

    void
    operator()(nil_t) const
    {
        os << "nil";
    }
    void
    operator()(bool x) const
    {
        os << (x ? "true" : "false");
    }
    void
    operator()(integer x) const
    {
        os << x;
    }
    void
    operator()(double x) const
    {
        os << x;
    }
    void
    operator()(string const& x) const
    {
        write_string(os, x);
    }
    void
    operator()(blob const& x) const
    {
        os << x;
    }
    void
    operator()(linear_record const& x) const
    {
        os << "{";
        bool first = true;
        for (auto const& [id, value] : x)
        {
            if (!first)
                os << ", ";
            first = false;
            os << id << ": " << value;
        }
        os << "}";
    }
    void
    operator()(linear_sequence const& x) const
    {
        os << "[";
        bool first = true;
        for (auto const& item : x)
        {
            if (!first)
                os << ", ";
            first = false;
            os << item;
        }
        os << "]";
    }
    void
    operator()(linear_dictionary const& x) const
    {
        os << "<";
        bool first = true;
        for (auto const& [key, value] : x)
        {
            if (!first)
                os << ", ";
            first = false;
            os << key << ": " << value;
        }
        os << ">";
    }
};

} // namespace

std::ostream&
operator<<(std::ostream& os, linear_value const& v)
{
    apply_to_value(value_writer{os}, v);
    return os;
}

std::ostream&
operator<<(std::ostream& os, std::list<linear_value> const& path)
{
    for (auto const& element : path)
        os << "/" << element;
    return os;
}

// COMPARISON OPERATORS

// Map a double onto an unsigned integer whose ordering is the IEEE total order
// of the original bit pattern.
static uint64_t
float_order_key(double d)
{
    uint64_t bits;
    std::memcpy(&bits, &d, sizeof(bits));
    uint64_t const sign = uint64_t(1) << 63;
    return (bits & sign) ? ~bits : (bits | sign);
}

bool
operator==(linear_value const& a, linear_value const& b)
{
    if (a.kind() != b.kind())
        return false;
    switch (a.kind())
    {
        case value_kind::NIL:
            return true;
        case value_kind::BOOLEAN:
            return cast<bool>(a) == cast<bool>(b);
        case value_kind::INTEGER:
            return cast<integer>(a) == cast<integer>(b);
        case value_kind::FLOAT:
            return float_order_key(cast<double>(a))
                   == float_order_key(cast<double>(b));
        case value_kind::STRING:
            return cast<string>(a) == cast<string>(b);
        case value_kind::BLOB:
            return cast<blob>(a) == cast<blob>(b);
        case value_kind::RECORD:
            return cast<linear_record>(a) == cast<linear_record>(b);
        case value_kind::SEQUENCE:
            return cast<linear_sequence>(a) == cast<linear_sequence>(b);
        case value_kind::DICTIONARY:
            return cast<linear_dictionary>(a) == cast<linear_dictionary>(b);
    }
    return false;
}
bool
operator!=(linear_value const& a, linear_value const& b)
{
    return !(a == b);
}

bool
operator<(linear_value const& a, linear_value const& b)
{
    if (a.kind() != b.kind())
        return a.kind() < b.kind();
    switch (a.kind())
    {
        case value_kind::NIL:
            return false;
        case value_kind::BOOLEAN:
            return cast<bool>(a) < cast<bool>(b);
        case value_kind::INTEGER:
            return cast<integer>(a) < cast<integer>(b);
        case value_kind::FLOAT:
            return float_order_key(cast<double>(a))
                   < float_order_key(cast<double>(b));
        case value_kind::STRING:
            return cast<string>(a) < cast<string>(b);
        case value_kind::BLOB:
            return cast<blob>(a) < cast<blob>(b);
        case value_kind::RECORD:
            return cast<linear_record>(a) < cast<linear_record>(b);
        case value_kind::SEQUENCE:
            return cast<linear_sequence>(a) < cast<linear_sequence>(b);
        case value_kind::DICTIONARY:
            return cast<linear_dictionary>(a) < cast<linear_dictionary>(b);
    }
    return false;
}
bool
operator<=(linear_value const& a, linear_value const& b)
{
    return !(b < a);
}
bool
operator>(linear_value const& a, linear_value const& b)
{
    return b < a;
}
bool
operator>=(linear_value const& a, linear_value const& b)
{
    return !(a < b);
}

// PATHS

void
add_value_path_element(boost::exception& e, linear_value const& path_element)
{
    std::list<linear_value>* info = get_error_info<value_path_info>(e);
    if (info)
    {
        info->push_front(path_element);
    }
    else
    {
        e << value_path_info(std::list<linear_value>({path_element}));
    }
}

// DICTIONARIES

static void
process_little_endian(boost::crc_32_type& crc, uint64_t n)
{
    unsigned char bytes[8];
    for (int i = 0; i != 8; ++i)
        bytes[i] = static_cast<unsigned char>((n >> (8 * i)) & 0xff);
    crc.process_bytes(bytes, sizeof(bytes));
}

uint32_t
dictionary_key_checksum(linear_value const& key)
{
    boost::crc_32_type crc;
    crc.process_byte(static_cast<unsigned char>(key.kind()));
    switch (key.kind())
    {
        case value_kind::BOOLEAN:
            crc.process_byte(cast<bool>(key) ? 1 : 0);
            break;
        case value_kind::INTEGER:
            process_little_endian(crc, static_cast<uint64_t>(cast<integer>(key)));
            break;
        case value_kind::FLOAT: {
            uint64_t bits;
            double d = cast<double>(key);
            std::memcpy(&bits, &d, sizeof(bits));
            process_little_endian(crc, bits);
            break;
        }
        case value_kind::STRING: {
            auto const& s = cast<string>(key);
            crc.process_bytes(s.data(), s.size());
            break;
        }
        case value_kind::BLOB: {
            auto const& b = cast<blob>(key);
            crc.process_bytes(b.bytes.data(), b.bytes.size());
            break;
        }
        default:
            LINTREE_THROW(
                structural_invariant_violation()
                << invariant_info("dictionary keys must be scalars")
                << actual_value_kind_info(key.kind()));
    }
    return crc.checksum();
}

bool
dictionary_key_less::operator()(
    linear_value const& a, linear_value const& b) const
{
    auto a_checksum = dictionary_key_checksum(a);
    auto b_checksum = dictionary_key_checksum(b);
    if (a_checksum != b_checksum)
        return a_checksum < b_checksum;
    return a < b;
}

linear_record
make_record(std::initializer_list<std::pair<field_id const, linear_value>> fields)
{
    linear_record record;
    for (auto const& field : fields)
    {
        if (!record.insert(field).second)
        {
            LINTREE_THROW(
                structural_invariant_violation()
                << invariant_info("duplicate field identifier")
                << value_path_info(
                       std::list<linear_value>({linear_value(field.first)})));
        }
    }
    return record;
}

linear_dictionary
make_dictionary(
    std::initializer_list<std::pair<linear_value const, linear_value>> entries)
{
    linear_dictionary dictionary;
    for (auto const& entry : entries)
    {
        if (!is_scalar(entry.first.kind()))
        {
            LINTREE_THROW(
                structural_invariant_violation()
                << invariant_info("dictionary keys must be scalars")
                << actual_value_kind_info(entry.first.kind()));
        }
        if (!dictionary.insert(entry).second)
        {
            LINTREE_THROW(
                structural_invariant_violation()
                << invariant_info("duplicate dictionary key")
                << value_path_info(std::list<linear_value>({entry.first})));
        }
    }
    return dictionary;
}

} // namespace lintree
