#include <lintree/adapter/linearize.hpp>

namespace lintree {

std::ostream&
operator<<(std::ostream& s, field_kind k)
{
    switch (k)
    {
        case field_kind::SCALAR:
            s << "scalar";
            break;
        case field_kind::MESSAGE:
            s << "message";
            break;
        case field_kind::REPEATED_SCALAR:
            s << "repeated scalar";
            break;
        case field_kind::REPEATED_MESSAGE:
            s << "repeated message";
            break;
        case field_kind::MAP:
            s << "map";
            break;
        default:
            LINTREE_THROW(
                invalid_enum_value()
                << enum_id_info("field_kind") << enum_value_info(int(k)));
    }
    return s;
}

void
to_linear(linear_value* v, bool x)
{
    *v = x;
}
void
from_linear(bool* x, linear_value const& v)
{
    *x = cast<bool>(v);
}

void
to_linear(linear_value* v, double x)
{
    *v = x;
}
void
from_linear(double* x, linear_value const& v)
{
    *x = cast<double>(v);
}

void
to_linear(linear_value* v, float x)
{
    *v = double(x);
}
void
from_linear(float* x, linear_value const& v)
{
    *x = float(cast<double>(v));
}

void
to_linear(linear_value* v, string const& x)
{
    *v = x;
}
void
from_linear(string* x, linear_value const& v)
{
    *x = cast<string>(v);
}

void
to_linear(linear_value* v, blob const& x)
{
    *v = x;
}
void
from_linear(blob* x, linear_value const& v)
{
    *x = cast<blob>(v);
}

} // namespace lintree
