#include <lintree/core/update_mask.hpp>

namespace lintree {

std::ostream&
operator<<(std::ostream& s, update_op op)
{
    switch (op)
    {
        case update_op::ADD:
            s << "ADD";
            break;
        case update_op::UPDATE:
            s << "UPDATE";
            break;
        case update_op::REMOVE:
            s << "REMOVE";
            break;
        default:
            LINTREE_THROW(
                invalid_enum_value()
                << enum_id_info("update_op") << enum_value_info(int(op)));
    }
    return s;
}

update_mask_entry
make_add_entry()
{
    return update_mask_entry{update_op::ADD, nullptr};
}

update_mask_entry
make_remove_entry()
{
    return update_mask_entry{update_op::REMOVE, nullptr};
}

update_mask_entry
make_update_entry()
{
    return update_mask_entry{update_op::UPDATE, nullptr};
}

update_mask_entry
make_update_entry(update_mask nested)
{
    return update_mask_entry{
        update_op::UPDATE,
        std::make_shared<update_mask const>(std::move(nested))};
}

bool
operator==(update_mask_entry const& a, update_mask_entry const& b)
{
    if (a.op != b.op)
        return false;
    if (!a.nested || !b.nested)
        return !a.nested && !b.nested;
    return *a.nested == *b.nested;
}
bool
operator!=(update_mask_entry const& a, update_mask_entry const& b)
{
    return !(a == b);
}

bool
operator==(update_mask const& a, update_mask const& b)
{
    return a.entries == b.entries;
}
bool
operator!=(update_mask const& a, update_mask const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& os, update_mask const& mask)
{
    os << "{";
    bool first = true;
    for (auto const& [key, entry] : mask.entries)
    {
        if (!first)
            os << ", ";
        first = false;
        os << key << ": " << entry.op;
        if (entry.nested)
            os << *entry.nested;
    }
    os << "}";
    return os;
}

update_mask
invert_update_mask(update_mask const& mask)
{
    update_mask inverted;
    for (auto const& [key, entry] : mask.entries)
    {
        switch (entry.op)
        {
            case update_op::ADD:
                inverted.entries[key] = make_remove_entry();
                break;
            case update_op::REMOVE:
                inverted.entries[key] = make_add_entry();
                break;
            case update_op::UPDATE:
                inverted.entries[key]
                    = entry.nested
                          ? make_update_entry(invert_update_mask(*entry.nested))
                          : make_update_entry();
                break;
        }
    }
    return inverted;
}

size_t
count_mask_operations(update_mask const& mask, update_op op)
{
    size_t count = 0;
    for (auto const& [key, entry] : mask.entries)
    {
        if (entry.op == op)
            ++count;
        if (entry.nested)
            count += count_mask_operations(*entry.nested, op);
    }
    return count;
}

} // namespace lintree
