#ifndef LINTREE_CORE_UPDATE_MASK_HPP
#define LINTREE_CORE_UPDATE_MASK_HPP

#include <memory>

#include <lintree/core/value.hpp>

namespace lintree {

enum class update_op
{
    // the slot exists in the latest version but not in the previous one
    ADD,
    // the slot exists in both versions but its value changed
    UPDATE,
    // the slot exists in the previous version but not in the latest one
    REMOVE
};

std::ostream&
operator<<(std::ostream& s, update_op op);

struct update_mask;

// An update_mask_entry describes what happened to a single slot.
// Only UPDATE entries may carry a nested mask, and only when the slot holds a
// composite of the same kind on both sides. Without a nested mask, the new
// value of the slot is taken whole from the accompanying diff tree.
struct update_mask_entry
{
    update_op op;
    std::shared_ptr<update_mask const> nested;
};

// update_mask is a tree that mirrors the region of a linear_value tree that
// changed. Its keys are slot keys: integer field identifiers for records,
// integer positions for sequences and the keys themselves for dictionaries.
struct update_mask
{
    std::map<linear_value, update_mask_entry> entries;
};

update_mask_entry
make_add_entry();

update_mask_entry
make_remove_entry();

update_mask_entry
make_update_entry();

update_mask_entry
make_update_entry(update_mask nested);

bool
operator==(update_mask_entry const& a, update_mask_entry const& b);
bool
operator!=(update_mask_entry const& a, update_mask_entry const& b);

bool
operator==(update_mask const& a, update_mask const& b);
bool
operator!=(update_mask const& a, update_mask const& b);

std::ostream&
operator<<(std::ostream& os, update_mask const& mask);

// Invert a mask so that it describes the path from the latest version back to
// the previous one. ADD and REMOVE are swapped at every level; UPDATE stays.
// Merging the inverted mask into the latest version with the 'before' side of
// the original diff yields the previous version.
update_mask
invert_update_mask(update_mask const& mask);

// Count the operations of kind :op at every level of :mask.
size_t
count_mask_operations(update_mask const& mask, update_op op);

} // namespace lintree

#endif
