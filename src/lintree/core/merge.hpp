#ifndef LINTREE_CORE_MERGE_HPP
#define LINTREE_CORE_MERGE_HPP

#include <lintree/core/update_mask.hpp>

namespace lintree {

// Thrown when a mask asks for a slot to be added or updated but the diff tree
// has no value for that slot.
LINTREE_DEFINE_EXCEPTION(missing_delta_value)

// Apply :mask to a copy of :current, taking new values from :diff (normally
// the 'after' side of a record_diff). Slots that aren't in the mask are left
// untouched, and applying the same mask twice has the same effect as applying
// it once.
//
// On failure, :current is unchanged and the exception carries the path to the
// offending slot.
linear_record
merge_records(
    update_mask const& mask,
    linear_record const& current,
    linear_record const& diff);

// Same as above, but modifies :current directly.
// If this throws, :current may have been partially updated and should be
// discarded.
void
merge_records_in_place(
    update_mask const& mask, linear_record& current, linear_record const& diff);

} // namespace lintree

#endif
