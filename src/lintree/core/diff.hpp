#ifndef LINTREE_CORE_DIFF_HPP
#define LINTREE_CORE_DIFF_HPP

#include <lintree/core/update_mask.hpp>

namespace lintree {

// record_diff is the result of comparing two versions of a record.
//
// :before and :after hold the changed slots only. A slot that doesn't exist
// on one side holds nil on that side. Within sequences, the deltas are
// positionally aligned with the longer of the two versions and unchanged
// positions hold nil.
//
// :mask is none if and only if the two records are identical.
struct record_diff
{
    linear_record before;
    linear_record after;
    optional<update_mask> mask;
};

// Compute the difference between two records.
// Merging the resulting mask into :previous with :after yields :latest.
// An absent record should be passed as the empty record.
// nil only marks absent slots in the deltas, so a nil value anywhere inside
// either record raises structural_invariant_violation.
record_diff
diff_records(linear_record const& previous, linear_record const& latest);

// value_comparison is the result of comparing two values that occupy the same
// slot. :nested is set when both values are composites of the same kind and
// they differ.
struct value_comparison
{
    bool changed = false;
    linear_value before, after;
    optional<update_mask> nested;
};

// Compare two values slot by slot.
// Values of different kinds are treated as a full replacement.
value_comparison
compare_values(linear_value const& previous, linear_value const& latest);

} // namespace lintree

#endif
