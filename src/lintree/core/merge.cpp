#include <lintree/core/merge.hpp>

#include <limits>

#include <lintree/core/logging.hpp>

namespace lintree {

static void
check_entry(update_mask_entry const& entry)
{
    if (entry.nested && entry.op != update_op::UPDATE)
    {
        LINTREE_THROW(
            structural_invariant_violation() << invariant_info(
                "only UPDATE entries may carry a nested mask"));
    }
}

static field_id
get_record_key(linear_value const& key)
{
    if (key.kind() != value_kind::INTEGER)
    {
        LINTREE_THROW(
            structural_invariant_violation()
            << invariant_info("record mask keys must be field identifiers")
            << actual_value_kind_info(key.kind()));
    }
    integer id = cast<integer>(key);
    if (id < (std::numeric_limits<field_id>::min)()
        || id > (std::numeric_limits<field_id>::max)())
    {
        LINTREE_THROW(
            structural_invariant_violation()
            << invariant_info("field identifier out of range"));
    }
    return field_id(id);
}

static size_t
get_sequence_position(linear_value const& key)
{
    if (key.kind() != value_kind::INTEGER || cast<integer>(key) < 0)
    {
        LINTREE_THROW(
            structural_invariant_violation()
            << invariant_info("sequence mask keys must be positions")
            << actual_value_kind_info(key.kind()));
    }
    return size_t(cast<integer>(key));
}

static void
check_dictionary_key(linear_value const& key)
{
    if (!is_scalar(key.kind()))
    {
        LINTREE_THROW(
            structural_invariant_violation()
            << invariant_info("dictionary keys must be scalars")
            << actual_value_kind_info(key.kind()));
    }
}

static linear_value const&
require_delta_value(linear_value const* diff_value)
{
    if (!diff_value || diff_value->kind() == value_kind::NIL)
        LINTREE_THROW(missing_delta_value());
    return *diff_value;
}

static void
merge_value(
    update_mask const& mask, linear_value& current, linear_value const& diff);

// Merge a nested mask into the current value of a slot (or null if the slot
// doesn't exist). The nested mask was computed between two composites of the
// kind that :diff holds, so the current value must be of that kind too.
static void
merge_nested(
    update_mask const& nested, linear_value* current, linear_value const& diff)
{
    if (!is_composite(diff.kind()))
    {
        LINTREE_THROW(
            shape_mismatch() << actual_value_kind_info(diff.kind()));
    }
    if (!current)
    {
        LINTREE_THROW(
            shape_mismatch() << expected_value_kind_info(diff.kind())
                             << actual_value_kind_info(value_kind::NIL));
    }
    check_kind(diff.kind(), current->kind());
    merge_value(nested, *current, diff);
}

static void
merge_record_slots(
    update_mask const& mask, linear_record& current, linear_record const& diff)
{
    for (auto const& [key, entry] : mask.entries)
    {
        try
        {
            check_entry(entry);
            auto id = get_record_key(key);
            if (entry.op == update_op::REMOVE)
            {
                current.erase(id);
                continue;
            }
            auto diff_slot = diff.find(id);
            auto const& diff_value = require_delta_value(
                diff_slot != diff.end() ? &diff_slot->second : nullptr);
            if (entry.nested)
            {
                auto current_slot = current.find(id);
                merge_nested(
                    *entry.nested,
                    current_slot != current.end() ? &current_slot->second
                                                  : nullptr,
                    diff_value);
            }
            else
            {
                current[id] = diff_value;
            }
        }
        catch (boost::exception& e)
        {
            add_value_path_element(e, key);
            throw;
        }
    }
}

static void
merge_sequence_items(
    update_mask const& mask,
    linear_sequence& current,
    linear_sequence const& diff)
{
    // The mask is ordered by position, so additions arrive in ascending order.
    // Removals only ever describe a shrinking tail: they must form a
    // contiguous run that ends the mask, and they're applied last as a single
    // truncation to the lowest removed position.
    optional<size_t> truncation;
    size_t last_removal = 0;
    for (auto const& [key, entry] : mask.entries)
    {
        try
        {
            check_entry(entry);
            auto position = get_sequence_position(key);
            if (truncation
                && (entry.op != update_op::REMOVE
                    || position != last_removal + 1))
            {
                LINTREE_THROW(
                    structural_invariant_violation() << invariant_info(
                        "sequence removals must be a contiguous tail"));
            }
            linear_value const* diff_slot
                = position < diff.size() ? &diff[position] : nullptr;
            switch (entry.op)
            {
                case update_op::REMOVE:
                    if (!truncation)
                        truncation = position;
                    last_removal = position;
                    break;
                case update_op::ADD: {
                    if (position > current.size())
                    {
                        LINTREE_THROW(
                            structural_invariant_violation() << invariant_info(
                                "added position is beyond the end of the "
                                "sequence"));
                    }
                    auto const& diff_value = require_delta_value(diff_slot);
                    // If the item is already there, this is a repeated merge.
                    if (position == current.size())
                        current.push_back(diff_value);
                    else
                        current[position] = diff_value;
                    break;
                }
                case update_op::UPDATE: {
                    auto const& diff_value = require_delta_value(diff_slot);
                    if (entry.nested)
                    {
                        merge_nested(
                            *entry.nested,
                            position < current.size() ? &current[position]
                                                      : nullptr,
                            diff_value);
                    }
                    else
                    {
                        if (position >= current.size())
                        {
                            LINTREE_THROW(
                                structural_invariant_violation()
                                << invariant_info(
                                    "updated position is beyond the end of "
                                    "the sequence"));
                        }
                        current[position] = diff_value;
                    }
                    break;
                }
            }
        }
        catch (boost::exception& e)
        {
            add_value_path_element(e, key);
            throw;
        }
    }
    // Removing positions that are already gone is a no-op.
    if (truncation && *truncation < current.size())
        current.resize(*truncation);
}

static void
merge_dictionary_entries(
    update_mask const& mask,
    linear_dictionary& current,
    linear_dictionary const& diff)
{
    for (auto const& [key, entry] : mask.entries)
    {
        try
        {
            check_entry(entry);
            check_dictionary_key(key);
            if (entry.op == update_op::REMOVE)
            {
                current.erase(key);
                continue;
            }
            auto diff_slot = diff.find(key);
            auto const& diff_value = require_delta_value(
                diff_slot != diff.end() ? &diff_slot->second : nullptr);
            if (entry.nested)
            {
                auto current_slot = current.find(key);
                merge_nested(
                    *entry.nested,
                    current_slot != current.end() ? &current_slot->second
                                                  : nullptr,
                    diff_value);
            }
            else
            {
                current[key] = diff_value;
            }
        }
        catch (boost::exception& e)
        {
            add_value_path_element(e, key);
            throw;
        }
    }
}

static void
merge_value(
    update_mask const& mask, linear_value& current, linear_value const& diff)
{
    switch (current.kind())
    {
        case value_kind::RECORD:
            merge_record_slots(
                mask, cast<linear_record>(current), cast<linear_record>(diff));
            break;
        case value_kind::SEQUENCE:
            merge_sequence_items(
                mask,
                cast<linear_sequence>(current),
                cast<linear_sequence>(diff));
            break;
        case value_kind::DICTIONARY:
            merge_dictionary_entries(
                mask,
                cast<linear_dictionary>(current),
                cast<linear_dictionary>(diff));
            break;
        default:
            LINTREE_THROW(
                shape_mismatch() << actual_value_kind_info(current.kind()));
    }
}

void
merge_records_in_place(
    update_mask const& mask, linear_record& current, linear_record const& diff)
{
    LINTREE_LOG_CALL(
        << LINTREE_LOG_ARG(mask) << LINTREE_LOG_ARG(current)
        << LINTREE_LOG_ARG(diff))

    merge_record_slots(mask, current, diff);

    auto logger = get_logger();
    if (logger->should_log(spdlog::level::debug))
    {
        logger->debug(
            "merge_records: applied {} additions, {} updates, {} removals",
            count_mask_operations(mask, update_op::ADD),
            count_mask_operations(mask, update_op::UPDATE),
            count_mask_operations(mask, update_op::REMOVE));
    }
}

linear_record
merge_records(
    update_mask const& mask,
    linear_record const& current,
    linear_record const& diff)
{
    linear_record merged = current;
    merge_records_in_place(mask, merged, diff);
    return merged;
}

} // namespace lintree
