#include <lintree/core/diff.hpp>

#include <algorithm>

#include <lintree/core/logging.hpp>

namespace lintree {

static void
record_change(update_mask& mask, linear_value key, value_comparison& comparison)
{
    mask.entries[std::move(key)]
        = comparison.nested
              ? make_update_entry(std::move(*comparison.nested))
              : make_update_entry();
}

// Compare the values of a slot that exists on both sides, tagging any error
// with the slot's key.
static value_comparison
compare_slot(
    linear_value const& key,
    linear_value const& previous,
    linear_value const& latest)
{
    try
    {
        return compare_values(previous, latest);
    }
    catch (boost::exception& e)
    {
        add_value_path_element(e, key);
        throw;
    }
}

static void
check_present(linear_value const& value);

// Check that :value holds no nil values, tagging any error with :key.
static void
check_present_slot(linear_value const& key, linear_value const& value)
{
    try
    {
        check_present(value);
    }
    catch (boost::exception& e)
    {
        add_value_path_element(e, key);
        throw;
    }
}

// nil marks absent slots in deltas, so it can't appear in a compared tree.
static void
check_present(linear_value const& value)
{
    switch (value.kind())
    {
        case value_kind::NIL:
            LINTREE_THROW(
                structural_invariant_violation()
                << invariant_info("nil value in a compared tree"));
        case value_kind::RECORD:
            for (auto const& [id, field] : cast<linear_record>(value))
                check_present_slot(linear_value(id), field);
            break;
        case value_kind::SEQUENCE: {
            auto const& items = cast<linear_sequence>(value);
            for (size_t i = 0; i != items.size(); ++i)
                check_present_slot(integer(i), items[i]);
            break;
        }
        case value_kind::DICTIONARY:
            for (auto const& [key, item] : cast<linear_dictionary>(value))
                check_present_slot(key, item);
            break;
        default:
            break;
    }
}

static void
diff_record_fields(
    update_mask& mask,
    linear_record& before,
    linear_record& after,
    linear_record const& a,
    linear_record const& b)
{
    // Both records are ordered by identifier, so walk them side by side.
    auto a_i = a.begin(), a_end = a.end();
    auto b_i = b.begin(), b_end = b.end();
    while (1)
    {
        if (a_i != a_end)
        {
            if (b_i != b_end)
            {
                if (a_i->first == b_i->first)
                {
                    linear_value key{a_i->first};
                    auto comparison
                        = compare_slot(key, a_i->second, b_i->second);
                    if (comparison.changed)
                    {
                        before[a_i->first] = std::move(comparison.before);
                        after[a_i->first] = std::move(comparison.after);
                        record_change(mask, key, comparison);
                    }
                    ++a_i;
                    ++b_i;
                }
                else if (a_i->first < b_i->first)
                {
                    // The removed value is the unit of change, so there's no
                    // need to look inside it.
                    check_present_slot(linear_value(a_i->first), a_i->second);
                    before[a_i->first] = a_i->second;
                    after[a_i->first] = nil;
                    mask.entries[linear_value(a_i->first)]
                        = make_remove_entry();
                    ++a_i;
                }
                else
                {
                    check_present_slot(linear_value(b_i->first), b_i->second);
                    before[b_i->first] = nil;
                    after[b_i->first] = b_i->second;
                    mask.entries[linear_value(b_i->first)] = make_add_entry();
                    ++b_i;
                }
            }
            else
            {
                check_present_slot(linear_value(a_i->first), a_i->second);
                before[a_i->first] = a_i->second;
                after[a_i->first] = nil;
                mask.entries[linear_value(a_i->first)] = make_remove_entry();
                ++a_i;
            }
        }
        else
        {
            if (b_i != b_end)
            {
                check_present_slot(linear_value(b_i->first), b_i->second);
                before[b_i->first] = nil;
                after[b_i->first] = b_i->second;
                mask.entries[linear_value(b_i->first)] = make_add_entry();
                ++b_i;
            }
            else
                break;
        }
    }
}

static void
diff_sequence_items(
    update_mask& mask,
    linear_sequence& before,
    linear_sequence& after,
    linear_sequence const& a,
    linear_sequence const& b)
{
    size_t a_size = a.size();
    size_t b_size = b.size();
    size_t common_size = (std::min)(a_size, b_size);

    // Positions are the only identity that sequence items have, so the deltas
    // stay aligned with the longer sequence.
    before.resize((std::max)(a_size, b_size));
    after.resize((std::max)(a_size, b_size));

    for (size_t i = 0; i != common_size; ++i)
    {
        linear_value key{integer(i)};
        auto comparison = compare_slot(key, a[i], b[i]);
        if (comparison.changed)
        {
            before[i] = std::move(comparison.before);
            after[i] = std::move(comparison.after);
            record_change(mask, key, comparison);
        }
    }

    // If the sequence grew, the trailing items were added.
    for (size_t i = common_size; i < b_size; ++i)
    {
        check_present_slot(integer(i), b[i]);
        after[i] = b[i];
        mask.entries[linear_value(integer(i))] = make_add_entry();
    }

    // If it shrank, each trailing item was removed.
    for (size_t i = common_size; i < a_size; ++i)
    {
        check_present_slot(integer(i), a[i]);
        before[i] = a[i];
        mask.entries[linear_value(integer(i))] = make_remove_entry();
    }
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

static void
diff_dictionary_entries(
    update_mask& mask,
    linear_dictionary& before,
    linear_dictionary& after,
    linear_dictionary const& a,
    linear_dictionary const& b)
{
    // Both dictionaries use the same deterministic key order, so they can be
    // walked side by side just like records.
    auto less = a.key_comp();
    auto a_i = a.begin(), a_end = a.end();
    auto b_i = b.begin(), b_end = b.end();
    while (a_i != a_end || b_i != b_end)
    {
        if (a_i != a_end)
            check_dictionary_key(a_i->first);
        if (b_i != b_end)
            check_dictionary_key(b_i->first);

        if (a_i != a_end && b_i != b_end && !less(a_i->first, b_i->first)
            && !less(b_i->first, a_i->first))
        {
            auto comparison = compare_slot(a_i->first, a_i->second, b_i->second);
            if (comparison.changed)
            {
                before[a_i->first] = std::move(comparison.before);
                after[a_i->first] = std::move(comparison.after);
                record_change(mask, a_i->first, comparison);
            }
            ++a_i;
            ++b_i;
        }
        else if (b_i == b_end || (a_i != a_end && less(a_i->first, b_i->first)))
        {
            check_present_slot(a_i->first, a_i->second);
            before[a_i->first] = a_i->second;
            after[a_i->first] = nil;
            mask.entries[a_i->first] = make_remove_entry();
            ++a_i;
        }
        else
        {
            check_present_slot(b_i->first, b_i->second);
            before[b_i->first] = nil;
            after[b_i->first] = b_i->second;
            mask.entries[b_i->first] = make_add_entry();
            ++b_i;
        }
    }
}

value_comparison
compare_values(linear_value const& previous, linear_value const& latest)
{
    value_comparison result;

    // A change of kind can't be described any more precisely than by
    // replacing the whole value.
    if (previous.kind() != latest.kind())
    {
        check_present(previous);
        check_present(latest);
        result.changed = true;
        result.before = previous;
        result.after = latest;
        return result;
    }

    switch (previous.kind())
    {
        case value_kind::RECORD: {
            update_mask mask;
            linear_record before, after;
            diff_record_fields(
                mask,
                before,
                after,
                cast<linear_record>(previous),
                cast<linear_record>(latest));
            if (!mask.entries.empty())
            {
                result.changed = true;
                result.before = std::move(before);
                result.after = std::move(after);
                result.nested = std::move(mask);
            }
            break;
        }
        case value_kind::SEQUENCE: {
            update_mask mask;
            linear_sequence before, after;
            diff_sequence_items(
                mask,
                before,
                after,
                cast<linear_sequence>(previous),
                cast<linear_sequence>(latest));
            if (!mask.entries.empty())
            {
                result.changed = true;
                result.before = std::move(before);
                result.after = std::move(after);
                result.nested = std::move(mask);
            }
            break;
        }
        case value_kind::DICTIONARY: {
            update_mask mask;
            linear_dictionary before, after;
            diff_dictionary_entries(
                mask,
                before,
                after,
                cast<linear_dictionary>(previous),
                cast<linear_dictionary>(latest));
            if (!mask.entries.empty())
            {
                result.changed = true;
                result.before = std::move(before);
                result.after = std::move(after);
                result.nested = std::move(mask);
            }
            break;
        }
        case value_kind::NIL:
            check_present(previous);
            break;
        default:
            if (previous != latest)
            {
                result.changed = true;
                result.before = previous;
                result.after = latest;
            }
            break;
    }
    return result;
}

record_diff
diff_records(linear_record const& previous, linear_record const& latest)
{
    LINTREE_LOG_CALL(<< LINTREE_LOG_ARG(previous) << LINTREE_LOG_ARG(latest))

    record_diff result;
    update_mask mask;
    diff_record_fields(mask, result.before, result.after, previous, latest);
    if (!mask.entries.empty())
    {
        auto logger = get_logger();
        if (logger->should_log(spdlog::level::debug))
        {
            logger->debug(
                "diff_records: {} added, {} updated, {} removed",
                count_mask_operations(mask, update_op::ADD),
                count_mask_operations(mask, update_op::UPDATE),
                count_mask_operations(mask, update_op::REMOVE));
        }
        result.mask = std::move(mask);
    }
    return result;
}

} // namespace lintree
