// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Sorting strategies, inversion and the layout pass that assigns node offsets
// and flattens the tree into the order used for display.
// _________________________________________________________________________________

#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "backend/frame.hpp"
#include "backend/profile.hpp"
#include "backend/tree.hpp"


namespace fgp {

// Sorting strategies are paired with profile types:
//
//    | strategy       | flamechart | flamegraph | order of siblings                  | offsets           |
//    | -------------- | ---------- | ---------- | ---------------------------------- | ----------------- |
//    | 'call order'   | +          | -          | chronological / first seen         | timestamps        |
//    | 'left heavy'   | +          | +          | descending total weight            | cumulative weight |
//    | 'alphabetical' | -          | +          | frame name, case-sensitive         | cumulative weight |
//
enum class sort_order : std::uint8_t { call_order, left_heavy, alphabetical };

[[nodiscard]] sort_order       parse_sort_order(std::string_view name);
[[nodiscard]] std::string_view to_string(sort_order sort) noexcept;

// Throws 'fgp::invalid_sort_error' for a strategy that doesn't fit the profile type
void validate_sort(sort_order sort, profile_type type);

void sort_left_heavy(fgp::call_tree& tree);
void sort_alphabetical(fgp::call_tree& tree, std::span<const fgp::frame> frames);

// Assigns offsets as cumulative sums of sibling weights, children start where their parent starts
void assign_cumulative_offsets(fgp::call_tree& tree);

// Re-roots the tree by leaf frames, reverses every stack & merges them again
[[nodiscard]] fgp::call_tree invert(std::span<const fgp::weighted_stack> samples);

// Sorts & assigns offsets according to the strategy, chronological trees laid out in 'call order'
// keep their real timestamps, everything else gets cumulative offsets
void layout(fgp::call_tree& tree, sort_order sort, std::span<const fgp::frame> frames, bool chronological);

// Post-order list of nodes, the root & zero-width nodes are omitted
[[nodiscard]] std::vector<std::size_t> flatten(const fgp::call_tree& tree);

} // namespace fgp
