// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "backend/layout.hpp"

#include <algorithm>
#include <ranges>

#include "utility/exception.hpp"


fgp::sort_order fgp::parse_sort_order(std::string_view name) {
    if (name == "call order") return sort_order::call_order;
    if (name == "left heavy") return sort_order::left_heavy;
    if (name == "alphabetical") return sort_order::alphabetical;

    throw fgp::exception{"Unknown sort order {{ {} }}, expected 'call order', 'left heavy' or 'alphabetical'", name};
}

std::string_view fgp::to_string(sort_order sort) noexcept {
    switch (sort) {
    case sort_order::call_order: return "call order";
    case sort_order::left_heavy: return "left heavy";
    case sort_order::alphabetical: return "alphabetical";
    }
    return "unknown";
}

void fgp::validate_sort(sort_order sort, profile_type type) {
    if (sort == sort_order::call_order && type == profile_type::flamegraph)
        throw fgp::invalid_sort_error{"Flamegraph profiles don't support {{ {} }} sorting", to_string(sort)};

    if (sort == sort_order::alphabetical && type == profile_type::flamechart)
        throw fgp::invalid_sort_error{"Flamechart profiles don't support {{ {} }} sorting", to_string(sort)};
}

// --- Sorting ---
// ---------------

namespace {

// Sorting is stable, so siblings that compare equal keep their first-seen order
template <class Less>
void sort_children(fgp::call_tree& tree, Less&& less) {
    for (auto& node : tree.nodes) std::stable_sort(node.children.begin(), node.children.end(), less);
}

} // namespace

void fgp::sort_left_heavy(fgp::call_tree& tree) {
    sort_children(tree, [&](std::size_t lhs, std::size_t rhs) {
        return tree.nodes[lhs].total_weight > tree.nodes[rhs].total_weight;
    });
}

void fgp::sort_alphabetical(fgp::call_tree& tree, std::span<const fgp::frame> frames) {
    sort_children(tree, [&](std::size_t lhs, std::size_t rhs) {
        return frames[tree.nodes[lhs].frame].name < frames[tree.nodes[rhs].frame].name;
    });
}

// --- Layout ---
// --------------

void fgp::assign_cumulative_offsets(fgp::call_tree& tree) {
    auto& root = tree.get_root();

    root.start = 0;
    root.end   = root.total_weight;

    // Pre-order, parents get their offsets before their children
    tree.for_all([&](std::size_t index) {
        double offset = tree.nodes[index].start;

        for (const std::size_t child : tree.nodes[index].children) {
            auto& child_node = tree.nodes[child];

            child_node.start = offset;
            child_node.end   = offset + child_node.total_weight;

            offset = child_node.end;
        }
    });
}

void fgp::layout(fgp::call_tree& tree, sort_order sort, std::span<const fgp::frame> frames, bool chronological) {
    switch (sort) {
    case sort_order::call_order:
        if (chronological) return;
        break;
    case sort_order::left_heavy: fgp::sort_left_heavy(tree); break;
    case sort_order::alphabetical: fgp::sort_alphabetical(tree, frames); break;
    }

    fgp::assign_cumulative_offsets(tree);
}

fgp::call_tree fgp::invert(std::span<const fgp::weighted_stack> samples) {
    fgp::stack_merger merger;

    for (const auto& [stack, weight] : samples) merger.add(fgp::stack(stack.rbegin(), stack.rend()), weight);

    return std::move(merger).finish();
}

std::vector<std::size_t> fgp::flatten(const fgp::call_tree& tree) {
    std::vector<std::size_t> order;
    order.reserve(tree.size());

    tree.for_all_post_order([&](std::size_t index) {
        const auto& node = tree.nodes[index];

        if (node.is_root()) return;
        if (node.end == node.start) return; // zero-width frames are never displayed

        order.push_back(index);
    });

    return order;
}
