// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "backend/tree.hpp"

#include <algorithm>
#include <cmath>

#include <boost/container_hash/hash.hpp>

#include "utility/exception.hpp"


// --- Call tree ---
// -----------------

std::size_t fgp::call_tree::add_child(std::size_t parent, node child) {
    const std::size_t index = this->nodes.size();

    child.parent = parent;
    child.depth  = this->at(parent).is_root() ? 0 : this->at(parent).depth + 1;

    this->nodes.push_back(std::move(child));
    this->nodes[parent].children.push_back(index); // 'at(parent)' reference could be invalidated by 'push_back()'

    return index;
}

fgp::call_tree::node& fgp::call_tree::at(std::size_t index) {
    if (index >= this->nodes.size())
        throw fgp::exception{"Node index {} is out of range, the tree contains {} nodes", index, this->nodes.size()};

    return this->nodes[index];
}

const fgp::call_tree::node& fgp::call_tree::at(std::size_t index) const {
    if (index >= this->nodes.size())
        throw fgp::exception{"Node index {} is out of range, the tree contains {} nodes", index, this->nodes.size()};

    return this->nodes[index];
}

void fgp::call_tree::validate_invariants() const {
    if (this->nodes.empty()) throw fgp::exception{"Broken invariant: the tree does not have a root node"};
    if (!this->get_root().is_root()) throw fgp::exception{"Broken invariant: root node of the tree has a parent"};

    // Weights are summed in a different order than they were accumulated, allow for rounding
    const auto approximately_equal = [](double a, double b) {
        return std::abs(a - b) <= 1e-9 * std::max({1.0, std::abs(a), std::abs(b)});
    };

    this->for_all([&](std::size_t index) {
        const auto& node = this->nodes[index];

        if (node.end < node.start)
            throw fgp::exception{"Broken invariant: node {} ends at {} before it starts at {}", index, node.end,
                                 node.start};

        double children_total = 0;

        for (const std::size_t child : node.children) {
            const auto& child_node = this->nodes[child];

            if (child_node.parent != index)
                throw fgp::exception{"Broken invariant: node {} is not linked back to its parent {}", child, index};

            const std::size_t expected_depth = node.is_root() ? 0 : node.depth + 1;

            if (child_node.depth != expected_depth)
                throw fgp::exception{"Broken invariant: node {} has depth {}, expected {}", child, child_node.depth,
                                     expected_depth};

            children_total += child_node.total_weight;
        }

        if (!approximately_equal(node.total_weight, node.self_weight + children_total))
            throw fgp::exception{"Broken invariant: node {} has total weight {}, which isn't self + children {}", index,
                                 node.total_weight, node.self_weight + children_total};
    });
}

// --- Stack merging ---
// ---------------------

fgp::stack fgp::make_stack(std::span<const std::size_t> frames) {
    fgp::stack stack;
    stack.reserve(frames.size());

    for (const std::size_t frame : frames) stack.push_back({.frame = frame});

    return stack;
}

std::size_t fgp::stack_merger::child_key_hash::operator()(const child_key& key) const noexcept {
    std::size_t seed = 0;

    boost::hash_combine(seed, key.parent);
    boost::hash_combine(seed, key.frame);
    boost::hash_range(seed, key.collapsed.begin(), key.collapsed.end());

    return seed;
}

std::size_t fgp::stack_merger::add(const fgp::stack& stack, double weight) {
    std::size_t current = fgp::call_tree::root;

    this->tree.get_root().total_weight += weight;

    for (const auto& element : stack) {
        child_key key{.parent = current, .frame = element.frame, .collapsed = element.collapsed};

        if (const auto it = this->lookup.find(key); it != this->lookup.end()) {
            current = it->second;
        } else {
            const std::size_t child =
                this->tree.add_child(current, {.frame = element.frame, .collapsed = element.collapsed});

            this->lookup.emplace(std::move(key), child);
            current = child;
        }

        this->tree.nodes[current].total_weight += weight;
    }

    this->tree.nodes[current].self_weight += weight; // leaf of the stack, or the root for an empty stack

    return current;
}

fgp::call_tree fgp::stack_merger::finish() && {
    this->lookup.clear();
    return std::move(this->tree);
}

fgp::call_tree fgp::merge_stacks(std::span<const fgp::weighted_stack> stacks) {
    fgp::stack_merger merger;

    for (const auto& [stack, weight] : stacks) merger.add(stack, weight);

    return std::move(merger).finish();
}
