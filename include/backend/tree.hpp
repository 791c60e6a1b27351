// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// A struct that holds the main in-memory representation of the call tree.
// _________________________________________________________________________________

#pragma once

#include <concepts>
#include <cstddef>
#include <limits>
#include <optional>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "backend/frame.hpp"


// The call tree is a tree of frame occurrences under a synthetic root:
//
// > flamegraph root          total 10 | self 0    // node 0, never pruned
// |  > main                  total 10 | self 1    // depth 0
// |  |  > parse              total  6 | self 6    // depth 1
// |  |  > render             total  3 | self 1    // depth 1
// |  |  |  > draw            total  2 | self 2    // depth 2
//
// Nodes live in a single arena and refer to each other by index, this keeps the tree trivially copyable
// & movable without any pointer fix-ups. Parent links are plain indices used for traversal, ownership
// always belongs to the arena. Every node upholds 'total_weight == self_weight + sum(children total_weight)'.

namespace fgp {

struct call_tree {

    constexpr static std::size_t      no_frame  = std::numeric_limits<std::size_t>::max();
    constexpr static std::size_t      root      = 0;
    constexpr static std::string_view root_name = "flamegraph root";

    struct node {
        std::size_t frame = no_frame; // index into the frame arena of the profile

        double start = 0; // timestamps, or synthetic offsets after the layout
        double end   = 0;

        std::size_t depth = 0; // 0 for the children of the root

        double self_weight  = 0;
        double total_weight = 0;

        std::optional<std::size_t> parent   = {};
        std::vector<std::size_t>   children = {};

        std::vector<std::size_t> collapsed = {}; // frames folded into this node by a collapse strategy

        [[nodiscard]] bool is_root() const noexcept { return !this->parent.has_value(); }
        [[nodiscard]] double width() const noexcept { return this->end - this->start; }
    };

    std::vector<node> nodes{node{}};

    // Appends a finalized node to the arena, links it to its parent & computes its depth
    std::size_t add_child(std::size_t parent, node child);

    [[nodiscard]] node&       at(std::size_t index);
    [[nodiscard]] const node& at(std::size_t index) const;

    [[nodiscard]] node&       get_root() { return this->nodes.front(); }
    [[nodiscard]] const node& get_root() const { return this->nodes.front(); }

    [[nodiscard]] bool        empty() const noexcept { return this->nodes.front().children.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return this->nodes.size() - 1; } // excluding the root

    // Pre-order traversal, parents are visited before their children
    template <std::invocable<std::size_t> Func>
    void for_all(Func func, std::size_t from = root) const {
        func(from);
        for (const std::size_t child : this->nodes[from].children) this->for_all(func, child);
    }

    // Post-order traversal, children are visited before their parents
    template <std::invocable<std::size_t> Func>
    void for_all_post_order(Func func, std::size_t from = root) const {
        for (const std::size_t child : this->nodes[from].children) this->for_all_post_order(func, child);
        func(from);
    }

    // Throws 'fgp::exception' describing the first broken invariant
    void validate_invariants() const;
};

// A single root-to-leaf path, every element can carry frames that were collapsed into it
struct stack_frame {
    std::size_t              frame     = call_tree::no_frame;
    std::vector<std::size_t> collapsed = {};

    bool operator==(const stack_frame& other) const = default;
};

using stack = std::vector<stack_frame>;

struct weighted_stack {
    fgp::stack stack  = {};
    double     weight = 0;
};

[[nodiscard]] fgp::stack make_stack(std::span<const std::size_t> frames);

// Merges weighted stacks into a trie, stacks that share a prefix share the tree nodes along that prefix.
// Children at every level are matched by frame identity (and identical collapsed frames), first-seen
// order of children is preserved.
class stack_merger {

    struct child_key {
        std::size_t              parent;
        std::size_t              frame;
        std::vector<std::size_t> collapsed;

        bool operator==(const child_key& other) const = default;
    };

    struct child_key_hash {
        std::size_t operator()(const child_key& key) const noexcept;
    };

    fgp::call_tree                                          tree{};
    std::unordered_map<child_key, std::size_t, child_key_hash> lookup{};

public:
    // Returns index of the leaf node of the stack, root for an empty stack
    std::size_t add(const fgp::stack& stack, double weight);

    [[nodiscard]] fgp::call_tree finish() &&;
};

[[nodiscard]] fgp::call_tree merge_stacks(std::span<const fgp::weighted_stack> stacks);

} // namespace fgp
