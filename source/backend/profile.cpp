// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "backend/profile.hpp"

#include <algorithm>
#include <variant>

#include "utility/exception.hpp"


// --- Enum conversions ---
// ------------------------

fgp::profile_type fgp::parse_profile_type(std::string_view name) {
    if (name == "flamegraph") return profile_type::flamegraph;
    if (name == "flamechart") return profile_type::flamechart;

    throw fgp::exception{"Unknown profile type {{ {} }}, expected 'flamegraph' or 'flamechart'", name};
}

std::string_view fgp::to_string(profile_type type) noexcept {
    switch (type) {
    case profile_type::flamegraph: return "flamegraph";
    case profile_type::flamechart: return "flamechart";
    }
    return "unknown";
}

std::string_view fgp::to_string(profile_encoding encoding) noexcept {
    switch (encoding) {
    case profile_encoding::evented: return "evented";
    case profile_encoding::sampled: return "sampled";
    }
    return "unknown";
}

const fgp::frame& fgp::profile::frame_of(const fgp::call_tree::node& node) const {
    if (node.frame >= this->frames.size())
        throw fgp::exception{"Node refers to frame {}, the profile contains {} frames", node.frame, this->frames.size()};

    return this->frames[node.frame];
}

// --- Implementation utils ---
// ----------------------------

namespace {

fgp::profile make_profile_header(std::string name, double start_value, double end_value, std::string_view unit,
                                 std::uint64_t thread_id, const fgp::frame_index& index,
                                 fgp::profile_options options) {
    if (end_value < start_value)
        throw fgp::invalid_trace_error{"Profile {{ {} }} ends at {} before it starts at {}", name, end_value,
                                       start_value};

    fgp::profile profile;

    profile.name      = std::move(name);
    profile.unit      = fgp::time::parse_unit(unit);
    profile.duration  = end_value - start_value;
    profile.thread_id = thread_id;
    profile.type      = options.type;

    // Every profile accumulates its own weights, so it gets its own copy of the frames
    profile.frames.assign(index.frames().begin(), index.frames().end());

    return profile;
}

// Frame weights are derived from the stacks, which makes them encoding-agnostic. A frame that appears multiple
// times in the same stack (recursion) still has its total weight counted once for that stack, otherwise its
// total weight could exceed the duration of the whole profile.
void accumulate_frame_weights(std::vector<fgp::frame>& frames, const std::vector<fgp::weighted_stack>& samples) {
    std::vector<std::size_t> seen; // frames counted for the current stack

    for (const auto& [stack, weight] : samples) {
        if (stack.empty()) continue;

        seen.clear();

        for (const auto& element : stack) {
            if (std::find(seen.begin(), seen.end(), element.frame) != seen.end()) continue;

            seen.push_back(element.frame);
            frames[element.frame].total_weight += weight;
        }

        frames[stack.back().frame].self_weight += weight;
    }
}

// Open node of the evented builder, the node itself is not in the tree until it gets closed
struct open_node {
    fgp::call_tree::node     node;
    std::vector<std::size_t> children; // finalized child nodes
};

} // namespace

// --- Evented profile ---
// -----------------------

// Evented traces list open / close events of every frame in chronological order. Assuming a correct trace
// every "O" event has a matching "C" event, so the event nesting directly reflects the call stack. Below is
// a simple example:
//
// Events:
//    > O main   | stack: [main]          | opens  'main'
//    > O parse  | stack: [main, parse]   | opens  'parse'
//    > C parse  | stack: [main]          | closes 'parse', finalized as a child of 'main'
//    > O render | stack: [main, render]  | opens  'render'
//    > C render | stack: [main]          | closes 'render', finalized as a child of 'main'
//    > C main   | stack: []              | closes 'main', finalized as a child of the root
//
// Nodes get appended to the tree in the order they get closed, which makes the arena order a post-order
// traversal of the chronological tree. Nodes that close at the same timestamp they opened have zero width,
// such nodes are dropped entirely. While walking the events we also record every interval between two
// events as a weighted sample of the stack that was active during that interval.

fgp::profile_ptr fgp::profile::from_evented(const fgp::evented_trace& trace, const fgp::frame_index& index,
                                            profile_options options) {
    fgp::profile profile = make_profile_header(trace.name, trace.start_value, trace.end_value, trace.unit,
                                               trace.thread_id, index, options);

    profile.encoding = profile_encoding::evented;

    std::vector<open_node>   stack;
    std::vector<std::size_t> root_children;
    std::vector<std::size_t> stack_frames; // frames of the open nodes, kept in sync with 'stack'

    double last_timestamp = trace.events.empty() ? 0 : trace.events.front().at;

    for (std::size_t i = 0; i < trace.events.size(); ++i) {
        const auto& event = trace.events[i];

        if (event.at < last_timestamp)
            throw fgp::invalid_trace_error{"Event {} at {} goes back in time, previous event was at {}", i, event.at,
                                           last_timestamp};

        // Whatever was on the stack since the previous event ran for the whole interval
        if (!stack.empty() && event.at > last_timestamp)
            profile.samples.push_back({.stack = fgp::make_stack(stack_frames), .weight = event.at - last_timestamp});

        last_timestamp = event.at;

        const std::size_t frame = index.canonical_index(event.frame);

        // Frame opened
        if (event.type == "O") {
            stack.push_back({.node = {.frame = frame, .start = event.at, .depth = stack.size()}});
            stack_frames.push_back(frame);
        }
        // Frame closed
        else if (event.type == "C") {
            if (stack.empty())
                throw fgp::unbalanced_stack_error{"Unbalanced append order stack, event {} closes frame {{ {} }} while "
                                                  "no frames are open",
                                                  i, profile.frames[frame].name};

            if (stack.back().node.frame != frame)
                throw fgp::unbalanced_stack_error{"Unbalanced append order stack, event {} closes frame {{ {} }} "
                                                  "while the top of the stack is {{ {} }}",
                                                  i, profile.frames[frame].name,
                                                  profile.frames[stack.back().node.frame].name};

            open_node closed = std::move(stack.back());
            stack.pop_back();
            stack_frames.pop_back();

            auto& node = closed.node;

            node.end = event.at;

            if (node.end == node.start) continue; // zero-width node, can't contain anything with non-zero width

            // Gather total & self weight
            double children_total = 0;
            for (const std::size_t child : closed.children) children_total += profile.tree.nodes[child].total_weight;

            node.total_weight = node.end - node.start;
            node.self_weight  = node.total_weight - children_total;
            node.children     = std::move(closed.children);

            // Finalize
            const std::size_t node_index = profile.tree.nodes.size();

            for (const std::size_t child : node.children) profile.tree.nodes[child].parent = node_index;

            profile.tree.nodes.push_back(std::move(node));

            if (stack.empty()) root_children.push_back(node_index);
            else stack.back().children.push_back(node_index);
        }
        // Corrupted event
        else {
            throw fgp::invalid_trace_error{"Event {} has type {{ {} }}, expected 'O' or 'C'", i, event.type};
        }
    }

    if (!stack.empty())
        throw fgp::unbalanced_stack_error{"Unbalanced append order stack, {} frames are still open at the end of the "
                                          "trace, innermost open frame is {{ {} }}",
                                          stack.size(), profile.frames[stack.back().node.frame].name};

    // Attach top-level nodes to the root
    auto& root = profile.tree.get_root();

    for (const std::size_t child : root_children) {
        profile.tree.nodes[child].parent = fgp::call_tree::root;
        root.total_weight += profile.tree.nodes[child].total_weight;
    }

    root.children = std::move(root_children);

    accumulate_frame_weights(profile.frames, profile.samples);

    return std::make_shared<const fgp::profile>(std::move(profile));
}

// --- Sampled profile ---
// -----------------------

// Sampled traces list stacks from the outermost to the innermost frame together with their weights,
// stacks are merged into a trie so that samples sharing a prefix share the tree nodes along that prefix.

fgp::profile_ptr fgp::profile::from_sampled(const fgp::sampled_trace& trace, const fgp::frame_index& index,
                                            profile_options options) {
    fgp::profile profile = make_profile_header(trace.name, trace.start_value, trace.end_value, trace.unit,
                                               trace.thread_id, index, options);

    profile.encoding = profile_encoding::sampled;

    if (trace.weights.size() != trace.samples.size())
        throw fgp::invalid_trace_error{"Sampled profile {{ {} }} has {} weights for {} samples", trace.name,
                                       trace.weights.size(), trace.samples.size()};

    profile.samples.reserve(trace.samples.size());

    for (std::size_t i = 0; i < trace.samples.size(); ++i) {
        const double weight = trace.weights[i];

        if (weight < 0) throw fgp::invalid_trace_error{"Sample {} has negative weight {}", i, weight};

        fgp::stack stack;
        stack.reserve(trace.samples[i].size());

        for (const std::size_t position : trace.samples[i]) stack.push_back({.frame = index.canonical_index(position)});

        profile.samples.push_back({.stack = std::move(stack), .weight = weight});
    }

    profile.tree = fgp::merge_stacks(profile.samples);

    accumulate_frame_weights(profile.frames, profile.samples);

    return std::make_shared<const fgp::profile>(std::move(profile));
}

fgp::profile_ptr fgp::profile::from_trace(const fgp::trace& trace, const fgp::frame_index& index,
                                          profile_options options) {
    if (const auto* evented = std::get_if<fgp::evented_trace>(&trace)) return from_evented(*evented, index, options);
    else return from_sampled(std::get<fgp::sampled_trace>(trace), index, options);
}

fgp::profile_ptr fgp::profile::empty() {
    fgp::profile profile;

    profile.type     = profile_type::flamechart;
    profile.encoding = profile_encoding::evented;

    return std::make_shared<const fgp::profile>(std::move(profile));
}
