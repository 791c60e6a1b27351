// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "backend/flamegraph.hpp"

#include <algorithm>

#include "utility/exception.hpp"


// --- Tree selection ---
// ----------------------

// Profiles keep both the tree they were built with & the weighted stacks it came from. The stored tree
// is reused whenever the requested view matches its shape, every other view is re-merged from the stacks:
//
//    | view                                  | tree                                     |
//    | ------------------------------------- | ---------------------------------------- |
//    | evented, 'call order'                 | stored chronological tree, timestamps    |
//    | evented, 'left heavy'                 | merged stacks, identical calls aggregate |
//    | sampled                               | stored merged tree                       |
//    | collapsed / inverted                  | stacks transformed & merged again        |
//

namespace {

bool can_reuse_stored_tree(const fgp::profile& profile, const fgp::flamegraph_options& options) {
    if (options.inverted || options.collapse) return false;
    if (profile.is_chronological()) return options.sort == fgp::sort_order::call_order;
    return true;
}

fgp::call_tree build_tree(const fgp::profile& profile, const fgp::flamegraph_options& options) {
    if (can_reuse_stored_tree(profile, options)) return profile.tree;

    std::vector<fgp::weighted_stack> samples = profile.samples;

    if (options.collapse)
        for (auto& sample : samples) sample.stack = options.collapse(std::move(sample.stack), profile.frames);

    if (options.inverted) return fgp::invert(samples);
    else return fgp::merge_stacks(samples);
}

} // namespace

// --- Flamegraph ---
// ------------------

fgp::flamegraph::flamegraph(fgp::profile_ptr profile, std::size_t profile_index, const flamegraph_options& options)
    : source(std::move(profile)), index(profile_index), is_inverted(options.inverted), sort_by(options.sort) {
    if (!this->source) throw fgp::exception{"Could not build a flamegraph without a profile"};

    const fgp::profile& prof = *this->source;

    fgp::validate_sort(options.sort, prof.type);

    const bool chronological = prof.is_chronological() && can_reuse_stored_tree(prof, options);

    this->laid_out_tree = build_tree(prof, options);

    fgp::layout(this->laid_out_tree, options.sort, prof.frames, chronological);

    // Flatten
    const std::vector<std::size_t> order = fgp::flatten(this->laid_out_tree);

    this->flat_frames.reserve(order.size());

    for (const std::size_t node_index : order) {
        const auto& node = this->laid_out_tree.nodes[node_index];

        this->flat_frames.push_back({
            .node  = node_index,
            .frame = &prof.frame_of(node),
            .start = node.start,
            .end   = node.end,
            .depth = node.depth,
        });

        // Only frames that made it into the output count towards the depth, zero-width nodes don't
        this->max_depth = std::max(this->max_depth, node.depth);
    }

    // Bounds

    this->space = options.config_space.value_or(fgp::rect{
        .x      = 0,
        .y      = 0,
        .width  = prof.duration > 0 ? prof.duration : default_width,
        .height = static_cast<double>(this->max_depth),
    });

    this->format_duration = fgp::time::make_formatter(prof.unit);
}

fgp::flamegraph fgp::flamegraph::from(const flamegraph& other, const flamegraph_options& options) {
    return flamegraph(other.source, other.index, options);
}

fgp::flamegraph fgp::flamegraph::empty() {
    return flamegraph(fgp::profile::empty(), 0, {.config_space = fgp::rect{0, 0, empty_width, 0}});
}
