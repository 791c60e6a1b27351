// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "frontend/terminal.hpp"

#include <fmt/color.h>

#include "frontend/generic.hpp"
#include "utility/exception.hpp"


namespace {

void serialize(fgp::output::string_state& state, const fgp::flamegraph& flamegraph, const fgp::config& config,
               std::size_t node_index) {
    const auto summary = fgp::output::summarize(flamegraph, config, node_index);

    if (!summary) return; // node is hidden, took too little time

    // Indent
    constexpr auto indent_color = fmt::color::gray;

    for (std::size_t i = 0; i < state.depth; ++i) fmt::print(fmt::fg(indent_color), "|  ");

    // Serialize node
    const auto color = summary->is_application           ? fmt::color::yellow
                       : summary->total_percentage >= 50 ? fmt::color::indian_red
                                                         : fmt::color::white;

    constexpr auto fmt = "> {} ({}, {:.2f}%) | self ({}, {:.2f}%)";

    fmt::print(fmt::fg(color), fmt, summary->name, summary->total, summary->total_percentage, summary->self,
               summary->self_percentage);

    if (summary->collapsed) fmt::print(fmt::fg(indent_color), " [+{} collapsed]", summary->collapsed);

    fmt::println("");

    ++state.depth;
    for (const std::size_t child : flamegraph.tree().at(node_index).children)
        serialize(state, flamegraph, config, child);
    --state.depth;
}

} // namespace

void fgp::output::terminal(const fgp::flamegraph& flamegraph, const fgp::config& config) try {
    constexpr auto style_header = fmt::fg(fmt::color::dark_turquoise) | fmt::emphasis::bold;

    // Serialize results to the terminal
    fmt::println("");
    fmt::println("{}", fmt::styled("# Flamegraph", style_header));
    fmt::println("");
    fmt::println("{}", fgp::output::describe_profile(flamegraph));
    fmt::println("");

    fgp::output::string_state state{};
    serialize(state, flamegraph, config, fgp::call_tree::root);

    fmt::println("");

} catch (std::exception& e) {
    throw fgp::exception{"Could not output flamegraph to the terminal, error:\n{}", e.what()};
}
