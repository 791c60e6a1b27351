// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "frontend/text.hpp"

#include <fstream>

#include "frontend/generic.hpp"
#include "utility/exception.hpp"


namespace {

void serialize(fgp::output::string_state& state, const fgp::flamegraph& flamegraph, const fgp::config& config,
               std::size_t node_index) {
    const auto summary = fgp::output::summarize(flamegraph, config, node_index);

    if (!summary) return;

    // Indent
    for (std::size_t i = 0; i < state.depth; ++i) state.format("|  ");

    // Serialize node
    constexpr auto fmt = "> {} ({}, {:.2f}%) | self ({}, {:.2f}%)";

    state.format(fmt, summary->name, summary->total, summary->total_percentage, summary->self,
                 summary->self_percentage);

    if (summary->collapsed) state.format(" [+{} collapsed]", summary->collapsed);

    state.format("\n");

    ++state.depth;
    for (const std::size_t child : flamegraph.tree().at(node_index).children)
        serialize(state, flamegraph, config, child);
    --state.depth;
}

} // namespace

std::string fgp::output::text_report(const fgp::flamegraph& flamegraph, const fgp::config& config) {
    fgp::output::string_state state{};

    state.format("{}\n\n", fgp::output::describe_profile(flamegraph));

    serialize(state, flamegraph, config, fgp::call_tree::root);

    return std::move(state.str);
}

void fgp::output::text(const fgp::flamegraph& flamegraph, const fgp::config& config,
                       const std::filesystem::path& output_directory) try {
    // Ensure proper directory structure
    std::filesystem::create_directories(output_directory);

    // Write to the text file
    const auto    path = output_directory / "report.txt";
    std::ofstream file{path};

    if (!file.good()) throw fgp::exception{"Could not open file {{ {} }} for writing", path.string()};

    file << fgp::output::text_report(flamegraph, config);

} catch (std::exception& e) { throw fgp::exception{"Could not output flamegraph as text, error:\n{}", e.what()}; }
