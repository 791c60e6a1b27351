// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "frontend/generic.hpp"

#include "utility/time.hpp"


std::optional<fgp::output::node_summary> fgp::output::summarize(const fgp::flamegraph& flamegraph,
                                                                const fgp::config& config, std::size_t node_index) {
    const auto& node      = flamegraph.tree().at(node_index);
    const auto  timeframe = flamegraph.root().total_weight;

    if (!node.is_root() && node.width() == 0) return std::nullopt; // zero-width frames are never displayed

    node_summary summary;

    summary.total_percentage = fgp::time::to_percentage(node.total_weight, timeframe);
    summary.self_percentage  = fgp::time::to_percentage(node.self_weight, timeframe);

    if (!node.is_root() && summary.total_percentage < static_cast<double>(config.output.min_percentage))
        return std::nullopt;

    summary.total     = flamegraph.formatter()(node.total_weight);
    summary.self      = flamegraph.formatter()(node.self_weight);
    summary.collapsed = node.collapsed.size();

    if (node.is_root()) {
        summary.name = fgp::call_tree::root_name;
        return summary;
    }

    const auto& frame = flamegraph.profile().frame_of(node);

    summary.is_application = frame.is_application;
    summary.name           = config.replace_prefixes(frame.name);

    const std::size_t max_name_width = config.output.max_name_width;

    if (summary.name.size() > max_name_width) summary.name = summary.name.substr(0, max_name_width - 3) + "...";

    return summary;
}

std::string fgp::output::describe_profile(const fgp::flamegraph& flamegraph) {
    const auto& profile = flamegraph.profile();

    return fmt::format("Profile {{ {} }} (thread {}, {} {}, {}), sorted by {{ {} }}{}",                  //
                       profile.name, profile.thread_id, fgp::to_string(profile.encoding),              //
                       fgp::to_string(profile.type), flamegraph.formatter()(profile.duration),         //
                       fgp::to_string(flamegraph.sort()), flamegraph.inverted() ? ", inverted" : "");  //
}
