// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "frontend/json.hpp"

#include "utility/exception.hpp"
#include "utility/json.hpp"


constexpr auto write_options = glz::opts{.prettify = true};

fgp::output::json_report fgp::output::make_json_report(const fgp::flamegraph& flamegraph, const fgp::config& config) {
    const auto& profile = flamegraph.profile();

    json_report report{
        .profile       = profile.name,
        .profile_index = flamegraph.profile_index(),
        .thread_id     = profile.thread_id,
        .unit          = std::string(fgp::time::to_string(profile.unit)),
        .duration      = profile.duration,
        .inverted      = flamegraph.inverted(),
        .sort          = std::string(fgp::to_string(flamegraph.sort())),
        .depth         = flamegraph.depth(),
        .config_space  = flamegraph.config_space(),
    };

    report.frames.reserve(flamegraph.frames().size());

    for (const auto& frame : flamegraph.frames()) {
        const auto& node = flamegraph.tree().at(frame.node);

        json_frame record{
            .name           = config.replace_prefixes(frame.frame->name),
            .start          = frame.start,
            .end            = frame.end,
            .depth          = frame.depth,
            .self_weight    = node.self_weight,
            .total_weight   = node.total_weight,
            .is_application = frame.frame->is_application,
        };

        for (const std::size_t collapsed : node.collapsed)
            record.collapsed.push_back(config.replace_prefixes(profile.frames.at(collapsed).name));

        report.frames.push_back(std::move(record));
    }

    return report;
}

void fgp::output::json(const fgp::flamegraph& flamegraph, const fgp::config& config,
                       const std::filesystem::path& output_directory) try {
    // Ensure proper directory structure
    std::filesystem::create_directories(output_directory);

    // Serialize the JSON dump of the flamegraph
    const auto path = output_directory / "flamegraph.json";

    fgp::write_file_json<write_options>(path.string(), fgp::output::make_json_report(flamegraph, config));

} catch (std::exception& e) { throw fgp::exception{"Could not output flamegraph as JSON, error:\n{}", e.what()}; }
