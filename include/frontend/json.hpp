// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Output serialization for '--output=json'.
// _________________________________________________________________________________

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "backend/config.hpp"
#include "backend/flamegraph.hpp"
#include "utility/rect.hpp"


namespace fgp::output {

// Flat frame list in the display order, everything a renderer needs to draw the flamegraph
struct json_frame {
    std::string              name{};
    double                   start{};
    double                   end{};
    std::size_t              depth{};
    double                   self_weight{};
    double                   total_weight{};
    bool                     is_application{};
    std::vector<std::string> collapsed{};
};

struct json_report {
    std::string             profile{};
    std::size_t             profile_index{};
    std::uint64_t           thread_id{};
    std::string             unit{};
    double                  duration{};
    bool                    inverted{};
    std::string             sort{};
    std::size_t             depth{};
    fgp::rect               config_space{};
    std::vector<json_frame> frames{};
};

[[nodiscard]] json_report make_json_report(const fgp::flamegraph& flamegraph, const fgp::config& config);

// Writes 'make_json_report()' to '<output_directory>/flamegraph.json'
void json(const fgp::flamegraph& flamegraph, const fgp::config& config, const std::filesystem::path& output_directory);

} // namespace fgp::output
