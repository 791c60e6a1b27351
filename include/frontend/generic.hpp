// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Generic logic & state for serializing a flamegraph to a string.
// _________________________________________________________________________________

#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "backend/config.hpp"
#include "backend/flamegraph.hpp"


namespace fgp::output {

struct string_state {
    std::size_t depth{};
    std::string str{};

    template <class... Args>
    void format(fmt::format_string<Args...> fmt, Args&&... args) {
        fmt::format_to(std::back_inserter(this->str), fmt, std::forward<Args>(args)...);
    }
};

// Everything the textual frontends display for a single node
struct node_summary {
    std::string name{};
    std::string total{};
    std::string self{};
    double      total_percentage{};
    double      self_percentage{};
    std::size_t collapsed{};
    bool        is_application{};
};

// Returns 'std::nullopt' for nodes hidden by 'output.min_percentage', names get configured prefixes
// replaced & are truncated to 'output.max_name_width'
[[nodiscard]] std::optional<node_summary> summarize(const fgp::flamegraph& flamegraph, const fgp::config& config,
                                                    std::size_t node_index);

// Header line with the profile name, thread, unit & duration
[[nodiscard]] std::string describe_profile(const fgp::flamegraph& flamegraph);

} // namespace fgp::output
