// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Struct representation of the YAML config and its parsing/serialization.
// _________________________________________________________________________________

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "backend/flamegraph.hpp"
#include "utility/version.hpp"


namespace fgp {

struct config {

    // --- Subclasses ---
    // ------------------

    struct prefix_replacement_rule {
        std::string from = {};
        std::string to   = {};
    };

    struct flamegraph_section {
        std::string sort     = "left heavy";
        bool        inverted = false;
        std::string collapse = "none";
        std::string type     = "flamechart";
    };

    struct frames_section {
        bool prettify = true;

        std::vector<prefix_replacement_rule> replace_prefix = {};
    };

    struct output_section {
        std::size_t max_name_width = 117;
        std::size_t min_percentage = 0; // nodes below this share of the root are hidden
    };

    // --- Members ---
    // ---------------

    std::string version = version::format_semantic();

    flamegraph_section flamegraph;
    frames_section     frames;
    output_section     output;

    constexpr static auto default_path = ".flamegraph-profiler";

    // --- Parsing/serialization ---
    // -----------------------------

    static config from_string(std::string_view str);
    static config from_file(std::string_view path);

    std::string to_string() const;
    void        to_file(std::string_view path) const;

    std::optional<std::string> validate() const;

    // --- Conversion ---
    // ------------------

    // Assumes a validated config
    fgp::flamegraph_options  make_flamegraph_options() const;
    fgp::profile_options     make_profile_options() const;
    fgp::frame_index_options make_frame_index_options() const;

    // Applies 'frames.replace_prefix' rules in order
    std::string replace_prefixes(std::string name) const;
};

} // namespace fgp
