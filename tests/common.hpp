// __________________________________ CONTENTS ___________________________________
//
//    Common utils / includes / namespaces used for testing.
//    Reduces test boilerplate, should not be included anywhere else.
// _______________________________________________________________________________

#pragma once

// ___________________ TEST FRAMEWORK  ____________________

#define DOCTEST_CONFIG_VOID_CAST_EXPRESSIONS // makes 'CHECK_THROWS()' not give warning for discarding [[nodiscard]]
#include <doctest/doctest.h>

// ___________________ PROJECT  ____________________

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "backend/flamegraph.hpp"
#include "backend/frame.hpp"
#include "backend/profile.hpp"
#include "backend/trace.hpp"
#include "backend/tree.hpp"
#include "utility/exception.hpp"

// ___________________ DATA  ____________________

inline const std::filesystem::path data_dir = "tests/data/";

// ___________________ TRACE BUILDERS  ____________________

inline fgp::evented_trace::event open_event(std::size_t frame, double at) {
    return {.type = "O", .at = at, .frame = frame};
}

inline fgp::evented_trace::event close_event(std::size_t frame, double at) {
    return {.type = "C", .at = at, .frame = frame};
}

inline fgp::frame_index make_frame_index(std::vector<fgp::frame_descriptor> descriptors,
                                         std::string_view                   platform = "mobile") {
    return fgp::create_frame_index(platform, descriptors);
}

// Frames 'f0', 'f1', ... with default metadata
inline fgp::frame_index make_frame_index(std::size_t count) {
    std::vector<fgp::frame_descriptor> descriptors;
    for (std::size_t i = 0; i < count; ++i) descriptors.push_back({.name = fmt::format("f{}", i)});
    return make_frame_index(std::move(descriptors));
}

inline fgp::evented_trace make_evented_trace(std::vector<fgp::evented_trace::event> events, double end_value = 1000,
                                             std::string unit = "milliseconds") {
    return {
        .name        = "profile",
        .start_value = 0,
        .end_value   = end_value,
        .unit        = std::move(unit),
        .thread_id   = 0,
        .events      = std::move(events),
    };
}

inline fgp::sampled_trace make_sampled_trace(std::vector<std::vector<std::size_t>> samples, std::vector<double> weights,
                                             double end_value = 1000) {
    return {
        .name        = "profile",
        .start_value = 0,
        .end_value   = end_value,
        .unit        = "milliseconds",
        .thread_id   = 0,
        .weights     = std::move(weights),
        .samples     = std::move(samples),
    };
}

inline fgp::profile_ptr make_evented_profile(std::vector<fgp::evented_trace::event> events, std::size_t frame_count,
                                             fgp::profile_type type = fgp::profile_type::flamechart) {
    return fgp::profile::from_evented(make_evented_trace(std::move(events)), make_frame_index(frame_count),
                                      {.type = type});
}

// ___________________ TREE QUERIES  ____________________

inline std::string name_of(const fgp::profile& profile, const fgp::call_tree& tree, std::size_t node) {
    if (tree.at(node).is_root()) return std::string(fgp::call_tree::root_name);
    return profile.frame_of(tree.at(node)).name;
}

inline std::vector<std::string> child_names(const fgp::profile& profile, const fgp::call_tree& tree,
                                            std::size_t node) {
    std::vector<std::string> names;
    for (const std::size_t child : tree.at(node).children) names.push_back(name_of(profile, tree, child));
    return names;
}

inline std::vector<std::string> collapsed_names(const fgp::profile& profile, const fgp::call_tree& tree,
                                                std::size_t node) {
    std::vector<std::string> names;
    for (const std::size_t frame : tree.at(node).collapsed) names.push_back(profile.frames.at(frame).name);
    return names;
}

// Returns the first child of 'parent' with a given frame name
inline std::optional<std::size_t> find_child(const fgp::profile& profile, const fgp::call_tree& tree,
                                             std::size_t parent, std::string_view name) {
    for (const std::size_t child : tree.at(parent).children)
        if (name_of(profile, tree, child) == name) return child;
    return std::nullopt;
}

// ___________________ INVARIANTS  ____________________

inline void verify_invariants(const fgp::call_tree& tree) {
    tree.for_all([&](std::size_t index) {
        const auto& node = tree.nodes[index];

        // Weights should be positive
        REQUIRE(node.total_weight >= 0);
        REQUIRE(node.self_weight >= 0);

        // Parent cannot weigh less than its children
        double child_total = 0;
        for (const std::size_t child : node.children) child_total += tree.nodes[child].total_weight;

        REQUIRE(node.total_weight == doctest::Approx(node.self_weight + child_total));

        // Nodes never end before they start
        REQUIRE(node.end >= node.start);
    });

    REQUIRE_NOTHROW(tree.validate_invariants());
}
