// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// A struct representing a fully built profile of a single thread, together with
// the builders that turn raw evented / sampled traces into it.
// _________________________________________________________________________________

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "backend/frame.hpp"
#include "backend/trace.hpp"
#include "backend/tree.hpp"
#include "utility/time.hpp"


namespace fgp {

// Hint of how the profile is meant to be viewed, chronological flamecharts and aggregated flamegraphs
// support different sorting strategies
enum class profile_type : std::uint8_t { flamegraph, flamechart };

enum class profile_encoding : std::uint8_t { evented, sampled };

[[nodiscard]] profile_type     parse_profile_type(std::string_view name);
[[nodiscard]] std::string_view to_string(profile_type type) noexcept;
[[nodiscard]] std::string_view to_string(profile_encoding encoding) noexcept;

struct profile_options {
    profile_type type = profile_type::flamechart;
};

struct profile;

using profile_ptr = std::shared_ptr<const fgp::profile>;

// Profiles are immutable once built, builders return them behind a pointer to const
// so that multiple flamegraphs can share the same profile
struct profile {
    std::string      name{};
    fgp::time_unit   unit      = fgp::time_unit::microseconds;
    double           duration  = 0; // 'end_value - start_value'
    std::uint64_t    thread_id = 0;
    profile_type     type      = profile_type::flamechart;
    profile_encoding encoding  = profile_encoding::evented;

    std::vector<fgp::frame> frames{}; // canonical frames with weights accumulated over this profile

    // Evented profiles store the tree in append (chronological) order, which is the order in which nodes
    // were closed, sampled profiles store the merged tree of their samples
    fgp::call_tree tree{};

    // Stacks with their weights, the tree can be re-merged from these in a different shape (inverted, collapsed)
    std::vector<fgp::weighted_stack> samples{};

    [[nodiscard]] bool is_chronological() const noexcept { return this->encoding == profile_encoding::evented; }

    [[nodiscard]] const fgp::frame& frame_of(const fgp::call_tree::node& node) const;

    [[nodiscard]] static profile_ptr from_evented(const fgp::evented_trace& trace, const fgp::frame_index& index,
                                                  profile_options options = {});

    [[nodiscard]] static profile_ptr from_sampled(const fgp::sampled_trace& trace, const fgp::frame_index& index,
                                                  profile_options options = {});

    [[nodiscard]] static profile_ptr from_trace(const fgp::trace& trace, const fgp::frame_index& index,
                                                profile_options options = {});

    [[nodiscard]] static profile_ptr empty();
};

} // namespace fgp
