// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Immutable laid-out view over a profile, the final product of the backend that
// gets passed to the frontends.
// _________________________________________________________________________________

#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "backend/collapse.hpp"
#include "backend/layout.hpp"
#include "backend/profile.hpp"
#include "backend/tree.hpp"
#include "utility/rect.hpp"
#include "utility/time.hpp"


namespace fgp {

struct flamegraph_options {
    bool       inverted = false;
    sort_order sort     = sort_order::call_order;

    fgp::collapse_strategy collapse{}; // empty function means no collapsing

    std::optional<fgp::rect> config_space{}; // overrides the computed coordinate space
};

// Flat record of a single laid-out node
struct flamegraph_frame {
    std::size_t       node  = 0;       // index into 'flamegraph::tree().nodes'
    const fgp::frame* frame = nullptr; // points into the frames of the shared profile
    double            start = 0;
    double            end   = 0;
    std::size_t       depth = 0;
};

class flamegraph {
    fgp::profile_ptr source{};
    std::size_t      index    = 0;
    bool             is_inverted = false;
    sort_order       sort_by  = sort_order::call_order;

    fgp::call_tree                     laid_out_tree{};
    std::vector<fgp::flamegraph_frame> flat_frames{};
    std::size_t                        max_depth = 0;
    fgp::rect                          space{};
    fgp::time::formatter               format_duration{};

public:
    constexpr static double default_width = 1'000'000; // width of the config space for zero-duration profiles
    constexpr static double empty_width   = 1'000;

    // 'profile_index' is an opaque ordinal of the caller, stored as is.
    // Throws 'fgp::invalid_sort_error' when the sort doesn't fit the profile type.
    flamegraph(fgp::profile_ptr profile, std::size_t profile_index, const flamegraph_options& options = {});

    // Same profile & index as 'other', laid out with different options
    [[nodiscard]] static flamegraph from(const flamegraph& other, const flamegraph_options& options);

    [[nodiscard]] static flamegraph empty();

    [[nodiscard]] const fgp::profile&     profile() const noexcept { return *this->source; }
    [[nodiscard]] std::size_t             profile_index() const noexcept { return this->index; }
    [[nodiscard]] bool                    inverted() const noexcept { return this->is_inverted; }
    [[nodiscard]] sort_order              sort() const noexcept { return this->sort_by; }

    [[nodiscard]] const fgp::call_tree&       tree() const noexcept { return this->laid_out_tree; }
    [[nodiscard]] const fgp::call_tree::node& root() const noexcept { return this->laid_out_tree.get_root(); }

    [[nodiscard]] const std::vector<fgp::flamegraph_frame>& frames() const noexcept { return this->flat_frames; }

    [[nodiscard]] std::size_t                 depth() const noexcept { return this->max_depth; }
    [[nodiscard]] const fgp::rect&            config_space() const noexcept { return this->space; }
    [[nodiscard]] const fgp::time::formatter& formatter() const noexcept { return this->format_duration; }
};

} // namespace fgp
