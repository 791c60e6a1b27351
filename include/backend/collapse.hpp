// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Pluggable strategies that compress repetitive runs of frames in a stack before
// it gets merged into a tree. Collapsing is a lossy view meant for display, the
// surviving frame keeps the full weight of the run, so totals remain correct.
// _________________________________________________________________________________

#pragma once

#include <functional>
#include <optional>
#include <span>
#include <string_view>

#include "backend/frame.hpp"
#include "backend/tree.hpp"


namespace fgp {

// Strategies get a stack (outermost frame first) and return the collapsed stack, they should be
// pure, the same stack always collapses the same way and the frames are never modified
using collapse_strategy = std::function<fgp::stack(fgp::stack, std::span<const fgp::frame>)>;

// Replaces every run of 2+ consecutive system (non-application) frames with the last frame of the run,
// earlier frames of the run are recorded in its 'collapsed' list. The outermost frame is never collapsed:
//
//    [f0, f1*, f2, f2, f3] -> [f0, f1*, f3 (collapsed: f2, f2)]    // '*' marks application frames
//    [f0, f3, f4, f1*]     -> [f0, f4 (collapsed: f3), f1*]
//
[[nodiscard]] fgp::stack collapse_system_frames(fgp::stack stack, std::span<const fgp::frame> frames);

// Strategies selectable by name from the config / CLI: "none" or "system frames"
[[nodiscard]] std::optional<fgp::collapse_strategy> collapse_strategy_from_name(std::string_view name);

[[nodiscard]] bool is_valid_collapse_name(std::string_view name) noexcept;

} // namespace fgp
