// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "backend/collapse.hpp"

#include "utility/exception.hpp"


fgp::stack fgp::collapse_system_frames(fgp::stack stack, std::span<const fgp::frame> frames) {
    if (stack.size() < 3) return stack; // nothing to collapse after the first frame

    const auto is_application = [&](const fgp::stack_frame& element) {
        if (element.frame >= frames.size())
            throw fgp::exception{"Stack refers to frame {}, only {} frames are known", element.frame, frames.size()};

        return frames[element.frame].is_application;
    };

    fgp::stack result;
    result.reserve(stack.size());

    result.push_back(std::move(stack.front()));

    for (std::size_t i = 1; i < stack.size();) {
        if (is_application(stack[i])) {
            result.push_back(std::move(stack[i++]));
            continue;
        }

        // Locate the run of system frames '[i, run_end)'
        std::size_t run_end = i + 1;
        while (run_end < stack.size() && !is_application(stack[run_end])) ++run_end;

        fgp::stack_frame survivor = std::move(stack[run_end - 1]);

        // Earlier frames of the run, in their original order, go before anything the survivor already had
        std::vector<std::size_t> collapsed;

        for (std::size_t k = i; k < run_end - 1; ++k) {
            collapsed.insert(collapsed.end(), stack[k].collapsed.begin(), stack[k].collapsed.end());
            collapsed.push_back(stack[k].frame);
        }

        collapsed.insert(collapsed.end(), survivor.collapsed.begin(), survivor.collapsed.end());

        survivor.collapsed = std::move(collapsed);
        result.push_back(std::move(survivor));

        i = run_end;
    }

    return result;
}

std::optional<fgp::collapse_strategy> fgp::collapse_strategy_from_name(std::string_view name) {
    if (name == "none") return std::nullopt;
    if (name == "system frames") return fgp::collapse_strategy{&fgp::collapse_system_frames};

    throw fgp::exception{"Unknown collapse strategy {{ {} }}, expected 'none' or 'system frames'", name};
}

bool fgp::is_valid_collapse_name(std::string_view name) noexcept { return name == "none" || name == "system frames"; }
