// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "utility/version.hpp"

#include <fmt/format.h>


std::string fgp::version::format_semantic() { return fmt::format("{}.{}.{}", major, minor, patch); }

// Example:
//    > flamegraph-report 0.1.0 (Linux, x86-64)
//    > Flamegraph & flamechart reports for evented and sampled traces
//    > Copyright (c) 2025 flamegraph-profiler contributors
std::string fgp::version::format_full() {
    return fmt::format("{} {} ({}, {})\n{}\n{}", program, format_semantic(), platform, architecture, description,
                       copyright);
}
