// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Version, build platform & copyright info.
// _________________________________________________________________________________

#pragma once

#include <string>

#include <UTL/predef.hpp>


namespace fgp {

struct version {
    constexpr static int major = 0;
    constexpr static int minor = 1;
    constexpr static int patch = 0;

    constexpr static auto program      = "flamegraph-report";
    constexpr static auto description  = "Flamegraph & flamechart reports for evented and sampled traces";
    constexpr static auto platform     = utl::predef::platform_name;
    constexpr static auto architecture = utl::predef::architecture_name;

    constexpr static auto copyright = "Copyright (c) 2025 flamegraph-profiler contributors";

    static std::string format_semantic(); // '<major>.<minor>.<patch>', also the version of the config format
    static std::string format_full();     // multiline banner printed by '--version'
};

} // namespace fgp
