// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Output serialization for '--output=terminal'.
// _________________________________________________________________________________

#pragma once

#include "backend/config.hpp"
#include "backend/flamegraph.hpp"


namespace fgp::output {

void terminal(const fgp::flamegraph& flamegraph, const fgp::config& config);

}
