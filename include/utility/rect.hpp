// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Axis-aligned rectangle used to describe the coordinate space of a flamegraph.
// _________________________________________________________________________________

#pragma once


namespace fgp {

struct rect {
    double x      = 0;
    double y      = 0;
    double width  = 0;
    double height = 0;

    bool operator==(const rect& other) const = default;
};

} // namespace fgp
