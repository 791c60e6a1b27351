// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Structs that hold an in-memory representation of raw profiling traces.
// _________________________________________________________________________________

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "utility/json.hpp"


namespace fgp {

// Traces come in two encodings that share a common header:
//
//    evented: { name, startValue, endValue, unit, threadID, events:  [{type: 'O'|'C', at, frame}] }
//    sampled: { name, startValue, endValue, unit, threadID, weights: [number], samples: [[frame, ...]] }
//
// Both refer to frames by their position in a shared list of frame descriptors, which
// lives next to the profiles in the trace document:
//
//    { platform, activeProfileIndex, shared: { frames: [...] }, profiles: [...] }

struct frame_descriptor {
    std::string                  name{};
    std::optional<bool>          is_application{};
    std::optional<std::string>   file{};
    std::optional<std::string>   package{};
    std::optional<std::string>   module{};
    std::optional<std::uint32_t> line{};
    std::optional<std::uint32_t> column{};
};

struct evented_trace {

    struct event {
        std::string type{};  // always contains a single char, 'O' (open) or 'C' (close)
        double      at{};    // timestamp in the trace unit
        std::size_t frame{}; // position in the frame descriptor list
    };

    std::string        name{};
    double             start_value{};
    double             end_value{};
    std::string        unit{"microseconds"};
    std::uint64_t      thread_id{};
    std::vector<event> events{};
};

struct sampled_trace {
    std::string                           name{};
    double                                start_value{};
    double                                end_value{};
    std::string                           unit{"microseconds"};
    std::uint64_t                         thread_id{};
    std::vector<double>                   weights{};
    std::vector<std::vector<std::size_t>> samples{}; // each sample goes from the outermost to the innermost frame
};

using trace = std::variant<evented_trace, sampled_trace>;

struct trace_document {

    struct shared_section {
        std::vector<fgp::frame_descriptor> frames{};
    };

    std::string             platform{"mobile"};
    std::size_t             active_profile_index{};
    shared_section          shared{};
    std::vector<fgp::trace> profiles{};
};

} // namespace fgp

// Rename reflected fields so we can use readable names in code, while the trace itself uses camel case
template <>
struct glz::meta<fgp::evented_trace::event> {
    using T = fgp::evented_trace::event;

    static constexpr auto value = glz::object("type", &T::type, "at", &T::at, "frame", &T::frame);
};

template <>
struct glz::meta<fgp::evented_trace> {
    using T = fgp::evented_trace;

    static constexpr auto value = glz::object( //
        "name", &T::name,                      //
        "startValue", &T::start_value,         //
        "endValue", &T::end_value,             //
        "unit", &T::unit,                      //
        "threadID", &T::thread_id,             //
        "events", &T::events                   //
    );                                         //
};

template <>
struct glz::meta<fgp::sampled_trace> {
    using T = fgp::sampled_trace;

    static constexpr auto value = glz::object( //
        "name", &T::name,                      //
        "startValue", &T::start_value,         //
        "endValue", &T::end_value,             //
        "unit", &T::unit,                      //
        "threadID", &T::thread_id,             //
        "weights", &T::weights,                //
        "samples", &T::samples                 //
    );                                         //
};

// Profiles are told apart by their "type" field
template <>
struct glz::meta<fgp::trace> {
    static constexpr std::string_view tag = "type";
    static constexpr auto             ids = std::array{"evented", "sampled"};
};

template <>
struct glz::meta<fgp::trace_document> {
    using T = fgp::trace_document;

    static constexpr auto value = glz::object(             //
        "platform", &T::platform,                          //
        "activeProfileIndex", &T::active_profile_index,    //
        "shared", &T::shared,                              //
        "profiles", &T::profiles                           //
    );                                                     //
};
