// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "backend/invoke.hpp"

#include "utility/exception.hpp"
#include "utility/json.hpp"


fgp::trace_document fgp::parse_trace_document(std::string_view json) {
    auto result = fgp::try_read_json<fgp::trace_document>(json);

    if (!result) throw fgp::invalid_trace_error{result.error()};

    return std::move(result.value());
}

fgp::trace_document fgp::read_trace_document(std::string_view path) {
    auto result = fgp::try_read_file_json<fgp::trace_document>(path);

    if (!result) throw fgp::invalid_trace_error{result.error()};

    return std::move(result.value());
}

fgp::profile_ptr fgp::load_profile(const fgp::trace_document& document, std::size_t profile_index,
                                   fgp::profile_options options, const fgp::frame_index_options& index_options) {
    if (profile_index >= document.profiles.size())
        throw fgp::exception{"Profile index {} is out of range, the document contains {} profiles", profile_index,
                             document.profiles.size()};

    const fgp::frame_index index = fgp::create_frame_index(document.platform, document.shared.frames, index_options);

    return fgp::profile::from_trace(document.profiles[profile_index], index, options);
}
