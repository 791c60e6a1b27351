// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Functions for loading trace documents, which handle the filesystem & parsing
// and invoke the actual profile builders.
// _________________________________________________________________________________

#pragma once

#include <cstddef>
#include <string_view>

#include "backend/frame.hpp"
#include "backend/profile.hpp"
#include "backend/trace.hpp"


namespace fgp {

// Both throw 'fgp::invalid_trace_error' for documents that don't match the trace schema
[[nodiscard]] fgp::trace_document parse_trace_document(std::string_view json);
[[nodiscard]] fgp::trace_document read_trace_document(std::string_view path);

// Builds the frame index of the document & the profile at 'profile_index'
[[nodiscard]] fgp::profile_ptr load_profile(const fgp::trace_document& document, std::size_t profile_index,
                                            fgp::profile_options            options       = {},
                                            const fgp::frame_index_options& index_options = {});

} // namespace fgp
