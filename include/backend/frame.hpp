// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Canonical frame records & the frame registry that deduplicates raw descriptors.
// _________________________________________________________________________________

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "backend/trace.hpp"


namespace fgp {

// A frame is the identity of a function / code location. Traces list frame descriptors by position
// and the same function can be listed multiple times, frames are deduplicated by a key derived from
// the name and the source location, so that every tree node of the same function refers to the same
// frame record.
//
// Frame weights are accumulated by the profile that owns a copy of the registry, a frame's total weight
// is counted once per stack, even when the frame recurses.
struct frame {
    std::size_t   index{}; // position in the canonical frame arena
    std::string   key{};
    std::string   name{};
    bool          is_application{};
    std::string   file{};
    std::string   package{};
    std::string   module{};
    std::uint32_t line{};
    std::uint32_t column{};

    double total_weight{};
    double self_weight{};
};

struct frame_index_options {
    bool prettify = true; // simplify demangled C++ names on native platforms
};

class frame_index {
    std::vector<fgp::frame>                      canonical{};
    std::vector<std::size_t>                     positions{}; // descriptor position -> canonical index
    std::unordered_map<std::string, std::size_t> keys{};      // key -> canonical index

public:
    frame_index() = default;

    // Returns the canonical index of the frame, creating a new record for a previously unseen key
    std::size_t insert(fgp::frame frame);

    void map_position(std::size_t canonical_index);

    [[nodiscard]] const fgp::frame& at(std::size_t position) const; // throws on out-of-range positions
    [[nodiscard]] std::size_t       canonical_index(std::size_t position) const;

    [[nodiscard]] std::span<const fgp::frame> frames() const noexcept { return this->canonical; }
    [[nodiscard]] std::size_t                 size() const noexcept { return this->positions.size(); }
    [[nodiscard]] bool                        empty() const noexcept { return this->positions.empty(); }
};

// Builds the registry from an ordered list of raw descriptors, the platform tag determines
// how names get resolved (e.g. native platforms get their symbols demangled)
[[nodiscard]] fgp::frame_index create_frame_index(std::string_view                        platform,
                                                  std::span<const fgp::frame_descriptor> descriptors,
                                                  const fgp::frame_index_options&         options = {});

[[nodiscard]] std::string make_frame_key(const fgp::frame& frame);

[[nodiscard]] bool is_native_platform(std::string_view platform) noexcept;

} // namespace fgp
