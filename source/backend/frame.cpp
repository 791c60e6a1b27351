// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "backend/frame.hpp"

#include <array>

#include <fmt/format.h>

#include "utility/demangle.hpp"
#include "utility/exception.hpp"
#include "utility/filepath.hpp"
#include "utility/prettify.hpp"


// --- Name resolution ---
// -----------------------

namespace {

std::string resolve_name(std::string_view platform, const fgp::frame_descriptor& descriptor,
                         const fgp::frame_index_options& options) {
    if (descriptor.name.empty()) {
        if (platform == "javascript" || platform == "node") return "<anonymous>";
        return "<unknown>";
    }

    if (!fgp::is_native_platform(platform)) return descriptor.name;

    std::string name = fgp::symbol::try_demangle(descriptor.name).value_or(descriptor.name);

    if (options.prettify) name = fgp::prettify::full(std::move(name));

    return name;
}

} // namespace

bool fgp::is_native_platform(std::string_view platform) noexcept {
    constexpr std::array<std::string_view, 4> native_platforms = {"native", "cocoa", "android", "cpp"};

    for (const auto& native : native_platforms)
        if (platform == native) return true;
    return false;
}

// Two descriptors describe the same frame if they match in everything that identifies a code location,
// fields are separated by a character that can't appear in any of them
std::string fgp::make_frame_key(const fgp::frame& frame) {
    return fmt::format("{}\x1f{}\x1f{}\x1f{}\x1f{}\x1f{}\x1f{}", frame.name, frame.file, frame.package, frame.module,
                       frame.line, frame.column, frame.is_application);
}

// --- Frame index ---
// -------------------

std::size_t fgp::frame_index::insert(fgp::frame frame) {
    frame.key = fgp::make_frame_key(frame);

    if (const auto it = this->keys.find(frame.key); it != this->keys.end()) return it->second;

    const std::size_t index = this->canonical.size();

    frame.index = index;
    this->keys.emplace(frame.key, index);
    this->canonical.push_back(std::move(frame));

    return index;
}

void fgp::frame_index::map_position(std::size_t canonical_index) {
    if (canonical_index >= this->canonical.size())
        throw fgp::exception{"Could not map frame position to a non-existent canonical frame {}", canonical_index};

    this->positions.push_back(canonical_index);
}

std::size_t fgp::frame_index::canonical_index(std::size_t position) const {
    if (position >= this->positions.size())
        throw fgp::invalid_trace_error{"Frame position {} is out of range, the frame index contains {} frames",
                                       position, this->positions.size()};

    return this->positions[position];
}

const fgp::frame& fgp::frame_index::at(std::size_t position) const {
    return this->canonical[this->canonical_index(position)];
}

fgp::frame_index fgp::create_frame_index(std::string_view platform, std::span<const fgp::frame_descriptor> descriptors,
                                         const fgp::frame_index_options& options) {
    fgp::frame_index index;

    for (const auto& descriptor : descriptors) {
        fgp::frame frame{
            .name           = resolve_name(platform, descriptor, options),
            .is_application = descriptor.is_application.value_or(false),
            .file           = fgp::normalize_filepath(descriptor.file.value_or("")),
            .package        = descriptor.package.value_or(""),
            .module         = descriptor.module.value_or(""),
            .line           = descriptor.line.value_or(0),
            .column         = descriptor.column.value_or(0),
        };

        index.map_position(index.insert(std::move(frame)));
    }

    return index;
}
