// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "backend/config.hpp"

#include <fstream>
#include <regex>

#include <fkYAML/node.hpp>
#include <UTL/stre.hpp>

#include "utility/exception.hpp"


namespace {

// More or less the fastest way of reading a text file
[[nodiscard]] std::string read_file_to_string(const std::string& path) {
    std::ifstream file(path, std::ios::ate | std::ios::binary); // open file and immediately seek to the end
    // opening file as binary allows us to skip pointless newline re-encoding
    if (!file.good()) throw fgp::exception("Could not open file {{ {} }}", path);

    const auto file_size = file.tellg(); // returns cursor pos, which is the end of file
    file.seekg(std::ios::beg);           // seek to the beginning
    std::string chars(file_size, 0);     // allocate string of appropriate size
    file.read(chars.data(), file_size);  // read into the string
    return chars;
}

bool is_valid_name(std::string_view name, auto&& parse) {
    try {
        [[maybe_unused]] const auto value = parse(name);
        return true;
    } catch (fgp::exception&) { return false; }
}

} // namespace

fgp::config fgp::config::from_string(std::string_view str) try {
    const fkyaml::node root = fkyaml::node::deserialize(str);

    fgp::config config;

    if (root.contains("version")) config.version = root.at("version").as_str();

    if (root.contains("flamegraph")) {
        const auto& flamegraph = root.at("flamegraph");

        if (flamegraph.contains("sort")) config.flamegraph.sort = flamegraph.at("sort").as_str();
        if (flamegraph.contains("inverted")) config.flamegraph.inverted = flamegraph.at("inverted").as_bool();
        if (flamegraph.contains("collapse")) config.flamegraph.collapse = flamegraph.at("collapse").as_str();
        if (flamegraph.contains("type")) config.flamegraph.type = flamegraph.at("type").as_str();
    }

    if (root.contains("frames")) {
        const auto& frames = root.at("frames");

        if (frames.contains("prettify")) config.frames.prettify = frames.at("prettify").as_bool();

        if (frames.contains("replace_prefix")) {
            config.frames.replace_prefix.clear();

            for (const auto& node : frames.at("replace_prefix").as_seq())
                config.frames.replace_prefix.push_back({.from = node.at("from").as_str(), .to = node.at("to").as_str()});
        }
    }

    if (root.contains("output")) {
        const auto& output = root.at("output");

        if (output.contains("max_name_width"))
            config.output.max_name_width = static_cast<std::size_t>(output.at("max_name_width").as_int());
        if (output.contains("min_percentage"))
            config.output.min_percentage = static_cast<std::size_t>(output.at("min_percentage").as_int());
    }

    return config;

} catch (std::exception& e) { throw fgp::exception{"Could not parse config, error:\n{}", e.what()}; }

fgp::config fgp::config::from_file(std::string_view path) {
    return fgp::config::from_string(read_file_to_string(std::string(path)));
}

std::string fgp::config::to_string() const {
    fkyaml::node root;

    root["version"] = this->version;

    root["flamegraph"]["sort"]     = this->flamegraph.sort;
    root["flamegraph"]["inverted"] = this->flamegraph.inverted;
    root["flamegraph"]["collapse"] = this->flamegraph.collapse;
    root["flamegraph"]["type"]     = this->flamegraph.type;

    root["frames"]["prettify"] = this->frames.prettify;

    auto& replace_prefix_node = (root["frames"]["replace_prefix"] = fkyaml::node::sequence());

    for (const auto& replacement : this->frames.replace_prefix) {
        fkyaml::node node;
        node["from"] = replacement.from;
        node["to"]   = replacement.to;

        replace_prefix_node.as_seq().emplace_back(std::move(node));
    }

    root["output"]["max_name_width"] = static_cast<std::int64_t>(this->output.max_name_width);
    root["output"]["min_percentage"] = static_cast<std::int64_t>(this->output.min_percentage);

    return fkyaml::node::serialize(root);
}

void fgp::config::to_file(std::string_view path) const {
    std::ofstream file(std::string(path));
    if (!file.good()) throw fgp::exception{"Could not open file {{ {} }} for writing", path};

    file << this->to_string();
}

// Function for validating the config & making user-friendly error messages
std::optional<std::string> fgp::config::validate() const {

    // Validate version
    if (!std::regex_match(this->version, std::regex{R"(^\d+\.\d+\.\d+$)"})) {
        constexpr auto fmt = "'version' has a value {{ {} }}, which doesn't match the schema <major>.<minor>.<patch>";
        return fmt::format(fmt, this->version);
    }

    // Validate flamegraph options
    if (!is_valid_name(this->flamegraph.sort, fgp::parse_sort_order)) {
        constexpr auto fmt = "'flamegraph.sort' has a value {{ {} }}, expected 'call order', 'left heavy' or "
                             "'alphabetical'";
        return fmt::format(fmt, this->flamegraph.sort);
    }

    if (!fgp::is_valid_collapse_name(this->flamegraph.collapse)) {
        constexpr auto fmt = "'flamegraph.collapse' has a value {{ {} }}, expected 'none' or 'system frames'";
        return fmt::format(fmt, this->flamegraph.collapse);
    }

    if (!is_valid_name(this->flamegraph.type, fgp::parse_profile_type)) {
        constexpr auto fmt = "'flamegraph.type' has a value {{ {} }}, expected 'flamegraph' or 'flamechart'";
        return fmt::format(fmt, this->flamegraph.type);
    }

    // Sort & type pairing
    try {
        fgp::validate_sort(fgp::parse_sort_order(this->flamegraph.sort), fgp::parse_profile_type(this->flamegraph.type));
    } catch (fgp::invalid_sort_error& e) {
        return fmt::format("'flamegraph.sort' doesn't fit 'flamegraph.type': {}", e.message());
    }

    // Validate prefix replacement rules
    std::size_t replace_prefix_pos = 0;

    for (const auto& [from, to] : this->frames.replace_prefix) {
        if (from.empty()) {
            constexpr auto fmt = "'frames.replace_prefix' contains an empty 'from' prefix at position {}";
            return fmt::format(fmt, replace_prefix_pos);
        }

        ++replace_prefix_pos;
    }

    // Validate output
    if (this->output.max_name_width < 4) {
        constexpr auto fmt = "'output.max_name_width' has a value {{ {} }}, which is too small to fit any name";
        return fmt::format(fmt, this->output.max_name_width);
    }

    if (this->output.min_percentage > 100) {
        constexpr auto fmt = "'output.min_percentage' has a value {{ {} }}, expected a percentage in [0, 100]";
        return fmt::format(fmt, this->output.min_percentage);
    }

    return std::nullopt;
}

// --- Conversion ---
// ------------------

fgp::flamegraph_options fgp::config::make_flamegraph_options() const {
    return {
        .inverted = this->flamegraph.inverted,
        .sort     = fgp::parse_sort_order(this->flamegraph.sort),
        .collapse = fgp::collapse_strategy_from_name(this->flamegraph.collapse).value_or(fgp::collapse_strategy{}),
    };
}

fgp::profile_options fgp::config::make_profile_options() const {
    return {.type = fgp::parse_profile_type(this->flamegraph.type)};
}

fgp::frame_index_options fgp::config::make_frame_index_options() const {
    return {.prettify = this->frames.prettify};
}

std::string fgp::config::replace_prefixes(std::string name) const {
    for (const auto& replacement : this->frames.replace_prefix)
        name = utl::stre::replace_prefix(std::move(name), replacement.from, replacement.to);

    return name;
}
