// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "utility/filepath.hpp"

#include <filesystem>


std::string_view fgp::trim_filepath(std::string_view path) {
    const std::size_t last_slash = path.find_last_of("/\\");

    if (last_slash != std::string_view::npos && last_slash + 1 < path.size()) return path.substr(last_slash + 1);
    return path;
}

std::string fgp::normalize_filepath(std::string path) {
    if (path.empty()) return path; // frames without a source location stay as they are

    return std::filesystem::path{std::move(path)}.lexically_normal().generic_string();
    // removes "./" and ".." backtracking, profilers tend to record paths relative to whatever
    // the working directory was, for example "/app/build/../src/main.cpp"
}
