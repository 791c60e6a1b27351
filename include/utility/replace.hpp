// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Substring & regex replacement functions used by the symbol prettifier.
// _________________________________________________________________________________

#pragma once

#include <string>
#include <string_view>

#include <boost/regex.hpp>


namespace fgp {

void replace_all(std::string& str, std::string_view from, std::string_view to);

void replace_all(std::string& str, const boost::regex& from, std::string_view to);

void replace_all_dynamically(std::string& str, std::string_view from, std::string_view to);

void replace_all_template(std::string& str, std::string_view from, std::string_view to);

} // namespace fgp
