// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "utility/replace.hpp"

#include "utility/exception.hpp"


void fgp::replace_all(std::string& str, std::string_view from, std::string_view to) {
    if (from.empty()) return;

    std::size_t i = 0;

    while ((i = str.find(from, i)) != std::string::npos) { // locate substring to replace
        str.replace(i, from.size(), to);                   // replace
        i += to.size();                                    // step over the replaced region
    }
}

void fgp::replace_all(std::string& str, const boost::regex& from, std::string_view to) {
    str = boost::regex_replace(str, from, std::string(to));
}

void fgp::replace_all_dynamically(std::string& str, std::string_view from, std::string_view to) {
    if (from.empty()) return;

    if (to.contains(from) || from.substr(1).contains(to))
        throw fgp::exception{"Could not dynamically replace {{ {} }} to {{ {} }} in the string {{ {} }},"
                             " self-similar tokens are not allowed",
                             from, to, str};

    std::size_t i = 0;

    while ((i = str.find(from, i)) != std::string::npos) { // locate substring to replace
        str.replace(i, from.size(), to);                   // replace
        // do NOT step over the replaced region, the replacement can create another match
        // to the left of it, for example when folding angle brackets: "> > >" => ">> >" => ">>>"
        i = i ? i - 1 : 0;
    }
}

void fgp::replace_all_template(std::string& str, std::string_view from, std::string_view to) {
    if (from.empty() || from.back() != '<')
        throw fgp::exception{"Template replacement {{ {} }} to {{ {} }} is invalid", from, to};

    std::size_t i = 0;

    while ((i = str.find(from, i)) != std::string::npos) { // locate substring to replace
        // Expand replaced range until the closing '>' is found
        std::size_t match_end         = i + from.size();
        std::size_t angle_brace_count = 1;

        for (; match_end < str.size() && angle_brace_count; ++match_end) {
            if (str[match_end] == '<') ++angle_brace_count;
            else if (str[match_end] == '>') --angle_brace_count;
        } // unbalanced braces mean the whole rest of the string gets replaced

        str.replace(i, match_end - i, to);

        i += to.size(); // step over the replaced region
    }
}
