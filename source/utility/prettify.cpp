// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "utility/prettify.hpp"

#include "utility/replace.hpp"


// Regex is only used where plain substring replacement can't express the rule,
// evaluating complex regex over every frame name of a large profile is expensive.

// --- Compiler format normalization ---
// -------------------------------------

std::string fgp::prettify::normalize(std::string identifier) {
    // "> >" -> ">>"
    fgp::replace_all_dynamically(identifier, "> >", ">>");

    // "type *" / "type &" -> "type*" / "type&"
    fgp::replace_all(identifier, " *", "*");
    fgp::replace_all(identifier, " &", "&");

    // "a ,b" / "a,b" -> "a, b"
    fgp::replace_all(identifier, " ,", ",");
    fgp::replace_all(identifier, ", ", ",");
    fgp::replace_all(identifier, ",", ", ");

    // "class whatever" -> "whatever", MSVC spells out elaborated type specifiers
    static const boost::regex elaborated_type{R"(\b(class|struct|enum|union)\s+)"};
    fgp::replace_all(identifier, elaborated_type, "");

    // "`anonymous namespace'" -> "(anonymous namespace)"
    fgp::replace_all(identifier, "`anonymous namespace'", "(anonymous namespace)");

    return identifier;
}

// --- Implementation quirks deobfuscation ---
// -------------------------------------------

std::string fgp::prettify::deobfuscate(std::string identifier) {
    // "std::__1::" / "std::__cxx11::" -> "std::"
    static const boost::regex inline_namespace{R"(std::_[a-zA-Z0-9_]+::)"};
    fgp::replace_all(identifier, inline_namespace, "std::");

    // Remove ABI tags like "[abi:cxx11]" or "[abi:ne210103]"
    static const boost::regex abi_tag{R"(\[abi:[a-zA-Z0-9]+\])"};
    fgp::replace_all(identifier, abi_tag, "");

    return identifier;
}

// --- Collapse template aliases ---
// ---------------------------------

std::string fgp::prettify::collapse(std::string identifier) {
    // Default traits are almost never passed explicitly, dropping them is technically lossy,
    // but allocators passed as the only argument (e.g. 'pool<std::allocator<int>>') are preserved
    fgp::replace_all_template(identifier, ", std::char_traits<", "");
    fgp::replace_all_template(identifier, ", std::allocator<", "");
    fgp::replace_all_template(identifier, ", std::default_delete<", "");

    fgp::replace_all(identifier, "std::basic_string<char>", "std::string");
    fgp::replace_all(identifier, "std::basic_string<wchar_t>", "std::wstring");
    fgp::replace_all(identifier, "std::basic_string_view<char>", "std::string_view");
    fgp::replace_all(identifier, "std::basic_string_view<wchar_t>", "std::wstring_view");
    fgp::replace_all(identifier, "std::basic_ostream<char>", "std::ostream");
    fgp::replace_all(identifier, "std::basic_istream<char>", "std::istream");
    fgp::replace_all(identifier, "std::basic_stringstream<char>", "std::stringstream");

    return identifier;
}

std::string fgp::prettify::full(std::string identifier) {
    return collapse(deobfuscate(normalize(std::move(identifier)))); // order matters
}
