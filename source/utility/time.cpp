// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "utility/time.hpp"

#include <fmt/format.h>

#include "utility/exception.hpp"


fgp::time::unit fgp::time::parse_unit(std::string_view name) {
    if (name == "microseconds") return unit::microseconds;
    if (name == "milliseconds") return unit::milliseconds;

    throw fgp::invalid_trace_error{"Unknown time unit {{ {} }}, expected 'microseconds' or 'milliseconds'", name};
}

std::string_view fgp::time::to_string(unit unit) noexcept {
    switch (unit) {
    case unit::microseconds: return "microseconds";
    case unit::milliseconds: return "milliseconds";
    }
    return "unknown";
}

fgp::time::microseconds fgp::time::to_duration(double value, unit unit) noexcept {
    if (unit == unit::milliseconds) return std::chrono::duration_cast<microseconds>(milliseconds{value});
    return microseconds{value};
}

std::string fgp::time::format_duration(microseconds duration) {
    const auto ms = std::chrono::duration_cast<milliseconds>(duration);

    if (ms.count() >= 1000) return fmt::format("{:.2f}s", std::chrono::duration_cast<seconds>(duration).count());
    if (ms.count() >= 1) return fmt::format("{:.2f}ms", ms.count());
    return fmt::format("{:.2f}μs", duration.count());
}

fgp::time::formatter fgp::time::make_formatter(unit unit) {
    return [unit](double value) { return format_duration(to_duration(value, unit)); };
}

double fgp::time::to_percentage(double value, double timeframe) noexcept {
    if (timeframe <= 0) return 0;
    return value / timeframe * 100;
}
