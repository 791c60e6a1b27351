// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Time units and <chrono> utils. Traces declare their own unit (microseconds or
// milliseconds) and every timestamp / weight of a profile is stored as a plain
// number in that unit, conversion only happens when we format it for display.
// _________________________________________________________________________________

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>


namespace fgp::time {

using microseconds = std::chrono::duration<double, std::micro>;
using milliseconds = std::chrono::duration<double, std::milli>;
using seconds      = std::chrono::duration<double>;

enum class unit : std::uint8_t { microseconds, milliseconds };

[[nodiscard]] unit             parse_unit(std::string_view name); // throws on unknown units
[[nodiscard]] std::string_view to_string(unit unit) noexcept;

// Converts a value in the profile unit to a typed duration
[[nodiscard]] microseconds to_duration(double value, unit unit) noexcept;

// Human-readable duration, picks the largest unit in which the value is still >= 1,
// for example '1000 ms' -> "1.00s", '500 ms' -> "500.00ms", '0.5 ms' -> "500.00μs"
[[nodiscard]] std::string format_duration(microseconds duration);

using formatter = std::function<std::string(double)>;

// Creates a formatter that interprets its argument in the given unit
[[nodiscard]] formatter make_formatter(unit unit);

[[nodiscard]] double to_percentage(double value, double timeframe) noexcept;

} // namespace fgp::time

namespace fgp {

using time_unit = time::unit;

} // namespace fgp
