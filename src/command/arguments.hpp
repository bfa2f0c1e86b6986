#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace tkv::command {

// ASCII case-insensitive comparison, used for command names and keywords.
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

[[nodiscard]] std::string to_lower(std::string_view s);

// Whole-string base-10 signed 64-bit integer.
[[nodiscard]] bool parse_int(std::string_view s, int64_t& out) noexcept;

// Whole-string decimal or "inf" / "+inf" / "-inf". NaN is rejected.
[[nodiscard]] bool parse_double(std::string_view s, double& out) noexcept;

enum class TimeoutError { None, NotANumber, Negative };

// Blocking timeout given in (possibly fractional) seconds.
[[nodiscard]] TimeoutError parse_timeout_seconds(std::string_view s,
                                                 std::chrono::milliseconds& out) noexcept;

} // namespace tkv::command
