#include "command/arguments.hpp"

#include <charconv>
#include <cmath>
#include <system_error>

namespace tkv::command {

namespace {

char lower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

} // anonymous namespace

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (lower(a[i]) != lower(b[i])) return false;
    }
    return true;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = lower(c);
    return out;
}

bool parse_int(std::string_view s, int64_t& out) noexcept {
    if (s.empty()) return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

bool parse_double(std::string_view s, double& out) noexcept {
    if (!s.empty() && s.front() == '+') s.remove_prefix(1);
    if (s.empty()) return false;
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size() || std::isnan(value)) {
        return false;
    }
    out = value;
    return true;
}

TimeoutError parse_timeout_seconds(std::string_view s, std::chrono::milliseconds& out) noexcept {
    double seconds = 0.0;
    if (!parse_double(s, seconds) || std::isinf(seconds)) {
        return TimeoutError::NotANumber;
    }
    if (seconds < 0) {
        return TimeoutError::Negative;
    }
    const double ms = seconds * 1000.0;
    if (ms > 9.0e15) {
        return TimeoutError::NotANumber;
    }
    out = std::chrono::milliseconds{static_cast<int64_t>(std::ceil(ms))};
    return TimeoutError::None;
}

} // namespace tkv::command
