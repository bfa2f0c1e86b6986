#pragma once

#include "network/resp_value.hpp"
#include "storage/value.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tkv::command {

// ── Reply builders ───────────────────────────────────────────────────────────

[[nodiscard]] inline RespValue ok() { return RespValue::simple("OK"); }

[[nodiscard]] inline RespValue integer(int64_t n) { return RespValue::integer_value(n); }

[[nodiscard]] inline RespValue bulk(std::string_view s) { return RespValue::bulk(std::string(s)); }

[[nodiscard]] inline RespValue error(std::string message) {
    return RespValue::error(std::move(message));
}

[[nodiscard]] RespValue bulk_array(const std::vector<std::string>& items);

[[nodiscard]] RespValue syntax_error();

[[nodiscard]] RespValue not_integer_error();

[[nodiscard]] RespValue not_float_error();

[[nodiscard]] RespValue wrong_arity(std::string_view name);

// `args` includes the command name.
[[nodiscard]] RespValue unknown_command(std::span<const std::string_view> args);

[[nodiscard]] RespValue wrong_type(storage::Kind expected, std::optional<storage::Kind> found);

// Maps a storage error code (other than wrong_type) to its error reply.
[[nodiscard]] RespValue error_reply(std::error_code ec);

// Shortest decimal that reads back as the same double ("inf" / "-inf" for
// infinities), as used for sorted set scores.
[[nodiscard]] std::string format_score(double score);

} // namespace tkv::command
