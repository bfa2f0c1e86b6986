#pragma once

#include "network/resp_value.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tkv::network {

// ── Decoder ──────────────────────────────────────────────────────────────────

struct DecodeLimits {
    std::size_t max_bulk_length   = 512 * 1024 * 1024;
    std::size_t max_array_length  = 1024 * 1024;
    std::size_t max_inline_length = 64 * 1024;

    // Request mode (server side). Top-level messages must be arrays of bulk
    // strings; anything not starting with '*' is an inline command line split
    // on spaces and tabs. Empty arrays and blank lines are consumed silently.
    // Client mode (false) decodes arbitrary replies.
    bool allow_inline = false;
};

struct DecodeResult {
    // Complete messages in input order. String payloads are views into the
    // decoded buffer.
    std::vector<RespView> messages;

    // Bytes of input covered by `messages` (and skipped empty requests).
    // A trailing partial message is never consumed.
    std::size_t consumed = 0;

    // Set on a protocol violation. Messages decoded before the offending one
    // are still returned; nothing after it is.
    std::optional<std::string> error;
};

// Decode every complete message in `input`.
// Thread-safe: pure function, no shared state.
[[nodiscard]] DecodeResult decode(std::string_view input, const DecodeLimits& limits = {});

// Maximum array nesting accepted by decode().
inline constexpr int kMaxNestingDepth = 32;

// ── Encoder ──────────────────────────────────────────────────────────────────

// Append the wire form of `value` to `out`.
void encode(const RespValue& value, std::string& out);

[[nodiscard]] std::string encode(const RespValue& value);

// Encode a request as an array of bulk strings.
[[nodiscard]] std::string encode_command(const std::vector<std::string>& args);

} // namespace tkv::network
