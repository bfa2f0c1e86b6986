#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace tkv::storage {

// ── StreamId ─────────────────────────────────────────────────────────────────

struct StreamId {
    uint64_t ms  = 0;
    uint64_t seq = 0;

    static constexpr StreamId min() noexcept { return {0, 0}; }
    static constexpr StreamId max() noexcept {
        return {std::numeric_limits<uint64_t>::max(), std::numeric_limits<uint64_t>::max()};
    }

    // Immediate successor / predecessor in ID order, nullopt at the ends.
    [[nodiscard]] std::optional<StreamId> next() const noexcept;
    [[nodiscard]] std::optional<StreamId> prev() const noexcept;

    // "<ms>-<seq>"
    [[nodiscard]] std::string to_string() const;

    auto operator<=>(const StreamId&) const = default;
};

using StreamFields = std::vector<std::pair<std::string, std::string>>;

struct StreamEntry {
    StreamId id;
    StreamFields fields;
};

// ── Stream ───────────────────────────────────────────────────────────────────
//
// Append-only log ordered by strictly increasing IDs. Entries are immutable
// once appended.
class Stream {
public:
    [[nodiscard]] const StreamId& last_id() const noexcept { return last_id_; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    // Precondition: id > last_id().
    void append(StreamId id, StreamFields fields);

    // Entries with start <= id <= end, at most `count` of them.
    [[nodiscard]] std::vector<StreamEntry>
    range(StreamId start, StreamId end, std::optional<std::size_t> count = std::nullopt) const;

    // Entries with id > `after`, at most `count` of them.
    [[nodiscard]] std::vector<StreamEntry>
    read_after(StreamId after, std::optional<std::size_t> count = std::nullopt) const;

private:
    std::map<StreamId, StreamFields> entries_;
    StreamId last_id_;
};

// ── ID parsing ───────────────────────────────────────────────────────────────

// The ID argument of XADD before it is resolved against a stream.
struct XaddId {
    enum class Mode {
        Auto,         // "*": time and sequence generated
        AutoSequence, // "<ms>-*" or "<ms>": sequence generated
        Explicit,     // "<ms>-<seq>"
    };
    Mode mode = Mode::Auto;
    uint64_t ms  = 0;
    uint64_t seq = 0;
};

// Parses "<ms>-<seq>", or "<ms>" in which case the sequence is `default_seq`.
[[nodiscard]] std::error_code
parse_stream_id(std::string_view text, uint64_t default_seq, StreamId& out);

[[nodiscard]] std::error_code parse_xadd_id(std::string_view text, XaddId& out);

// Turns an XADD ID into the concrete ID to append after `last`.
// Fails with stream_id_zero or stream_id_too_small.
[[nodiscard]] std::error_code
resolve_xadd_id(const XaddId& requested, const StreamId& last, int64_t now_ms, StreamId& out);

// Parses an XRANGE bound: "-", "+", "<ms>[-<seq>]" or an exclusive "(<id>".
// An incomplete start defaults to sequence 0, an incomplete end to the
// maximum sequence. `out` is nullopt when an exclusive bound excludes
// everything.
[[nodiscard]] std::error_code
parse_range_bound(std::string_view text, bool is_start, std::optional<StreamId>& out);

} // namespace tkv::storage
