#include "storage/stream.hpp"
#include "storage/errors.hpp"

#include <charconv>
#include <limits>

#include <fmt/format.h>

namespace tkv::storage {

namespace {

constexpr uint64_t kMaxU64 = std::numeric_limits<uint64_t>::max();

bool parse_u64(std::string_view sv, uint64_t& out) {
    if (sv.empty()) return false;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

template <typename It>
std::vector<StreamEntry> collect(It first, It last, std::optional<std::size_t> count) {
    std::vector<StreamEntry> out;
    for (; first != last; ++first) {
        if (count && out.size() >= *count) break;
        out.push_back(StreamEntry{first->first, first->second});
    }
    return out;
}

} // anonymous namespace

// ── StreamId ─────────────────────────────────────────────────────────────────

std::optional<StreamId> StreamId::next() const noexcept {
    if (seq < kMaxU64) return StreamId{ms, seq + 1};
    if (ms < kMaxU64) return StreamId{ms + 1, 0};
    return std::nullopt;
}

std::optional<StreamId> StreamId::prev() const noexcept {
    if (seq > 0) return StreamId{ms, seq - 1};
    if (ms > 0) return StreamId{ms - 1, kMaxU64};
    return std::nullopt;
}

std::string StreamId::to_string() const {
    return fmt::format("{}-{}", ms, seq);
}

// ── Stream ───────────────────────────────────────────────────────────────────

void Stream::append(StreamId id, StreamFields fields) {
    entries_.emplace_hint(entries_.end(), id, std::move(fields));
    last_id_ = id;
}

std::vector<StreamEntry>
Stream::range(StreamId start, StreamId end, std::optional<std::size_t> count) const {
    if (start > end) {
        return {};
    }
    return collect(entries_.lower_bound(start), entries_.upper_bound(end), count);
}

std::vector<StreamEntry>
Stream::read_after(StreamId after, std::optional<std::size_t> count) const {
    return collect(entries_.upper_bound(after), entries_.end(), count);
}

// ── ID parsing ───────────────────────────────────────────────────────────────

std::error_code parse_stream_id(std::string_view text, uint64_t default_seq, StreamId& out) {
    StreamId id;
    const auto dash = text.find('-');
    if (dash == std::string_view::npos) {
        if (!parse_u64(text, id.ms)) return errc::invalid_stream_id;
        id.seq = default_seq;
    } else if (!parse_u64(text.substr(0, dash), id.ms) ||
               !parse_u64(text.substr(dash + 1), id.seq)) {
        return errc::invalid_stream_id;
    }
    out = id;
    return {};
}

std::error_code parse_xadd_id(std::string_view text, XaddId& out) {
    if (text == "*") {
        out = XaddId{};
        return {};
    }

    XaddId id;
    const auto dash = text.find('-');
    const auto ms_part = dash == std::string_view::npos ? text : text.substr(0, dash);
    if (!parse_u64(ms_part, id.ms)) return errc::invalid_stream_id;

    if (dash == std::string_view::npos || text.substr(dash + 1) == "*") {
        id.mode = XaddId::Mode::AutoSequence;
    } else {
        if (!parse_u64(text.substr(dash + 1), id.seq)) return errc::invalid_stream_id;
        id.mode = XaddId::Mode::Explicit;
    }
    out = id;
    return {};
}

std::error_code
resolve_xadd_id(const XaddId& requested, const StreamId& last, int64_t now_ms, StreamId& out) {
    StreamId id;
    switch (requested.mode) {
    case XaddId::Mode::Auto: {
        const auto now = now_ms > 0 ? static_cast<uint64_t>(now_ms) : 0;
        if (now > last.ms) {
            id = StreamId{now, 0};
        } else if (auto next = last.next()) {
            id = *next;
        } else {
            return errc::stream_id_too_small;
        }
        break;
    }
    case XaddId::Mode::AutoSequence:
        if (requested.ms == last.ms) {
            if (last.seq == kMaxU64) return errc::stream_id_too_small;
            id = StreamId{requested.ms, last.seq + 1};
        } else {
            id = StreamId{requested.ms, 0};
        }
        break;
    case XaddId::Mode::Explicit:
        id = StreamId{requested.ms, requested.seq};
        break;
    }

    if (id == StreamId::min()) return errc::stream_id_zero;
    if (id <= last) return errc::stream_id_too_small;
    out = id;
    return {};
}

std::error_code
parse_range_bound(std::string_view text, bool is_start, std::optional<StreamId>& out) {
    if (text == "-") {
        out = StreamId::min();
        return {};
    }
    if (text == "+") {
        out = StreamId::max();
        return {};
    }

    const bool exclusive = !text.empty() && text.front() == '(';
    if (exclusive) text.remove_prefix(1);

    StreamId id;
    if (auto ec = parse_stream_id(text, is_start ? 0 : kMaxU64, id)) {
        return ec;
    }
    if (!exclusive) {
        out = id;
    } else {
        out = is_start ? id.next() : id.prev();
    }
    return {};
}

} // namespace tkv::storage
