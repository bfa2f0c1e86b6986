#include "storage/database.hpp"

namespace tkv::storage {

std::error_code Database::xadd(std::string_view key, const XaddId& id,
                               StreamFields fields, StreamId& out) {
    Stream* stream = nullptr;
    if (auto ec = find_as(key, stream)) return ec;

    const StreamId last = stream ? stream->last_id() : StreamId::min();
    StreamId resolved;
    if (auto ec = resolve_xadd_id(id, last, clock_.now_ms(), resolved)) return ec;

    if (!stream) {
        if (auto ec = find_or_create(key, stream)) return ec;
    }
    stream->append(resolved, std::move(fields));
    out = resolved;
    return {};
}

std::error_code Database::xlen(std::string_view key, std::size_t& out) {
    Stream* stream = nullptr;
    if (auto ec = find_as(key, stream)) return ec;
    out = stream ? stream->size() : 0;
    return {};
}

std::error_code Database::xrange(std::string_view key, StreamId start, StreamId end,
                                 std::optional<std::size_t> count,
                                 std::vector<StreamEntry>& out) {
    out.clear();
    Stream* stream = nullptr;
    if (auto ec = find_as(key, stream); ec || !stream) return ec;
    out = stream->range(start, end, count);
    return {};
}

std::error_code Database::xread(std::string_view key, StreamId after,
                                std::optional<std::size_t> count,
                                std::vector<StreamEntry>& out) {
    out.clear();
    Stream* stream = nullptr;
    if (auto ec = find_as(key, stream); ec || !stream) return ec;
    out = stream->read_after(after, count);
    return {};
}

std::error_code Database::xlast_id(std::string_view key, StreamId& out) {
    Stream* stream = nullptr;
    if (auto ec = find_as(key, stream)) return ec;
    out = stream ? stream->last_id() : StreamId::min();
    return {};
}

} // namespace tkv::storage
