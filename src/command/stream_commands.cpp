#include "command/arguments.hpp"
#include "command/command_table.hpp"
#include "command/reply.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tkv::command {

namespace {

using storage::Kind;
using storage::StreamEntry;
using storage::StreamId;

// [id, [field, value, ...]]
RespValue entry_reply(StreamEntry& entry) {
    std::vector<RespValue> fields;
    fields.reserve(entry.fields.size() * 2);
    for (auto& [field, value] : entry.fields) {
        fields.push_back(RespValue::bulk(std::move(field)));
        fields.push_back(RespValue::bulk(std::move(value)));
    }
    return RespValue::array({RespValue::bulk(entry.id.to_string()),
                             RespValue::array(std::move(fields))});
}

RespValue entries_reply(std::vector<StreamEntry>& entries) {
    std::vector<RespValue> out;
    out.reserve(entries.size());
    for (auto& entry : entries) out.push_back(entry_reply(entry));
    return RespValue::array(std::move(out));
}

// XADD key id field value [field value ...]
Outcome xadd(Context& ctx, Args args) {
    if ((args.size() - 3) % 2 != 0) return wrong_arity("xadd");

    storage::XaddId id;
    if (auto ec = storage::parse_xadd_id(args[2], id)) return error_reply(ec);

    storage::StreamFields fields;
    fields.reserve((args.size() - 3) / 2);
    for (std::size_t i = 3; i < args.size(); i += 2) {
        fields.emplace_back(std::string(args[i]), std::string(args[i + 1]));
    }

    StreamId added;
    if (auto ec = ctx.db.xadd(args[1], id, std::move(fields), added)) {
        return ctx.fail(ec, args[1], Kind::Stream);
    }
    ctx.signal_ready(args[1]);
    return RespValue::bulk(added.to_string());
}

// XRANGE key start end [COUNT n]
Outcome xrange(Context& ctx, Args args) {
    std::optional<std::size_t> count;
    if (args.size() == 6 && iequals(args[4], "count")) {
        int64_t n = 0;
        if (!parse_int(args[5], n)) return not_integer_error();
        if (n <= 0) return RespValue::array();
        count = static_cast<std::size_t>(n);
    } else if (args.size() != 4) {
        return syntax_error();
    }

    std::optional<StreamId> start;
    std::optional<StreamId> end;
    if (auto ec = storage::parse_range_bound(args[2], true, start)) return error_reply(ec);
    if (auto ec = storage::parse_range_bound(args[3], false, end)) return error_reply(ec);

    std::vector<StreamEntry> entries;
    if (auto ec = ctx.db.xrange(args[1], start.value_or(StreamId::max()),
                                end.value_or(StreamId::min()), count, entries)) {
        return ctx.fail(ec, args[1], Kind::Stream);
    }
    // An exclusive bound past either end selects nothing.
    if (!start || !end) return RespValue::array();
    return entries_reply(entries);
}

Outcome xlen(Context& ctx, Args args) {
    std::size_t length = 0;
    if (auto ec = ctx.db.xlen(args[1], length)) return ctx.fail(ec, args[1], Kind::Stream);
    return integer(static_cast<int64_t>(length));
}

// ── XREAD ────────────────────────────────────────────────────────────────────

struct ReadTarget {
    std::string key;
    StreamId after;
};

// [[key, entries], ...] for the streams with new entries, nullopt if none.
std::optional<RespValue> read_streams(Context& ctx, const std::vector<ReadTarget>& targets,
                                      std::optional<std::size_t> count) {
    std::vector<RespValue> out;
    for (const auto& target : targets) {
        std::vector<StreamEntry> entries;
        if (auto ec = ctx.db.xread(target.key, target.after, count, entries)) {
            return ctx.fail(ec, target.key, Kind::Stream);
        }
        if (entries.empty()) continue;
        out.push_back(RespValue::array({RespValue::bulk(target.key), entries_reply(entries)}));
    }
    if (out.empty()) return std::nullopt;
    return RespValue::array(std::move(out));
}

// XREAD [COUNT n] [BLOCK ms] STREAMS key [key ...] id [id ...]
Outcome xread(Context& ctx, Args args) {
    std::optional<std::size_t> count;
    std::optional<std::chrono::milliseconds> block;
    std::size_t streams_at = 0;

    for (std::size_t i = 1; i < args.size(); ++i) {
        const auto arg = args[i];
        if (iequals(arg, "streams")) {
            streams_at = i + 1;
            break;
        }
        if (iequals(arg, "count") && i + 1 < args.size()) {
            int64_t n = 0;
            if (!parse_int(args[++i], n)) return not_integer_error();
            if (n > 0) count = static_cast<std::size_t>(n);
        } else if (iequals(arg, "block") && i + 1 < args.size()) {
            int64_t ms = 0;
            if (!parse_int(args[++i], ms)) {
                return error("ERR timeout is not an integer or out of range");
            }
            if (ms < 0) return error("ERR timeout is negative");
            block = std::chrono::milliseconds{ms};
        } else {
            return syntax_error();
        }
    }
    if (streams_at == 0) return syntax_error();

    const std::size_t remaining = args.size() - streams_at;
    if (remaining == 0 || remaining % 2 != 0) {
        return error("ERR Unbalanced 'xread' list of streams: for each stream key an ID or '$' "
                     "must be specified.");
    }

    // IDs are resolved once, so '$' keeps meaning "newer than when XREAD ran".
    const std::size_t n = remaining / 2;
    std::vector<ReadTarget> targets;
    targets.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const auto key = args[streams_at + i];
        const auto id_text = args[streams_at + n + i];
        ReadTarget target{std::string(key), StreamId::min()};
        if (id_text == "$") {
            if (auto ec = ctx.db.xlast_id(key, target.after)) {
                return ctx.fail(ec, key, Kind::Stream);
            }
        } else if (auto ec = storage::parse_stream_id(id_text, 0, target.after)) {
            return error_reply(ec);
        }
        targets.push_back(std::move(target));
    }

    if (auto reply = read_streams(ctx, targets, count)) return std::move(*reply);
    if (!block || ctx.in_transaction) return RespValue::null_array();

    BlockRequest request;
    for (const auto& target : targets) request.keys.push_back(target.key);
    request.timeout = *block;
    request.attempt = [targets = std::move(targets), count](Context& retry) {
        return read_streams(retry, targets, count);
    };
    return request;
}

} // anonymous namespace

void register_stream_commands(CommandTable& table) {
    table.add({"xadd",   -5, xadd});
    table.add({"xrange", -4, xrange});
    table.add({"xlen",   2,  xlen});
    table.add({"xread",  -4, xread});
}

} // namespace tkv::command
