#include "command/arguments.hpp"
#include "command/command_table.hpp"
#include "command/reply.hpp"

#include <limits>
#include <optional>
#include <string>

namespace tkv::command {

namespace {

using storage::Kind;

Outcome get(Context& ctx, Args args) {
    std::optional<std::string> value;
    if (auto ec = ctx.db.get(args[1], value)) return ctx.fail(ec, args[1], Kind::String);
    return value ? RespValue::bulk(std::move(*value)) : RespValue::null_bulk();
}

// SET key value [EX seconds | PX milliseconds] [NX | XX] [GET]
Outcome set(Context& ctx, Args args) {
    const auto key = args[1];
    bool nx = false;
    bool xx = false;
    bool want_old = false;
    std::optional<int64_t> ttl_ms;
    bool has_ex = false;
    bool has_px = false;

    for (std::size_t i = 3; i < args.size(); ++i) {
        const auto opt = args[i];
        if (iequals(opt, "nx") && !xx) {
            nx = true;
        } else if (iequals(opt, "xx") && !nx) {
            xx = true;
        } else if (iequals(opt, "get")) {
            want_old = true;
        } else if ((iequals(opt, "ex") || iequals(opt, "px")) && !has_ex && !has_px &&
                   i + 1 < args.size()) {
            const bool seconds = iequals(opt, "ex");
            int64_t amount = 0;
            if (!parse_int(args[++i], amount) || amount <= 0 ||
                (seconds && amount > std::numeric_limits<int64_t>::max() / 1000)) {
                return error("ERR invalid expire time in 'set' command");
            }
            ttl_ms = seconds ? amount * 1000 : amount;
            (seconds ? has_ex : has_px) = true;
        } else {
            return syntax_error();
        }
    }

    const int64_t now = ctx.db.clock().now_ms();
    if (ttl_ms && *ttl_ms > std::numeric_limits<int64_t>::max() - now) {
        return error("ERR invalid expire time in 'set' command");
    }

    // With GET a key of another kind fails before anything is written.
    std::optional<std::string> old;
    if (want_old) {
        if (auto ec = ctx.db.get(key, old)) return ctx.fail(ec, key, Kind::String);
    }

    const bool present = ctx.db.exists(key);
    if ((nx && present) || (xx && !present)) {
        return want_old && old ? RespValue::bulk(std::move(*old)) : RespValue::null_bulk();
    }

    std::optional<int64_t> expires_at;
    if (ttl_ms) expires_at = now + *ttl_ms;
    ctx.db.set(key, std::string(args[2]), expires_at);

    if (want_old) {
        return old ? RespValue::bulk(std::move(*old)) : RespValue::null_bulk();
    }
    return ok();
}

Outcome mget(Context& ctx, Args args) {
    std::vector<RespValue> out;
    out.reserve(args.size() - 1);
    for (std::size_t i = 1; i < args.size(); ++i) {
        std::optional<std::string> value;
        // Keys of other kinds read as null.
        if (!ctx.db.get(args[i], value) && value) {
            out.push_back(RespValue::bulk(std::move(*value)));
        } else {
            out.push_back(RespValue::null_bulk());
        }
    }
    return RespValue::array(std::move(out));
}

Outcome incr_by_generic(Context& ctx, std::string_view key, int64_t delta) {
    int64_t result = 0;
    if (auto ec = ctx.db.incr_by(key, delta, result)) return ctx.fail(ec, key, Kind::String);
    return integer(result);
}

Outcome incr(Context& ctx, Args args) {
    return incr_by_generic(ctx, args[1], 1);
}

Outcome decr(Context& ctx, Args args) {
    return incr_by_generic(ctx, args[1], -1);
}

Outcome incrby(Context& ctx, Args args) {
    int64_t delta = 0;
    if (!parse_int(args[2], delta)) return not_integer_error();
    return incr_by_generic(ctx, args[1], delta);
}

Outcome decrby(Context& ctx, Args args) {
    int64_t delta = 0;
    if (!parse_int(args[2], delta)) return not_integer_error();
    if (delta == std::numeric_limits<int64_t>::min()) {
        return error("ERR decrement would overflow");
    }
    return incr_by_generic(ctx, args[1], -delta);
}

Outcome append(Context& ctx, Args args) {
    std::size_t length = 0;
    if (auto ec = ctx.db.append(args[1], args[2], length)) {
        return ctx.fail(ec, args[1], Kind::String);
    }
    return integer(static_cast<int64_t>(length));
}

Outcome strlen(Context& ctx, Args args) {
    std::size_t length = 0;
    if (auto ec = ctx.db.strlen(args[1], length)) return ctx.fail(ec, args[1], Kind::String);
    return integer(static_cast<int64_t>(length));
}

} // anonymous namespace

void register_string_commands(CommandTable& table) {
    table.add({"get",    2,  get});
    table.add({"set",    -3, set});
    table.add({"mget",   -2, mget});
    table.add({"incr",   2,  incr});
    table.add({"decr",   2,  decr});
    table.add({"incrby", 3,  incrby});
    table.add({"decrby", 3,  decrby});
    table.add({"append", 3,  append});
    table.add({"strlen", 2,  strlen});
}

} // namespace tkv::command
