#include "command/arguments.hpp"
#include "command/command_table.hpp"
#include "command/reply.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tkv::command {

namespace {

using storage::Database;
using storage::Kind;

Outcome push_generic(Context& ctx, Args args, Database::End end) {
    std::size_t length = 0;
    if (auto ec = ctx.db.push(args[1], end, args.subspan(2), length)) {
        return ctx.fail(ec, args[1], Kind::List);
    }
    ctx.signal_ready(args[1]);
    return integer(static_cast<int64_t>(length));
}

Outcome lpush(Context& ctx, Args args) {
    return push_generic(ctx, args, Database::End::Front);
}

Outcome rpush(Context& ctx, Args args) {
    return push_generic(ctx, args, Database::End::Back);
}

// LPOP / RPOP key [count]
Outcome pop_generic(Context& ctx, Args args, Database::End end, std::string_view name) {
    if (args.size() > 3) return wrong_arity(name);

    std::optional<std::size_t> count;
    if (args.size() == 3) {
        int64_t n = 0;
        if (!parse_int(args[2], n) || n < 0) {
            return error("ERR value is out of range, must be positive");
        }
        count = static_cast<std::size_t>(n);
    }

    std::vector<std::string> popped;
    const bool existed = ctx.db.exists(args[1]);
    if (auto ec = ctx.db.pop(args[1], end, count.value_or(1), popped)) {
        return ctx.fail(ec, args[1], Kind::List);
    }

    if (!count) {
        return popped.empty() ? RespValue::null_bulk() : RespValue::bulk(std::move(popped.front()));
    }
    if (!existed) return RespValue::null_array();
    return bulk_array(popped);
}

Outcome lpop(Context& ctx, Args args) {
    return pop_generic(ctx, args, Database::End::Front, "lpop");
}

Outcome rpop(Context& ctx, Args args) {
    return pop_generic(ctx, args, Database::End::Back, "rpop");
}

Outcome llen(Context& ctx, Args args) {
    std::size_t length = 0;
    if (auto ec = ctx.db.llen(args[1], length)) return ctx.fail(ec, args[1], Kind::List);
    return integer(static_cast<int64_t>(length));
}

Outcome lrange(Context& ctx, Args args) {
    int64_t start = 0;
    int64_t stop = 0;
    if (!parse_int(args[2], start) || !parse_int(args[3], stop)) return not_integer_error();

    std::vector<std::string> items;
    if (auto ec = ctx.db.lrange(args[1], start, stop, items)) {
        return ctx.fail(ec, args[1], Kind::List);
    }
    return bulk_array(items);
}

Outcome lindex(Context& ctx, Args args) {
    int64_t index = 0;
    if (!parse_int(args[2], index)) return not_integer_error();

    std::optional<std::string> item;
    if (auto ec = ctx.db.lindex(args[1], index, item)) return ctx.fail(ec, args[1], Kind::List);
    return item ? RespValue::bulk(std::move(*item)) : RespValue::null_bulk();
}

// ── Blocking pops ────────────────────────────────────────────────────────────

// One non-blocking pass over `keys` in order. nullopt when every list is
// empty or absent.
std::optional<RespValue> try_pop_first(Context& ctx, const std::vector<std::string>& keys,
                                       Database::End end) {
    for (const auto& key : keys) {
        std::vector<std::string> popped;
        if (auto ec = ctx.db.pop(key, end, 1, popped)) return ctx.fail(ec, key, Kind::List);
        if (!popped.empty()) {
            return RespValue::array({RespValue::bulk(key), RespValue::bulk(std::move(popped.front()))});
        }
    }
    return std::nullopt;
}

// BLPOP / BRPOP key [key ...] timeout
Outcome blocking_pop(Context& ctx, Args args, Database::End end) {
    std::chrono::milliseconds timeout{0};
    switch (parse_timeout_seconds(args.back(), timeout)) {
    case TimeoutError::NotANumber:
        return error("ERR timeout is not a float or out of range");
    case TimeoutError::Negative:
        return error("ERR timeout is negative");
    case TimeoutError::None:
        break;
    }

    std::vector<std::string> keys;
    for (std::size_t i = 1; i + 1 < args.size(); ++i) keys.emplace_back(args[i]);

    if (auto reply = try_pop_first(ctx, keys, end)) return std::move(*reply);
    if (ctx.in_transaction) return RespValue::null_array();

    BlockRequest request;
    request.keys = keys;
    request.timeout = timeout;
    request.attempt = [keys = std::move(keys), end](Context& retry) {
        return try_pop_first(retry, keys, end);
    };
    return request;
}

Outcome blpop(Context& ctx, Args args) {
    return blocking_pop(ctx, args, Database::End::Front);
}

Outcome brpop(Context& ctx, Args args) {
    return blocking_pop(ctx, args, Database::End::Back);
}

} // anonymous namespace

void register_list_commands(CommandTable& table) {
    table.add({"lpush",  -3, lpush});
    table.add({"rpush",  -3, rpush});
    table.add({"lpop",   -2, lpop});
    table.add({"rpop",   -2, rpop});
    table.add({"llen",   2,  llen});
    table.add({"lrange", 4,  lrange});
    table.add({"lindex", 3,  lindex});
    table.add({"blpop",  -3, blpop});
    table.add({"brpop",  -3, brpop});
}

} // namespace tkv::command
