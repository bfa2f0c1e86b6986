#include "command/arguments.hpp"
#include "command/command_table.hpp"
#include "command/reply.hpp"

#include <limits>

#include <fmt/format.h>

namespace tkv::command {

namespace {

// ── Connection / server ──────────────────────────────────────────────────────

Outcome ping(Context&, Args args) {
    if (args.size() > 2) return wrong_arity("ping");
    if (args.size() == 2) return bulk(args[1]);
    return RespValue::simple("PONG");
}

Outcome echo(Context&, Args args) {
    return bulk(args[1]);
}

// Client libraries send COMMAND / COMMAND DOCS on connect; an empty reply
// is enough for them to proceed.
Outcome command_info(Context&, Args) {
    return RespValue::array();
}

Outcome dbsize(Context& ctx, Args) {
    return integer(static_cast<int64_t>(ctx.db.size()));
}

Outcome flushdb(Context& ctx, Args args) {
    if (args.size() > 2 ||
        (args.size() == 2 && !iequals(args[1], "async") && !iequals(args[1], "sync"))) {
        return syntax_error();
    }
    ctx.db.flush();
    return ok();
}

Outcome keys(Context& ctx, Args args) {
    return bulk_array(ctx.db.keys(args[1]));
}

// ── Generic keys ─────────────────────────────────────────────────────────────

Outcome del(Context& ctx, Args args) {
    int64_t removed = 0;
    for (std::size_t i = 1; i < args.size(); ++i) {
        if (ctx.db.del(args[i])) ++removed;
    }
    return integer(removed);
}

Outcome exists(Context& ctx, Args args) {
    int64_t found = 0;
    for (std::size_t i = 1; i < args.size(); ++i) {
        if (ctx.db.exists(args[i])) ++found;
    }
    return integer(found);
}

Outcome type(Context& ctx, Args args) {
    const auto kind = ctx.db.kind_of(args[1]);
    return RespValue::simple(std::string(kind ? storage::kind_name(*kind) : "none"));
}

Outcome expire_generic(Context& ctx, Args args, int64_t unit_ms, std::string_view name) {
    int64_t amount = 0;
    if (!parse_int(args[2], amount)) return not_integer_error();

    const int64_t now = ctx.db.clock().now_ms();
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    if ((amount > 0 && amount > (kMax - now) / unit_ms) ||
        (amount < 0 && amount < -(kMax / unit_ms))) {
        return error(fmt::format("ERR invalid expire time in '{}' command", name));
    }
    return integer(ctx.db.expire_at(args[1], now + amount * unit_ms) ? 1 : 0);
}

Outcome expire(Context& ctx, Args args) {
    return expire_generic(ctx, args, 1000, "expire");
}

Outcome pexpire(Context& ctx, Args args) {
    return expire_generic(ctx, args, 1, "pexpire");
}

Outcome ttl(Context& ctx, Args args) {
    const int64_t ms = ctx.db.ttl_ms(args[1]);
    if (ms < 0) return integer(ms);
    return integer((ms + 500) / 1000);
}

Outcome pttl(Context& ctx, Args args) {
    return integer(ctx.db.ttl_ms(args[1]));
}

Outcome persist(Context& ctx, Args args) {
    return integer(ctx.db.persist(args[1]) ? 1 : 0);
}

} // anonymous namespace

void register_keyspace_commands(CommandTable& table) {
    table.add({"ping",    -1, ping, kPubSub});
    table.add({"echo",    2,  echo});
    table.add({"command", -1, command_info});
    table.add({"dbsize",  1,  dbsize});
    table.add({"flushdb", -1, flushdb});
    table.add({"keys",    2,  keys});
    table.add({"del",     -2, del});
    table.add({"exists",  -2, exists});
    table.add({"type",    2,  type});
    table.add({"expire",  3,  expire});
    table.add({"pexpire", 3,  pexpire});
    table.add({"ttl",     2,  ttl});
    table.add({"pttl",    2,  pttl});
    table.add({"persist", 2,  persist});
}

} // namespace tkv::command
