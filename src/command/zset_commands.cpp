#include "command/arguments.hpp"
#include "command/command_table.hpp"
#include "command/reply.hpp"

#include <optional>
#include <vector>

namespace tkv::command {

namespace {

using storage::Database;
using storage::Kind;

// ZADD key score member [score member ...]
Outcome zadd(Context& ctx, Args args) {
    if ((args.size() - 2) % 2 != 0) return syntax_error();

    // Every score is parsed before anything is written.
    std::vector<Database::ScoredMember> items;
    items.reserve((args.size() - 2) / 2);
    for (std::size_t i = 2; i < args.size(); i += 2) {
        double score = 0.0;
        if (!parse_double(args[i], score)) return not_float_error();
        items.emplace_back(score, args[i + 1]);
    }

    std::size_t added = 0;
    if (auto ec = ctx.db.zadd(args[1], items, added)) return ctx.fail(ec, args[1], Kind::SortedSet);
    return integer(static_cast<int64_t>(added));
}

Outcome zrem(Context& ctx, Args args) {
    std::size_t removed = 0;
    if (auto ec = ctx.db.zrem(args[1], args.subspan(2), removed)) {
        return ctx.fail(ec, args[1], Kind::SortedSet);
    }
    return integer(static_cast<int64_t>(removed));
}

// ZRANGE key start stop [WITHSCORES]
Outcome zrange(Context& ctx, Args args) {
    if (args.size() > 5) return syntax_error();
    bool with_scores = false;
    if (args.size() == 5) {
        if (!iequals(args[4], "withscores")) return syntax_error();
        with_scores = true;
    }

    int64_t start = 0;
    int64_t stop = 0;
    if (!parse_int(args[2], start) || !parse_int(args[3], stop)) return not_integer_error();

    std::vector<storage::SortedSet::Item> items;
    if (auto ec = ctx.db.zrange(args[1], start, stop, items)) {
        return ctx.fail(ec, args[1], Kind::SortedSet);
    }

    std::vector<RespValue> out;
    out.reserve(items.size() * (with_scores ? 2 : 1));
    for (auto& [score, member] : items) {
        out.push_back(RespValue::bulk(std::move(member)));
        if (with_scores) out.push_back(RespValue::bulk(format_score(score)));
    }
    return RespValue::array(std::move(out));
}

Outcome zscore(Context& ctx, Args args) {
    std::optional<double> score;
    if (auto ec = ctx.db.zscore(args[1], args[2], score)) {
        return ctx.fail(ec, args[1], Kind::SortedSet);
    }
    return score ? RespValue::bulk(format_score(*score)) : RespValue::null_bulk();
}

Outcome zrank(Context& ctx, Args args) {
    std::optional<std::size_t> rank;
    if (auto ec = ctx.db.zrank(args[1], args[2], rank)) {
        return ctx.fail(ec, args[1], Kind::SortedSet);
    }
    return rank ? integer(static_cast<int64_t>(*rank)) : RespValue::null_bulk();
}

Outcome zcard(Context& ctx, Args args) {
    std::size_t size = 0;
    if (auto ec = ctx.db.zcard(args[1], size)) return ctx.fail(ec, args[1], Kind::SortedSet);
    return integer(static_cast<int64_t>(size));
}

} // anonymous namespace

void register_zset_commands(CommandTable& table) {
    table.add({"zadd",   -4, zadd});
    table.add({"zrem",   -3, zrem});
    table.add({"zrange", -4, zrange});
    table.add({"zscore", 3,  zscore});
    table.add({"zrank",  3,  zrank});
    table.add({"zcard",  2,  zcard});
}

} // namespace tkv::command
