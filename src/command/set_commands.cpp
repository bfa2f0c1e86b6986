#include "command/command_table.hpp"
#include "command/reply.hpp"

#include <string>
#include <vector>

namespace tkv::command {

namespace {

using storage::Kind;

Outcome sadd(Context& ctx, Args args) {
    std::size_t added = 0;
    if (auto ec = ctx.db.sadd(args[1], args.subspan(2), added)) {
        return ctx.fail(ec, args[1], Kind::Set);
    }
    return integer(static_cast<int64_t>(added));
}

Outcome srem(Context& ctx, Args args) {
    std::size_t removed = 0;
    if (auto ec = ctx.db.srem(args[1], args.subspan(2), removed)) {
        return ctx.fail(ec, args[1], Kind::Set);
    }
    return integer(static_cast<int64_t>(removed));
}

Outcome smembers(Context& ctx, Args args) {
    std::vector<std::string> members;
    if (auto ec = ctx.db.smembers(args[1], members)) return ctx.fail(ec, args[1], Kind::Set);
    return bulk_array(members);
}

Outcome sismember(Context& ctx, Args args) {
    bool found = false;
    if (auto ec = ctx.db.sismember(args[1], args[2], found)) {
        return ctx.fail(ec, args[1], Kind::Set);
    }
    return integer(found ? 1 : 0);
}

Outcome scard(Context& ctx, Args args) {
    std::size_t size = 0;
    if (auto ec = ctx.db.scard(args[1], size)) return ctx.fail(ec, args[1], Kind::Set);
    return integer(static_cast<int64_t>(size));
}

} // anonymous namespace

void register_set_commands(CommandTable& table) {
    table.add({"sadd",      -3, sadd});
    table.add({"srem",      -3, srem});
    table.add({"smembers",  2,  smembers});
    table.add({"sismember", 3,  sismember});
    table.add({"scard",     2,  scard});
}

} // namespace tkv::command
