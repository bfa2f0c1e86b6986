#include "command/command_table.hpp"
#include "command/reply.hpp"

namespace tkv::command {

namespace {

// PUBLISH channel message
Outcome publish(Context& ctx, Args args) {
    return integer(static_cast<int64_t>(ctx.channels.publish(args[1], args[2])));
}

} // anonymous namespace

// SUBSCRIBE and UNSUBSCRIBE change connection state and are executed by the
// Dispatcher itself.
void register_pubsub_commands(CommandTable& table) {
    table.add({"publish", 3, publish});
}

} // namespace tkv::command
