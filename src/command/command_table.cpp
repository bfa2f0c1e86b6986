#include "command/command_table.hpp"
#include "command/arguments.hpp"

namespace tkv::command {

CommandTable::CommandTable() {
    // Connection and transaction control, executed by the Dispatcher.
    add({"auth",        2,  nullptr, kConnection | kNoAuth});
    add({"quit",        -1, nullptr, kConnection | kNoAuth | kPubSub});
    add({"multi",       1,  nullptr, kConnection});
    add({"exec",        1,  nullptr, kConnection});
    add({"discard",     1,  nullptr, kConnection});
    add({"subscribe",   -2, nullptr, kConnection | kPubSub});
    add({"unsubscribe", -1, nullptr, kConnection | kPubSub});

    register_keyspace_commands(*this);
    register_string_commands(*this);
    register_list_commands(*this);
    register_set_commands(*this);
    register_zset_commands(*this);
    register_geo_commands(*this);
    register_stream_commands(*this);
    register_pubsub_commands(*this);
}

const CommandSpec* CommandTable::find(std::string_view name) const {
    auto it = commands_.find(to_lower(name));
    return it == commands_.end() ? nullptr : &it->second;
}

void CommandTable::add(const CommandSpec& spec) {
    commands_.insert_or_assign(std::string(spec.name), spec);
}

} // namespace tkv::command
