#pragma once

#include "command/context.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tkv::command {

// ── Command flags ────────────────────────────────────────────────────────────

enum CommandFlag : uint32_t {
    kNoAuth     = 1u << 0,  // allowed before AUTH succeeds
    kConnection = 1u << 1,  // handled by the Dispatcher itself (no handler)
    kPubSub     = 1u << 2,  // allowed while the client is subscribed
};

// One entry of the command table.
//
// Arity follows the Redis convention: a positive value is the exact argument
// count including the command name, a negative value -N means "at least N".
struct CommandSpec {
    std::string_view name;  // lower case
    int arity = 0;
    Handler handler = nullptr;
    uint32_t flags = 0;

    [[nodiscard]] bool arity_ok(std::size_t argc) const noexcept {
        const auto n = static_cast<int>(argc);
        return arity >= 0 ? n == arity : n >= -arity;
    }
};

// Name → CommandSpec lookup, case-insensitive. Populated with every
// supported command on construction; immutable afterwards.
class CommandTable {
public:
    CommandTable();

    [[nodiscard]] const CommandSpec* find(std::string_view name) const;

    [[nodiscard]] std::size_t size() const noexcept { return commands_.size(); }

    void add(const CommandSpec& spec);

private:
    std::unordered_map<std::string, CommandSpec> commands_;
};

// Per-family registration, one per *_commands.cpp file.
void register_keyspace_commands(CommandTable& table);
void register_string_commands(CommandTable& table);
void register_list_commands(CommandTable& table);
void register_set_commands(CommandTable& table);
void register_zset_commands(CommandTable& table);
void register_geo_commands(CommandTable& table);
void register_stream_commands(CommandTable& table);
void register_pubsub_commands(CommandTable& table);

} // namespace tkv::command
