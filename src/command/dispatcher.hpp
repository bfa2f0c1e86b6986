#pragma once

#include "command/blocking.hpp"
#include "command/command_table.hpp"
#include "command/context.hpp"
#include "command/pubsub.hpp"
#include "storage/database.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tkv::command {

// Per-connection state the Dispatcher reads and updates.
struct ClientState {
    bool authenticated = false;

    // MULTI / EXEC
    bool in_multi = false;
    bool multi_failed = false;
    std::vector<std::vector<std::string>> queued;

    // Set by QUIT: write the reply, then close.
    bool close_after_reply = false;

    // Registered with blocking commands. Called under the Dispatcher lock, so
    // it must only schedule the retry, never run it.
    std::function<void()> wake;

    // Pub/Sub channels, in subscription order. Non-empty means subscribe mode.
    std::vector<std::string> channels;

    // Receives messages published to those channels. Same constraints as wake.
    std::function<void(RespValue)> push;
};

// Executes commands against one shared Database.
//
// Thread-safety:
//   Every public method is safe to call from any thread. A single mutex is
//   held for the whole of a command (or of an EXEC), so commands are atomic
//   with respect to each other.
//
// Blocking commands:
//   execute() returns a BlockRequest whose waiter is already registered under
//   the same lock as the failed attempt, so no write can slip in between.
//   The caller then alternates retry() and waiting for ClientState::wake
//   until it gets a reply, and calls cancel() on timeout or disconnect.
//
// Pub/Sub:
//   SUBSCRIBE puts a client in subscribe mode, where only (UN)SUBSCRIBE, PING
//   and QUIT are accepted. Messages reach it through ClientState::push. The
//   owner of a ClientState must call disconnect() before destroying it.
class Dispatcher {
public:
    Dispatcher(storage::Database& db, std::string requirepass = {});

    Dispatcher(const Dispatcher&)            = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // `args` holds the command name followed by its arguments.
    [[nodiscard]] Outcome execute(ClientState& client, Args args);

    // Re-runs a blocked command. On success the waiter is unregistered and
    // the reply returned; nullopt means it is still waiting.
    [[nodiscard]] std::optional<RespValue> retry(BlockRequest& request);

    // Unregisters a blocked command. Safe to call more than once.
    void cancel(BlockRequest& request);

    // Drops every subscription of `client`.
    void disconnect(ClientState& client);

    // Erases every expired key. Returns the number removed.
    std::size_t purge_expired();

    // Number of clients currently blocked.
    [[nodiscard]] std::size_t blocked_clients() const;

    [[nodiscard]] const CommandTable& table() const noexcept { return table_; }

private:
    Outcome connection_command(ClientState& client, const CommandSpec& spec, Args args);
    RespValue exec(ClientState& client);

    ReplySequence subscribe(ClientState& client, Args args);
    ReplySequence unsubscribe(ClientState& client, Args args);

    // Runs one handler under the lock, registers its waiter if it blocks and
    // wakes clients blocked on the keys it wrote.
    Outcome run(ClientState& client, const CommandSpec& spec, Args args);

    // Caller must hold mutex_.
    void notify_ready(const Context& ctx);

    storage::Database& db_;
    const std::string requirepass_;
    const CommandTable table_;

    mutable std::mutex mutex_;
    BlockingRegistry registry_;
    PubSubRegistry channels_;
};

} // namespace tkv::command
