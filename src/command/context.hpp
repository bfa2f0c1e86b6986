#pragma once

#include "command/blocking.hpp"
#include "command/pubsub.hpp"
#include "network/resp_value.hpp"
#include "storage/database.hpp"
#include "storage/value.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace tkv::command {

// Arguments of one request, command name first. Views stay valid only for
// the duration of the call.
using Args = std::span<const std::string_view>;

// State a command handler sees while it runs inside the critical section.
struct Context {
    Context(storage::Database& database, PubSubRegistry& pubsub, bool transaction = false)
        : db(database), channels(pubsub), in_transaction(transaction) {}

    storage::Database& db;
    PubSubRegistry& channels;

    // Blocking commands must not block inside MULTI / EXEC.
    bool in_transaction = false;

    // Keys that received data a blocked client may be waiting for.
    std::vector<std::string> ready_keys;

    void signal_ready(std::string_view key) { ready_keys.emplace_back(key); }

    // Error reply for a failed storage operation on `key`. For wrong_type the
    // kind actually stored is looked up to name it in the message.
    [[nodiscard]] RespValue fail(std::error_code ec, std::string_view key,
                                 storage::Kind expected);
};

// A command that found nothing to return yet and asks to wait for a write to
// one of `keys`.
struct BlockRequest {
    std::vector<std::string> keys;

    // Zero waits forever.
    std::chrono::milliseconds timeout{0};

    // Re-runs the command. nullopt means "still nothing, keep waiting".
    std::function<std::optional<RespValue>(Context&)> attempt;

    RespValue timeout_reply = RespValue::null_array();

    // Registration in the BlockingRegistry, set by the Dispatcher.
    std::shared_ptr<BlockingRegistry::Waiter> waiter;
};

// Several top-level replies to one command, e.g. one confirmation per channel
// for SUBSCRIBE a b.
struct ReplySequence {
    std::vector<RespValue> replies;
};

using Outcome = std::variant<RespValue, BlockRequest, ReplySequence>;

using Handler = Outcome (*)(Context&, Args);

} // namespace tkv::command
