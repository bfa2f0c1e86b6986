#include "command/dispatcher.hpp"
#include "command/arguments.hpp"
#include "command/reply.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <string_view>
#include <utility>

namespace tkv::command {

Dispatcher::Dispatcher(storage::Database& db, std::string requirepass)
    : db_(db), requirepass_(std::move(requirepass)) {}

Outcome Dispatcher::execute(ClientState& client, Args args) {
    if (args.empty()) {
        return unknown_command(args);
    }

    const CommandSpec* spec = table_.find(args.front());
    if (!spec) {
        if (client.in_multi) client.multi_failed = true;
        return unknown_command(args);
    }
    if (!spec->arity_ok(args.size())) {
        if (client.in_multi) client.multi_failed = true;
        return wrong_arity(spec->name);
    }

    if (!requirepass_.empty() && !client.authenticated && !(spec->flags & kNoAuth)) {
        return error("NOAUTH Authentication required.");
    }

    if (!client.channels.empty()) {
        if (!(spec->flags & kPubSub)) {
            return error(fmt::format("ERR Can't execute '{}': only (P|S)SUBSCRIBE / "
                                     "(P|S)UNSUBSCRIBE / PING / QUIT / RESET are allowed in "
                                     "this context",
                                     spec->name));
        }
        if (spec->name == "ping") {
            if (args.size() > 2) return wrong_arity("ping");
            return RespValue::array({bulk("pong"), bulk(args.size() == 2 ? args[1] : "")});
        }
    }

    if (spec->flags & kConnection) {
        return connection_command(client, *spec, args);
    }

    if (client.in_multi) {
        client.queued.emplace_back(args.begin(), args.end());
        return RespValue::simple("QUEUED");
    }

    return run(client, *spec, args);
}

std::optional<RespValue> Dispatcher::retry(BlockRequest& request) {
    std::lock_guard lock(mutex_);
    Context ctx(db_, channels_);
    auto reply = request.attempt(ctx);
    if (reply) {
        registry_.remove(request.waiter);
        request.waiter.reset();
    }
    notify_ready(ctx);
    return reply;
}

void Dispatcher::disconnect(ClientState& client) {
    std::lock_guard lock(mutex_);
    for (const auto& channel : client.channels) {
        channels_.unsubscribe(channel, &client);
    }
    client.channels.clear();
}

void Dispatcher::cancel(BlockRequest& request) {
    std::lock_guard lock(mutex_);
    registry_.remove(request.waiter);
    request.waiter.reset();
}

std::size_t Dispatcher::purge_expired() {
    std::lock_guard lock(mutex_);
    return db_.purge_expired();
}

std::size_t Dispatcher::blocked_clients() const {
    std::lock_guard lock(mutex_);
    return registry_.size();
}

// ── Connection commands ──────────────────────────────────────────────────────

Outcome Dispatcher::connection_command(ClientState& client, const CommandSpec& spec,
                                       Args args) {
    const auto name = spec.name;

    if (name == "auth") {
        if (requirepass_.empty()) {
            return error("ERR AUTH <password> called without any password configured for the "
                         "default user. Are you sure your configuration is correct?");
        }
        if (args[1] != requirepass_) {
            spdlog::debug("Dispatcher: rejected AUTH attempt");
            return error("WRONGPASS invalid username-password pair or user is disabled.");
        }
        client.authenticated = true;
        return ok();
    }

    if (name == "quit") {
        client.close_after_reply = true;
        return ok();
    }

    if (name == "multi") {
        if (client.in_multi) return error("ERR MULTI calls can not be nested");
        client.in_multi = true;
        client.multi_failed = false;
        client.queued.clear();
        return ok();
    }

    if (name == "discard") {
        if (!client.in_multi) return error("ERR DISCARD without MULTI");
        client.in_multi = false;
        client.multi_failed = false;
        client.queued.clear();
        return ok();
    }

    if (name == "exec") {
        if (!client.in_multi) return error("ERR EXEC without MULTI");
        return exec(client);
    }

    if (name == "subscribe" || name == "unsubscribe") {
        if (client.in_multi) {
            client.multi_failed = true;
            return error("ERR Command not allowed inside a transaction");
        }
        return name == "subscribe" ? subscribe(client, args) : unsubscribe(client, args);
    }

    return unknown_command(args);
}

RespValue Dispatcher::exec(ClientState& client) {
    auto queued = std::move(client.queued);
    const bool failed = client.multi_failed;
    client.in_multi = false;
    client.multi_failed = false;
    client.queued.clear();

    if (failed) {
        return error("EXECABORT Transaction discarded because of previous errors.");
    }

    std::vector<RespValue> replies;
    replies.reserve(queued.size());

    std::lock_guard lock(mutex_);
    Context ctx(db_, channels_, /*transaction=*/true);
    for (const auto& command : queued) {
        const std::vector<std::string_view> args(command.begin(), command.end());
        // Lookup and arity were checked when the command was queued.
        const CommandSpec* spec = table_.find(args.front());
        auto outcome = spec->handler(ctx, args);
        if (auto* reply = std::get_if<RespValue>(&outcome)) {
            replies.push_back(std::move(*reply));
        } else {
            replies.push_back(std::get<BlockRequest>(outcome).timeout_reply);
        }
    }
    notify_ready(ctx);
    return RespValue::array(std::move(replies));
}

// ── Pub/Sub ──────────────────────────────────────────────────────────────────

ReplySequence Dispatcher::subscribe(ClientState& client, Args args) {
    std::lock_guard lock(mutex_);
    ReplySequence out;
    for (std::size_t i = 1; i < args.size(); ++i) {
        if (channels_.subscribe(args[i], &client)) {
            client.channels.emplace_back(args[i]);
        }
        out.replies.push_back(RespValue::array(
            {bulk("subscribe"), bulk(args[i]), integer(static_cast<int64_t>(client.channels.size()))}));
    }
    return out;
}

// Without arguments, leaves every channel.
ReplySequence Dispatcher::unsubscribe(ClientState& client, Args args) {
    std::lock_guard lock(mutex_);
    std::vector<std::string> targets = client.channels;
    if (args.size() > 1) {
        targets.assign(args.begin() + 1, args.end());
    }

    ReplySequence out;
    if (targets.empty()) {
        out.replies.push_back(
            RespValue::array({bulk("unsubscribe"), RespValue::null_bulk(), integer(0)}));
        return out;
    }
    for (const auto& channel : targets) {
        if (channels_.unsubscribe(channel, &client)) {
            std::erase(client.channels, channel);
        }
        out.replies.push_back(RespValue::array(
            {bulk("unsubscribe"), bulk(channel), integer(static_cast<int64_t>(client.channels.size()))}));
    }
    return out;
}

// ── Command execution ────────────────────────────────────────────────────────

Outcome Dispatcher::run(ClientState& client, const CommandSpec& spec, Args args) {
    std::lock_guard lock(mutex_);
    Context ctx(db_, channels_);
    auto outcome = spec.handler(ctx, args);
    if (auto* request = std::get_if<BlockRequest>(&outcome)) {
        request->waiter = registry_.add(request->keys, client.wake);
    }
    notify_ready(ctx);
    return outcome;
}

void Dispatcher::notify_ready(const Context& ctx) {
    for (const auto& key : ctx.ready_keys) {
        if (const auto woken = registry_.notify(key); woken > 0) {
            spdlog::trace("Dispatcher: woke {} client(s) blocked on '{}'", woken, key);
        }
    }
}

} // namespace tkv::command
