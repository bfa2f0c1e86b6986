#pragma once

#include "storage/string_hash.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tkv::command {

struct ClientState;

// ── PubSubRegistry ───────────────────────────────────────────────────────────
//
// Channel → subscribed clients. PUBLISH hands ["message", channel, payload]
// to the ClientState::push callback of every subscriber of the channel.
//
// A client's own list of channels lives in ClientState::channels; the
// Dispatcher keeps both sides in step and drops every subscription of a
// client in disconnect().
//
// NOT thread-safe: used only under the Dispatcher lock, like
// BlockingRegistry. Push callbacks run under that lock.

class PubSubRegistry {
public:
    // False if `client` was already subscribed to `channel`.
    bool subscribe(std::string_view channel, ClientState* client);

    // False if `client` was not subscribed to `channel`.
    bool unsubscribe(std::string_view channel, ClientState* client);

    // Returns the number of clients the message was handed to.
    std::size_t publish(std::string_view channel, std::string_view message);

    // Number of channels with at least one subscriber.
    [[nodiscard]] std::size_t channels() const noexcept { return by_channel_.size(); }

private:
    using SubscriberList = std::vector<ClientState*>;

    std::unordered_map<std::string, SubscriberList, storage::StringHash, std::equal_to<>>
        by_channel_;
};

} // namespace tkv::command
