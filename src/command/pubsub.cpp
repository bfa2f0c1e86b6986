#include "command/pubsub.hpp"
#include "command/dispatcher.hpp"
#include "command/reply.hpp"

#include <algorithm>

namespace tkv::command {

bool PubSubRegistry::subscribe(std::string_view channel, ClientState* client) {
    auto it = by_channel_.find(channel);
    if (it == by_channel_.end()) {
        it = by_channel_.emplace(std::string(channel), SubscriberList{}).first;
    }
    auto& list = it->second;
    if (std::find(list.begin(), list.end(), client) != list.end()) {
        return false;
    }
    list.push_back(client);
    return true;
}

bool PubSubRegistry::unsubscribe(std::string_view channel, ClientState* client) {
    auto it = by_channel_.find(channel);
    if (it == by_channel_.end()) {
        return false;
    }
    auto& list = it->second;
    auto pos = std::find(list.begin(), list.end(), client);
    if (pos == list.end()) {
        return false;
    }
    list.erase(pos);
    if (list.empty()) {
        by_channel_.erase(it);
    }
    return true;
}

std::size_t PubSubRegistry::publish(std::string_view channel, std::string_view message) {
    auto it = by_channel_.find(channel);
    if (it == by_channel_.end()) {
        return 0;
    }
    const auto frame = RespValue::array({bulk("message"), bulk(channel), bulk(message)});
    for (auto* client : it->second) {
        if (client->push) {
            client->push(frame);
        }
    }
    return it->second.size();
}

} // namespace tkv::command
