#include "command/blocking.hpp"

#include <algorithm>

namespace tkv::command {

std::shared_ptr<BlockingRegistry::Waiter>
BlockingRegistry::add(std::vector<std::string> keys, std::function<void()> wake) {
    auto waiter = std::make_shared<Waiter>(Waiter{std::move(keys), std::move(wake)});
    for (const auto& key : waiter->keys) {
        auto& list = by_key_[key];
        // BLPOP k k: one registration per distinct key.
        if (std::find(list.begin(), list.end(), waiter) == list.end()) {
            list.push_back(waiter);
        }
    }
    ++count_;
    return waiter;
}

void BlockingRegistry::remove(const std::shared_ptr<Waiter>& waiter) {
    if (!waiter) {
        return;
    }
    bool found = false;
    for (const auto& key : waiter->keys) {
        auto it = by_key_.find(key);
        if (it == by_key_.end()) {
            continue;
        }
        auto& list = it->second;
        auto pos = std::find(list.begin(), list.end(), waiter);
        if (pos != list.end()) {
            list.erase(pos);
            found = true;
        }
        if (list.empty()) {
            by_key_.erase(it);
        }
    }
    if (found) {
        --count_;
    }
}

std::size_t BlockingRegistry::notify(std::string_view key) {
    auto it = by_key_.find(key);
    if (it == by_key_.end()) {
        return 0;
    }
    for (const auto& waiter : it->second) {
        if (waiter->wake) {
            waiter->wake();
        }
    }
    return it->second.size();
}

} // namespace tkv::command
