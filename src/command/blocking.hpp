#pragma once

#include "storage/string_hash.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tkv::command {

// ── BlockingRegistry ─────────────────────────────────────────────────────────
//
// Tracks clients blocked in BLPOP / BRPOP / XREAD BLOCK, indexed by the keys
// they wait on:
//
//   1. A blocking command finds nothing and registers a waiter (add()).
//   2. A write that makes data available on a key calls notify(key), which
//      invokes the wake callback of every waiter on that key.
//   3. The woken client retries its command; on success, timeout or
//      disconnect it unregisters (remove()).
//
// Every waiter on a key is woken; whichever retries first gets the data and
// the others go back to waiting.
//
// NOT thread-safe: the Dispatcher calls it only while holding its lock. Wake
// callbacks are therefore invoked under that lock and must only schedule work
// (e.g. post to a strand), never call back into the Dispatcher.

class BlockingRegistry {
public:
    struct Waiter {
        std::vector<std::string> keys;
        std::function<void()> wake;
    };

    std::shared_ptr<Waiter> add(std::vector<std::string> keys, std::function<void()> wake);

    // Safe to call with a waiter that was already removed or is null.
    void remove(const std::shared_ptr<Waiter>& waiter);

    // Returns the number of waiters woken.
    std::size_t notify(std::string_view key);

    // Number of registered waiters.
    [[nodiscard]] std::size_t size() const noexcept { return count_; }

private:
    using WaiterList = std::vector<std::shared_ptr<Waiter>>;

    std::unordered_map<std::string, WaiterList, storage::StringHash, std::equal_to<>> by_key_;
    std::size_t count_ = 0;
};

} // namespace tkv::command
