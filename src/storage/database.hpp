#pragma once

#include "common/clock.hpp"
#include "storage/errors.hpp"
#include "storage/sorted_set.hpp"
#include "storage/stream.hpp"
#include "storage/string_hash.hpp"
#include "storage/value.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tkv::storage {

// The typed in-memory key space.
//
// Concurrency model:
//   NOT thread-safe. The command dispatcher serialises every command (or a
//   whole transaction) under one mutex; nothing else may touch a Database
//   concurrently.
//
// Expiry:
//   Keys carrying an expiry at or before Clock::now_ms() are treated as absent
//   by every operation and erased when touched. purge_expired() removes them
//   in bulk.
//
// Errors:
//   Typed operations return a std::error_code from errc and deliver results
//   through out-parameters. A failed operation never mutates the key space.
//   Applying an operation to a key of another kind yields errc::wrong_type.
class Database {
public:
    enum class End { Front, Back };

    explicit Database(const Clock& clock) : clock_(clock) {}

    Database(const Database&)            = delete;
    Database& operator=(const Database&) = delete;

    // ── Generic ──────────────────────────────────────────────────────────────

    [[nodiscard]] bool exists(std::string_view key);

    // Returns true if the key existed.
    bool del(std::string_view key);

    [[nodiscard]] std::optional<Kind> kind_of(std::string_view key);

    // Sets an absolute expiry. A timestamp not in the future deletes the key.
    // Returns false if the key does not exist.
    bool expire_at(std::string_view key, int64_t at_ms);

    // Clears the expiry. Returns true if the key had one.
    bool persist(std::string_view key);

    // Remaining time to live: -2 if absent, -1 if the key does not expire.
    [[nodiscard]] int64_t ttl_ms(std::string_view key);

    // Number of stored keys, including expired keys not yet purged.
    [[nodiscard]] std::size_t size() const noexcept { return map_.size(); }

    // Live keys matching a glob pattern (*, ?, [abc], [^a-z], \x).
    [[nodiscard]] std::vector<std::string> keys(std::string_view pattern) const;

    void flush();

    // Erases every expired key. Returns the number removed.
    std::size_t purge_expired();

    [[nodiscard]] const Clock& clock() const noexcept { return clock_; }

    // ── Strings ──────────────────────────────────────────────────────────────

    [[nodiscard]] std::error_code get(std::string_view key, std::optional<std::string>& out);

    // Replaces the key wholesale, whatever it held before.
    void set(std::string_view key, std::string value,
             std::optional<int64_t> expires_at_ms = std::nullopt);

    // Keeps any expiry the key already has.
    [[nodiscard]] std::error_code incr_by(std::string_view key, int64_t delta, int64_t& out);

    [[nodiscard]] std::error_code append(std::string_view key, std::string_view suffix,
                                         std::size_t& new_length);

    [[nodiscard]] std::error_code strlen(std::string_view key, std::size_t& out);

    // ── Lists ────────────────────────────────────────────────────────────────

    // Elements are pushed one at a time, so LPUSH a b c yields [c, b, a].
    [[nodiscard]] std::error_code push(std::string_view key, End end,
                                       std::span<const std::string_view> elements,
                                       std::size_t& new_length);

    // Pops up to `count` elements. An emptied list is removed.
    [[nodiscard]] std::error_code pop(std::string_view key, End end, std::size_t count,
                                      std::vector<std::string>& out);

    [[nodiscard]] std::error_code llen(std::string_view key, std::size_t& out);

    [[nodiscard]] std::error_code lrange(std::string_view key, int64_t start, int64_t stop,
                                         std::vector<std::string>& out);

    [[nodiscard]] std::error_code lindex(std::string_view key, int64_t index,
                                         std::optional<std::string>& out);

    // ── Sets ─────────────────────────────────────────────────────────────────

    [[nodiscard]] std::error_code sadd(std::string_view key,
                                       std::span<const std::string_view> members,
                                       std::size_t& added);

    // An emptied set is removed.
    [[nodiscard]] std::error_code srem(std::string_view key,
                                       std::span<const std::string_view> members,
                                       std::size_t& removed);

    [[nodiscard]] std::error_code smembers(std::string_view key, std::vector<std::string>& out);

    [[nodiscard]] std::error_code sismember(std::string_view key, std::string_view member,
                                            bool& out);

    [[nodiscard]] std::error_code scard(std::string_view key, std::size_t& out);

    // ── Sorted sets ──────────────────────────────────────────────────────────

    using ScoredMember = std::pair<double, std::string_view>;

    // Returns errc::nan_score (without mutating) if any score is NaN.
    [[nodiscard]] std::error_code zadd(std::string_view key,
                                       std::span<const ScoredMember> items,
                                       std::size_t& added);

    // An emptied sorted set is removed.
    [[nodiscard]] std::error_code zrem(std::string_view key,
                                       std::span<const std::string_view> members,
                                       std::size_t& removed);

    [[nodiscard]] std::error_code zrange(std::string_view key, int64_t start, int64_t stop,
                                         std::vector<SortedSet::Item>& out);

    [[nodiscard]] std::error_code zscore(std::string_view key, std::string_view member,
                                         std::optional<double>& out);

    [[nodiscard]] std::error_code zrank(std::string_view key, std::string_view member,
                                        std::optional<std::size_t>& out);

    [[nodiscard]] std::error_code zcard(std::string_view key, std::size_t& out);

    // ── Streams ──────────────────────────────────────────────────────────────

    // Resolves the ID against the stream top item and the clock, then appends.
    // The stream is created only once the ID has been accepted.
    [[nodiscard]] std::error_code xadd(std::string_view key, const XaddId& id,
                                       StreamFields fields, StreamId& out);

    [[nodiscard]] std::error_code xlen(std::string_view key, std::size_t& out);

    [[nodiscard]] std::error_code xrange(std::string_view key, StreamId start, StreamId end,
                                         std::optional<std::size_t> count,
                                         std::vector<StreamEntry>& out);

    // Entries strictly after `after`.
    [[nodiscard]] std::error_code xread(std::string_view key, StreamId after,
                                        std::optional<std::size_t> count,
                                        std::vector<StreamEntry>& out);

    // Last ID of the stream, 0-0 if the key does not exist.
    [[nodiscard]] std::error_code xlast_id(std::string_view key, StreamId& out);

private:
    using Map = std::unordered_map<std::string, Entry, StringHash, std::equal_to<>>;

    [[nodiscard]] bool expired(const Entry& entry) const noexcept {
        return entry.expires_at_ms && *entry.expires_at_ms <= clock_.now_ms();
    }

    // Live entry for `key`, or nullptr. An expired entry is erased.
    Entry* find(std::string_view key);

    // Sets `out` to the value if the key holds a T, nullptr if it is absent.
    template <typename T>
    std::error_code find_as(std::string_view key, T*& out) {
        out = nullptr;
        Entry* entry = find(key);
        if (!entry) return {};
        out = std::get_if<T>(&entry->value);
        if (!out) return errc::wrong_type;
        return {};
    }

    // Like find_as, but inserts an empty T when the key is absent.
    template <typename T>
    std::error_code find_or_create(std::string_view key, T*& out) {
        if (auto ec = find_as(key, out); ec || out) return ec;
        auto [it, inserted] = map_.emplace(std::string(key), Entry{Value{T{}}, std::nullopt});
        out = std::get_if<T>(&it->second.value);
        return {};
    }

    // Erases `key` if its container became empty.
    template <typename T>
    void erase_if_empty(std::string_view key, const T& container) {
        if (container.empty()) {
            if (auto it = map_.find(key); it != map_.end()) map_.erase(it);
        }
    }

    const Clock& clock_;
    Map map_;
};

// Glob matching used by KEYS. Binary safe.
[[nodiscard]] bool glob_match(std::string_view pattern, std::string_view text) noexcept;

} // namespace tkv::storage
