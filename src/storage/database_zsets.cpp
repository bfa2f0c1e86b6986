#include "storage/database.hpp"

#include <cmath>

namespace tkv::storage {

std::error_code Database::zadd(std::string_view key,
                               std::span<const ScoredMember> items,
                               std::size_t& added) {
    for (const auto& [score, member] : items) {
        if (std::isnan(score)) return errc::nan_score;
    }

    SortedSet* zset = nullptr;
    if (auto ec = find_or_create(key, zset)) return ec;
    added = 0;
    for (const auto& [score, member] : items) {
        if (zset->add(member, score)) ++added;
    }
    return {};
}

std::error_code Database::zrem(std::string_view key,
                               std::span<const std::string_view> members,
                               std::size_t& removed) {
    removed = 0;
    SortedSet* zset = nullptr;
    if (auto ec = find_as(key, zset); ec || !zset) return ec;
    for (auto member : members) {
        if (zset->remove(member)) ++removed;
    }
    erase_if_empty(key, *zset);
    return {};
}

std::error_code Database::zrange(std::string_view key, int64_t start, int64_t stop,
                                 std::vector<SortedSet::Item>& out) {
    out.clear();
    SortedSet* zset = nullptr;
    if (auto ec = find_as(key, zset); ec || !zset) return ec;
    if (auto range = normalize_range(start, stop, zset->size())) {
        out = zset->range(range->first, range->second);
    }
    return {};
}

std::error_code Database::zscore(std::string_view key, std::string_view member,
                                 std::optional<double>& out) {
    out.reset();
    SortedSet* zset = nullptr;
    if (auto ec = find_as(key, zset); ec || !zset) return ec;
    out = zset->score(member);
    return {};
}

std::error_code Database::zrank(std::string_view key, std::string_view member,
                                std::optional<std::size_t>& out) {
    out.reset();
    SortedSet* zset = nullptr;
    if (auto ec = find_as(key, zset); ec || !zset) return ec;
    out = zset->rank(member);
    return {};
}

std::error_code Database::zcard(std::string_view key, std::size_t& out) {
    SortedSet* zset = nullptr;
    if (auto ec = find_as(key, zset)) return ec;
    out = zset ? zset->size() : 0;
    return {};
}

} // namespace tkv::storage
