#include "storage/database.hpp"

namespace tkv::storage {

std::error_code Database::sadd(std::string_view key,
                               std::span<const std::string_view> members,
                               std::size_t& added) {
    SetValue* set = nullptr;
    if (auto ec = find_or_create(key, set)) return ec;
    added = 0;
    for (auto member : members) {
        if (set->find(member) == set->end()) {
            set->emplace(member);
            ++added;
        }
    }
    return {};
}

std::error_code Database::srem(std::string_view key,
                               std::span<const std::string_view> members,
                               std::size_t& removed) {
    removed = 0;
    SetValue* set = nullptr;
    if (auto ec = find_as(key, set); ec || !set) return ec;
    for (auto member : members) {
        if (auto it = set->find(member); it != set->end()) {
            set->erase(it);
            ++removed;
        }
    }
    erase_if_empty(key, *set);
    return {};
}

std::error_code Database::smembers(std::string_view key, std::vector<std::string>& out) {
    out.clear();
    SetValue* set = nullptr;
    if (auto ec = find_as(key, set); ec || !set) return ec;
    out.assign(set->begin(), set->end());
    return {};
}

std::error_code Database::sismember(std::string_view key, std::string_view member, bool& out) {
    SetValue* set = nullptr;
    if (auto ec = find_as(key, set)) return ec;
    out = set && set->find(member) != set->end();
    return {};
}

std::error_code Database::scard(std::string_view key, std::size_t& out) {
    SetValue* set = nullptr;
    if (auto ec = find_as(key, set)) return ec;
    out = set ? set->size() : 0;
    return {};
}

} // namespace tkv::storage
