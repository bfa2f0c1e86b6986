#include "storage/database.hpp"

#include <charconv>
#include <limits>
#include <utility>

#include <fmt/format.h>

namespace tkv::storage {

namespace {

bool parse_int64(std::string_view sv, int64_t& out) {
    if (sv.empty()) return false;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

} // anonymous namespace

// ── Lookup ───────────────────────────────────────────────────────────────────

Entry* Database::find(std::string_view key) {
    auto it = map_.find(key);
    if (it == map_.end()) {
        return nullptr;
    }
    if (expired(it->second)) {
        map_.erase(it);
        return nullptr;
    }
    return &it->second;
}

// ── Generic ──────────────────────────────────────────────────────────────────

bool Database::exists(std::string_view key) {
    return find(key) != nullptr;
}

bool Database::del(std::string_view key) {
    auto it = map_.find(key);
    if (it == map_.end()) {
        return false;
    }
    const bool live = !expired(it->second);
    map_.erase(it);
    return live;
}

std::optional<Kind> Database::kind_of(std::string_view key) {
    const Entry* entry = find(key);
    if (!entry) return std::nullopt;
    return entry->kind();
}

bool Database::expire_at(std::string_view key, int64_t at_ms) {
    Entry* entry = find(key);
    if (!entry) {
        return false;
    }
    if (at_ms <= clock_.now_ms()) {
        del(key);
        return true;
    }
    entry->expires_at_ms = at_ms;
    return true;
}

bool Database::persist(std::string_view key) {
    Entry* entry = find(key);
    if (!entry || !entry->expires_at_ms) {
        return false;
    }
    entry->expires_at_ms.reset();
    return true;
}

int64_t Database::ttl_ms(std::string_view key) {
    const Entry* entry = find(key);
    if (!entry) return -2;
    if (!entry->expires_at_ms) return -1;
    return *entry->expires_at_ms - clock_.now_ms();
}

std::vector<std::string> Database::keys(std::string_view pattern) const {
    std::vector<std::string> out;
    for (const auto& [key, entry] : map_) {
        if (!expired(entry) && glob_match(pattern, key)) {
            out.push_back(key);
        }
    }
    return out;
}

void Database::flush() {
    map_.clear();
}

std::size_t Database::purge_expired() {
    std::size_t removed = 0;
    for (auto it = map_.begin(); it != map_.end();) {
        if (expired(it->second)) {
            it = map_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

// ── Strings ──────────────────────────────────────────────────────────────────

std::error_code Database::get(std::string_view key, std::optional<std::string>& out) {
    std::string* value = nullptr;
    if (auto ec = find_as(key, value)) return ec;
    if (value) {
        out = *value;
    } else {
        out.reset();
    }
    return {};
}

void Database::set(std::string_view key, std::string value, std::optional<int64_t> expires_at_ms) {
    Entry entry{Value{std::move(value)}, expires_at_ms};
    if (auto it = map_.find(key); it != map_.end()) {
        it->second = std::move(entry);
    } else {
        map_.emplace(std::string(key), std::move(entry));
    }
}

std::error_code Database::incr_by(std::string_view key, int64_t delta, int64_t& out) {
    std::string* value = nullptr;
    if (auto ec = find_as(key, value)) return ec;

    int64_t current = 0;
    if (value && !parse_int64(*value, current)) {
        return errc::not_integer;
    }
    if ((delta > 0 && current > std::numeric_limits<int64_t>::max() - delta) ||
        (delta < 0 && current < std::numeric_limits<int64_t>::min() - delta)) {
        return errc::overflow;
    }

    out = current + delta;
    if (value) {
        *value = fmt::format("{}", out);
    } else {
        set(key, fmt::format("{}", out));
    }
    return {};
}

std::error_code Database::append(std::string_view key, std::string_view suffix,
                                 std::size_t& new_length) {
    std::string* value = nullptr;
    if (auto ec = find_or_create(key, value)) return ec;
    value->append(suffix);
    new_length = value->size();
    return {};
}

std::error_code Database::strlen(std::string_view key, std::size_t& out) {
    std::string* value = nullptr;
    if (auto ec = find_as(key, value)) return ec;
    out = value ? value->size() : 0;
    return {};
}

// ── glob_match ───────────────────────────────────────────────────────────────

bool glob_match(std::string_view pattern, std::string_view text) noexcept {
    std::size_t p = 0;
    std::size_t t = 0;
    // Backtrack point for the most recent '*'.
    std::size_t star_p = std::string_view::npos;
    std::size_t star_t = 0;

    while (t < text.size()) {
        if (p < pattern.size()) {
            const char pc = pattern[p];
            if (pc == '*') {
                star_p = p++;
                star_t = t;
                continue;
            }
            if (pc == '?') {
                ++p;
                ++t;
                continue;
            }
            if (pc == '[') {
                std::size_t q = p + 1;
                const bool negate = q < pattern.size() && pattern[q] == '^';
                if (negate) ++q;
                bool matched = false;
                while (q < pattern.size() && pattern[q] != ']') {
                    if (pattern[q] == '\\' && q + 1 < pattern.size()) {
                        ++q;
                        if (pattern[q] == text[t]) matched = true;
                        ++q;
                    } else if (q + 2 < pattern.size() && pattern[q + 1] == '-' &&
                               pattern[q + 2] != ']') {
                        auto lo = static_cast<unsigned char>(pattern[q]);
                        auto hi = static_cast<unsigned char>(pattern[q + 2]);
                        if (lo > hi) std::swap(lo, hi);
                        const auto c = static_cast<unsigned char>(text[t]);
                        if (c >= lo && c <= hi) matched = true;
                        q += 3;
                    } else {
                        if (pattern[q] == text[t]) matched = true;
                        ++q;
                    }
                }
                if (matched != negate) {
                    p = q < pattern.size() ? q + 1 : q;
                    ++t;
                    continue;
                }
            } else {
                char expected = pc;
                std::size_t width = 1;
                if (pc == '\\' && p + 1 < pattern.size()) {
                    expected = pattern[p + 1];
                    width = 2;
                }
                if (expected == text[t]) {
                    p += width;
                    ++t;
                    continue;
                }
            }
        }
        if (star_p == std::string_view::npos) {
            return false;
        }
        p = star_p + 1;
        t = ++star_t;
    }

    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

} // namespace tkv::storage
