#pragma once

#include "storage/sorted_set.hpp"
#include "storage/stream.hpp"
#include "storage/string_hash.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <variant>

namespace tkv::storage {

// ── Value kinds ──────────────────────────────────────────────────────────────

// Order matches the alternatives of Value.
enum class Kind : uint8_t {
    String,
    List,
    Set,
    SortedSet,
    Stream,
};

// Name reported by TYPE and in WRONGTYPE errors.
[[nodiscard]] constexpr std::string_view kind_name(Kind kind) noexcept {
    switch (kind) {
    case Kind::String:    return "string";
    case Kind::List:      return "list";
    case Kind::Set:       return "set";
    case Kind::SortedSet: return "zset";
    case Kind::Stream:    return "stream";
    }
    return "none";
}

using ListValue = std::deque<std::string>;
using SetValue  = std::unordered_set<std::string, StringHash, std::equal_to<>>;

using Value = std::variant<std::string, ListValue, SetValue, SortedSet, Stream>;

template <typename T> struct kind_of_type;
template <> struct kind_of_type<std::string> { static constexpr Kind value = Kind::String; };
template <> struct kind_of_type<ListValue>   { static constexpr Kind value = Kind::List; };
template <> struct kind_of_type<SetValue>    { static constexpr Kind value = Kind::Set; };
template <> struct kind_of_type<SortedSet>   { static constexpr Kind value = Kind::SortedSet; };
template <> struct kind_of_type<Stream>      { static constexpr Kind value = Kind::Stream; };

struct Entry {
    Value value;
    std::optional<int64_t> expires_at_ms;  // absolute Unix time, none = persistent

    [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(value.index()); }
};

// Resolve an inclusive [start, stop] index pair where negative indexes count
// from the end. Out-of-range bounds are clamped; returns nullopt when the
// resulting range is empty.
[[nodiscard]] inline std::optional<std::pair<std::size_t, std::size_t>>
normalize_range(int64_t start, int64_t stop, std::size_t size) noexcept {
    const auto len = static_cast<int64_t>(size);
    if (start < 0) start += len;
    if (stop < 0) stop += len;
    if (start < 0) start = 0;
    if (stop >= len) stop = len - 1;
    if (len == 0 || start > stop || start >= len) {
        return std::nullopt;
    }
    return std::pair{static_cast<std::size_t>(start), static_cast<std::size_t>(stop)};
}

} // namespace tkv::storage
