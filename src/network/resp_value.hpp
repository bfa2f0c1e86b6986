#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tkv {

// ── RESP2 value model ────────────────────────────────────────────────────────

enum class RespType : uint8_t {
    SimpleString,
    Error,
    Integer,
    BulkString,
    NullBulkString,
    Array,
    NullArray,
};

// One RESP2 value. `Str` is std::string for owned values (replies, client
// side) and std::string_view for values borrowed from a decode buffer.
// `str` holds the payload of simple strings, errors and bulk strings;
// `integer` the value of integers; `elements` the children of arrays.
template <typename Str>
struct BasicRespValue {
    RespType type = RespType::NullBulkString;
    Str str{};
    int64_t integer = 0;
    std::vector<BasicRespValue> elements;

    static BasicRespValue simple(Str s) {
        return {RespType::SimpleString, std::move(s), 0, {}};
    }
    static BasicRespValue error(Str s) {
        return {RespType::Error, std::move(s), 0, {}};
    }
    static BasicRespValue integer_value(int64_t n) {
        return {RespType::Integer, Str{}, n, {}};
    }
    static BasicRespValue bulk(Str s) {
        return {RespType::BulkString, std::move(s), 0, {}};
    }
    static BasicRespValue null_bulk() {
        return {RespType::NullBulkString, Str{}, 0, {}};
    }
    static BasicRespValue array(std::vector<BasicRespValue> items = {}) {
        return {RespType::Array, Str{}, 0, std::move(items)};
    }
    static BasicRespValue null_array() {
        return {RespType::NullArray, Str{}, 0, {}};
    }

    [[nodiscard]] bool is_null() const noexcept {
        return type == RespType::NullBulkString || type == RespType::NullArray;
    }
    [[nodiscard]] bool is_error() const noexcept { return type == RespType::Error; }

    bool operator==(const BasicRespValue&) const = default;
};

using RespValue = BasicRespValue<std::string>;
using RespView  = BasicRespValue<std::string_view>;

// Deep-copies a borrowed value so it no longer references the decode buffer.
[[nodiscard]] inline RespValue to_owned(const RespView& v) {
    RespValue out;
    out.type = v.type;
    out.str = std::string(v.str);
    out.integer = v.integer;
    out.elements.reserve(v.elements.size());
    for (const auto& e : v.elements) {
        out.elements.push_back(to_owned(e));
    }
    return out;
}

} // namespace tkv
