#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace tkv::storage {

// Failure modes of typed Database operations. A non-zero code always means
// the dataset was left unchanged.
enum class errc {
    wrong_type = 1,        // key holds a different kind of value
    not_integer,           // stored string or argument is not a 64-bit integer
    overflow,              // integer increment would overflow
    nan_score,             // sorted set score would become NaN
    invalid_stream_id,     // malformed stream ID
    stream_id_zero,        // explicit XADD ID 0-0
    stream_id_too_small,   // explicit XADD ID not above the stream top item
    no_such_member,        // referenced sorted set member does not exist
};

[[nodiscard]] const std::error_category& storage_category() noexcept;

[[nodiscard]] inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), storage_category()};
}

} // namespace tkv::storage

namespace std {
template <>
struct is_error_code_enum<tkv::storage::errc> : true_type {};
} // namespace std
