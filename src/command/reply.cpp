#include "command/reply.hpp"
#include "command/context.hpp"
#include "storage/errors.hpp"

#include <cmath>
#include <iterator>

#include <fmt/format.h>

namespace tkv::command {

RespValue bulk_array(const std::vector<std::string>& items) {
    std::vector<RespValue> elements;
    elements.reserve(items.size());
    for (const auto& item : items) {
        elements.push_back(RespValue::bulk(item));
    }
    return RespValue::array(std::move(elements));
}

RespValue syntax_error() {
    return error("ERR syntax error");
}

RespValue not_integer_error() {
    return error("ERR value is not an integer or out of range");
}

RespValue not_float_error() {
    return error("ERR value is not a valid float");
}

RespValue wrong_arity(std::string_view name) {
    return error(fmt::format("ERR wrong number of arguments for '{}' command", name));
}

RespValue unknown_command(std::span<const std::string_view> args) {
    std::string message = fmt::format("ERR unknown command '{}', with args beginning with: ",
                                      args.empty() ? std::string_view{} : args.front());
    for (std::size_t i = 1; i < args.size(); ++i) {
        fmt::format_to(std::back_inserter(message), "'{}' ", args[i]);
    }
    return error(std::move(message));
}

RespValue wrong_type(storage::Kind expected, std::optional<storage::Kind> found) {
    return error(fmt::format(
        "WRONGTYPE Operation against a key holding the wrong kind of value "
        "(expected {}, found {})",
        storage::kind_name(expected),
        found ? storage::kind_name(*found) : std::string_view{"none"}));
}

RespValue error_reply(std::error_code ec) {
    using storage::errc;
    if (ec.category() != storage::storage_category()) {
        return error("ERR " + ec.message());
    }
    switch (static_cast<errc>(ec.value())) {
    case errc::wrong_type:
        return error("WRONGTYPE Operation against a key holding the wrong kind of value");
    case errc::not_integer:
        return not_integer_error();
    case errc::overflow:
        return error("ERR increment or decrement would overflow");
    case errc::nan_score:
        return error("ERR resulting score is not a number (NaN)");
    case errc::invalid_stream_id:
        return error("ERR Invalid stream ID specified as stream command argument");
    case errc::stream_id_zero:
        return error("ERR The ID specified in XADD must be greater than 0-0");
    case errc::stream_id_too_small:
        return error("ERR The ID specified in XADD is equal or smaller than the target stream top item");
    case errc::no_such_member:
        return error("ERR could not decode requested zset member");
    }
    return error("ERR " + ec.message());
}

std::string format_score(double score) {
    if (std::isinf(score)) {
        return score > 0 ? "inf" : "-inf";
    }
    return fmt::format("{}", score);
}

// ── Context ──────────────────────────────────────────────────────────────────

RespValue Context::fail(std::error_code ec, std::string_view key, storage::Kind expected) {
    if (ec == storage::errc::wrong_type) {
        return wrong_type(expected, db.kind_of(key));
    }
    return error_reply(ec);
}

} // namespace tkv::command
