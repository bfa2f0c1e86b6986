#pragma once

#include "network/resp_value.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

namespace tkv::client {

// ── Connection ────────────────────────────────────────────────────────────────
//
// Synchronous RESP2 client for one server connection.
//
// Commands are sent as arrays of bulk strings; every reply is decoded into an
// owned RespValue, so a null bulk string and an empty one stay distinct.
//
// Errors:
//   - connect / socket failures throw boost::system::system_error
//   - a malformed reply or a connection closed by the server throws
//     std::runtime_error
//   Error replies from the server (-ERR ...) are returned, not thrown.
//
// Not thread-safe: use one Connection per thread.

class Connection {
public:
    Connection(const std::string& host, uint16_t port);

    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    // Sends one command and waits for its reply.
    RespValue command(const std::vector<std::string>& args);

    // Sends every command in a single write, then reads one reply per command.
    std::vector<RespValue> pipeline(const std::vector<std::vector<std::string>>& commands);

    // Writes bytes as-is (inline commands, deliberately malformed input).
    void send_raw(std::string_view bytes);

    // Reads the next reply.
    RespValue read_reply();

    void close();

    [[nodiscard]] bool is_open() const noexcept { return socket_.is_open(); }

private:
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::socket socket_;

    std::string buffer_;            // received bytes not yet decoded
    std::deque<RespValue> pending_; // decoded replies not yet returned
};

// ── CLI helpers ───────────────────────────────────────────────────────────────

// Renders a reply the way an interactive client prints it:
//   OK, (integer) 1, "bar", (nil), (error) ERR ..., numbered array items.
[[nodiscard]] std::string format_reply(const RespValue& reply);

// Splits a command line on whitespace. "double" and 'single' quotes group
// words; inside double quotes \n, \r, \t, \" and \\ are unescaped.
// Throws std::runtime_error on an unterminated quote.
[[nodiscard]] std::vector<std::string> split_command_line(std::string_view line);

} // namespace tkv::client
