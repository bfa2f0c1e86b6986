#pragma once

#include "command/dispatcher.hpp"
#include "common/server_config.hpp"
#include "network/resp_codec.hpp"
#include "storage/database.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace tkv::network {

// Owns the io_context, the TCP acceptor and the command Dispatcher in front of
// the shared Database.
//
// Usage:
//   storage::Database db{clock};
//   Server srv{config, db};
//   srv.run();   // blocks until SIGINT/SIGTERM or stop()
class Server {
public:
    // Binds and listens immediately; throws boost::system::system_error if
    // the address is unusable. Port 0 picks an ephemeral port.
    Server(const ServerConfig& config, storage::Database& db);

    // Starts the thread pool, begins accepting connections, and installs signal
    // handlers for graceful shutdown (SIGINT / SIGTERM).
    // Blocks until the server stops.
    void run();

    // Stops the io_context, causing run() to return. Thread-safe.
    void stop();

    // The port actually bound.
    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    [[nodiscard]] std::size_t connections() const noexcept { return connections_.load(); }

    [[nodiscard]] command::Dispatcher& dispatcher() noexcept { return dispatcher_; }

private:
    // Accept loop coroutine – runs until the acceptor is closed.
    boost::asio::awaitable<void> accept_loop();

    // Tells an over-limit client why it is being dropped, then closes it.
    boost::asio::awaitable<void> reject(boost::asio::ip::tcp::socket socket);

    // Periodically erases expired keys.
    boost::asio::awaitable<void> expiry_sweep();

    ServerConfig config_;
    DecodeLimits limits_;
    command::Dispatcher dispatcher_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t port_ = 0;

    std::atomic<std::size_t> connections_{0};
};

} // namespace tkv::network
