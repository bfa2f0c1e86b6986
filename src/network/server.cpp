#include "network/server.hpp"
#include "network/session.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <memory>
#include <string_view>
#include <thread>
#include <vector>

namespace tkv::network {

namespace {

using boost::asio::redirect_error;
using boost::asio::use_awaitable;

unsigned thread_count(unsigned configured) {
    if (configured > 0) return configured;
    return std::max(1u, std::thread::hardware_concurrency());
}

} // anonymous namespace

Server::Server(const ServerConfig& config, storage::Database& db)
    : config_(config),
      dispatcher_(db, config.requirepass),
      ioc_(static_cast<int>(thread_count(config.threads))),
      acceptor_(ioc_) {
    limits_.max_bulk_length = config_.max_bulk_length;
    limits_.max_inline_length = config_.max_inline_length;
    limits_.allow_inline = true;

    const auto address = boost::asio::ip::make_address(config_.host);
    const boost::asio::ip::tcp::endpoint endpoint{address, config_.port};

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();

    spdlog::info("Server listening on {}:{}", config_.host, port_);
}

void Server::run() {
    // Install SIGINT / SIGTERM handler for graceful shutdown.
    boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            spdlog::info("Server: received signal {}, shutting down", signo);
            stop();
        }
    });

    boost::asio::co_spawn(ioc_, accept_loop(), boost::asio::detached);
    if (config_.expiry_sweep_interval_ms > 0) {
        boost::asio::co_spawn(ioc_, expiry_sweep(), boost::asio::detached);
    }

    // Run the io_context across a thread pool.
    const unsigned nthreads = thread_count(config_.threads);
    std::vector<std::thread> pool;
    pool.reserve(nthreads - 1);
    for (unsigned i = 1; i < nthreads; ++i) {
        pool.emplace_back([this] { ioc_.run(); });
    }

    ioc_.run(); // Run on the calling thread as well.

    for (auto& t : pool) {
        t.join();
    }

    spdlog::info("Server: io_context stopped, all threads joined");
}

void Server::stop() {
    ioc_.stop();
}

boost::asio::awaitable<void> Server::accept_loop() {
    spdlog::debug("Server: accept loop started");

    for (;;) {
        boost::system::error_code ec;
        auto socket = co_await acceptor_.async_accept(redirect_error(use_awaitable, ec));

        if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
                spdlog::warn("Server: accept error: {}", ec.message());
            }
            break; // Acceptor was closed – time to stop.
        }

        if (connections_.load() >= config_.max_connections) {
            spdlog::warn("Server: rejecting connection, {} clients connected",
                         connections_.load());
            boost::asio::co_spawn(ioc_, reject(std::move(socket)), boost::asio::detached);
            continue;
        }

        // Disable Nagle – send responses immediately.
        boost::system::error_code opt_ec;
        socket.set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);

        ++connections_;
        auto session = std::make_shared<Session>(std::move(socket), dispatcher_, limits_);
        boost::asio::co_spawn(
            session->strand(),
            [session]() -> boost::asio::awaitable<void> { co_await session->run(); },
            [this](std::exception_ptr e) {
                --connections_;
                if (!e) return;
                try {
                    std::rethrow_exception(e);
                } catch (const std::exception& ex) {
                    spdlog::error("Server: session terminated by exception: {}", ex.what());
                }
            });
    }

    spdlog::debug("Server: accept loop exited");
}

boost::asio::awaitable<void> Server::reject(boost::asio::ip::tcp::socket socket) {
    static constexpr std::string_view kMessage = "-ERR max number of clients reached\r\n";
    boost::system::error_code ec;
    co_await boost::asio::async_write(socket, boost::asio::buffer(kMessage.data(), kMessage.size()),
                                      redirect_error(use_awaitable, ec));
    socket.close(ec);
}

boost::asio::awaitable<void> Server::expiry_sweep() {
    boost::asio::steady_timer timer(ioc_);
    const std::chrono::milliseconds interval{config_.expiry_sweep_interval_ms};

    for (;;) {
        timer.expires_after(interval);
        boost::system::error_code ec;
        co_await timer.async_wait(redirect_error(use_awaitable, ec));
        if (ec) break;

        if (const auto removed = dispatcher_.purge_expired(); removed > 0) {
            spdlog::debug("Server: expiry sweep removed {} key(s)", removed);
        }
    }
}

} // namespace tkv::network
