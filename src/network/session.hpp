#pragma once

#include "command/dispatcher.hpp"
#include "network/resp_codec.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <memory>
#include <optional>
#include <string>

namespace tkv::network {

// Handles one TCP connection for its lifetime.
//
// Each Session is co_spawned on its own strand from Server::accept_loop() and
// runs until the client disconnects, sends QUIT or violates the protocol.
//
// Request loop: read whatever is available, decode every complete request in
// the buffer, execute them in order, write all replies in one batch, drop the
// consumed prefix and read again. A partial trailing request stays buffered
// until the rest arrives.
//
// Blocking commands park the loop on a timer. The Dispatcher's wake callback
// cancels that timer through the strand. While parked the socket is still
// read: bytes that arrive are kept for after the blocked reply, and a peer
// close ends the session.
//
// Pub/Sub messages are posted to the strand and written as soon as no other
// write is in flight, so they never interleave with a batch of replies.
class Session : public std::enable_shared_from_this<Session> {
public:
    using Strand = boost::asio::strand<boost::asio::any_io_executor>;

    Session(boost::asio::ip::tcp::socket socket, command::Dispatcher& dispatcher,
            const DecodeLimits& limits);
    ~Session();

    // Executor the session must be spawned on.
    [[nodiscard]] const Strand& strand() const noexcept { return strand_; }

    // Main coroutine. Returns when the connection is done.
    boost::asio::awaitable<void> run();

private:
    // Writes and clears `out`, then any messages pushed meanwhile. Returns
    // false if the connection failed.
    boost::asio::awaitable<bool> flush(std::string& out);

    // Writes `pushed_` until it is empty. Caller sets writing_ first.
    boost::asio::awaitable<bool> write_pushed();

    // Called on the strand with each Pub/Sub message for this client.
    void deliver(const RespValue& message);

    // Waits until a blocked command produces a reply or times out.
    // nullopt if the peer went away meanwhile.
    boost::asio::awaitable<std::optional<RespValue>> await_blocked(command::BlockRequest& request);

    // Called on the strand by the Dispatcher's wake callback.
    void on_wake();

    // Keeps one read outstanding while blocked. Data goes to pending_; EOF or
    // a socket error sets peer_closed_.
    void read_while_blocked();

    // Cancels that read and waits until its handler has run.
    boost::asio::awaitable<void> stop_reading();

    boost::asio::ip::tcp::socket socket_;
    Strand strand_;
    boost::asio::steady_timer block_timer_;

    command::Dispatcher& dispatcher_;
    command::ClientState client_;
    DecodeLimits limits_;

    std::string remote_;
    bool woken_ = false;

    // Reading while blocked.
    std::string pending_;
    bool reading_ = false;
    bool watching_ = false;
    bool peer_closed_ = false;

    // Writing.
    std::string pushed_;
    bool writing_ = false;
    boost::asio::steady_timer write_idle_;
};

} // namespace tkv::network
