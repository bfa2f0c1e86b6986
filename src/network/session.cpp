#include "network/session.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <string_view>
#include <vector>

namespace tkv::network {

namespace {

using boost::asio::redirect_error;
using boost::asio::use_awaitable;

constexpr std::size_t kReadChunk = 16 * 1024;

bool is_disconnect(const boost::system::error_code& ec) {
    return ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset ||
           ec == boost::asio::error::broken_pipe ||
           ec == boost::asio::error::operation_aborted;
}

} // anonymous namespace

Session::Session(boost::asio::ip::tcp::socket socket, command::Dispatcher& dispatcher,
                 const DecodeLimits& limits)
    : socket_(std::move(socket)),
      strand_(boost::asio::make_strand(socket_.get_executor())),
      block_timer_(strand_),
      dispatcher_(dispatcher),
      limits_(limits),
      write_idle_(strand_) {
    limits_.allow_inline = true;

    boost::system::error_code ec;
    const auto ep = socket_.remote_endpoint(ec);
    remote_ = ec ? "<unknown>" : ep.address().to_string() + ":" + std::to_string(ep.port());
}

Session::~Session() {
    dispatcher_.disconnect(client_);
}

boost::asio::awaitable<void> Session::run() {
    spdlog::debug("Session {}: connected", remote_);

    // Both callbacks may run on any thread, under the Dispatcher lock.
    client_.wake = [weak = weak_from_this(), strand = strand_] {
        boost::asio::post(strand, [weak] {
            if (auto self = weak.lock()) self->on_wake();
        });
    };
    client_.push = [weak = weak_from_this(), strand = strand_](RespValue message) {
        boost::asio::post(strand, [weak, message = std::move(message)] {
            if (auto self = weak.lock()) self->deliver(message);
        });
    };

    std::string buffer;
    std::string out;
    bool need_read = true;

    for (;;) {
        if (need_read) {
            const std::size_t filled = buffer.size();
            buffer.resize(filled + kReadChunk);

            boost::system::error_code ec;
            const std::size_t n = co_await socket_.async_read_some(
                boost::asio::buffer(buffer.data() + filled, kReadChunk),
                redirect_error(use_awaitable, ec));
            buffer.resize(filled + n);

            if (ec) {
                if (!is_disconnect(ec)) {
                    spdlog::warn("Session {}: read error: {}", remote_, ec.message());
                }
                break;
            }
        }
        need_read = true;

        // Views in `result` point into `buffer`, which must not change until
        // every message has been dispatched.
        auto result = decode(buffer, limits_);

        for (const auto& message : result.messages) {
            std::vector<std::string_view> args;
            args.reserve(message.elements.size());
            for (const auto& element : message.elements) args.push_back(element.str);

            spdlog::trace("Session {}: {}", remote_, args.empty() ? "" : args.front());

            auto outcome = dispatcher_.execute(client_, args);
            if (auto* reply = std::get_if<RespValue>(&outcome)) {
                encode(*reply, out);
            } else if (auto* sequence = std::get_if<command::ReplySequence>(&outcome)) {
                for (const auto& item : sequence->replies) encode(item, out);
            } else {
                auto& request = std::get<command::BlockRequest>(outcome);
                // Replies to earlier pipelined commands go out before blocking.
                if (!co_await flush(out)) {
                    dispatcher_.cancel(request);
                    co_return;
                }
                auto unblocked = co_await await_blocked(request);
                if (!unblocked) {
                    spdlog::debug("Session {}: closed while blocked", remote_);
                    co_return;
                }
                encode(*unblocked, out);
            }

            if (client_.close_after_reply) {
                co_await flush(out);
                spdlog::debug("Session {}: QUIT", remote_);
                co_return;
            }
        }

        if (result.error) {
            spdlog::warn("Session {}: protocol error: {}", remote_, *result.error);
            out += "-ERR Protocol error: ";
            out += *result.error;
            out += "\r\n";
            co_await flush(out);
            break;
        }

        buffer.erase(0, result.consumed);

        // Requests that arrived while a command was blocked are decoded
        // before reading again.
        if (!pending_.empty()) {
            buffer += pending_;
            pending_.clear();
            need_read = false;
        }

        if (!co_await flush(out)) break;
    }

    spdlog::debug("Session {}: disconnected", remote_);
}

// ── Writing ──────────────────────────────────────────────────────────────────

boost::asio::awaitable<bool> Session::flush(std::string& out) {
    if (out.empty()) co_return true;

    // A Pub/Sub write may be in flight.
    while (writing_) {
        boost::system::error_code ec;
        write_idle_.expires_at(std::chrono::steady_clock::time_point::max());
        co_await write_idle_.async_wait(redirect_error(use_awaitable, ec));
    }

    writing_ = true;
    boost::system::error_code ec;
    co_await boost::asio::async_write(socket_, boost::asio::buffer(out),
                                      redirect_error(use_awaitable, ec));
    out.clear();
    if (ec) {
        writing_ = false;
        if (!is_disconnect(ec)) {
            spdlog::warn("Session {}: write error: {}", remote_, ec.message());
        }
        co_return false;
    }
    co_return co_await write_pushed();
}

boost::asio::awaitable<bool> Session::write_pushed() {
    bool healthy = true;
    while (!pushed_.empty()) {
        std::string batch;
        batch.swap(pushed_);

        boost::system::error_code ec;
        co_await boost::asio::async_write(socket_, boost::asio::buffer(batch),
                                          redirect_error(use_awaitable, ec));
        if (ec) {
            pushed_.clear();
            healthy = false;
            break;
        }
    }
    writing_ = false;
    write_idle_.cancel();
    co_return healthy;
}

void Session::deliver(const RespValue& message) {
    encode(message, pushed_);
    if (writing_) return;

    writing_ = true;
    boost::asio::co_spawn(
        strand_,
        [self = shared_from_this()]() -> boost::asio::awaitable<void> {
            if (!co_await self->write_pushed()) {
                spdlog::debug("Session {}: message push failed", self->remote_);
            }
        },
        boost::asio::detached);
}

// ── Blocking commands ────────────────────────────────────────────────────────

boost::asio::awaitable<std::optional<RespValue>>
Session::await_blocked(command::BlockRequest& request) {
    using Clock = std::chrono::steady_clock;
    const auto deadline = request.timeout.count() > 0 ? Clock::now() + request.timeout
                                                      : Clock::time_point::max();

    watching_ = true;
    read_while_blocked();

    for (;;) {
        // Retry before waiting: a wake delivered while the earlier replies were
        // being written found no pending wait to cancel.
        woken_ = false;
        if (auto reply = dispatcher_.retry(request)) {
            co_await stop_reading();
            co_return reply;
        }

        if (peer_closed_) {
            dispatcher_.cancel(request);
            co_await stop_reading();
            co_return std::nullopt;
        }

        if (Clock::now() >= deadline) {
            dispatcher_.cancel(request);
            co_await stop_reading();
            co_return request.timeout_reply;
        }

        block_timer_.expires_at(deadline);
        boost::system::error_code ec;
        co_await block_timer_.async_wait(redirect_error(use_awaitable, ec));
        // Timer expiry or cancellation (wake / peer close): loop and retry.
    }
}

void Session::on_wake() {
    woken_ = true;
    block_timer_.cancel();
}

void Session::read_while_blocked() {
    reading_ = true;
    const std::size_t filled = pending_.size();
    pending_.resize(filled + kReadChunk);

    socket_.async_read_some(
        boost::asio::buffer(pending_.data() + filled, kReadChunk),
        boost::asio::bind_executor(
            strand_,
            [self = shared_from_this(), filled](const boost::system::error_code& ec,
                                                std::size_t n) {
                self->reading_ = false;
                self->pending_.resize(filled + n);

                if (ec) {
                    if (ec != boost::asio::error::operation_aborted) {
                        self->peer_closed_ = true;
                    }
                    self->block_timer_.cancel();
                    return;
                }
                if (self->watching_) {
                    self->read_while_blocked();
                } else {
                    self->block_timer_.cancel();
                }
            }));
}

boost::asio::awaitable<void> Session::stop_reading() {
    watching_ = false;
    if (reading_) {
        boost::system::error_code ec;
        socket_.cancel(ec);
    }
    while (reading_) {
        boost::system::error_code ec;
        block_timer_.expires_at(std::chrono::steady_clock::time_point::max());
        co_await block_timer_.async_wait(redirect_error(use_awaitable, ec));
    }
}

} // namespace tkv::network
