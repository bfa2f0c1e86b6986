#include "client/client.hpp"
#include "network/resp_codec.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <fmt/format.h>

#include <iterator>
#include <stdexcept>

namespace tkv::client {

namespace {

using tcp = boost::asio::ip::tcp;

constexpr std::size_t kReadChunk = 16 * 1024;

void format_into(const RespValue& reply, std::string& out, std::size_t indent) {
    switch (reply.type) {
    case RespType::SimpleString:
        out += reply.str;
        break;
    case RespType::Error:
        out += "(error) ";
        out += reply.str;
        break;
    case RespType::Integer:
        fmt::format_to(std::back_inserter(out), "(integer) {}", reply.integer);
        break;
    case RespType::BulkString:
        out += '"';
        out += reply.str;
        out += '"';
        break;
    case RespType::NullBulkString:
    case RespType::NullArray:
        out += "(nil)";
        break;
    case RespType::Array: {
        if (reply.elements.empty()) {
            out += "(empty array)";
            break;
        }
        const auto width = std::to_string(reply.elements.size()).size();
        for (std::size_t i = 0; i < reply.elements.size(); ++i) {
            if (i > 0) {
                out += '\n';
                out.append(indent, ' ');
            }
            const auto label = fmt::format("{:>{}}) ", i + 1, width);
            out += label;
            format_into(reply.elements[i], out, indent + label.size());
        }
        break;
    }
    }
}

} // anonymous namespace

// ── Connection ────────────────────────────────────────────────────────────────

Connection::Connection(const std::string& host, uint16_t port) : ioc_(1), socket_(ioc_) {
    tcp::resolver resolver{ioc_};
    auto endpoints = resolver.resolve(host, std::to_string(port));
    boost::asio::connect(socket_, endpoints);
    socket_.set_option(tcp::no_delay(true));
}

RespValue Connection::command(const std::vector<std::string>& args) {
    send_raw(network::encode_command(args));
    return read_reply();
}

std::vector<RespValue>
Connection::pipeline(const std::vector<std::vector<std::string>>& commands) {
    std::string batch;
    for (const auto& args : commands) {
        batch += network::encode_command(args);
    }
    send_raw(batch);

    std::vector<RespValue> replies;
    replies.reserve(commands.size());
    for (std::size_t i = 0; i < commands.size(); ++i) {
        replies.push_back(read_reply());
    }
    return replies;
}

void Connection::send_raw(std::string_view bytes) {
    boost::asio::write(socket_, boost::asio::buffer(bytes.data(), bytes.size()));
}

RespValue Connection::read_reply() {
    while (pending_.empty()) {
        auto result = network::decode(buffer_);
        for (const auto& message : result.messages) {
            pending_.push_back(to_owned(message));
        }
        buffer_.erase(0, result.consumed);
        if (result.error) {
            throw std::runtime_error("Protocol error: " + *result.error);
        }
        if (!pending_.empty()) break;

        const std::size_t filled = buffer_.size();
        buffer_.resize(filled + kReadChunk);
        boost::system::error_code ec;
        const std::size_t n =
            socket_.read_some(boost::asio::buffer(buffer_.data() + filled, kReadChunk), ec);
        buffer_.resize(filled + n);
        if (ec == boost::asio::error::eof) {
            throw std::runtime_error("connection closed by server");
        }
        if (ec) {
            throw boost::system::system_error(ec);
        }
    }

    RespValue reply = std::move(pending_.front());
    pending_.pop_front();
    return reply;
}

void Connection::close() {
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

// ── CLI helpers ───────────────────────────────────────────────────────────────

std::string format_reply(const RespValue& reply) {
    std::string out;
    format_into(reply, out, 0);
    return out;
}

std::vector<std::string> split_command_line(std::string_view line) {
    std::vector<std::string> words;
    std::size_t i = 0;

    auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };

    while (i < line.size()) {
        while (i < line.size() && is_space(line[i])) ++i;
        if (i == line.size()) break;

        std::string word;
        while (i < line.size() && !is_space(line[i])) {
            const char c = line[i];
            if (c == '"' || c == '\'') {
                const char quote = c;
                ++i;
                bool closed = false;
                while (i < line.size()) {
                    char q = line[i++];
                    if (q == quote) {
                        closed = true;
                        break;
                    }
                    if (quote == '"' && q == '\\' && i < line.size()) {
                        switch (const char e = line[i++]; e) {
                        case 'n': q = '\n'; break;
                        case 'r': q = '\r'; break;
                        case 't': q = '\t'; break;
                        default:  q = e;    break;
                        }
                    }
                    word += q;
                }
                if (!closed) {
                    throw std::runtime_error("Invalid argument(s): unbalanced quotes");
                }
            } else {
                word += c;
                ++i;
            }
        }
        words.push_back(std::move(word));
    }
    return words;
}

} // namespace tkv::client
