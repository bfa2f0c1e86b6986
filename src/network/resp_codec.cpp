#include "network/resp_codec.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace tkv::network {

namespace {

enum class Status { Ok, Incomplete, Error };

// Printable rendering of a type byte for error messages.
std::string describe_byte(char c) {
    const auto u = static_cast<unsigned char>(c);
    if (u >= 0x20 && u < 0x7f) {
        return std::string(1, c);
    }
    return fmt::format("\\x{:02x}", u);
}

bool parse_int64(std::string_view sv, int64_t& out) {
    if (sv.empty()) return false;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

// Declared lengths are untrusted: preallocate at most this many elements and
// let the vector grow as elements actually arrive.
constexpr int64_t kMaxReserve = 1024;

std::size_t reserve_hint(int64_t count) {
    return static_cast<std::size_t>(std::min(count, kMaxReserve));
}

// Recursive-descent parser over one input buffer. `pos_` only moves past a
// value once it has been fully parsed; on Incomplete the caller discards the
// partial value and rewinds to the start of the message.
class Parser {
public:
    Parser(std::string_view input, const DecodeLimits& limits)
        : in_(input), limits_(limits) {}

    [[nodiscard]] std::size_t pos() const noexcept { return pos_; }
    void rewind(std::size_t pos) noexcept { pos_ = pos; }
    [[nodiscard]] bool at_end() const noexcept { return pos_ >= in_.size(); }
    [[nodiscard]] const std::string& error() const noexcept { return error_; }

    // Parses one top-level message. `skip` is set for requests that carry no
    // command (blank inline line, empty or null array).
    Status parse_message(RespView& out, bool& skip) {
        skip = false;
        if (limits_.allow_inline) {
            return parse_request(out, skip);
        }
        return parse_value(out, 0);
    }

private:
    Status fail(std::string message) {
        error_ = std::move(message);
        return Status::Error;
    }

    // Reads a CRLF-terminated line starting at pos_ into `line`.
    Status read_line(std::string_view& line) {
        const auto end = in_.find("\r\n", pos_);
        if (end == std::string_view::npos) {
            if (in_.size() - pos_ > limits_.max_inline_length) {
                return fail("too big inline request");
            }
            return Status::Incomplete;
        }
        if (end - pos_ > limits_.max_inline_length) {
            return fail("too big inline request");
        }
        line = in_.substr(pos_, end - pos_);
        pos_ = end + 2;
        return Status::Ok;
    }

    Status parse_request(RespView& out, bool& skip) {
        if (in_[pos_] != '*') {
            return parse_inline(out, skip);
        }
        ++pos_;
        std::string_view header;
        if (auto st = read_line(header); st != Status::Ok) return st;

        int64_t count = 0;
        if (!parse_int64(header, count) || count < -1 ||
            count > static_cast<int64_t>(limits_.max_array_length)) {
            return fail("invalid multibulk length");
        }
        if (count <= 0) {
            skip = true;
            return Status::Ok;
        }

        out = RespView::array();
        out.elements.reserve(reserve_hint(count));
        for (int64_t i = 0; i < count; ++i) {
            if (at_end()) return Status::Incomplete;
            if (in_[pos_] != '$') {
                return fail(fmt::format("expected '$', got '{}'", describe_byte(in_[pos_])));
            }
            RespView element;
            if (auto st = parse_value(element, 1); st != Status::Ok) return st;
            if (element.type != RespType::BulkString) {
                return fail("invalid bulk length");
            }
            out.elements.push_back(element);
        }
        return Status::Ok;
    }

    Status parse_inline(RespView& out, bool& skip) {
        const auto end = in_.find('\n', pos_);
        if (end == std::string_view::npos) {
            if (in_.size() - pos_ > limits_.max_inline_length) {
                return fail("too big inline request");
            }
            return Status::Incomplete;
        }
        if (end - pos_ > limits_.max_inline_length) {
            return fail("too big inline request");
        }
        std::string_view line = in_.substr(pos_, end - pos_);
        pos_ = end + 1;
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        out = RespView::array();
        std::size_t i = 0;
        while (i < line.size()) {
            while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
            const auto start = i;
            while (i < line.size() && line[i] != ' ' && line[i] != '\t') ++i;
            if (i > start) {
                out.elements.push_back(RespView::bulk(line.substr(start, i - start)));
            }
        }
        skip = out.elements.empty();
        return Status::Ok;
    }

    Status parse_value(RespView& out, int depth) {
        if (depth > kMaxNestingDepth) {
            return fail("nesting too deep");
        }
        if (at_end()) return Status::Incomplete;

        const char marker = in_[pos_];
        switch (marker) {
        case '+':
        case '-':
        case ':': {
            ++pos_;
            std::string_view line;
            if (auto st = read_line(line); st != Status::Ok) return st;
            if (marker == '+') {
                out = RespView::simple(line);
            } else if (marker == '-') {
                out = RespView::error(line);
            } else {
                int64_t n = 0;
                if (!parse_int64(line, n)) return fail("invalid integer");
                out = RespView::integer_value(n);
            }
            return Status::Ok;
        }
        case '$': {
            ++pos_;
            std::string_view header;
            if (auto st = read_line(header); st != Status::Ok) return st;
            int64_t len = 0;
            if (!parse_int64(header, len) || len < -1 ||
                (len > 0 && static_cast<uint64_t>(len) > limits_.max_bulk_length)) {
                return fail("invalid bulk length");
            }
            if (len == -1) {
                out = RespView::null_bulk();
                return Status::Ok;
            }
            const auto n = static_cast<std::size_t>(len);
            if (in_.size() - pos_ < n + 2) return Status::Incomplete;
            if (in_[pos_ + n] != '\r' || in_[pos_ + n + 1] != '\n') {
                return fail("expected CRLF after bulk string payload");
            }
            out = RespView::bulk(in_.substr(pos_, n));
            pos_ += n + 2;
            return Status::Ok;
        }
        case '*': {
            ++pos_;
            std::string_view header;
            if (auto st = read_line(header); st != Status::Ok) return st;
            int64_t count = 0;
            if (!parse_int64(header, count) || count < -1 ||
                count > static_cast<int64_t>(limits_.max_array_length)) {
                return fail("invalid multibulk length");
            }
            if (count == -1) {
                out = RespView::null_array();
                return Status::Ok;
            }
            out = RespView::array();
            out.elements.reserve(reserve_hint(count));
            for (int64_t i = 0; i < count; ++i) {
                RespView element;
                if (auto st = parse_value(element, depth + 1); st != Status::Ok) return st;
                out.elements.push_back(std::move(element));
            }
            return Status::Ok;
        }
        default:
            return fail(fmt::format("unknown type byte '{}'", describe_byte(marker)));
        }
    }

    std::string_view in_;
    const DecodeLimits& limits_;
    std::size_t pos_ = 0;
    std::string error_;
};

void append_line(std::string& out, char marker, std::string_view body) {
    out += marker;
    out.append(body);
    out += "\r\n";
}

} // anonymous namespace

// ── decode ───────────────────────────────────────────────────────────────────

DecodeResult decode(std::string_view input, const DecodeLimits& limits) {
    DecodeResult result;
    Parser parser{input, limits};

    while (!parser.at_end()) {
        const auto start = parser.pos();
        RespView message;
        bool skip = false;
        const auto status = parser.parse_message(message, skip);

        if (status == Status::Incomplete) {
            parser.rewind(start);
            break;
        }
        if (status == Status::Error) {
            result.error = parser.error();
            break;
        }
        if (!skip) {
            result.messages.push_back(std::move(message));
        }
        result.consumed = parser.pos();
    }
    return result;
}

// ── encode ───────────────────────────────────────────────────────────────────

void encode(const RespValue& value, std::string& out) {
    switch (value.type) {
    case RespType::SimpleString:
        append_line(out, '+', value.str);
        break;
    case RespType::Error:
        append_line(out, '-', value.str);
        break;
    case RespType::Integer:
        fmt::format_to(std::back_inserter(out), ":{}\r\n", value.integer);
        break;
    case RespType::BulkString:
        fmt::format_to(std::back_inserter(out), "${}\r\n", value.str.size());
        out += value.str;
        out += "\r\n";
        break;
    case RespType::NullBulkString:
        out += "$-1\r\n";
        break;
    case RespType::Array:
        fmt::format_to(std::back_inserter(out), "*{}\r\n", value.elements.size());
        for (const auto& element : value.elements) {
            encode(element, out);
        }
        break;
    case RespType::NullArray:
        out += "*-1\r\n";
        break;
    }
}

std::string encode(const RespValue& value) {
    std::string out;
    encode(value, out);
    return out;
}

std::string encode_command(const std::vector<std::string>& args) {
    std::string out;
    fmt::format_to(std::back_inserter(out), "*{}\r\n", args.size());
    for (const auto& arg : args) {
        fmt::format_to(std::back_inserter(out), "${}\r\n", arg.size());
        out += arg;
        out += "\r\n";
    }
    return out;
}

} // namespace tkv::network
