#include "network/resp_codec.hpp"
#include "network/resp_value.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

namespace {

using tkv::RespType;
using tkv::RespValue;
using tkv::RespView;
using tkv::network::decode;
using tkv::network::DecodeLimits;

DecodeLimits request_limits() {
    DecodeLimits limits;
    limits.allow_inline = true;
    return limits;
}

// Flattens a request message into its argument strings.
std::vector<std::string> args_of(const RespView& msg) {
    std::vector<std::string> out;
    for (const auto& e : msg.elements) out.emplace_back(e.str);
    return out;
}

// ── Encoder ──────────────────────────────────────────────────────────────────

TEST(RespEncodeTest, SimpleString) {
    EXPECT_EQ(tkv::network::encode(RespValue::simple("OK")), "+OK\r\n");
}

TEST(RespEncodeTest, Error) {
    EXPECT_EQ(tkv::network::encode(RespValue::error("ERR boom")), "-ERR boom\r\n");
}

TEST(RespEncodeTest, Integer) {
    EXPECT_EQ(tkv::network::encode(RespValue::integer_value(-42)), ":-42\r\n");
}

TEST(RespEncodeTest, BulkStringIsBinarySafe) {
    const std::string payload("a\r\nb\0c", 6);
    EXPECT_EQ(tkv::network::encode(RespValue::bulk(payload)),
              std::string("$6\r\na\r\nb\0c\r\n", 13));
}

TEST(RespEncodeTest, EmptyBulkString) {
    EXPECT_EQ(tkv::network::encode(RespValue::bulk("")), "$0\r\n\r\n");
}

TEST(RespEncodeTest, Nulls) {
    EXPECT_EQ(tkv::network::encode(RespValue::null_bulk()), "$-1\r\n");
    EXPECT_EQ(tkv::network::encode(RespValue::null_array()), "*-1\r\n");
}

TEST(RespEncodeTest, EmptyArray) {
    EXPECT_EQ(tkv::network::encode(RespValue::array()), "*0\r\n");
}

TEST(RespEncodeTest, NestedArray) {
    auto v = RespValue::array({
        RespValue::bulk("k"),
        RespValue::array({RespValue::integer_value(1), RespValue::null_bulk()}),
    });
    EXPECT_EQ(tkv::network::encode(v), "*2\r\n$1\r\nk\r\n*2\r\n:1\r\n$-1\r\n");
}

TEST(RespEncodeTest, AppendsToExistingBuffer) {
    std::string out = "+PONG\r\n";
    tkv::network::encode(RespValue::simple("PONG"), out);
    EXPECT_EQ(out, "+PONG\r\n+PONG\r\n");
}

TEST(RespEncodeTest, Command) {
    EXPECT_EQ(tkv::network::encode_command({"SET", "foo", "bar"}),
              "*3\r\n$3\r\nSET\r\n$3\r\nfoo\r\n$3\r\nbar\r\n");
}

// ── Decoder: client mode ─────────────────────────────────────────────────────

TEST(RespDecodeTest, DecodesEveryReplyType) {
    const std::string wire =
        "+OK\r\n-ERR bad\r\n:7\r\n$3\r\nabc\r\n$-1\r\n*-1\r\n*2\r\n+a\r\n:2\r\n";
    auto r = decode(wire);

    ASSERT_FALSE(r.error.has_value());
    ASSERT_EQ(r.messages.size(), 7u);
    EXPECT_EQ(r.consumed, wire.size());

    EXPECT_EQ(r.messages[0], RespView::simple("OK"));
    EXPECT_EQ(r.messages[1], RespView::error("ERR bad"));
    EXPECT_EQ(r.messages[2], RespView::integer_value(7));
    EXPECT_EQ(r.messages[3], RespView::bulk("abc"));
    EXPECT_EQ(r.messages[4].type, RespType::NullBulkString);
    EXPECT_EQ(r.messages[5].type, RespType::NullArray);
    ASSERT_EQ(r.messages[6].elements.size(), 2u);
    EXPECT_EQ(r.messages[6].elements[1].integer, 2);
}

TEST(RespDecodeTest, BulkPayloadIsViewIntoInput) {
    const std::string wire = "$5\r\nhello\r\n";
    auto r = decode(wire);
    ASSERT_EQ(r.messages.size(), 1u);
    EXPECT_EQ(r.messages[0].str.data(), wire.data() + 4);
}

TEST(RespDecodeTest, EmptyBulkDistinctFromNull) {
    auto r = decode("$0\r\n\r\n$-1\r\n");
    ASSERT_EQ(r.messages.size(), 2u);
    EXPECT_EQ(r.messages[0].type, RespType::BulkString);
    EXPECT_TRUE(r.messages[0].str.empty());
    EXPECT_EQ(r.messages[1].type, RespType::NullBulkString);
}

TEST(RespDecodeTest, PartialMessageIsNotConsumed) {
    const std::string wire = "+OK\r\n$5\r\nhel";
    auto r = decode(wire);
    ASSERT_FALSE(r.error.has_value());
    ASSERT_EQ(r.messages.size(), 1u);
    EXPECT_EQ(r.consumed, 5u);
}

TEST(RespDecodeTest, ChunkBoundaryIndependent) {
    const std::string wire =
        "*3\r\n$3\r\nSET\r\n$3\r\nkey\r\n$5\r\nva\r\nl\r\n*1\r\n$4\r\nPING\r\n";

    const auto whole = decode(wire);
    ASSERT_FALSE(whole.error.has_value());
    ASSERT_EQ(whole.messages.size(), 2u);

    // Feed the stream in every possible two-chunk split.
    for (std::size_t split = 0; split <= wire.size(); ++split) {
        std::string buf = wire.substr(0, split);
        std::vector<RespValue> got;

        auto first = decode(buf);
        ASSERT_FALSE(first.error.has_value()) << "split at " << split;
        for (const auto& m : first.messages) got.push_back(tkv::to_owned(m));
        buf.erase(0, first.consumed);

        buf += wire.substr(split);
        auto second = decode(buf);
        ASSERT_FALSE(second.error.has_value()) << "split at " << split;
        for (const auto& m : second.messages) got.push_back(tkv::to_owned(m));
        EXPECT_EQ(second.consumed, buf.size());

        ASSERT_EQ(got.size(), 2u) << "split at " << split;
        EXPECT_EQ(got[0], tkv::to_owned(whole.messages[0]));
        EXPECT_EQ(got[1], tkv::to_owned(whole.messages[1]));
    }
}

TEST(RespDecodeTest, UnknownTypeByteIsError) {
    auto r = decode("+OK\r\n!oops\r\n");
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(*r.error, "unknown type byte '!'");
    ASSERT_EQ(r.messages.size(), 1u);
    EXPECT_EQ(r.consumed, 5u);
}

TEST(RespDecodeTest, NonNumericLengthIsError) {
    auto r = decode("$abc\r\n");
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(*r.error, "invalid bulk length");
}

TEST(RespDecodeTest, EmptyLengthIsError) {
    auto r = decode("*\r\n");
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(*r.error, "invalid multibulk length");
}

TEST(RespDecodeTest, NegativeLengthOtherThanMinusOneIsError) {
    EXPECT_TRUE(decode("$-2\r\n").error.has_value());
    EXPECT_TRUE(decode("*-5\r\n").error.has_value());
}

TEST(RespDecodeTest, MissingCrlfAfterPayloadIsError) {
    auto r = decode("$3\r\nabcXY");
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(*r.error, "expected CRLF after bulk string payload");
}

TEST(RespDecodeTest, BulkLongerThanLimitIsError) {
    DecodeLimits limits;
    limits.max_bulk_length = 4;
    auto r = decode("$5\r\nhello\r\n", limits);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(*r.error, "invalid bulk length");
}

TEST(RespDecodeTest, OversizedBulkRejectedBeforePayloadArrives) {
    DecodeLimits limits;
    limits.max_bulk_length = 1024;
    auto r = decode("$1000000\r\n", limits);
    EXPECT_TRUE(r.error.has_value());
}

TEST(RespDecodeTest, ArrayLongerThanLimitIsError) {
    DecodeLimits limits;
    limits.max_array_length = 2;
    auto r = decode("*3\r\n:1\r\n:2\r\n:3\r\n", limits);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(*r.error, "invalid multibulk length");
}

TEST(RespDecodeTest, UnterminatedLongLineIsError) {
    DecodeLimits limits;
    limits.max_inline_length = 8;
    auto r = decode("+" + std::string(32, 'x'), limits);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(*r.error, "too big inline request");
}

TEST(RespDecodeTest, NestingDepthIsBounded) {
    std::string deep;
    for (int i = 0; i < tkv::network::kMaxNestingDepth + 2; ++i) deep += "*1\r\n";
    deep += ":1\r\n";
    auto r = decode(deep);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(*r.error, "nesting too deep");

    std::string ok;
    for (int i = 0; i < tkv::network::kMaxNestingDepth; ++i) ok += "*1\r\n";
    ok += ":1\r\n";
    EXPECT_FALSE(decode(ok).error.has_value());
}

// ── Decoder: request mode ────────────────────────────────────────────────────

TEST(RespRequestDecodeTest, MultibulkCommand) {
    auto r = decode("*2\r\n$4\r\nECHO\r\n$2\r\nhi\r\n", request_limits());
    ASSERT_EQ(r.messages.size(), 1u);
    EXPECT_EQ(args_of(r.messages[0]), (std::vector<std::string>{"ECHO", "hi"}));
}

TEST(RespRequestDecodeTest, InlineCommandSplitsOnWhitespace) {
    auto r = decode("SET  key\tvalue\r\nPING\n", request_limits());
    ASSERT_FALSE(r.error.has_value());
    ASSERT_EQ(r.messages.size(), 2u);
    EXPECT_EQ(args_of(r.messages[0]), (std::vector<std::string>{"SET", "key", "value"}));
    EXPECT_EQ(args_of(r.messages[1]), (std::vector<std::string>{"PING"}));
}

TEST(RespRequestDecodeTest, BlankLinesAndEmptyArraysAreSkipped) {
    const std::string wire = "\r\n   \r\n*0\r\n*-1\r\nPING\r\n";
    auto r = decode(wire, request_limits());
    ASSERT_FALSE(r.error.has_value());
    ASSERT_EQ(r.messages.size(), 1u);
    EXPECT_EQ(r.consumed, wire.size());
}

TEST(RespRequestDecodeTest, PartialInlineIsNotConsumed) {
    auto r = decode("PING\r\nPI", request_limits());
    EXPECT_EQ(r.messages.size(), 1u);
    EXPECT_EQ(r.consumed, 6u);
}

TEST(RespRequestDecodeTest, NegativeCountOtherThanMinusOneIsError) {
    auto r = decode("*-5\r\nPING\r\n", request_limits());
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(*r.error, "invalid multibulk length");
    EXPECT_TRUE(r.messages.empty());
    EXPECT_EQ(r.consumed, 0u);
}

TEST(RespRequestDecodeTest, LargeDeclaredCountWaitsForElements) {
    const std::string wire = "*1048576\r\n$1\r\na\r\n";
    auto r = decode(wire, request_limits());
    EXPECT_FALSE(r.error.has_value());
    EXPECT_TRUE(r.messages.empty());
    EXPECT_EQ(r.consumed, 0u);

    // Same for the reply-mode parser.
    auto reply = decode("*1048576\r\n:1\r\n");
    EXPECT_FALSE(reply.error.has_value());
    EXPECT_TRUE(reply.messages.empty());
}

TEST(RespRequestDecodeTest, NonBulkElementIsError) {
    auto r = decode("*1\r\n:1\r\n", request_limits());
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(*r.error, "expected '$', got ':'");
}

TEST(RespRequestDecodeTest, ThreePipelinedPingsAcrossTwoReads) {
    const std::string wire = "*1\r\n$4\r\nPING\r\n*1\r\n$4\r\nPING\r\n*1\r\n$4\r\nPING\r\n";
    std::string buf = wire.substr(0, 20);

    auto first = decode(buf, request_limits());
    std::size_t total = first.messages.size();
    buf.erase(0, first.consumed);
    buf += wire.substr(20);

    auto second = decode(buf, request_limits());
    total += second.messages.size();
    EXPECT_EQ(total, 3u);
    EXPECT_EQ(second.consumed, buf.size());
}

} // namespace
