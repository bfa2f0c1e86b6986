#include "client/client.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace tkv::client {

// ── format_reply() ────────────────────────────────────────────────────────────

TEST(FormatReplyTest, Scalars) {
    EXPECT_EQ(format_reply(RespValue::simple("OK")), "OK");
    EXPECT_EQ(format_reply(RespValue::integer_value(-3)), "(integer) -3");
    EXPECT_EQ(format_reply(RespValue::bulk("bar")), "\"bar\"");
    EXPECT_EQ(format_reply(RespValue::bulk("")), "\"\"");
    EXPECT_EQ(format_reply(RespValue::null_bulk()), "(nil)");
    EXPECT_EQ(format_reply(RespValue::null_array()), "(nil)");
    EXPECT_EQ(format_reply(RespValue::error("ERR syntax error")), "(error) ERR syntax error");
}

TEST(FormatReplyTest, EmptyArray) {
    EXPECT_EQ(format_reply(RespValue::array()), "(empty array)");
}

TEST(FormatReplyTest, FlatArrayIsNumbered) {
    auto reply = RespValue::array({RespValue::bulk("a"), RespValue::null_bulk()});
    EXPECT_EQ(format_reply(reply), "1) \"a\"\n2) (nil)");
}

TEST(FormatReplyTest, NestedArraysAreIndented) {
    auto reply = RespValue::array({
        RespValue::bulk("list"),
        RespValue::array({RespValue::bulk("x"), RespValue::integer_value(1)}),
    });
    EXPECT_EQ(format_reply(reply), "1) \"list\"\n2) 1) \"x\"\n   2) (integer) 1");
}

TEST(FormatReplyTest, WideArrayAlignsLabels) {
    std::vector<RespValue> items;
    for (int i = 0; i < 10; ++i) {
        items.push_back(RespValue::integer_value(i));
    }
    const auto text = format_reply(RespValue::array(std::move(items)));
    EXPECT_EQ(text.substr(0, 15), " 1) (integer) 0");
    EXPECT_NE(text.find("\n10) (integer) 9"), std::string::npos);
}

// ── split_command_line() ──────────────────────────────────────────────────────

TEST(SplitCommandLineTest, SplitsOnWhitespace) {
    EXPECT_EQ(split_command_line("  SET  key\tvalue "),
              (std::vector<std::string>{"SET", "key", "value"}));
    EXPECT_TRUE(split_command_line("   ").empty());
}

TEST(SplitCommandLineTest, QuotesGroupWords) {
    EXPECT_EQ(split_command_line("SET k \"hello world\""),
              (std::vector<std::string>{"SET", "k", "hello world"}));
    EXPECT_EQ(split_command_line("SET k 'it is'"),
              (std::vector<std::string>{"SET", "k", "it is"}));
    EXPECT_EQ(split_command_line("SET k \"\""),
              (std::vector<std::string>{"SET", "k", ""}));
}

TEST(SplitCommandLineTest, DoubleQuotesUnescape) {
    EXPECT_EQ(split_command_line(R"(ECHO "a\nb" "say \"hi\"")"),
              (std::vector<std::string>{"ECHO", "a\nb", "say \"hi\""}));
    // Single quotes keep backslashes.
    EXPECT_EQ(split_command_line(R"(ECHO 'a\nb')"),
              (std::vector<std::string>{"ECHO", "a\\nb"}));
}

TEST(SplitCommandLineTest, UnbalancedQuotesThrow) {
    EXPECT_THROW(split_command_line("SET k \"oops"), std::runtime_error);
    EXPECT_THROW(split_command_line("SET k 'oops"), std::runtime_error);
}

} // namespace tkv::client
