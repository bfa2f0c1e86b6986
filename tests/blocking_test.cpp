#include "command/blocking.hpp"
#include "command/dispatcher.hpp"
#include "command/reply.hpp"
#include "common/clock.hpp"
#include "storage/database.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tkv::command {

using namespace std::chrono_literals;

// ── BlockingRegistry ──────────────────────────────────────────────────────────

TEST(BlockingRegistryTest, NotifyWakesWaitersOnThatKeyOnly) {
    BlockingRegistry registry;
    int woken_a = 0;
    int woken_b = 0;
    auto a = registry.add({"k1", "k2"}, [&] { ++woken_a; });
    auto b = registry.add({"k2"}, [&] { ++woken_b; });
    EXPECT_EQ(registry.size(), 2u);

    EXPECT_EQ(registry.notify("k1"), 1u);
    EXPECT_EQ(woken_a, 1);
    EXPECT_EQ(woken_b, 0);

    EXPECT_EQ(registry.notify("k2"), 2u);
    EXPECT_EQ(woken_a, 2);
    EXPECT_EQ(woken_b, 1);

    EXPECT_EQ(registry.notify("other"), 0u);
}

TEST(BlockingRegistryTest, RemoveUnregistersFromEveryKey) {
    BlockingRegistry registry;
    int woken = 0;
    auto waiter = registry.add({"k1", "k2"}, [&] { ++woken; });

    registry.remove(waiter);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(registry.notify("k1"), 0u);
    EXPECT_EQ(registry.notify("k2"), 0u);
    EXPECT_EQ(woken, 0);

    // Removing twice or removing null is harmless.
    registry.remove(waiter);
    registry.remove(nullptr);
    EXPECT_EQ(registry.size(), 0u);
}

TEST(BlockingRegistryTest, RepeatedKeyRegistersOnce) {
    BlockingRegistry registry;
    int woken = 0;
    auto waiter = registry.add({"k", "k"}, [&] { ++woken; });
    EXPECT_EQ(registry.notify("k"), 1u);
    EXPECT_EQ(woken, 1);
    registry.remove(waiter);
    EXPECT_EQ(registry.size(), 0u);
}

// ── Dispatcher with blocking commands ────────────────────────────────────────

class BlockingDispatchTest : public ::testing::Test {
protected:
    Outcome execute(ClientState& client, const std::vector<std::string>& args) {
        const std::vector<std::string_view> views(args.begin(), args.end());
        return dispatcher_.execute(client, views);
    }

    RespValue reply(ClientState& client, const std::vector<std::string>& args) {
        auto outcome = execute(client, args);
        EXPECT_TRUE(std::holds_alternative<RespValue>(outcome));
        return std::get<RespValue>(std::move(outcome));
    }

    MockClock clock_;
    storage::Database db_{clock_};
    Dispatcher dispatcher_{db_};
};

TEST_F(BlockingDispatchTest, BlpopOnEmptyListBlocksUntilPush) {
    int wakes = 0;
    ClientState waiter;
    waiter.wake = [&] { ++wakes; };
    ClientState writer;

    auto outcome = execute(waiter, {"BLPOP", "a", "b", "1.5"});
    ASSERT_TRUE(std::holds_alternative<BlockRequest>(outcome));
    auto& request = std::get<BlockRequest>(outcome);
    EXPECT_EQ(request.keys, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(request.timeout, 1500ms);
    EXPECT_EQ(request.timeout_reply, RespValue::null_array());
    EXPECT_EQ(dispatcher_.blocked_clients(), 1u);

    // Nothing to pop yet.
    EXPECT_FALSE(dispatcher_.retry(request).has_value());
    EXPECT_EQ(dispatcher_.blocked_clients(), 1u);

    EXPECT_EQ(reply(writer, {"RPUSH", "b", "x", "y"}), integer(2));
    EXPECT_EQ(wakes, 1);

    auto result = dispatcher_.retry(request);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, RespValue::array({bulk("b"), bulk("x")}));
    EXPECT_EQ(dispatcher_.blocked_clients(), 0u);
    EXPECT_EQ(reply(writer, {"LRANGE", "b", "0", "-1"}), RespValue::array({bulk("y")}));
}

TEST_F(BlockingDispatchTest, BrpopPopsFromTail) {
    ClientState waiter;
    ClientState writer;
    auto outcome = execute(waiter, {"BRPOP", "l", "0"});
    ASSERT_TRUE(std::holds_alternative<BlockRequest>(outcome));
    auto& request = std::get<BlockRequest>(outcome);
    EXPECT_EQ(request.timeout, 0ms);

    reply(writer, {"RPUSH", "l", "first", "last"});
    auto result = dispatcher_.retry(request);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, RespValue::array({bulk("l"), bulk("last")}));
}

TEST_F(BlockingDispatchTest, LosingWaiterKeepsWaiting) {
    int wakes = 0;
    ClientState first;
    ClientState second;
    first.wake = [&] { ++wakes; };
    second.wake = [&] { ++wakes; };
    ClientState writer;

    auto first_outcome = execute(first, {"BLPOP", "q", "0"});
    auto second_outcome = execute(second, {"BLPOP", "q", "0"});
    auto& first_request = std::get<BlockRequest>(first_outcome);
    auto& second_request = std::get<BlockRequest>(second_outcome);
    EXPECT_EQ(dispatcher_.blocked_clients(), 2u);

    reply(writer, {"LPUSH", "q", "only"});
    EXPECT_EQ(wakes, 2);

    auto won = dispatcher_.retry(second_request);
    ASSERT_TRUE(won.has_value());
    EXPECT_EQ(*won, RespValue::array({bulk("q"), bulk("only")}));

    EXPECT_FALSE(dispatcher_.retry(first_request).has_value());
    EXPECT_EQ(dispatcher_.blocked_clients(), 1u);

    dispatcher_.cancel(first_request);
    dispatcher_.cancel(first_request);
    EXPECT_EQ(dispatcher_.blocked_clients(), 0u);
}

TEST_F(BlockingDispatchTest, PushToKindMismatchWakesNobody) {
    int wakes = 0;
    ClientState waiter;
    waiter.wake = [&] { ++wakes; };
    ClientState writer;

    auto outcome = execute(waiter, {"BLPOP", "k", "0"});
    ASSERT_TRUE(std::holds_alternative<BlockRequest>(outcome));

    reply(writer, {"SET", "other", "v"});
    EXPECT_EQ(wakes, 0);
    dispatcher_.cancel(std::get<BlockRequest>(outcome));
}

TEST_F(BlockingDispatchTest, XreadBlockWaitsForNewerEntries) {
    int wakes = 0;
    ClientState waiter;
    waiter.wake = [&] { ++wakes; };
    ClientState writer;

    reply(writer, {"XADD", "s", "1-1", "f", "old"});

    auto outcome = execute(waiter, {"XREAD", "BLOCK", "250", "STREAMS", "s", "$"});
    ASSERT_TRUE(std::holds_alternative<BlockRequest>(outcome));
    auto& request = std::get<BlockRequest>(outcome);
    EXPECT_EQ(request.keys, (std::vector<std::string>{"s"}));
    EXPECT_EQ(request.timeout, 250ms);
    EXPECT_EQ(dispatcher_.blocked_clients(), 1u);

    EXPECT_EQ(reply(writer, {"XADD", "s", "2-1", "f", "new"}), bulk("2-1"));
    EXPECT_EQ(wakes, 1);

    auto result = dispatcher_.retry(request);
    ASSERT_TRUE(result.has_value());
    const auto entry = RespValue::array({bulk("2-1"), RespValue::array({bulk("f"), bulk("new")})});
    EXPECT_EQ(*result, RespValue::array({RespValue::array({bulk("s"), RespValue::array({entry})})}));
    EXPECT_EQ(dispatcher_.blocked_clients(), 0u);
}

TEST_F(BlockingDispatchTest, XreadWithoutBlockNeverBlocks) {
    ClientState client;
    EXPECT_EQ(reply(client, {"XREAD", "STREAMS", "s", "$"}), RespValue::null_array());
    EXPECT_EQ(dispatcher_.blocked_clients(), 0u);
}

TEST_F(BlockingDispatchTest, ExecWakesBlockedClients) {
    int wakes = 0;
    ClientState waiter;
    waiter.wake = [&] { ++wakes; };
    ClientState writer;

    auto outcome = execute(waiter, {"BLPOP", "l", "0"});
    ASSERT_TRUE(std::holds_alternative<BlockRequest>(outcome));

    reply(writer, {"MULTI"});
    reply(writer, {"RPUSH", "l", "v"});
    EXPECT_EQ(wakes, 0);
    reply(writer, {"EXEC"});
    EXPECT_EQ(wakes, 1);

    auto result = dispatcher_.retry(std::get<BlockRequest>(outcome));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, RespValue::array({bulk("l"), bulk("v")}));
}

TEST_F(BlockingDispatchTest, RetryReportsKindMismatch) {
    ClientState waiter;
    ClientState writer;
    auto outcome = execute(waiter, {"BLPOP", "l", "0"});
    auto& request = std::get<BlockRequest>(outcome);

    reply(writer, {"SET", "l", "string"});
    auto result = dispatcher_.retry(request);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->is_error());
    EXPECT_EQ(dispatcher_.blocked_clients(), 0u);
}

} // namespace tkv::command
