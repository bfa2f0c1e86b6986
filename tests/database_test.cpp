#include "common/clock.hpp"
#include "storage/database.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tkv::storage {

using namespace std::chrono_literals;

// ── Fixture ───────────────────────────────────────────────────────────────────

class DatabaseTest : public ::testing::Test {
protected:
    std::size_t push_back(std::string_view key, std::vector<std::string_view> elements) {
        std::size_t len = 0;
        EXPECT_FALSE(db_.push(key, Database::End::Back, elements, len));
        return len;
    }

    std::vector<std::string> lrange_all(std::string_view key) {
        std::vector<std::string> out;
        EXPECT_FALSE(db_.lrange(key, 0, -1, out));
        return out;
    }

    MockClock clock_;
    Database db_{clock_};
};

// ── Strings and expiry ───────────────────────────────────────────────────────

TEST_F(DatabaseTest, SetThenGet) {
    db_.set("foo", "bar");
    std::optional<std::string> v;
    ASSERT_FALSE(db_.get("foo", v));
    EXPECT_EQ(v, "bar");
}

TEST_F(DatabaseTest, GetMissingIsNullNotError) {
    std::optional<std::string> v = "stale";
    ASSERT_FALSE(db_.get("nope", v));
    EXPECT_FALSE(v.has_value());
}

TEST_F(DatabaseTest, ExpiredKeyIsAbsent) {
    db_.set("k", "v", clock_.now_ms() + 100);
    EXPECT_TRUE(db_.exists("k"));

    clock_.advance(100ms);
    std::optional<std::string> v;
    ASSERT_FALSE(db_.get("k", v));
    EXPECT_FALSE(v.has_value());
    EXPECT_FALSE(db_.exists("k"));
    EXPECT_EQ(db_.ttl_ms("k"), -2);
}

TEST_F(DatabaseTest, ExpiredKeyIsOverwritableByAnyKind) {
    db_.set("k", "v", clock_.now_ms() + 10);
    clock_.advance(20ms);
    EXPECT_EQ(push_back("k", {"a"}), 1u);
    EXPECT_EQ(db_.kind_of("k"), Kind::List);
}

TEST_F(DatabaseTest, SetClearsPreviousExpiry) {
    db_.set("k", "v", clock_.now_ms() + 10);
    db_.set("k", "w");
    clock_.advance(1h);
    EXPECT_TRUE(db_.exists("k"));
    EXPECT_EQ(db_.ttl_ms("k"), -1);
}

TEST_F(DatabaseTest, TtlExpirePersist) {
    db_.set("k", "v");
    EXPECT_EQ(db_.ttl_ms("k"), -1);
    EXPECT_TRUE(db_.expire_at("k", clock_.now_ms() + 5000));
    EXPECT_EQ(db_.ttl_ms("k"), 5000);
    clock_.advance(1s);
    EXPECT_EQ(db_.ttl_ms("k"), 4000);
    EXPECT_TRUE(db_.persist("k"));
    EXPECT_FALSE(db_.persist("k"));
    EXPECT_EQ(db_.ttl_ms("k"), -1);
    EXPECT_FALSE(db_.expire_at("missing", clock_.now_ms() + 1));
}

TEST_F(DatabaseTest, ExpireInThePastDeletes) {
    db_.set("k", "v");
    EXPECT_TRUE(db_.expire_at("k", clock_.now_ms()));
    EXPECT_FALSE(db_.exists("k"));
}

TEST_F(DatabaseTest, ExpiryAppliesToContainers) {
    push_back("list", {"a", "b"});
    db_.expire_at("list", clock_.now_ms() + 1);
    clock_.advance(1ms);
    std::size_t len = 99;
    ASSERT_FALSE(db_.llen("list", len));
    EXPECT_EQ(len, 0u);
}

TEST_F(DatabaseTest, PurgeExpiredRemovesOnlyExpired) {
    db_.set("a", "1", clock_.now_ms() + 10);
    db_.set("b", "2", clock_.now_ms() + 10);
    db_.set("c", "3");
    clock_.advance(10ms);
    EXPECT_EQ(db_.purge_expired(), 2u);
    EXPECT_EQ(db_.size(), 1u);
}

TEST_F(DatabaseTest, IncrBy) {
    int64_t out = 0;
    ASSERT_FALSE(db_.incr_by("n", 5, out));
    EXPECT_EQ(out, 5);
    ASSERT_FALSE(db_.incr_by("n", -7, out));
    EXPECT_EQ(out, -2);

    db_.set("s", "abc");
    EXPECT_EQ(db_.incr_by("s", 1, out), errc::not_integer);

    db_.set("big", std::to_string(std::numeric_limits<int64_t>::max()));
    EXPECT_EQ(db_.incr_by("big", 1, out), errc::overflow);
    std::optional<std::string> v;
    ASSERT_FALSE(db_.get("big", v));
    EXPECT_EQ(v, std::to_string(std::numeric_limits<int64_t>::max()));
}

TEST_F(DatabaseTest, IncrKeepsTtl) {
    db_.set("n", "1", clock_.now_ms() + 1000);
    int64_t out = 0;
    ASSERT_FALSE(db_.incr_by("n", 1, out));
    EXPECT_EQ(db_.ttl_ms("n"), 1000);
}

TEST_F(DatabaseTest, AppendAndStrlen) {
    std::size_t len = 0;
    ASSERT_FALSE(db_.append("k", "Hello", len));
    EXPECT_EQ(len, 5u);
    ASSERT_FALSE(db_.append("k", " World", len));
    EXPECT_EQ(len, 11u);
    ASSERT_FALSE(db_.strlen("k", len));
    EXPECT_EQ(len, 11u);
    ASSERT_FALSE(db_.strlen("missing", len));
    EXPECT_EQ(len, 0u);
}

// ── Kind mismatch ────────────────────────────────────────────────────────────

TEST_F(DatabaseTest, WrongTypeNeverMutates) {
    db_.set("foo", "bar");

    std::size_t n = 0;
    const std::vector<std::string_view> elems{"a"};
    EXPECT_EQ(db_.push("foo", Database::End::Front, elems, n), errc::wrong_type);
    EXPECT_EQ(db_.sadd("foo", elems, n), errc::wrong_type);
    const std::vector<Database::ScoredMember> items{{1.0, "a"}};
    EXPECT_EQ(db_.zadd("foo", items, n), errc::wrong_type);
    StreamId id;
    EXPECT_EQ(db_.xadd("foo", XaddId{}, {{"f", "v"}}, id), errc::wrong_type);

    std::optional<std::string> v;
    ASSERT_FALSE(db_.get("foo", v));
    EXPECT_EQ(v, "bar");
    EXPECT_EQ(db_.kind_of("foo"), Kind::String);

    push_back("list", {"x"});
    EXPECT_EQ(db_.get("list", v), errc::wrong_type);
    int64_t out = 0;
    EXPECT_EQ(db_.incr_by("list", 1, out), errc::wrong_type);
    EXPECT_EQ(lrange_all("list"), (std::vector<std::string>{"x"}));
}

// ── Lists ────────────────────────────────────────────────────────────────────

TEST_F(DatabaseTest, PushFrontReversesArgumentOrder) {
    std::size_t len = 0;
    const std::vector<std::string_view> elems{"a", "b", "c"};
    ASSERT_FALSE(db_.push("l", Database::End::Front, elems, len));
    EXPECT_EQ(len, 3u);
    EXPECT_EQ(lrange_all("l"), (std::vector<std::string>{"c", "b", "a"}));
}

TEST_F(DatabaseTest, PopRemovesEmptiedList) {
    push_back("l", {"a", "b"});
    std::vector<std::string> out;
    ASSERT_FALSE(db_.pop("l", Database::End::Back, 5, out));
    EXPECT_EQ(out, (std::vector<std::string>{"b", "a"}));
    EXPECT_FALSE(db_.exists("l"));
}

TEST_F(DatabaseTest, LrangeClampsAndHandlesNegatives) {
    push_back("l", {"a", "b", "c", "d"});
    std::vector<std::string> out;
    ASSERT_FALSE(db_.lrange("l", -2, 100, out));
    EXPECT_EQ(out, (std::vector<std::string>{"c", "d"}));
    ASSERT_FALSE(db_.lrange("l", -100, 1, out));
    EXPECT_EQ(out, (std::vector<std::string>{"a", "b"}));
    ASSERT_FALSE(db_.lrange("l", 3, 1, out));
    EXPECT_TRUE(out.empty());
    ASSERT_FALSE(db_.lrange("l", 10, 20, out));
    EXPECT_TRUE(out.empty());
}

TEST_F(DatabaseTest, Lindex) {
    push_back("l", {"a", "b", "c"});
    std::optional<std::string> v;
    ASSERT_FALSE(db_.lindex("l", -1, v));
    EXPECT_EQ(v, "c");
    ASSERT_FALSE(db_.lindex("l", 3, v));
    EXPECT_FALSE(v.has_value());
}

// ── Sets ─────────────────────────────────────────────────────────────────────

TEST_F(DatabaseTest, SaddSremCounts) {
    std::size_t n = 0;
    const std::vector<std::string_view> add{"a", "b", "a"};
    ASSERT_FALSE(db_.sadd("s", add, n));
    EXPECT_EQ(n, 2u);

    bool member = false;
    ASSERT_FALSE(db_.sismember("s", "a", member));
    EXPECT_TRUE(member);

    const std::vector<std::string_view> rem{"a", "b", "zz"};
    ASSERT_FALSE(db_.srem("s", rem, n));
    EXPECT_EQ(n, 2u);
    EXPECT_FALSE(db_.exists("s"));
}

TEST_F(DatabaseTest, Smembers) {
    std::size_t n = 0;
    const std::vector<std::string_view> add{"x", "y"};
    ASSERT_FALSE(db_.sadd("s", add, n));
    std::vector<std::string> out;
    ASSERT_FALSE(db_.smembers("s", out));
    std::sort(out.begin(), out.end());
    EXPECT_EQ(out, (std::vector<std::string>{"x", "y"}));
}

// ── Sorted sets ──────────────────────────────────────────────────────────────

TEST_F(DatabaseTest, ZaddRejectsNanWithoutMutating) {
    std::size_t n = 0;
    const std::vector<Database::ScoredMember> items{
        {1.0, "a"}, {std::numeric_limits<double>::quiet_NaN(), "b"}};
    EXPECT_EQ(db_.zadd("z", items, n), errc::nan_score);
    EXPECT_FALSE(db_.exists("z"));
}

TEST_F(DatabaseTest, ZremRemovesEmptiedSet) {
    std::size_t n = 0;
    const std::vector<Database::ScoredMember> items{{1.0, "a"}};
    ASSERT_FALSE(db_.zadd("z", items, n));
    const std::vector<std::string_view> members{"a"};
    ASSERT_FALSE(db_.zrem("z", members, n));
    EXPECT_EQ(n, 1u);
    EXPECT_FALSE(db_.exists("z"));
}

TEST_F(DatabaseTest, ZrangeNegativeIndexes) {
    std::size_t n = 0;
    const std::vector<Database::ScoredMember> items{{3.0, "c"}, {1.0, "a"}, {2.0, "b"}};
    ASSERT_FALSE(db_.zadd("z", items, n));
    EXPECT_EQ(n, 3u);
    std::vector<SortedSet::Item> out;
    ASSERT_FALSE(db_.zrange("z", -2, -1, out));
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].second, "b");
    EXPECT_EQ(out[1].second, "c");
}

// ── Streams ──────────────────────────────────────────────────────────────────

TEST_F(DatabaseTest, XaddAutoIdsIncreaseWithinOneMillisecond) {
    StreamId a;
    StreamId b;
    ASSERT_FALSE(db_.xadd("s", XaddId{}, {{"f", "1"}}, a));
    ASSERT_FALSE(db_.xadd("s", XaddId{}, {{"f", "2"}}, b));
    EXPECT_EQ(a.ms, static_cast<uint64_t>(clock_.now_ms()));
    EXPECT_EQ(b, (StreamId{a.ms, a.seq + 1}));
}

TEST_F(DatabaseTest, XaddRejectedIdDoesNotCreateStream) {
    StreamId id;
    XaddId zero{XaddId::Mode::Explicit, 0, 0};
    EXPECT_EQ(db_.xadd("s", zero, {{"f", "v"}}, id), errc::stream_id_zero);
    EXPECT_FALSE(db_.exists("s"));
}

TEST_F(DatabaseTest, XaddExplicitNotAboveTopFails) {
    StreamId id;
    ASSERT_FALSE(db_.xadd("s", XaddId{XaddId::Mode::Explicit, 5, 5}, {{"f", "v"}}, id));
    EXPECT_EQ(db_.xadd("s", XaddId{XaddId::Mode::Explicit, 5, 5}, {{"f", "v"}}, id),
              errc::stream_id_too_small);
    EXPECT_EQ(db_.xadd("s", XaddId{XaddId::Mode::Explicit, 4, 9}, {{"f", "v"}}, id),
              errc::stream_id_too_small);
    std::size_t len = 0;
    ASSERT_FALSE(db_.xlen("s", len));
    EXPECT_EQ(len, 1u);
}

TEST_F(DatabaseTest, XreadAfterAndLastId) {
    StreamId id;
    ASSERT_FALSE(db_.xadd("s", XaddId{XaddId::Mode::Explicit, 1, 1}, {{"a", "1"}}, id));
    ASSERT_FALSE(db_.xadd("s", XaddId{XaddId::Mode::Explicit, 1, 2}, {{"b", "2"}}, id));

    StreamId last;
    ASSERT_FALSE(db_.xlast_id("s", last));
    EXPECT_EQ(last, (StreamId{1, 2}));
    ASSERT_FALSE(db_.xlast_id("nope", last));
    EXPECT_EQ(last, StreamId::min());

    std::vector<StreamEntry> out;
    ASSERT_FALSE(db_.xread("s", StreamId{1, 1}, std::nullopt, out));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].fields[0].first, "b");
}

// ── Generic ──────────────────────────────────────────────────────────────────

TEST_F(DatabaseTest, KeysGlob) {
    db_.set("hello", "1");
    db_.set("hallo", "1");
    db_.set("hxllo", "1");
    db_.set("world", "1");
    auto keys = db_.keys("h[ae]llo");
    std::sort(keys.begin(), keys.end());
    EXPECT_EQ(keys, (std::vector<std::string>{"hallo", "hello"}));
    EXPECT_EQ(db_.keys("*").size(), 4u);
    EXPECT_EQ(db_.keys("w?rld").size(), 1u);
}

TEST(GlobMatchTest, Patterns) {
    EXPECT_TRUE(glob_match("*", ""));
    EXPECT_TRUE(glob_match("h*llo", "heeeello"));
    EXPECT_TRUE(glob_match("h?llo", "hello"));
    EXPECT_FALSE(glob_match("h?llo", "hllo"));
    EXPECT_TRUE(glob_match("h[^e]llo", "hallo"));
    EXPECT_FALSE(glob_match("h[^e]llo", "hello"));
    EXPECT_TRUE(glob_match("h[a-b]llo", "hbllo"));
    EXPECT_TRUE(glob_match("a\\*b", "a*b"));
    EXPECT_FALSE(glob_match("a\\*b", "axb"));
    EXPECT_TRUE(glob_match("*:*:end", "a:b:c:end"));
}

TEST_F(DatabaseTest, DelAndFlush) {
    db_.set("a", "1");
    db_.set("b", "2");
    EXPECT_TRUE(db_.del("a"));
    EXPECT_FALSE(db_.del("a"));
    db_.flush();
    EXPECT_EQ(db_.size(), 0u);
}

} // namespace tkv::storage
