/**
 * @file test_connection_table.cpp
 * @brief Connection lifecycle: teardown, idle expiry and LRU eviction
 */

#include <gtest/gtest.h>
#include "tw_echo_tracker.hpp"
#include <chrono>

using namespace tw;
using std::chrono::seconds;

namespace {

ConnectionInfo conn(const std::string& uid) {
    ConnectionInfo c;
    c.uid = uid;
    c.originator = {"198.51.100.7", 40022};
    c.responder = {"203.0.113.9", 22};
    return c;
}

const TimePoint kStart{};

} // namespace

TEST(ConnectionTableTest, CloseReleasesState) {
    EchoTracker tracker;
    tracker.on_authenticated(conn("a"), "aes128-ctr", "hmac-sha2-256", kStart);
    ASSERT_TRUE(tracker.is_tracking("a"));

    EXPECT_TRUE(tracker.on_closed("a"));
    EXPECT_FALSE(tracker.is_tracking("a"));
    EXPECT_FALSE(tracker.snapshot("a").has_value());
    EXPECT_FALSE(tracker.on_closed("a"));

    // packets after teardown are not eligible
    EXPECT_FALSE(tracker.observe("a", Direction::FromResponder, 128, kStart).has_value());
    EXPECT_EQ(tracker.get_stats().ignored, 1u);
    EXPECT_EQ(tracker.get_stats().closed, 1u);
}

TEST(ConnectionTableTest, ReauthenticationAfterCloseStartsFresh) {
    EchoTracker tracker;
    tracker.on_authenticated(conn("a"), "aes128-ctr", "hmac-sha2-256", kStart);
    tracker.observe("a", Direction::FromResponder, 128, kStart);
    tracker.on_closed("a");

    EXPECT_TRUE(tracker.on_authenticated(conn("a"), "chacha20-poly1305@openssh.com", "", kStart));
    auto snap = tracker.snapshot("a");
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->match_counter, 0u);
    EXPECT_EQ(snap->expected_length, 80u);
}

TEST(ConnectionTableTest, IdleConnectionsExpire) {
    TrackerConfig cfg;
    cfg.idle_timeout = seconds(600);
    EchoTracker tracker(cfg);

    tracker.on_authenticated(conn("quiet"), "aes128-ctr", "hmac-sha2-256", kStart);
    tracker.on_authenticated(conn("busy"), "aes128-ctr", "hmac-sha2-256", kStart);
    tracker.observe("busy", Direction::FromResponder, 128, kStart + seconds(500));

    EXPECT_EQ(tracker.expire_idle(kStart + seconds(599)), 0u);
    EXPECT_EQ(tracker.expire_idle(kStart + seconds(600)), 1u);
    EXPECT_FALSE(tracker.is_tracking("quiet"));
    EXPECT_TRUE(tracker.is_tracking("busy"));

    EXPECT_EQ(tracker.expire_idle(kStart + seconds(1100)), 1u);
    EXPECT_EQ(tracker.size(), 0u);
    EXPECT_EQ(tracker.get_stats().expirations, 2u);
}

TEST(ConnectionTableTest, ObservationRefreshesLastSeen) {
    EchoTracker tracker;
    tracker.on_authenticated(conn("a"), "aes128-ctr", "hmac-sha2-256", kStart);
    tracker.observe("a", Direction::FromOriginator, 52, kStart + seconds(42));
    EXPECT_EQ(tracker.snapshot("a")->last_seen, kStart + seconds(42));
}

TEST(ConnectionTableTest, ExpiredConnectionLosesProgress) {
    TrackerConfig cfg;
    cfg.idle_timeout = seconds(60);
    EchoTracker tracker(cfg);

    tracker.on_authenticated(conn("a"), "aes128-ctr", "hmac-sha2-256", kStart);
    tracker.observe("a", Direction::FromResponder, 128, kStart);
    tracker.observe("a", Direction::FromOriginator, 128, kStart);
    tracker.expire_idle(kStart + seconds(120));

    EXPECT_FALSE(tracker.observe("a", Direction::FromResponder, 128, kStart + seconds(121)).has_value());
    EXPECT_FALSE(tracker.is_tracking("a"));
}

TEST(ConnectionTableTest, LeastRecentlySeenIsEvictedAtCapacity) {
    TrackerConfig cfg;
    cfg.max_connections = 2;
    EchoTracker tracker(cfg);

    tracker.on_authenticated(conn("a"), "aes128-ctr", "hmac-sha2-256", kStart);
    tracker.on_authenticated(conn("b"), "aes128-ctr", "hmac-sha2-256", kStart + seconds(1));
    // touching "a" makes "b" the oldest
    tracker.observe("a", Direction::FromResponder, 128, kStart + seconds(2));
    tracker.on_authenticated(conn("c"), "aes128-ctr", "hmac-sha2-256", kStart + seconds(3));

    EXPECT_EQ(tracker.size(), 2u);
    EXPECT_TRUE(tracker.is_tracking("a"));
    EXPECT_FALSE(tracker.is_tracking("b"));
    EXPECT_TRUE(tracker.is_tracking("c"));
    EXPECT_EQ(tracker.get_stats().evictions, 1u);
    EXPECT_EQ(tracker.snapshot("a")->match_counter, 1u);
}

TEST(ConnectionTableTest, StatsTrackArmingAndSize) {
    EchoTracker tracker;
    tracker.on_authenticated(conn("a"), "aes128-ctr", "hmac-sha2-256", kStart);
    tracker.on_authenticated(conn("b"), "aes256-gcm@openssh.com", "", kStart);
    tracker.on_authenticated(conn("b"), "aes256-gcm@openssh.com", "", kStart);

    TrackerStats stats = tracker.get_stats();
    EXPECT_EQ(stats.armed, 2u);
    EXPECT_EQ(stats.current_size, 2u);
}
