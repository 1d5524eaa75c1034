/**
 * @file test_trace.cpp
 * @brief Trace line parsing and replay
 */

#include <gtest/gtest.h>
#include "tw_trace.hpp"
#include <chrono>
#include <sstream>
#include <string>

using namespace tw;

TEST(TraceParseTest, AuthLine) {
    auto ev = parse_trace_line("12.5 auth C1 10.1.1.1 50000 10.2.2.2 22 aes128-ctr hmac-sha2-256");
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->kind, TraceEvent::Kind::Auth);
    EXPECT_DOUBLE_EQ(ev->ts, 12.5);
    EXPECT_EQ(ev->conn.uid, "C1");
    EXPECT_EQ(ev->conn.originator.address, "10.1.1.1");
    EXPECT_EQ(ev->conn.originator.port, 50000);
    EXPECT_EQ(ev->conn.responder.address, "10.2.2.2");
    EXPECT_EQ(ev->conn.responder.port, 22);
    EXPECT_EQ(ev->cipher, "aes128-ctr");
    EXPECT_EQ(ev->mac, "hmac-sha2-256");
}

TEST(TraceParseTest, PacketLine) {
    auto ev = parse_trace_line("3 pkt C1 resp 128   # echo");
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->kind, TraceEvent::Kind::Packet);
    EXPECT_EQ(ev->dir, Direction::FromResponder);
    EXPECT_EQ(ev->length, 128);

    auto orig = parse_trace_line("3.25\tpkt\tC1\torig\t52");
    ASSERT_TRUE(orig.has_value());
    EXPECT_EQ(orig->dir, Direction::FromOriginator);
}

TEST(TraceParseTest, CloseLine) {
    auto ev = parse_trace_line("99 close C1");
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->kind, TraceEvent::Kind::Close);
    EXPECT_EQ(ev->conn.uid, "C1");
}

TEST(TraceParseTest, RejectsMalformedLines) {
    std::string error;
    EXPECT_FALSE(parse_trace_line("1 pkt C1 sideways 128", &error).has_value());
    EXPECT_NE(error.find("direction"), std::string::npos);

    EXPECT_FALSE(parse_trace_line("1 pkt C1 orig -5", &error).has_value());
    EXPECT_NE(error.find("length"), std::string::npos);

    EXPECT_FALSE(parse_trace_line("1 pkt C1 orig 12x", &error).has_value());
    EXPECT_FALSE(parse_trace_line("abc pkt C1 orig 12", &error).has_value());
    EXPECT_NE(error.find("timestamp"), std::string::npos);

    EXPECT_FALSE(parse_trace_line("10000000000 pkt C1 resp 128", &error).has_value());
    EXPECT_NE(error.find("timestamp out of range"), std::string::npos);
    EXPECT_FALSE(parse_trace_line("1e300 close C1", &error).has_value());
    EXPECT_NE(error.find("timestamp out of range"), std::string::npos);

    EXPECT_FALSE(parse_trace_line("1 auth C1 h 70000 h 22 aes128-ctr hmac-sha1", &error).has_value());
    EXPECT_NE(error.find("port"), std::string::npos);

    EXPECT_FALSE(parse_trace_line("1 auth C1 h 1 h 22 aes128-ctr", &error).has_value());
    EXPECT_FALSE(parse_trace_line("1 close C1 extra", &error).has_value());
    EXPECT_FALSE(parse_trace_line("1 reset C1", &error).has_value());
    EXPECT_NE(error.find("unknown"), std::string::npos);
    EXPECT_FALSE(parse_trace_line("1 pkt", &error).has_value());
}

TEST(TraceParseTest, LargeTimestampKeepsItsTimePoint) {
    // a few years past the epoch, well inside the clock range
    auto ev = parse_trace_line("1700000000.5 close C1");
    ASSERT_TRUE(ev.has_value());
    auto since_epoch = ev->time_point().time_since_epoch();
    EXPECT_GT(since_epoch.count(), 0);
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count(), 1700000000);
}

TEST(TraceParseTest, BlankAndCommentLines) {
    EXPECT_TRUE(is_blank_trace_line(""));
    EXPECT_TRUE(is_blank_trace_line("   \t"));
    EXPECT_TRUE(is_blank_trace_line("# header"));
    EXPECT_TRUE(is_blank_trace_line("   # indented"));
    EXPECT_FALSE(is_blank_trace_line("1 close C1"));
}

namespace {

// ten alternating echoes of echo_len, then the return key
std::string keystroke_burst(const std::string& uid, int start_ts, int echo_len = 128) {
    std::ostringstream oss;
    int ts = start_ts;
    for (int i = 1; i <= 10; ++i) {
        oss << ts++ << " pkt " << uid << (i % 2 == 1 ? " resp " : " orig ") << echo_len << "\n";
    }
    oss << ts << " pkt " << uid << " orig 512\n";
    return oss.str();
}

} // namespace

TEST(TraceReplayTest, DetectsTunnelInTrace) {
    std::ostringstream trace;
    trace << "# outer session\n"
          << "0 auth C9 10.0.0.1 50111 10.0.0.2 22 aes128-ctr hmac-sha2-256\n"
          << "0.5 pkt C9 orig 52\n"
          << "this line is garbage\n"
          << keystroke_burst("C9", 1)
          << "30 close C9\n"
          << "31 pkt C9 resp 128\n";

    EchoTracker tracker;
    TraceReplayer replayer(tracker);
    std::istringstream in(trace.str());
    ReplaySummary summary = replayer.run(in);

    EXPECT_EQ(summary.malformed, 1u);
    ASSERT_EQ(summary.findings.size(), 1u);
    EXPECT_EQ(summary.findings[0].uid, "C9");
    EXPECT_EQ(summary.findings[0].characters_typed, 4);
    EXPECT_EQ(summary.findings[0].originator.port, 50111);
    EXPECT_EQ(summary.events, 15u);

    EXPECT_FALSE(tracker.is_tracking("C9"));
    EXPECT_EQ(tracker.get_stats().ignored, 1u);
}

TEST(TraceReplayTest, PacketsBeforeAuthAreIgnored) {
    std::istringstream in(
        "0 pkt C2 resp 128\n"
        "1 auth C2 a 1 b 22 aes128-ctr hmac-sha2-256\n"
        "2 pkt C2 resp 128\n");

    EchoTracker tracker;
    TraceReplayer replayer(tracker);
    replayer.run(in);

    EXPECT_EQ(tracker.get_stats().ignored, 1u);
    EXPECT_EQ(tracker.snapshot("C2")->match_counter, 1u);
}

TEST(TraceReplayTest, IdleSweepFollowsTraceTime) {
    TrackerConfig cfg;
    cfg.idle_timeout = std::chrono::seconds(300);
    EchoTracker tracker(cfg);
    TraceReplayer replayer(tracker, std::chrono::seconds(60));

    std::istringstream in(
        "0 auth C3 a 1 b 22 aes128-ctr hmac-sha2-256\n"
        "10 pkt C3 resp 128\n"
        "1000 auth C4 a 2 b 22 aes128-ctr hmac-sha2-256\n"
        "1001 pkt C3 orig 128\n");
    replayer.run(in);

    EXPECT_FALSE(tracker.is_tracking("C3"));
    EXPECT_TRUE(tracker.is_tracking("C4"));
    EXPECT_EQ(tracker.get_stats().expirations, 1u);
    EXPECT_EQ(tracker.get_stats().ignored, 1u);
}

TEST(TraceReplayTest, SecondBurstOnSameConnection) {
    std::ostringstream trace;
    trace << "0 auth C5 a 1 b 22 chacha20-poly1305@openssh.com none\n";
    // the chacha tunneled keystroke is 80 bytes
    trace << keystroke_burst("C5", 1, 80) << keystroke_burst("C5", 20, 80);

    EchoTracker tracker;
    TraceReplayer replayer(tracker);
    std::istringstream in(trace.str());
    ReplaySummary summary = replayer.run(in);

    ASSERT_EQ(summary.findings.size(), 2u);
    EXPECT_EQ(summary.findings[1].characters_typed, 4);
}
