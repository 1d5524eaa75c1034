#include "../include/tw_trace.hpp"
#include "../include/tw_logger.hpp"
#include <cmath>
#include <istream>
#include <sstream>
#include <stdexcept>

namespace tw {

namespace {

// time_point() must stay representable in Clock::duration
const double kMaxTraceSeconds =
    std::chrono::duration_cast<std::chrono::duration<double>>(Clock::duration::max()).count();

bool parse_int(const std::string& token, int64_t& out) {
    try {
        size_t used = 0;
        long long v = std::stoll(token, &used);
        if (used != token.size()) return false;
        out = static_cast<int64_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_port(const std::string& token, uint16_t& out) {
    int64_t v = 0;
    if (!parse_int(token, v) || v < 0 || v > 65535) return false;
    out = static_cast<uint16_t>(v);
    return true;
}

bool parse_ts(const std::string& token, double& out) {
    try {
        size_t used = 0;
        double v = std::stod(token, &used);
        if (used != token.size() || !std::isfinite(v) || v < 0.0) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::optional<TraceEvent> fail(std::string* error, const std::string& reason) {
    if (error) *error = reason;
    return std::nullopt;
}

std::string strip_comment(const std::string& line) {
    auto pos = line.find('#');
    return pos == std::string::npos ? line : line.substr(0, pos);
}

} // namespace

TimePoint TraceEvent::time_point() const {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(ts)));
}

bool is_blank_trace_line(const std::string& line) {
    return strip_comment(line).find_first_not_of(" \t\r\n") == std::string::npos;
}

std::optional<TraceEvent> parse_trace_line(const std::string& line, std::string* error) {
    std::istringstream iss(strip_comment(line));
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }

    if (tokens.size() < 3) {
        return fail(error, "too few fields");
    }

    TraceEvent event;
    if (!parse_ts(tokens[0], event.ts)) {
        return fail(error, "bad timestamp '" + tokens[0] + "'");
    }
    if (event.ts >= kMaxTraceSeconds) {
        return fail(error, "timestamp out of range '" + tokens[0] + "'");
    }
    event.conn.uid = tokens[2];

    const std::string& kind = tokens[1];
    if (kind == "auth") {
        if (tokens.size() != 9) return fail(error, "auth expects 9 fields");
        event.kind = TraceEvent::Kind::Auth;
        event.conn.originator.address = tokens[3];
        if (!parse_port(tokens[4], event.conn.originator.port)) {
            return fail(error, "bad originator port '" + tokens[4] + "'");
        }
        event.conn.responder.address = tokens[5];
        if (!parse_port(tokens[6], event.conn.responder.port)) {
            return fail(error, "bad responder port '" + tokens[6] + "'");
        }
        event.cipher = tokens[7];
        event.mac = tokens[8];
        return event;
    }

    if (kind == "pkt") {
        if (tokens.size() != 5) return fail(error, "pkt expects 5 fields");
        event.kind = TraceEvent::Kind::Packet;
        if (tokens[3] == "orig") {
            event.dir = Direction::FromOriginator;
        } else if (tokens[3] == "resp") {
            event.dir = Direction::FromResponder;
        } else {
            return fail(error, "bad direction '" + tokens[3] + "'");
        }
        if (!parse_int(tokens[4], event.length) || event.length < 0) {
            return fail(error, "bad length '" + tokens[4] + "'");
        }
        return event;
    }

    if (kind == "close") {
        if (tokens.size() != 3) return fail(error, "close expects 3 fields");
        event.kind = TraceEvent::Kind::Close;
        return event;
    }

    return fail(error, "unknown event '" + kind + "'");
}

TraceReplayer::TraceReplayer(EchoTracker& tracker, std::chrono::seconds sweep_interval)
    : tracker_(tracker)
    , sweep_interval_(sweep_interval)
{}

void TraceReplayer::apply(const TraceEvent& event, ReplaySummary& summary) {
    const TimePoint now = event.time_point();

    if (!last_sweep_) {
        last_sweep_ = now;
    } else if (now - *last_sweep_ >= sweep_interval_) {
        tracker_.expire_idle(now);
        last_sweep_ = now;
    }

    switch (event.kind) {
        case TraceEvent::Kind::Auth:
            tracker_.on_authenticated(event.conn, event.cipher, event.mac, now);
            break;
        case TraceEvent::Kind::Packet: {
            auto finding = tracker_.observe(event.conn.uid, event.dir, event.length, now);
            if (finding) {
                summary.findings.push_back(*finding);
            }
            break;
        }
        case TraceEvent::Kind::Close:
            tracker_.on_closed(event.conn.uid);
            break;
    }
    summary.events++;
}

ReplaySummary TraceReplayer::run(std::istream& in) {
    ReplaySummary summary;
    std::string line;
    while (std::getline(in, line)) {
        summary.lines++;
        if (is_blank_trace_line(line)) continue;

        std::string error;
        auto event = parse_trace_line(line, &error);
        if (!event) {
            summary.malformed++;
            TW_LOG_WARN("trace line " + std::to_string(summary.lines) + ": " + error);
            continue;
        }
        apply(*event, summary);
    }
    return summary;
}

} // namespace tw
