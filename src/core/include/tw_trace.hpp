#ifndef TW_TRACE_HPP
#define TW_TRACE_HPP

/**
 * @file tw_trace.hpp
 * @brief Text trace of SSH connection events and its replay into EchoTracker
 *
 * One event per line, '#' starts a comment:
 *
 *   <ts> auth  <uid> <orig_h> <orig_p> <resp_h> <resp_p> <cipher> <mac>
 *   <ts> pkt   <uid> orig|resp <length>
 *   <ts> close <uid>
 *
 * <ts> is in seconds and may carry a fraction.
 */

#include "tw_echo_tracker.hpp"
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace tw {

struct TraceEvent {
    enum class Kind {
        Auth,
        Packet,
        Close
    };

    Kind kind = Kind::Packet;
    double ts = 0.0;
    ConnectionInfo conn;          // only uid is set for Packet and Close
    std::string cipher;
    std::string mac;
    Direction dir = Direction::FromOriginator;
    int64_t length = 0;

    TimePoint time_point() const;
};

/// True for lines with nothing but whitespace or a comment.
bool is_blank_trace_line(const std::string& line);

/**
 * @brief Parse one non-blank trace line
 * @param error receives a short reason when parsing fails (may be null)
 */
std::optional<TraceEvent> parse_trace_line(const std::string& line, std::string* error = nullptr);

struct ReplaySummary {
    size_t lines = 0;
    size_t events = 0;
    size_t malformed = 0;
    std::vector<Finding> findings;
};

/**
 * @brief Drives an EchoTracker from a trace stream
 *
 * Idle connections are expired whenever trace time has advanced by
 * sweep_interval since the previous sweep.
 */
class TraceReplayer {
public:
    explicit TraceReplayer(EchoTracker& tracker,
                           std::chrono::seconds sweep_interval = std::chrono::seconds(60));

    ReplaySummary run(std::istream& in);
    void apply(const TraceEvent& event, ReplaySummary& summary);

private:
    EchoTracker& tracker_;
    std::chrono::seconds sweep_interval_;
    std::optional<TimePoint> last_sweep_;
};

} // namespace tw

#endif // TW_TRACE_HPP
