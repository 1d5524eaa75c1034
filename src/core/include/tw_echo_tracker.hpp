#ifndef TW_ECHO_TRACKER_HPP
#define TW_ECHO_TRACKER_HPP

/**
 * @file tw_echo_tracker.hpp
 * @brief Keystroke echo detector for SSH sessions tunneled inside SSH
 */

#include "tw_ssh_framing.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace tw {

class Config;

enum class Direction {
    FromOriginator,
    FromResponder
};

const char* direction_to_string(Direction dir);

struct Endpoint {
    std::string address;
    uint16_t port = 0;

    std::string to_string() const;
};

/**
 * @brief Identity of an outer SSH connection as reported by the traffic layer
 */
struct ConnectionInfo {
    std::string uid;
    Endpoint originator;
    Endpoint responder;
};

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/**
 * @brief A confirmed burst of keystrokes into a reverse shell
 */
struct Finding {
    std::string uid;
    Endpoint originator;
    Endpoint responder;
    int64_t characters_typed = 0;
    uint32_t match_count = 0;      // counter value when the return was seen
    size_t expected_length = 0;
    uint64_t return_length = 0;    // length of the oversized originator packet
    TimePoint timestamp{};

    /// "<N> characters typed into a reverse SSH shell followed by a return"
    std::string message() const;
    /// "<uid> <orig> -> <resp>: <message>"
    std::string to_string() const;
};

/// Longest idle timeout whose nanosecond count still fits in Clock::duration
constexpr int64_t kMaxIdleTimeoutSeconds =
    std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::max()).count();

struct TrackerConfig {
    uint32_t min_echo_run = 10;
    std::chrono::seconds idle_timeout = std::chrono::seconds(3600);
    size_t max_connections = 65536;

    bool is_valid() const {
        return min_echo_run >= 3 &&
               idle_timeout.count() >= 1 &&
               idle_timeout.count() <= kMaxIdleTimeoutSeconds &&
               max_connections >= 1;
    }
};

/**
 * @brief Build a TrackerConfig from the tracker.* keys
 *
 * Out-of-range values are replaced by the defaults and logged.
 */
TrackerConfig tracker_config_from(const Config& cfg);

/**
 * @brief Read-only view of one connection's detector state
 */
struct ConnectionSnapshot {
    ConnectionInfo info;
    ssh::AlgorithmProfile profile;
    size_t expected_length = 0;
    uint32_t match_counter = 0;
    bool tunnel_confirmed = false;
    TimePoint last_seen{};
};

struct TrackerStats {
    uint64_t armed = 0;          // connections given an expected length
    uint64_t observations = 0;   // packets evaluated against a pattern
    uint64_t ignored = 0;        // packets for connections not yet armed
    uint64_t resets = 0;         // counter dropped to 0 after progress
    uint64_t findings = 0;
    uint64_t closed = 0;
    uint64_t evictions = 0;      // dropped to respect max_connections
    uint64_t expirations = 0;    // dropped by expire_idle()
    size_t current_size = 0;
};

/**
 * @brief Per-connection echo pattern state machine
 *
 * Each connection is armed once, after authentication, with the outer
 * length of a single tunneled keystroke. Every encrypted packet on the
 * connection then either extends the responder/originator echo run or
 * resets it. A run of at least min_echo_run matches followed by a larger
 * originator packet (the return key) produces a Finding and re-arms the
 * connection.
 *
 * Not synchronized: an instance belongs to the single task that feeds it
 * packets for its connections.
 */
class EchoTracker {
public:
    using FindingCallback = std::function<void(const Finding&)>;

    EchoTracker();
    explicit EchoTracker(const TrackerConfig& config);
    ~EchoTracker();

    EchoTracker(const EchoTracker&) = delete;
    EchoTracker& operator=(const EchoTracker&) = delete;

    /**
     * @brief Arm a connection once its algorithms are known
     * @return false if the connection was already armed (state is kept)
     */
    bool on_authenticated(const ConnectionInfo& conn, const std::string& cipher,
                          const std::string& mac, TimePoint now = Clock::now());

    bool on_authenticated(const ConnectionInfo& conn, const ssh::AlgorithmProfile& profile,
                          TimePoint now = Clock::now());

    /**
     * @brief Feed one encrypted packet of an armed connection
     * @param length encrypted packet length, must be >= 0
     * @return the finding if this packet completed a pattern
     * @throws std::invalid_argument on negative length or unknown direction
     *
     * Packets for connections that are not armed are ignored.
     */
    std::optional<Finding> observe(const std::string& uid, Direction dir, int64_t length,
                                   TimePoint now = Clock::now());

    /**
     * @brief Release a connection's state on teardown
     * @return true if the connection was tracked
     */
    bool on_closed(const std::string& uid);

    /**
     * @brief Drop connections idle for at least idle_timeout
     * @return number of connections removed
     */
    size_t expire_idle(TimePoint now = Clock::now());

    bool is_tracking(const std::string& uid) const;
    std::optional<ConnectionSnapshot> snapshot(const std::string& uid) const;
    size_t size() const;

    TrackerStats get_stats() const;
    const TrackerConfig& config() const;

    void set_finding_callback(FindingCallback callback);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tw

#endif // TW_ECHO_TRACKER_HPP
