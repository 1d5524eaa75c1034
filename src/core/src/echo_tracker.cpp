/**
 * @file echo_tracker.cpp
 * @brief Keystroke echo state machine and connection table
 */

#include "../include/tw_echo_tracker.hpp"
#include "../include/tw_config.hpp"
#include "../include/tw_logger.hpp"
#include <list>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace tw {

const char* direction_to_string(Direction dir) {
    switch (dir) {
        case Direction::FromOriginator: return "orig";
        case Direction::FromResponder:  return "resp";
        default:                        return "?";
    }
}

std::string Endpoint::to_string() const {
    if (address.find(':') != std::string::npos) {
        return "[" + address + "]:" + std::to_string(port);
    }
    return address + ":" + std::to_string(port);
}

std::string Finding::message() const {
    return std::to_string(characters_typed) +
           " characters typed into a reverse SSH shell followed by a return";
}

std::string Finding::to_string() const {
    return uid + " " + originator.to_string() + " -> " + responder.to_string() +
           ": " + message();
}

TrackerConfig tracker_config_from(const Config& cfg) {
    TrackerConfig defaults;
    TrackerConfig out;

    int64_t run = cfg.getInt("tracker.min_echo_run", defaults.min_echo_run);
    if (run >= 3 && run <= 0xFFFF) {
        out.min_echo_run = static_cast<uint32_t>(run);
    } else {
        TW_LOG_WARN("tracker.min_echo_run=" + std::to_string(run) +
                    " out of range, using " + std::to_string(defaults.min_echo_run));
    }

    int64_t idle = cfg.getInt("tracker.idle_timeout_s", defaults.idle_timeout.count());
    if (idle >= 1 && idle <= kMaxIdleTimeoutSeconds) {
        out.idle_timeout = std::chrono::seconds(idle);
    } else {
        TW_LOG_WARN("tracker.idle_timeout_s=" + std::to_string(idle) +
                    " out of range, using " + std::to_string(defaults.idle_timeout.count()));
    }

    int64_t max_conn = cfg.getInt("tracker.max_connections",
                                  static_cast<int64_t>(defaults.max_connections));
    if (max_conn >= 1) {
        out.max_connections = static_cast<size_t>(max_conn);
    } else {
        TW_LOG_WARN("tracker.max_connections=" + std::to_string(max_conn) +
                    " out of range, using " + std::to_string(defaults.max_connections));
    }

    return out;
}

namespace {

struct ConnectionEntry {
    ConnectionInfo info;
    ssh::AlgorithmProfile profile;
    size_t expected_length = 0;
    uint32_t match_counter = 0;
    bool tunnel_confirmed = false;
    TimePoint last_seen{};
};

/**
 * One transition of the echo pattern. Returns false when no row matches;
 * the caller then resets the counter.
 *
 *   counter  dir   length
 *   0        resp  == E    -> 1
 *   1        orig  == E    -> 2
 *   >=2      resp  == E    -> +1
 *   >=3      orig  == E    -> +1
 *   >=run    orig  >  E    -> +1, confirmed
 */
bool advance(ConnectionEntry& entry, Direction dir, uint64_t length, uint32_t min_echo_run) {
    const uint64_t expected = entry.expected_length;
    const uint32_t counter = entry.match_counter;

    if (length == expected) {
        if (dir == Direction::FromResponder && (counter == 0 || counter >= 2)) {
            entry.match_counter = counter + 1;
            return true;
        }
        if (dir == Direction::FromOriginator && (counter == 1 || counter >= 3)) {
            entry.match_counter = counter + 1;
            return true;
        }
        return false;
    }

    if (length > expected && dir == Direction::FromOriginator && counter >= min_echo_run) {
        entry.match_counter = counter + 1;
        entry.tunnel_confirmed = true;
        return true;
    }

    return false;
}

} // namespace

// LRU ordered table: most recently seen connection at the front
struct EchoTracker::Impl {
    TrackerConfig config;
    TrackerStats stats;
    FindingCallback on_finding;

    using ListItem = std::pair<std::string, ConnectionEntry>;
    std::list<ListItem> lru_list;
    std::unordered_map<std::string, std::list<ListItem>::iterator> table;

    explicit Impl(const TrackerConfig& cfg) : config(cfg) {
        if (!config.is_valid()) {
            TW_LOG_WARN("Invalid tracker configuration, using defaults");
            config = TrackerConfig{};
        }
    }

    void touch(std::list<ListItem>::iterator it, TimePoint now) {
        it->second.last_seen = now;
        lru_list.splice(lru_list.begin(), lru_list, it);
    }

    void evict_lru() {
        if (lru_list.empty()) return;

        auto& victim = lru_list.back();
        TW_LOG_DEBUG("Evicting least recently seen connection " + victim.first);
        table.erase(victim.first);
        lru_list.pop_back();
        stats.evictions++;
    }

    ConnectionSnapshot make_snapshot(const ConnectionEntry& entry) const {
        ConnectionSnapshot snap;
        snap.info = entry.info;
        snap.profile = entry.profile;
        snap.expected_length = entry.expected_length;
        snap.match_counter = entry.match_counter;
        snap.tunnel_confirmed = entry.tunnel_confirmed;
        snap.last_seen = entry.last_seen;
        return snap;
    }

    Finding make_finding(const ConnectionEntry& entry, uint64_t length, TimePoint now) const {
        Finding finding;
        finding.uid = entry.info.uid;
        finding.originator = entry.info.originator;
        finding.responder = entry.info.responder;
        finding.match_count = entry.match_counter;
        finding.characters_typed = static_cast<int64_t>(entry.match_counter / 2) - 1;
        finding.expected_length = entry.expected_length;
        finding.return_length = length;
        finding.timestamp = now;
        return finding;
    }
};

EchoTracker::EchoTracker() : impl_(std::make_unique<Impl>(TrackerConfig{})) {}
EchoTracker::EchoTracker(const TrackerConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}
EchoTracker::~EchoTracker() = default;

bool EchoTracker::on_authenticated(const ConnectionInfo& conn, const std::string& cipher,
                                   const std::string& mac, TimePoint now) {
    ssh::AlgorithmProfile profile = ssh::resolve_profile(cipher, mac);
    if (!profile.known_cipher) {
        TW_LOG_DEBUG(conn.uid + ": cipher '" + cipher + "' not in table, assuming " +
                     std::to_string(ssh::kDefaultBlockSize) + "-byte blocks");
    }
    if (!profile.known_mac && !profile.aead) {
        TW_LOG_DEBUG(conn.uid + ": MAC '" + mac + "' not in table, assuming " +
                     std::to_string(ssh::kDefaultMacSize) + "-byte tag");
    }
    return on_authenticated(conn, profile, now);
}

bool EchoTracker::on_authenticated(const ConnectionInfo& conn, const ssh::AlgorithmProfile& profile,
                                   TimePoint now) {
    if (impl_->table.count(conn.uid)) {
        TW_LOG_WARN(conn.uid + ": duplicate authentication event, keeping existing state");
        return false;
    }

    while (impl_->table.size() >= impl_->config.max_connections) {
        impl_->evict_lru();
    }

    ConnectionEntry entry;
    entry.info = conn;
    entry.profile = profile;
    entry.expected_length = ssh::tunneled_keystroke_length(profile);
    entry.last_seen = now;

    impl_->lru_list.emplace_front(conn.uid, std::move(entry));
    impl_->table[conn.uid] = impl_->lru_list.begin();
    impl_->stats.armed++;

    TW_LOG_INFO(conn.uid + ": armed, tunneled keystroke length " +
                std::to_string(impl_->lru_list.front().second.expected_length));
    return true;
}

std::optional<Finding> EchoTracker::observe(const std::string& uid, Direction dir, int64_t length,
                                            TimePoint now) {
    if (length < 0) {
        throw std::invalid_argument("observe: negative packet length " +
                                    std::to_string(length) + " on " + uid);
    }
    if (dir != Direction::FromOriginator && dir != Direction::FromResponder) {
        throw std::invalid_argument("observe: invalid direction on " + uid);
    }

    auto found = impl_->table.find(uid);
    if (found == impl_->table.end()) {
        impl_->stats.ignored++;
        return std::nullopt;
    }

    auto it = found->second;
    impl_->touch(it, now);
    impl_->stats.observations++;

    ConnectionEntry& entry = it->second;
    const uint64_t len = static_cast<uint64_t>(length);
    const uint32_t before = entry.match_counter;

    if (!advance(entry, dir, len, impl_->config.min_echo_run)) {
        if (before > 0) {
            impl_->stats.resets++;
            if (Logger::instance().enabled(LogLevel::TRACE)) {
                TW_LOG_TRACE(uid + ": echo run reset at " + std::to_string(before) + " (" +
                             direction_to_string(dir) + " " + std::to_string(len) + ")");
            }
        }
        entry.match_counter = 0;
    }

    if (!entry.tunnel_confirmed) {
        return std::nullopt;
    }

    Finding finding = impl_->make_finding(entry, len, now);
    entry.tunnel_confirmed = false;
    entry.match_counter = 0;
    impl_->stats.findings++;

    TW_LOG_INFO("Reverse SSH shell on " + finding.to_string());
    if (impl_->on_finding) {
        impl_->on_finding(finding);
    }
    return finding;
}

bool EchoTracker::on_closed(const std::string& uid) {
    auto found = impl_->table.find(uid);
    if (found == impl_->table.end()) return false;

    impl_->lru_list.erase(found->second);
    impl_->table.erase(found);
    impl_->stats.closed++;
    return true;
}

size_t EchoTracker::expire_idle(TimePoint now) {
    size_t removed = 0;
    auto it = impl_->lru_list.begin();
    while (it != impl_->lru_list.end()) {
        if (now - it->second.last_seen >= impl_->config.idle_timeout) {
            TW_LOG_DEBUG(it->first + ": idle, dropping state");
            impl_->table.erase(it->first);
            it = impl_->lru_list.erase(it);
            impl_->stats.expirations++;
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

bool EchoTracker::is_tracking(const std::string& uid) const {
    return impl_->table.count(uid) != 0;
}

std::optional<ConnectionSnapshot> EchoTracker::snapshot(const std::string& uid) const {
    auto found = impl_->table.find(uid);
    if (found == impl_->table.end()) return std::nullopt;
    return impl_->make_snapshot(found->second->second);
}

size_t EchoTracker::size() const {
    return impl_->table.size();
}

TrackerStats EchoTracker::get_stats() const {
    TrackerStats stats = impl_->stats;
    stats.current_size = impl_->table.size();
    return stats;
}

const TrackerConfig& EchoTracker::config() const {
    return impl_->config;
}

void EchoTracker::set_finding_callback(FindingCallback callback) {
    impl_->on_finding = std::move(callback);
}

} // namespace tw
