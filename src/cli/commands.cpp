#include "commands.hpp"

#include "tw_config.hpp"
#include "tw_echo_tracker.hpp"
#include "tw_logger.hpp"
#include "tw_ssh_framing.hpp"
#include "tw_trace.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <ostream>
#include <stdexcept>

namespace tw {
namespace cli {

namespace {

std::string get_arg(const std::vector<std::string>& args, size_t index, const std::string& default_val = "") {
    return index < args.size() ? args[index] : default_val;
}

bool has_option(const std::vector<std::string>& args, const std::string& option) {
    return std::find(args.begin(), args.end(), option) != args.end();
}

std::string get_option(const std::vector<std::string>& args, const std::string& option, const std::string& default_val = "") {
    auto it = std::find(args.begin(), args.end(), option);
    if (it != args.end() && ++it != args.end()) return *it;
    return default_val;
}

void apply_logging(const Config& cfg) {
    auto& logger = Logger::instance();
    logger.setLevel(Logger::levelFromString(cfg.get("log.level", "info")));
    logger.setConsoleOutput(cfg.getBool("log.console", true));

    std::string path = cfg.get("log.file");
    if (!logger.setFileOutput(path)) {
        TW_LOG_ERROR("Cannot open log file: " + path);
    }
}

void load_config(const std::string& path) {
    auto& cfg = Config::instance();
    if (!path.empty()) {
        if (!cfg.loadFromFile(path)) {
            throw std::runtime_error("cannot read config file " + path);
        }
    }
    apply_logging(cfg);
    if (!path.empty()) {
        TW_LOG_INFO("Configuration loaded from: " + path);
    }
}

} // namespace

std::optional<size_t> parse_payload_size(const std::string& text) {
    // stoull would wrap a leading '-'
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) return std::nullopt;
    try {
        size_t used = 0;
        unsigned long long v = std::stoull(text, &used);
        // packet_length is a 32-bit field
        if (used != text.size() || v > UINT32_MAX) return std::nullopt;
        return static_cast<size_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int handle_replay(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    std::string trace_path = get_arg(args, 0);
    std::string config_path = get_option(args, "--config");
    if (trace_path.empty() || trace_path.rfind("--", 0) == 0 ||
        (has_option(args, "--config") && config_path.empty())) {
        err << "Usage: tunnelwatch replay <trace> [--config <file>]\n";
        return 1;
    }

    try {
        load_config(config_path);

        std::ifstream in(trace_path);
        if (!in.is_open()) {
            throw std::runtime_error("cannot open trace file " + trace_path);
        }

        EchoTracker tracker(tracker_config_from(Config::instance()));
        tracker.set_finding_callback([&out](const Finding& f) {
            out << "[!] " << f.to_string() << "\n";
        });

        TraceReplayer replayer(tracker);
        ReplaySummary summary = replayer.run(in);

        TrackerStats stats = tracker.get_stats();
        TW_LOG_INFO("Replayed " + std::to_string(summary.events) + " events from " +
                    trace_path + " (" + std::to_string(summary.malformed) + " malformed lines)");

        out << "\nConnections armed:   " << stats.armed << "\n"
            << "Packets evaluated:   " << stats.observations << "\n"
            << "Packets ignored:     " << stats.ignored << "\n"
            << "Pattern resets:      " << stats.resets << "\n"
            << "Idle expirations:    " << stats.expirations << "\n"
            << "Evictions:           " << stats.evictions << "\n"
            << "Findings:            " << stats.findings << "\n";
        return 0;
    } catch (const std::exception& e) {
        TW_LOG_ERROR(std::string("replay failed: ") + e.what());
        return 1;
    }
}

int handle_framelen(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    if (args.size() < 2) {
        err << "Usage: tunnelwatch framelen <cipher> <mac> [payload]\n";
        return 1;
    }

    std::optional<size_t> payload;
    std::string payload_arg = get_arg(args, 2);
    if (!payload_arg.empty()) {
        payload = parse_payload_size(payload_arg);
        if (!payload) {
            err << "Invalid payload size: " << payload_arg << "\n";
            return 1;
        }
    }

    ssh::AlgorithmProfile profile = ssh::resolve_profile(args[0], args[1]);

    out << "block size: " << profile.block_size
        << (profile.known_cipher ? "" : " (default)") << "\n"
        << "mac size:   " << profile.mac_size
        << (profile.aead ? " (aead)" : profile.known_mac ? "" : " (default)") << "\n"
        << "etm:        " << (profile.etm ? "yes" : "no") << "\n";

    if (payload) {
        out << "frame:      " << ssh::frame_length(*payload, profile) << "\n";
        return 0;
    }

    size_t inner = ssh::frame_length(ssh::kKeystrokePayload, profile);
    out << "inner:      " << inner << "\n"
        << "outer:      " << ssh::frame_length(inner, profile) << "\n";
    return 0;
}

} // namespace cli
} // namespace tw
