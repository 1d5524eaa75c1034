#pragma once

#include <string>
#include <cstdint>
#include <map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <mutex>
#include <cctype>
#include <stdexcept>

namespace tw {

/**
 * @brief Runtime configuration for tunnelwatch
 *
 * Flat key/value store read from "key = value" files. Holds the logging
 * settings and the connection tracker limits. Missing keys fall back to
 * the defaults installed by loadDefaults().
 */
class Config {
public:
    static Config& instance() {
        static Config cfg;
        return cfg;
    }

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // ==================== Getters ====================
    std::string get(const std::string& key, const std::string& default_val = "") const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_val;
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return values_.count(key) != 0;
    }

    int64_t getInt(const std::string& key, int64_t default_val = 0) const {
        std::string v = get(key);
        if (v.empty()) return default_val;
        try {
            size_t used = 0;
            long long parsed = std::stoll(v, &used);
            if (used != v.size()) return default_val;
            return static_cast<int64_t>(parsed);
        } catch (const std::exception&) {
            return default_val;
        }
    }

    bool getBool(const std::string& key, bool default_val = false) const {
        std::string v = get(key);
        if (v.empty()) return default_val;
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
        if (v == "false" || v == "0" || v == "no" || v == "off") return false;
        return default_val;
    }

    // ==================== Setters ====================
    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mtx_);
        values_[key] = value;
    }

    void setInt(const std::string& key, int64_t value) {
        set(key, std::to_string(value));
    }

    void setBool(const std::string& key, bool value) {
        set(key, value ? "true" : "false");
    }

    // ==================== File I/O ====================
    bool loadFromFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) return false;

        std::lock_guard<std::mutex> lock(mtx_);
        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            auto first = line.find_first_not_of(" \t");
            if (first == std::string::npos) continue;
            if (line[first] == '#' || line[first] == ';') continue;
            auto pos = line.find('=');
            if (pos == std::string::npos) continue;

            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);
            if (key.empty()) continue;

            values_[key] = val;
        }
        return true;
    }

    bool saveToFile(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mtx_);
        std::ofstream file(path);
        if (!file.is_open()) return false;

        file << "# tunnelwatch configuration\n\n";
        for (const auto& [k, v] : values_) {
            file << k << " = " << v << "\n";
        }
        return static_cast<bool>(file);
    }

    // ==================== Defaults ====================
    void loadDefaults() {
        std::lock_guard<std::mutex> lock(mtx_);
        values_["log.level"] = "info";
        values_["log.console"] = "true";
        values_["log.file"] = "";
        values_["tracker.min_echo_run"] = "10";
        values_["tracker.idle_timeout_s"] = "3600";
        values_["tracker.max_connections"] = "65536";
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        values_.clear();
    }

private:
    Config() { loadDefaults(); }

    static void trim(std::string& s) {
        s.erase(0, s.find_first_not_of(" \t"));
        s.erase(s.find_last_not_of(" \t") + 1);
    }

    mutable std::mutex mtx_;
    std::map<std::string, std::string> values_;
};

} // namespace tw
