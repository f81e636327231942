// include/tempo/utils/config.hpp
#pragma once
#include <string>
#include <unordered_map>
#include <mutex>
#include <memory>
#include <istream>
#include <sstream>

namespace tempo {
namespace utils {

// Well-known keys read by the library and the tempo_report tool
namespace config_keys {
inline constexpr const char* LOG_LEVEL = "log.level";
inline constexpr const char* PROFILE_ROOT_NAME = "profile.root_name";
inline constexpr const char* THROTTLE_COOLDOWN_MS = "throttle.cooldown_ms";
inline constexpr const char* NOTIFY_TITLE = "notify.title";
inline constexpr const char* NOTIFY_ENDPOINT = "notify.endpoint";
inline constexpr const char* SCAN_PATH = "scan.path";
} // namespace config_keys

class Config {
private:
    std::unordered_map<std::string, std::string> values_;
    mutable std::mutex mutex_;
    static std::shared_ptr<Config> instance_;
    static std::mutex instance_mutex_;

    void parse(std::istream& in);

public:
    Config() = default;

    // Process-wide settings shared by the tool and the host helpers
    static std::shared_ptr<Config> instance();

    // Load key=value lines, '#' starts a comment line. Replaces current values.
    bool load_from_file(const std::string& filename);
    void load_from_string(const std::string& text);

    bool contains(const std::string& key) const;

    template<typename T>
    T get(const std::string& key, const T& default_value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        std::istringstream iss(it->second);
        T value;
        if (!(iss >> value)) {
            return default_value;
        }

        return value;
    }

    std::string get(const std::string& key, const std::string& default_value) const;
    std::string get(const std::string& key, const char* default_value) const {
        return get(key, std::string(default_value));
    }
    bool get(const std::string& key, bool default_value) const;

    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        oss << value;
        values_[key] = oss.str();
    }

    void clear();
};

} // namespace utils
} // namespace tempo
