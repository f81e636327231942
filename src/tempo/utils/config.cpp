// src/tempo/utils/config.cpp
#include "tempo/utils/config.hpp"
#include <fstream>

namespace tempo {
namespace utils {

std::shared_ptr<Config> Config::instance_ = nullptr;
std::mutex Config::instance_mutex_;

namespace {

void trim(std::string& s) {
    s.erase(0, s.find_first_not_of(" \t\r"));
    s.erase(s.find_last_not_of(" \t\r") + 1);
}

} // namespace

std::shared_ptr<Config> Config::instance() {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (!instance_) {
        instance_ = std::make_shared<Config>();
    }
    return instance_;
}

void Config::parse(std::istream& in) {
    values_.clear();
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);
        trim(key);
        trim(value);

        if (!key.empty()) {
            values_[key] = value;
        }
    }
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    parse(file);
    return true;
}

void Config::load_from_string(const std::string& text) {
    std::istringstream in(text);
    std::lock_guard<std::mutex> lock(mutex_);
    parse(in);
}

bool Config::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.find(key) != values_.end();
}

std::string Config::get(const std::string& key, const std::string& default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    return (it != values_.end()) ? it->second : default_value;
}

bool Config::get(const std::string& key, bool default_value) const {
    std::string value = get(key, std::string());
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }
    return default_value;
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
}

} // namespace utils
} // namespace tempo
