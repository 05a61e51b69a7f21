#include "ferry/core/config.hpp"
#include "ferry/transfer/transfer_settings.hpp"
#include <algorithm>
#include <cctype>

namespace ferry::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    std::string line;
    while (std::getline(file, line)) {
        parse_line(line);
    }
    
    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    file << "# Ferry Configuration\n\n";
    file << to_string();
    
    return file.good();
}

void Config::load_from_string(const std::string& text) {
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        parse_line(line);
    }
}

std::string Config::to_string() const {
    std::ostringstream oss;
    for (const auto& [key, value] : values_) {
        oss << key << "=" << value << "\n";
    }
    return oss.str();
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    
    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::uint64_t Config::get_uint64(const std::string& key, std::uint64_t default_value) const {
    auto raw = get(key);
    if (!raw || raw->empty() || raw->front() == '-') return default_value;
    
    auto value = get_as<std::uint64_t>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

std::vector<std::string> Config::keys() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, value] : values_) {
        result.push_back(key);
    }
    return result;
}

void Config::set_defaults() {
    ferry::transfer::TransferSettings().store(*this);
    values_["log.level"] = "info";
    values_["log.file"] = "ferry.log";
    values_["storage.database"] = "ferry.db";
    values_["p2p.download_directory"] = "./downloads";
}

void Config::parse_line(const std::string& raw_line) {
    std::string line = trim(raw_line);
    
    if (line.empty() || line[0] == '#') {
        return;
    }
    
    auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos) {
        return;
    }
    
    std::string key = trim(line.substr(0, eq_pos));
    std::string value = trim(line.substr(eq_pos + 1));
    
    if (!key.empty()) {
        values_[key] = value;
    }
}

std::string Config::trim(const std::string& str) const {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }
    
    auto end = str.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        end--;
    }
    
    return std::string(start, end);
}

}
