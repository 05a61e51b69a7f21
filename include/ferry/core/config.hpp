#pragma once

#include <string>
#include <map>
#include <optional>
#include <sstream>
#include <fstream>
#include <vector>
#include <cstdint>

namespace ferry::core {

class Config {
public:
    static Config& instance();
    
    Config() = default;
    
    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;
    
    // Same key=value format as the file, used for persisting through storage
    void load_from_string(const std::string& text);
    std::string to_string() const;
    
    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    bool contains(const std::string& key) const { return values_.count(key) > 0; }
    
    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) return std::nullopt;
        
        std::istringstream iss(*value);
        T result;
        if (iss >> result && iss.eof()) {
            return result;
        }
        return std::nullopt;
    }
    
    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    std::uint64_t get_uint64(const std::string& key, std::uint64_t default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    
    std::vector<std::string> keys() const;
    
    void set_defaults();
    void clear() { values_.clear(); }
    
private:
    std::map<std::string, std::string> values_;
    
    void parse_line(const std::string& raw_line);
    std::string trim(const std::string& str) const;
};

}
