#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <filesystem>
#include <optional>
#include <cstdint>

namespace ferry::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static bool ends_with(const std::string& str, const std::string& suffix);
    
    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_speed(double bytes_per_second);
    static std::string format_duration(std::chrono::milliseconds duration);
    static std::string format_eta(double seconds);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static std::string get_file_extension(const std::filesystem::path& path);
    static std::filesystem::path get_home_dir();
    static std::filesystem::path expand_home(const std::string& path);
};

class TimeUtils {
public:
    static std::chrono::system_clock::time_point now();
    static std::string to_iso_string(const std::chrono::system_clock::time_point& time);
    static std::string format_timestamp(const std::chrono::system_clock::time_point& time);
    static std::chrono::system_clock::time_point start_of_local_day(const std::chrono::system_clock::time_point& time);
    static std::int64_t to_millis(const std::chrono::system_clock::time_point& time);
    static std::chrono::system_clock::time_point from_millis(std::int64_t millis);
};

}
