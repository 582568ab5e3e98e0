#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relaydrop::core::utils {

class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);

    // Strict decimal parse: rejects signs, whitespace and trailing garbage.
    static std::optional<std::uint64_t> parse_uint64(std::string_view str);

    static std::string format_bytes(std::uint64_t bytes);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_directory(const std::filesystem::path& path);

    static std::optional<std::string> read_file(const std::filesystem::path& path);

    // Writes to a temporary sibling and renames it over `path`.
    static bool write_file_atomic(const std::filesystem::path& path, std::string_view content);

    static std::filesystem::path expand_home(const std::string& path);
    static std::filesystem::path get_home_dir();
};

class TimeUtils {
public:
    static std::chrono::system_clock::time_point now();
    static std::int64_t to_epoch_millis(std::chrono::system_clock::time_point time);
};

}
