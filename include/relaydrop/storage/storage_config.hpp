#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace relaydrop::core {
class Config;
}

namespace relaydrop::storage {

enum class TransferMode {
    LAN,
    WEBRTC,
    RELAY
};

std::optional<TransferMode> parse_transfer_mode(const std::string& name);
const char* to_string(TransferMode mode);

struct StorageConfig {
    std::filesystem::path upload_directory = "uploads";

    std::uint64_t chunk_size_lan = 2 * 1024 * 1024;    // 2MB
    std::uint64_t chunk_size_webrtc = 512 * 1024;      // 512KB
    std::uint64_t chunk_size_relay = 1024 * 1024;      // 1MB

    std::chrono::hours cleanup_after{24};
    std::chrono::minutes sweep_interval{60};

    StorageConfig() = default;

    explicit StorageConfig(const std::filesystem::path& upload_dir);

    static StorageConfig from_config(const core::Config& config);

    bool validate() const;

    bool create_directories() const;

    std::uint64_t chunk_size_for(TransferMode mode) const;
};

}
