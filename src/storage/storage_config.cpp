#include "relaydrop/storage/storage_config.hpp"
#include "relaydrop/core/config.hpp"
#include "relaydrop/core/utils.hpp"

namespace relaydrop::storage {

std::optional<TransferMode> parse_transfer_mode(const std::string& name) {
    auto lower = core::utils::StringUtils::to_lower(name);
    if (lower == "lan") return TransferMode::LAN;
    if (lower == "webrtc") return TransferMode::WEBRTC;
    if (lower == "relay") return TransferMode::RELAY;
    return std::nullopt;
}

const char* to_string(TransferMode mode) {
    switch (mode) {
        case TransferMode::LAN: return "lan";
        case TransferMode::WEBRTC: return "webrtc";
        case TransferMode::RELAY: return "relay";
    }
    return "relay";
}

StorageConfig::StorageConfig(const std::filesystem::path& upload_dir)
    : upload_directory(upload_dir) {
}

StorageConfig StorageConfig::from_config(const core::Config& config) {
    StorageConfig storage;
    storage.upload_directory = config.get_string("relay.upload_dir", "uploads");
    storage.chunk_size_lan = config.get_uint64("transfer.chunk_size.lan", storage.chunk_size_lan);
    storage.chunk_size_webrtc = config.get_uint64("transfer.chunk_size.webrtc", storage.chunk_size_webrtc);
    storage.chunk_size_relay = config.get_uint64("transfer.chunk_size.relay", storage.chunk_size_relay);
    storage.cleanup_after = std::chrono::hours(config.get_int("relay.cleanup_after_hours", 24));
    storage.sweep_interval = std::chrono::minutes(config.get_int("relay.sweep_interval_minutes", 60));
    return storage;
}

bool StorageConfig::validate() const {
    if (upload_directory.empty()) {
        return false;
    }

    // 1KB to 64MB per chunk
    for (auto size : {chunk_size_lan, chunk_size_webrtc, chunk_size_relay}) {
        if (size < 1024 || size > 64ULL * 1024 * 1024) {
            return false;
        }
    }

    if (cleanup_after.count() <= 0 || sweep_interval.count() < 0) {
        return false;
    }

    return true;
}

bool StorageConfig::create_directories() const {
    std::error_code ec;
    std::filesystem::create_directories(upload_directory, ec);
    return !ec;
}

std::uint64_t StorageConfig::chunk_size_for(TransferMode mode) const {
    switch (mode) {
        case TransferMode::LAN: return chunk_size_lan;
        case TransferMode::WEBRTC: return chunk_size_webrtc;
        case TransferMode::RELAY: return chunk_size_relay;
    }
    return chunk_size_relay;
}

}
