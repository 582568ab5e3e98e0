#pragma once

#include "manifest.hpp"
#include "storage_config.hpp"
#include "relaydrop/core/result.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace relaydrop::storage {

struct StoredChunk {
    std::string hash;
    std::uint64_t size = 0;
};

struct RelayStatus {
    std::string transfer_id;
    std::uint64_t total_chunks = 0;
    std::uint64_t uploaded_chunks = 0;
    double progress = 0.0;
    std::vector<std::uint64_t> available_chunks;
    bool complete = false;
};

// Filesystem chunk store. Each transfer owns root/<transfer_id>/ holding manifest.json
// and chunks/chunk_NNNNNN. Nothing is cached in memory; every query rescans the disk,
// so concurrent writers of distinct chunk ids and process restarts need no coordination.
class RelayStore {
public:
    static constexpr const char* MANIFEST_FILE = "manifest.json";
    static constexpr const char* CHUNKS_DIR = "chunks";

    explicit RelayStore(std::filesystem::path root,
                        std::chrono::seconds retention = std::chrono::hours(24));
    explicit RelayStore(const StorageConfig& config);

    core::Result initialize();

    // Re-creating an existing transfer replaces its manifest and keeps uploaded chunks.
    core::Result create(const std::string& transfer_id, const Manifest& manifest);

    core::Result put_chunk(const std::string& transfer_id, std::uint64_t chunk_id,
                           const std::vector<std::uint8_t>& data, StoredChunk& stored);

    // NOT_FOUND carries TRANSFER_UNKNOWN or CHUNK_PENDING.
    core::Result get_chunk(const std::string& transfer_id, std::uint64_t chunk_id,
                           std::vector<std::uint8_t>& data) const;

    core::Result get_manifest(const std::string& transfer_id, Manifest& manifest) const;
    core::Result remove(const std::string& transfer_id);
    core::Result status(const std::string& transfer_id, RelayStatus& status) const;

    core::Result sweep(std::vector<std::string>& removed);
    core::Result sweep(std::chrono::system_clock::time_point now, std::vector<std::string>& removed);

    const std::filesystem::path& root() const { return root_; }
    std::chrono::seconds retention() const { return retention_; }

    static bool is_valid_transfer_id(const std::string& transfer_id);
    static std::string chunk_file_name(std::uint64_t chunk_id);

private:
    std::filesystem::path root_;
    std::chrono::seconds retention_;

    std::filesystem::path transfer_dir(const std::string& transfer_id) const;
    std::filesystem::path chunk_path(const std::string& transfer_id, std::uint64_t chunk_id) const;

    core::Result check_transfer(const std::string& transfer_id) const;
    core::Result load_record(const std::string& transfer_id, Manifest& manifest,
                             std::int64_t& created_at_ms) const;
    std::vector<std::uint64_t> scan_chunks(const std::string& transfer_id) const;
};

}
