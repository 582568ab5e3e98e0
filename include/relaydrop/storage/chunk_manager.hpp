#pragma once

#include "manifest.hpp"
#include "storage_config.hpp"
#include "relaydrop/core/result.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace relaydrop::storage {

class ChunkManager {
public:
    static constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 1024 * 1024; // 1MB

    explicit ChunkManager(std::uint64_t chunk_size = DEFAULT_CHUNK_SIZE);
    ChunkManager(const StorageConfig& config, TransferMode mode);

    core::Result create_file_manifest(const std::filesystem::path& file_path, FileManifest& manifest) const;
    core::Result create_folder_manifest(const std::filesystem::path& folder_path, FolderManifest& manifest) const;
    core::Result create_manifest(const std::filesystem::path& path, Manifest& manifest) const;

    core::Result read_chunk(const std::filesystem::path& file_path,
                            std::uint64_t chunk_id,
                            std::vector<std::uint8_t>& chunk_data) const;

    // Positioned write at chunk_id * chunk_size. Creates the file and its parent
    // directories when missing and never truncates bytes outside the written range.
    core::Result write_chunk(const std::filesystem::path& file_path,
                             std::uint64_t chunk_id,
                             const std::vector<std::uint8_t>& chunk_data) const;

    bool verify_chunk(const std::vector<std::uint8_t>& chunk_data,
                      const std::string& expected_hash) const;

    bool verify_chunk(const std::filesystem::path& file_path,
                      std::uint64_t chunk_id,
                      const std::string& expected_hash) const;

    bool verify_file(const std::filesystem::path& file_path,
                     const std::string& expected_hash) const;

    // Resume heuristic from file length alone: floor(size / chunk_size) chunks are
    // taken as present and everything after them as missing. Only sound when chunks
    // were written in increasing order without gaps.
    std::vector<std::uint64_t> get_missing_chunks(const std::filesystem::path& file_path,
                                                  std::uint64_t total_chunks) const;

    std::uint64_t get_chunk_size() const { return chunk_size_; }

    static std::string compute_chunk_hash(const std::vector<std::uint8_t>& chunk_data);

private:
    std::uint64_t chunk_size_;
};

}
