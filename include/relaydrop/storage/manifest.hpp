#pragma once

#include "relaydrop/core/result.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace relaydrop::storage {

struct ChunkInfo {
    std::uint64_t id = 0;
    std::string hash;
    std::uint64_t size = 0;

    bool operator==(const ChunkInfo& other) const = default;
};

struct FileManifest {
    std::string file_name;
    std::string file_path;
    std::uint64_t size = 0;
    std::uint64_t chunk_size = 0;
    std::uint64_t total_chunks = 0;
    std::string hash;
    std::vector<ChunkInfo> chunks;

    // Set only for members of a FolderManifest; generic '/' separators.
    std::string relative_path;

    bool operator==(const FileManifest& other) const = default;
};

struct FolderManifest {
    std::string folder_name;
    std::string folder_path;
    std::uint64_t total_size = 0;
    std::uint64_t total_files = 0;
    std::uint64_t chunk_size = 0;
    std::vector<FileManifest> files;

    std::uint64_t total_chunks() const;

    bool operator==(const FolderManifest& other) const = default;
};

using Manifest = std::variant<FileManifest, FolderManifest>;

inline bool is_folder(const Manifest& manifest) {
    return std::holds_alternative<FolderManifest>(manifest);
}

std::uint64_t total_chunks(const Manifest& manifest);
std::uint64_t chunk_size(const Manifest& manifest);
const std::string& display_name(const Manifest& manifest);

constexpr std::uint64_t expected_chunk_count(std::uint64_t size, std::uint64_t chunk_size) {
    return chunk_size == 0 ? 0 : (size + chunk_size - 1) / chunk_size;
}

nlohmann::json to_json(const Manifest& manifest);
nlohmann::json to_json(const FileManifest& manifest);
nlohmann::json to_json(const FolderManifest& manifest);

// Decodes and validates a manifest; any structural problem is INVALID_INPUT.
core::Result from_json(const nlohmann::json& json, Manifest& manifest);

core::Result validate(const FileManifest& manifest);
core::Result validate(const FolderManifest& manifest);

// True when `relative` is a non-empty relative path with no "." or ".." components.
bool is_safe_relative_path(const std::string& relative);

// A single path component: not empty, not "." or "..", no separators.
bool is_safe_file_name(const std::string& name);

}
