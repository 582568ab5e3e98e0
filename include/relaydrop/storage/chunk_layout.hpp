#pragma once

#include "manifest.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace relaydrop::storage {

// One file's slice of a transfer's global chunk-id space.
struct FileChunkRange {
    std::size_t file_index = 0;
    std::uint64_t first_global_id = 0;
    std::uint64_t chunk_count = 0;

    std::uint64_t end_global_id() const { return first_global_id + chunk_count; }
};

// Where a chunk lives, both in the transfer-wide id space and inside its file.
struct ChunkAddress {
    std::uint64_t global_id = 0;
    std::optional<std::size_t> file_index;
    std::uint64_t local_id = 0;
};

// Lays a folder's files end to end in manifest order: file 0's chunks take ids
// [0, n0), file 1's take [n0, n0 + n1), and so on. Upload, download and the relay's
// chunk count all go through this function so the mapping cannot diverge.
std::vector<FileChunkRange> flatten_chunk_layout(const FolderManifest& manifest);

// A single file occupies one range starting at 0.
std::vector<FileChunkRange> flatten_chunk_layout(const Manifest& manifest);

std::optional<ChunkAddress> locate_chunk(const std::vector<FileChunkRange>& layout,
                                         std::uint64_t global_id);

}
