#include "relaydrop/storage/chunk_layout.hpp"
#include <algorithm>

namespace relaydrop::storage {

std::vector<FileChunkRange> flatten_chunk_layout(const FolderManifest& manifest) {
    std::vector<FileChunkRange> layout;
    layout.reserve(manifest.files.size());

    std::uint64_t offset = 0;
    for (std::size_t i = 0; i < manifest.files.size(); ++i) {
        layout.push_back({i, offset, manifest.files[i].total_chunks});
        offset += manifest.files[i].total_chunks;
    }
    return layout;
}

std::vector<FileChunkRange> flatten_chunk_layout(const Manifest& manifest) {
    if (const auto* folder = std::get_if<FolderManifest>(&manifest)) {
        return flatten_chunk_layout(*folder);
    }
    return {FileChunkRange{0, 0, std::get<FileManifest>(manifest).total_chunks}};
}

std::optional<ChunkAddress> locate_chunk(const std::vector<FileChunkRange>& layout,
                                         std::uint64_t global_id) {
    // Ranges are sorted by first_global_id; empty files share their neighbour's start.
    auto it = std::upper_bound(layout.begin(), layout.end(), global_id,
        [](std::uint64_t id, const FileChunkRange& range) { return id < range.first_global_id; });

    while (it != layout.begin()) {
        --it;
        if (global_id >= it->first_global_id && global_id < it->end_global_id()) {
            return ChunkAddress{global_id, it->file_index, global_id - it->first_global_id};
        }
        if (it->chunk_count != 0) {
            break;
        }
    }
    return std::nullopt;
}

}
