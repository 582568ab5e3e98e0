#pragma once

#include "relaydrop/core/result.hpp"
#include "relaydrop/storage/chunk_layout.hpp"
#include "relaydrop/storage/manifest.hpp"
#include "relaydrop/storage/relay_store.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace relaydrop::transfer {

// Receiving side of an upload. Implementations are called from several worker
// threads at once and must tolerate concurrent put_chunk calls for distinct ids.
class ChunkSink {
public:
    virtual ~ChunkSink() = default;

    virtual core::Result create(const std::string& transfer_id, const storage::Manifest& manifest) = 0;

    // `stored` receives the hash and size the sink computed over what it actually kept.
    virtual core::Result put_chunk(const std::string& transfer_id,
                                   std::uint64_t chunk_id,
                                   const std::vector<std::uint8_t>& data,
                                   storage::StoredChunk& stored) = 0;
};

// Serving side of a download. Relay-backed sources address chunks by global id;
// a LAN source uses the per-file coordinates in `address`.
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    virtual core::Result get_manifest(const std::string& transfer_id, storage::Manifest& manifest) = 0;

    virtual core::Result get_chunk(const std::string& transfer_id,
                                   const storage::ChunkAddress& address,
                                   std::vector<std::uint8_t>& data) = 0;
};

} // namespace relaydrop::transfer
