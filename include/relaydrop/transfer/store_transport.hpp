#pragma once

#include "transport.hpp"
#include "relaydrop/storage/relay_store.hpp"

namespace relaydrop::transfer {

// Drives a RelayStore in-process, without HTTP in between.
class StoreTransport : public ChunkSink, public ChunkSource {
public:
    explicit StoreTransport(storage::RelayStore& store) : store_(store) {}

    core::Result create(const std::string& transfer_id, const storage::Manifest& manifest) override;
    core::Result put_chunk(const std::string& transfer_id,
                           std::uint64_t chunk_id,
                           const std::vector<std::uint8_t>& data,
                           storage::StoredChunk& stored) override;

    core::Result get_manifest(const std::string& transfer_id, storage::Manifest& manifest) override;
    core::Result get_chunk(const std::string& transfer_id,
                           const storage::ChunkAddress& address,
                           std::vector<std::uint8_t>& data) override;

private:
    storage::RelayStore& store_;
};

} // namespace relaydrop::transfer
