#include "relaydrop/transfer/store_transport.hpp"

namespace relaydrop::transfer {

core::Result StoreTransport::create(const std::string& transfer_id, const storage::Manifest& manifest) {
    return store_.create(transfer_id, manifest);
}

core::Result StoreTransport::put_chunk(const std::string& transfer_id,
                                       std::uint64_t chunk_id,
                                       const std::vector<std::uint8_t>& data,
                                       storage::StoredChunk& stored) {
    return store_.put_chunk(transfer_id, chunk_id, data, stored);
}

core::Result StoreTransport::get_manifest(const std::string& transfer_id, storage::Manifest& manifest) {
    return store_.get_manifest(transfer_id, manifest);
}

core::Result StoreTransport::get_chunk(const std::string& transfer_id,
                                       const storage::ChunkAddress& address,
                                       std::vector<std::uint8_t>& data) {
    return store_.get_chunk(transfer_id, address.global_id, data);
}

} // namespace relaydrop::transfer
