#pragma once

#include "relaydrop/network/http_client.hpp"
#include "relaydrop/transfer/transport.hpp"

namespace relaydrop::network {

// ChunkSource over a LanServer. The transfer id is not part of the LAN protocol
// and is ignored.
class LanClient : public transfer::ChunkSource {
public:
    explicit LanClient(HttpEndpoint endpoint, std::chrono::seconds timeout = std::chrono::seconds(60));

    core::Result get_manifest(const std::string& transfer_id, storage::Manifest& manifest) override;
    core::Result get_chunk(const std::string& transfer_id,
                           const storage::ChunkAddress& address,
                           std::vector<std::uint8_t>& data) override;

    core::Result download_chunk(std::uint64_t chunk_id, std::vector<std::uint8_t>& data) const;
    core::Result download_file_chunk(std::size_t file_index, std::uint64_t chunk_id,
                                     std::vector<std::uint8_t>& data) const;

private:
    HttpClient client_;

    core::Result fetch(const std::string& target, std::vector<std::uint8_t>& data) const;
};

}
