#pragma once

#include "relaydrop/network/http_client.hpp"
#include "relaydrop/transfer/transport.hpp"
#include <string>
#include <vector>

namespace relaydrop::network {

class RelayClient : public transfer::ChunkSink, public transfer::ChunkSource {
public:
    explicit RelayClient(HttpEndpoint endpoint, std::chrono::seconds timeout = std::chrono::seconds(60));

    core::Result create(const std::string& transfer_id, const storage::Manifest& manifest) override;
    core::Result put_chunk(const std::string& transfer_id,
                           std::uint64_t chunk_id,
                           const std::vector<std::uint8_t>& data,
                           storage::StoredChunk& stored) override;

    core::Result get_manifest(const std::string& transfer_id, storage::Manifest& manifest) override;
    core::Result get_chunk(const std::string& transfer_id,
                           const storage::ChunkAddress& address,
                           std::vector<std::uint8_t>& data) override;

    core::Result status(const std::string& transfer_id, storage::RelayStatus& status) const;
    core::Result remove(const std::string& transfer_id) const;
    core::Result cleanup(std::vector<std::string>& removed) const;
    core::Result health() const;

private:
    HttpClient client_;

    static std::string transfer_path(const std::string& transfer_id);

    // Parses a 2xx JSON body; garbage from the server is INVALID_INPUT, never retried.
    core::Result read_json(const HttpResponse& response, nlohmann::json& body) const;
};

}
