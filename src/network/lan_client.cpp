#include "relaydrop/network/lan_client.hpp"

namespace relaydrop::network {

using core::ErrorCode;
using core::Result;
using nlohmann::json;

LanClient::LanClient(HttpEndpoint endpoint, std::chrono::seconds timeout)
    : client_(std::move(endpoint), timeout) {
}

Result LanClient::get_manifest(const std::string&, storage::Manifest& manifest) {
    HttpResponse response;
    auto result = client_.get("/manifest", response);
    if (!result) {
        return result;
    }

    result = result_from_response(response);
    if (!result) {
        return result;
    }

    auto body = json::parse(response.body(), nullptr, false);
    if (body.is_discarded()) {
        return Result(ErrorCode::INVALID_INPUT, "Malformed manifest from LAN peer");
    }
    return storage::from_json(body, manifest);
}

Result LanClient::get_chunk(const std::string&, const storage::ChunkAddress& address,
                            std::vector<std::uint8_t>& data) {
    if (address.file_index) {
        return download_file_chunk(*address.file_index, address.local_id, data);
    }
    return download_chunk(address.global_id, data);
}

Result LanClient::download_chunk(std::uint64_t chunk_id, std::vector<std::uint8_t>& data) const {
    return fetch("/chunk/" + std::to_string(chunk_id), data);
}

Result LanClient::download_file_chunk(std::size_t file_index, std::uint64_t chunk_id,
                                      std::vector<std::uint8_t>& data) const {
    return fetch("/file/" + std::to_string(file_index) + "/chunk/" + std::to_string(chunk_id), data);
}

Result LanClient::fetch(const std::string& target, std::vector<std::uint8_t>& data) const {
    HttpResponse response;
    auto result = client_.get(target, response);
    if (!result) {
        return result;
    }

    result = result_from_response(response);
    if (!result) {
        return result;
    }

    data = body_bytes(response.body());
    return Result();
}

}
