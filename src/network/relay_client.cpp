#include "relaydrop/network/relay_client.hpp"
#include "relaydrop/core/logger.hpp"

namespace relaydrop::network {

using core::ErrorCode;
using core::Result;
using nlohmann::json;

RelayClient::RelayClient(HttpEndpoint endpoint, std::chrono::seconds timeout)
    : client_(std::move(endpoint), timeout) {
}

std::string RelayClient::transfer_path(const std::string& transfer_id) {
    return "/transfer/" + transfer_id;
}

Result RelayClient::read_json(const HttpResponse& response, json& body) const {
    auto result = result_from_response(response);
    if (!result) {
        return result;
    }

    body = json::parse(response.body(), nullptr, false);
    if (body.is_discarded()) {
        LOG_ERROR("Relay at {} returned malformed JSON", client_.endpoint().host);
        return Result(ErrorCode::INVALID_INPUT, "Malformed response from relay");
    }
    return Result();
}

Result RelayClient::create(const std::string& transfer_id, const storage::Manifest& manifest) {
    HttpResponse response;
    auto result = client_.post_json("/transfer/create",
                                    {{"transfer_id", transfer_id}, {"manifest", storage::to_json(manifest)}},
                                    response);
    if (!result) {
        return result;
    }
    return result_from_response(response);
}

Result RelayClient::put_chunk(const std::string& transfer_id,
                              std::uint64_t chunk_id,
                              const std::vector<std::uint8_t>& data,
                              storage::StoredChunk& stored) {
    HttpResponse response;
    auto result = client_.post_binary(transfer_path(transfer_id) + "/chunk/" + std::to_string(chunk_id),
                                      data, response);
    if (!result) {
        return result;
    }

    json body;
    result = read_json(response, body);
    if (!result) {
        return result;
    }

    try {
        body.at("hash").get_to(stored.hash);
        body.at("size").get_to(stored.size);
    } catch (const json::exception& e) {
        return Result(ErrorCode::INVALID_INPUT, std::string("Malformed upload response: ") + e.what());
    }
    return Result();
}

Result RelayClient::get_manifest(const std::string& transfer_id, storage::Manifest& manifest) {
    HttpResponse response;
    auto result = client_.get(transfer_path(transfer_id) + "/manifest", response);
    if (!result) {
        return result;
    }

    json body;
    result = read_json(response, body);
    if (!result) {
        return result;
    }
    return storage::from_json(body, manifest);
}

Result RelayClient::get_chunk(const std::string& transfer_id,
                              const storage::ChunkAddress& address,
                              std::vector<std::uint8_t>& data) {
    HttpResponse response;
    auto result = client_.get(transfer_path(transfer_id) + "/chunk/" + std::to_string(address.global_id),
                              response);
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

Result RelayClient::status(const std::string& transfer_id, storage::RelayStatus& status) const {
    HttpResponse response;
    auto result = client_.get(transfer_path(transfer_id) + "/status", response);
    if (!result) {
        return result;
    }

    json body;
    result = read_json(response, body);
    if (!result) {
        return result;
    }

    try {
        storage::RelayStatus parsed;
        body.at("transfer_id").get_to(parsed.transfer_id);
        body.at("total_chunks").get_to(parsed.total_chunks);
        body.at("uploaded_chunks").get_to(parsed.uploaded_chunks);
        body.at("progress").get_to(parsed.progress);
        body.at("available_chunks").get_to(parsed.available_chunks);
        body.at("complete").get_to(parsed.complete);
        status = std::move(parsed);
    } catch (const json::exception& e) {
        return Result(ErrorCode::INVALID_INPUT, std::string("Malformed status response: ") + e.what());
    }
    return Result();
}

Result RelayClient::remove(const std::string& transfer_id) const {
    HttpResponse response;
    auto result = client_.remove(transfer_path(transfer_id), response);
    if (!result) {
        return result;
    }
    return result_from_response(response);
}

Result RelayClient::cleanup(std::vector<std::string>& removed) const {
    HttpResponse response;
    auto result = client_.get("/cleanup", response);
    if (!result) {
        return result;
    }

    json body;
    result = read_json(response, body);
    if (!result) {
        return result;
    }

    try {
        body.at("deleted_transfers").get_to(removed);
    } catch (const json::exception& e) {
        return Result(ErrorCode::INVALID_INPUT, std::string("Malformed cleanup response: ") + e.what());
    }
    return Result();
}

Result RelayClient::health() const {
    HttpResponse response;
    auto result = client_.get("/", response);
    if (!result) {
        return result;
    }
    return result_from_response(response);
}

}
