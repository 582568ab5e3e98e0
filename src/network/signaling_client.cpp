#include "relaydrop/network/signaling_client.hpp"

namespace relaydrop::network {

using core::ErrorCode;
using core::Result;
using nlohmann::json;

SignalingClient::SignalingClient(HttpEndpoint endpoint, std::chrono::seconds timeout)
    : client_(std::move(endpoint), timeout) {
}

Result SignalingClient::read_json(const HttpResponse& response, json& body) const {
    auto result = result_from_response(response);
    if (!result) {
        return result;
    }
    body = json::parse(response.body(), nullptr, false);
    if (!body.is_object()) {
        return Result(ErrorCode::INVALID_INPUT, "Malformed response from signaling server");
    }
    return Result();
}

Result SignalingClient::create_pair_code(const std::string& transfer_id, const json& manifest,
                                         signaling::PairCodeInfo& info) const {
    HttpResponse response;
    auto result = client_.post_json("/pair/create", {{"transfer_id", transfer_id}, {"manifest", manifest}}, response);
    if (!result) {
        return result;
    }

    json body;
    result = read_json(response, body);
    if (!result) {
        return result;
    }

    try {
        body.at("pair_code").get_to(info.pair_code);
        body.at("transfer_id").get_to(info.transfer_id);
        info.expires_in = std::chrono::seconds(body.at("expires_in").get<std::int64_t>());
    } catch (const json::exception& e) {
        return Result(ErrorCode::INVALID_INPUT, std::string("Malformed pair code response: ") + e.what());
    }
    info.manifest = manifest;
    info.status = signaling::PairStatus::WAITING;
    return Result();
}

Result SignalingClient::get_info(const std::string& code, signaling::PairCodeInfo& info) const {
    HttpResponse response;
    auto result = client_.get("/pair/" + code + "/info", response);
    if (!result) {
        return result;
    }

    json body;
    result = read_json(response, body);
    if (!result) {
        return result;
    }

    try {
        body.at("pair_code").get_to(info.pair_code);
        body.at("transfer_id").get_to(info.transfer_id);
        info.manifest = body.at("manifest");
        info.status = body.at("status").get<std::string>() == "paired"
            ? signaling::PairStatus::PAIRED
            : signaling::PairStatus::WAITING;
        info.expires_in = std::chrono::seconds(body.at("expires_in").get<std::int64_t>());
    } catch (const json::exception& e) {
        return Result(ErrorCode::INVALID_INPUT, std::string("Malformed pair info response: ") + e.what());
    }
    return Result();
}

Result SignalingClient::stats(signaling::HubStats& stats) const {
    HttpResponse response;
    auto result = client_.get("/stats", response);
    if (!result) {
        return result;
    }

    json body;
    result = read_json(response, body);
    if (!result) {
        return result;
    }

    try {
        body.at("active_pairs").get_to(stats.active_pairs);
        body.at("total_pair_codes").get_to(stats.total_pair_codes);
        body.at("active_connections").get_to(stats.active_connections);
    } catch (const json::exception& e) {
        return Result(ErrorCode::INVALID_INPUT, std::string("Malformed stats response: ") + e.what());
    }
    return Result();
}

}
