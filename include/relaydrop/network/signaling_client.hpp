#pragma once

#include "relaydrop/network/http_client.hpp"
#include "relaydrop/signaling/signaling_hub.hpp"

namespace relaydrop::network {

class SignalingClient {
public:
    explicit SignalingClient(HttpEndpoint endpoint, std::chrono::seconds timeout = std::chrono::seconds(30));

    core::Result create_pair_code(const std::string& transfer_id, const nlohmann::json& manifest,
                                  signaling::PairCodeInfo& info) const;
    core::Result get_info(const std::string& code, signaling::PairCodeInfo& info) const;
    core::Result stats(signaling::HubStats& stats) const;

private:
    HttpClient client_;

    core::Result read_json(const HttpResponse& response, nlohmann::json& body) const;
};

}
