#pragma once

#include "relaydrop/network/http_types.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace relaydrop::network {

struct HttpEndpoint {
    std::string host;
    std::string port = "80";
    std::string base_path;

    // Accepts "http://host[:port][/base]" or "host[:port]".
    static bool parse(const std::string& url, HttpEndpoint& endpoint);
};

// Blocking HTTP/1.1 client. Each request opens its own connection and io_context,
// so one instance may be shared by any number of threads.
class HttpClient {
public:
    HttpClient(HttpEndpoint endpoint, std::chrono::seconds timeout = std::chrono::seconds(30));

    core::Result get(const std::string& target, HttpResponse& response) const;
    core::Result post_json(const std::string& target, const nlohmann::json& body, HttpResponse& response) const;
    core::Result post_binary(const std::string& target, const std::vector<std::uint8_t>& body,
                             HttpResponse& response) const;
    core::Result remove(const std::string& target, HttpResponse& response) const;

    // Transport-level failures are NETWORK_FAILURE; a response of any status is success here.
    core::Result request(http::verb method, const std::string& target,
                         std::string body, const std::string& content_type,
                         HttpResponse& response) const;

    const HttpEndpoint& endpoint() const { return endpoint_; }

private:
    HttpEndpoint endpoint_;
    std::chrono::seconds timeout_;
};

}
