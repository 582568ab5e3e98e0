#include "relaydrop/network/http_client.hpp"
#include "relaydrop/core/logger.hpp"
#include "relaydrop/core/utils.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/version.hpp>
#include <limits>

namespace relaydrop::network {

using core::ErrorCode;
using core::Result;
using boost::asio::ip::tcp;

bool HttpEndpoint::parse(const std::string& url, HttpEndpoint& endpoint) {
    std::string rest = url;
    const std::string scheme = "http://";
    if (rest.compare(0, scheme.size(), scheme) == 0) {
        rest = rest.substr(scheme.size());
    } else if (rest.find("://") != std::string::npos) {
        return false;
    }

    HttpEndpoint parsed;
    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        parsed.base_path = rest.substr(slash);
        while (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
            parsed.base_path.pop_back();
        }
        rest = rest.substr(0, slash);
    }

    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        auto port = core::utils::StringUtils::parse_uint64(std::string_view(rest).substr(colon + 1));
        if (!port || *port == 0 || *port > 65535) {
            return false;
        }
        parsed.port = std::to_string(*port);
        rest = rest.substr(0, colon);
    }

    if (rest.empty()) {
        return false;
    }
    parsed.host = rest;
    endpoint = std::move(parsed);
    return true;
}

HttpClient::HttpClient(HttpEndpoint endpoint, std::chrono::seconds timeout)
    : endpoint_(std::move(endpoint)), timeout_(timeout) {
}

Result HttpClient::get(const std::string& target, HttpResponse& response) const {
    return request(http::verb::get, target, {}, {}, response);
}

Result HttpClient::post_json(const std::string& target, const nlohmann::json& body, HttpResponse& response) const {
    return request(http::verb::post, target, body.dump(), CONTENT_TYPE_JSON, response);
}

Result HttpClient::post_binary(const std::string& target, const std::vector<std::uint8_t>& body,
                               HttpResponse& response) const {
    std::string payload(body.begin(), body.end());
    return request(http::verb::post, target, std::move(payload), CONTENT_TYPE_BINARY, response);
}

Result HttpClient::remove(const std::string& target, HttpResponse& response) const {
    return request(http::verb::delete_, target, {}, {}, response);
}

Result HttpClient::request(http::verb method, const std::string& target,
                           std::string body, const std::string& content_type,
                           HttpResponse& response) const {
    const auto full_target = endpoint_.base_path + target;

    HttpRequest req{method, full_target, 11};
    req.set(http::field::host, endpoint_.host + ":" + endpoint_.port);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (!content_type.empty()) {
        req.set(http::field::content_type, content_type);
    }
    req.body() = std::move(body);
    req.prepare_payload();

    boost::asio::io_context io_context;
    tcp::resolver resolver(io_context);
    beast::tcp_stream stream(io_context);
    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());

    // tcp_stream deadlines only apply to asynchronous operations.
    beast::error_code failure;
    const char* stage = "resolve";

    resolver.async_resolve(endpoint_.host, endpoint_.port,
        [&](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec) { failure = ec; return; }
            stage = "connect";
            stream.expires_after(timeout_);
            stream.async_connect(results, [&](beast::error_code ec, const tcp::endpoint&) {
                if (ec) { failure = ec; return; }
                stage = "write";
                stream.expires_after(timeout_);
                http::async_write(stream, req, [&](beast::error_code ec, std::size_t) {
                    if (ec) { failure = ec; return; }
                    stage = "read";
                    stream.expires_after(timeout_);
                    http::async_read(stream, buffer, parser, [&](beast::error_code ec, std::size_t) {
                        if (ec) { failure = ec; return; }
                        beast::error_code ignored;
                        stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
                    });
                });
            });
        });

    io_context.run();

    if (failure) {
        LOG_DEBUG("{} {}:{}{} failed during {}: {}", std::string(http::to_string(method)),
                  endpoint_.host, endpoint_.port, full_target, stage, failure.message());
        return Result(ErrorCode::NETWORK_FAILURE,
                      "Request to " + endpoint_.host + ":" + endpoint_.port + " failed during " + stage +
                      ": " + failure.message());
    }

    response = parser.release();
    return Result();
}

}
