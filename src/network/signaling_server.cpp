#include "relaydrop/network/signaling_server.hpp"
#include "relaydrop/core/logger.hpp"
#include "relaydrop/core/version.hpp"
#include "relaydrop/network/websocket_session.hpp"

namespace relaydrop::network {

using core::ErrorCode;
using core::Result;
using nlohmann::json;

json to_json(const signaling::PairCodeInfo& info) {
    return {
        {"pair_code", info.pair_code},
        {"transfer_id", info.transfer_id},
        {"manifest", info.manifest},
        {"status", signaling::to_string(info.status)},
        {"expires_in", info.expires_in.count()}
    };
}

SignalingServer::SignalingServer(signaling::SignalingOptions options, std::string host, std::uint16_t port)
    : server_("Signaling server", std::move(host), port)
    , hub_(std::move(options)) {
    using http::verb;

    server_.route(verb::post, "/pair/create",
        [this](const HttpRequest& req, const RouteParams&) { return handle_create(req); });
    server_.route(verb::get, "/pair/{code}/info",
        [this](const HttpRequest& req, const RouteParams& p) { return handle_info(req, p); });
    server_.route(verb::get, "/stats",
        [this](const HttpRequest& req, const RouteParams&) { return handle_stats(req); });
    server_.route(verb::get, "/",
        [this](const HttpRequest& req, const RouteParams&) { return handle_health(req); });
    server_.route(verb::head, "/",
        [this](const HttpRequest& req, const RouteParams&) { return handle_head(req); });

    server_.websocket("/ws/{code}/{role}",
        [this](beast::tcp_stream stream, HttpRequest request, const RouteParams& params) {
            auto session = std::make_shared<WebSocketSession>(std::move(stream), hub_,
                                                              params.at("code"), params.at("role"));
            session->start(std::move(request));
        });
}

SignalingServer::~SignalingServer() {
    stop();
}

bool SignalingServer::start() {
    if (!server_.start()) {
        return false;
    }
    LOG_INFO("Pair codes: {} digits, valid for {}s", hub_.options().code_length, hub_.options().code_ttl.count());
    return true;
}

void SignalingServer::stop() {
    server_.stop();
}

HttpResponse SignalingServer::handle_create(const HttpRequest& request) {
    json body;
    auto result = parse_json_body(request.body(), body);
    if (!result) {
        return error_response(request, result);
    }

    if (!body.contains("transfer_id") || !body["transfer_id"].is_string() || !body.contains("manifest")) {
        return error_response(request, Result(ErrorCode::INVALID_INPUT, "Expected {transfer_id, manifest}"));
    }

    json manifest = body["manifest"];
    if (manifest.is_string()) {
        result = parse_json_body(manifest.get<std::string>(), manifest);
        if (!result) {
            return error_response(request, result);
        }
    }

    signaling::PairCodeInfo info;
    result = hub_.issue_pair_code(body["transfer_id"].get<std::string>(), manifest, info);
    if (!result) {
        LOG_WARN("Pair code request rejected: {}", result.message);
        return error_response(request, result);
    }

    return json_response(request, http::status::ok, {
        {"pair_code", info.pair_code},
        {"transfer_id", info.transfer_id},
        {"expires_in", info.expires_in.count()}
    });
}

HttpResponse SignalingServer::handle_info(const HttpRequest& request, const RouteParams& params) {
    signaling::PairCodeInfo info;
    auto result = hub_.get_info(params.at("code"), info);
    if (!result) {
        return error_response(request, result);
    }
    return json_response(request, http::status::ok, to_json(info));
}

HttpResponse SignalingServer::handle_stats(const HttpRequest& request) {
    auto stats = hub_.stats();
    return json_response(request, http::status::ok, {
        {"active_pairs", stats.active_pairs},
        {"total_pair_codes", stats.total_pair_codes},
        {"active_connections", stats.active_connections}
    });
}

HttpResponse SignalingServer::handle_health(const HttpRequest& request) {
    return json_response(request, http::status::ok, {
        {"service", "RelayDrop Signaling Server"},
        {"status", "running"},
        {"version", core::VERSION}
    });
}

HttpResponse SignalingServer::handle_head(const HttpRequest& request) {
    HttpResponse response{http::status::ok, request.version()};
    response.set(http::field::server, SERVER_NAME);
    response.keep_alive(request.keep_alive());
    response.prepare_payload();
    return response;
}

}
