#pragma once

#include "relaydrop/network/http_server.hpp"
#include "relaydrop/signaling/signaling_hub.hpp"
#include <string>

namespace relaydrop::network {

// HTTP and WebSocket front end of a SignalingHub:
//   POST /pair/create {transfer_id, manifest}
//   GET  /pair/{code}/info
//   GET  /stats
//   GET|HEAD /
//   WS   /ws/{code}/{role}
class SignalingServer {
public:
    SignalingServer(signaling::SignalingOptions options, std::string host, std::uint16_t port);
    ~SignalingServer();

    bool start();
    void stop();

    bool is_running() const { return server_.is_running(); }
    std::uint16_t port() const { return server_.port(); }

    signaling::SignalingHub& hub() { return hub_; }

private:
    HttpServer server_;
    // Destroyed before server_: the sessions still held in rooms are released while
    // their io_context exists. Handlers left queued in server_ keep a reference to
    // the dead hub but never run, and ~WebSocketSession does not touch it.
    signaling::SignalingHub hub_;

    HttpResponse handle_create(const HttpRequest& request);
    HttpResponse handle_info(const HttpRequest& request, const RouteParams& params);
    HttpResponse handle_stats(const HttpRequest& request);
    HttpResponse handle_health(const HttpRequest& request);
    HttpResponse handle_head(const HttpRequest& request);
};

nlohmann::json to_json(const signaling::PairCodeInfo& info);

}
