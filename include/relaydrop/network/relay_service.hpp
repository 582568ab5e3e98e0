#pragma once

#include "relaydrop/network/http_server.hpp"
#include "relaydrop/storage/relay_store.hpp"
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <string>

namespace relaydrop::network {

// HTTP front end of a RelayStore. With a non-zero sweep interval expired transfers
// are also swept on a timer, in addition to GET /cleanup.
class RelayService {
public:
    RelayService(storage::RelayStore& store, std::string host, std::uint16_t port,
                 std::chrono::minutes sweep_interval = std::chrono::minutes(0));
    ~RelayService();

    bool start();
    void stop();

    bool is_running() const { return server_.is_running(); }
    std::uint16_t port() const { return server_.port(); }

private:
    storage::RelayStore& store_;
    HttpServer server_;
    boost::asio::steady_timer sweep_timer_;
    std::chrono::minutes sweep_interval_;

    void register_routes();
    void schedule_sweep();

    HttpResponse handle_create(const HttpRequest& request);
    HttpResponse handle_upload(const HttpRequest& request, const RouteParams& params);
    HttpResponse handle_download(const HttpRequest& request, const RouteParams& params);
    HttpResponse handle_manifest(const HttpRequest& request, const RouteParams& params);
    HttpResponse handle_status(const HttpRequest& request, const RouteParams& params);
    HttpResponse handle_delete(const HttpRequest& request, const RouteParams& params);
    HttpResponse handle_cleanup(const HttpRequest& request);
    HttpResponse handle_health(const HttpRequest& request);

    HttpResponse fail(const HttpRequest& request, const core::Result& error) const;
};

}
