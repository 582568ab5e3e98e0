#pragma once

#include "relaydrop/network/http_types.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace relaydrop::network {

using boost::asio::ip::tcp;

using RouteHandler = std::function<HttpResponse(const HttpRequest&, const RouteParams&)>;

// Takes ownership of the stream after a WebSocket upgrade request matched its route.
using UpgradeHandler = std::function<void(beast::tcp_stream, HttpRequest, const RouteParams&)>;

// Small HTTP/1.1 server: one io_context on a dedicated thread, routes matched by
// method and path pattern where "{name}" segments capture into RouteParams.
class HttpServer {
public:
    static constexpr std::size_t DEFAULT_BODY_LIMIT = 80 * 1024 * 1024;

    HttpServer(std::string name, std::string host, std::uint16_t port);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void route(http::verb method, const std::string& pattern, RouteHandler handler);
    void websocket(const std::string& pattern, UpgradeHandler handler);

    bool start();
    void stop();

    bool is_running() const { return running_; }

    // The bound port, which differs from the requested one when that was 0.
    std::uint16_t port() const { return bound_port_; }

    boost::asio::io_context& io_context() { return io_context_; }

    void set_body_limit(std::size_t limit) { body_limit_ = limit; }
    void set_idle_timeout(std::chrono::seconds timeout) { idle_timeout_ = timeout; }

    HttpResponse dispatch(const HttpRequest& request) const;

private:
    class Session;

    struct Route {
        http::verb method;
        std::vector<std::string> segments;
        RouteHandler handler;
    };

    struct UpgradeRoute {
        std::vector<std::string> segments;
        UpgradeHandler handler;
    };

    std::string name_;
    std::string host_;
    std::uint16_t port_;
    std::uint16_t bound_port_;
    std::atomic<bool> running_;
    std::size_t body_limit_;
    std::chrono::seconds idle_timeout_;

    boost::asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::thread server_thread_;

    std::vector<Route> routes_;
    std::vector<UpgradeRoute> upgrade_routes_;

    void do_accept();
    bool try_upgrade(beast::tcp_stream& stream, HttpRequest& request);

    static std::vector<std::string> split_path(const std::string& target);
    static bool match(const std::vector<std::string>& pattern,
                      const std::vector<std::string>& path,
                      RouteParams& params);
};

}
