#include "relaydrop/network/http_server.hpp"
#include "relaydrop/core/logger.hpp"
#include <boost/beast/websocket.hpp>
#include <optional>

namespace relaydrop::network {

using core::ErrorCode;
using core::Result;

class HttpServer::Session : public std::enable_shared_from_this<HttpServer::Session> {
public:
    Session(HttpServer& server, tcp::socket socket)
        : server_(server), stream_(std::move(socket)) {}

    void start() {
        do_read();
    }

private:
    HttpServer& server_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<HttpResponse> response_;

    void do_read() {
        parser_.emplace();
        parser_->body_limit(server_.body_limit_);
        stream_.expires_after(server_.idle_timeout_);

        http::async_read(stream_, buffer_, *parser_,
            beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            do_close();
            return;
        }
        if (ec) {
            if (ec != beast::error::timeout && ec != boost::asio::error::operation_aborted) {
                LOG_DEBUG("{}: read failed: {}", server_.name_, ec.message());
            }
            return;
        }

        auto request = parser_->release();

        if (beast::websocket::is_upgrade(request)) {
            stream_.expires_never();
            if (server_.try_upgrade(stream_, request)) {
                return;
            }
            LOG_WARN("{}: no WebSocket route for {}", server_.name_, std::string(request.target()));
            write(error_response(request, Result(ErrorCode::NOT_FOUND, "No WebSocket endpoint here")));
            return;
        }

        write(server_.dispatch(request));
    }

    void write(HttpResponse response) {
        response_ = std::make_shared<HttpResponse>(std::move(response));
        http::async_write(stream_, *response_,
            beast::bind_front_handler(&Session::on_write, shared_from_this(), response_->need_eof()));
    }

    void on_write(bool close, beast::error_code ec, std::size_t) {
        response_.reset();
        if (ec) {
            LOG_DEBUG("{}: write failed: {}", server_.name_, ec.message());
            return;
        }
        if (close) {
            do_close();
            return;
        }
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }
};

HttpServer::HttpServer(std::string name, std::string host, std::uint16_t port)
    : name_(std::move(name))
    , host_(std::move(host))
    , port_(port)
    , bound_port_(0)
    , running_(false)
    , body_limit_(DEFAULT_BODY_LIMIT)
    , idle_timeout_(std::chrono::seconds(60))
    , io_context_()
    , acceptor_(io_context_) {
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(http::verb method, const std::string& pattern, RouteHandler handler) {
    routes_.push_back({method, split_path(pattern), std::move(handler)});
}

void HttpServer::websocket(const std::string& pattern, UpgradeHandler handler) {
    upgrade_routes_.push_back({split_path(pattern), std::move(handler)});
}

bool HttpServer::start() {
    if (running_) {
        LOG_WARN("{} already running", name_);
        return false;
    }

    try {
        tcp::endpoint endpoint(boost::asio::ip::make_address(host_), port_);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        bound_port_ = acceptor_.local_endpoint().port();
    } catch (const boost::system::system_error& e) {
        LOG_ERROR("Failed to start {} on {}:{}: {}", name_, host_, port_, e.what());
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        return false;
    }

    running_ = true;
    io_context_.restart();
    do_accept();

    server_thread_ = std::thread([this]() {
        LOG_INFO("{} listening on {}:{}", name_, host_, bound_port_);

        while (running_) {
            try {
                io_context_.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("{} IO context error: {}", name_, e.what());
                if (!running_) break;

                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                io_context_.restart();
            }
        }

        LOG_INFO("{} stopped", name_);
    });

    return true;
}

void HttpServer::stop() {
    if (!running_) {
        return;
    }

    LOG_INFO("Stopping {} on port {}", name_, bound_port_);
    running_ = false;
    io_context_.stop();

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    boost::system::error_code ec;
    acceptor_.close(ec);
}

void HttpServer::do_accept() {
    if (!running_) {
        return;
    }

    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!ec && running_) {
                std::make_shared<Session>(*this, std::move(socket))->start();
            } else if (ec && ec != boost::asio::error::operation_aborted) {
                LOG_ERROR("{} accept error: {}", name_, ec.message());
            }

            do_accept();
        });
}

HttpResponse HttpServer::dispatch(const HttpRequest& request) const {
    auto path = split_path(std::string(request.target()));

    bool path_matched = false;
    for (const auto& route : routes_) {
        RouteParams params;
        if (!match(route.segments, path, params)) {
            continue;
        }
        path_matched = true;
        if (route.method != request.method()) {
            continue;
        }

        try {
            return route.handler(request, params);
        } catch (const std::exception& e) {
            LOG_ERROR("{}: handler for {} {} threw: {}", name_,
                      std::string(request.method_string()), std::string(request.target()), e.what());
            return error_response(request, Result(ErrorCode::IO_FAILURE, "Internal server error"));
        }
    }

    if (path_matched) {
        return json_response(request, http::status::method_not_allowed,
                             error_body(Result(ErrorCode::INVALID_INPUT, "Method not allowed")));
    }

    LOG_DEBUG("{}: no route for {} {}", name_, std::string(request.method_string()), std::string(request.target()));
    return error_response(request, Result(ErrorCode::NOT_FOUND, "Not found: " + std::string(request.target())));
}

bool HttpServer::try_upgrade(beast::tcp_stream& stream, HttpRequest& request) {
    auto path = split_path(std::string(request.target()));
    for (const auto& route : upgrade_routes_) {
        RouteParams params;
        if (match(route.segments, path, params)) {
            route.handler(std::move(stream), std::move(request), params);
            return true;
        }
    }
    return false;
}

std::vector<std::string> HttpServer::split_path(const std::string& target) {
    auto path = target.substr(0, target.find('?'));

    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        if (end > start) {
            segments.push_back(path.substr(start, end - start));
        }
        start = end + 1;
    }
    return segments;
}

bool HttpServer::match(const std::vector<std::string>& pattern,
                       const std::vector<std::string>& path,
                       RouteParams& params) {
    if (pattern.size() != path.size()) {
        return false;
    }

    for (std::size_t i = 0; i < pattern.size(); ++i) {
        const auto& segment = pattern[i];
        if (segment.size() > 2 && segment.front() == '{' && segment.back() == '}') {
            params[segment.substr(1, segment.size() - 2)] = path[i];
        } else if (segment != path[i]) {
            return false;
        }
    }
    return true;
}

}
