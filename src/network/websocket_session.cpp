#include "relaydrop/network/websocket_session.hpp"
#include "relaydrop/core/logger.hpp"
#include <boost/asio/post.hpp>

namespace relaydrop::network {

namespace websocket = beast::websocket;
using nlohmann::json;

WebSocketSession::WebSocketSession(beast::tcp_stream stream, signaling::SignalingHub& hub,
                                   std::string code, std::string role)
    : ws_(std::move(stream))
    , hub_(hub)
    , code_(std::move(code))
    , role_name_(std::move(role))
    , role_(signaling::parse_peer_role(role_name_))
    , write_in_progress_(false)
    , close_after_flush_(false)
    , registered_(false)
    , closed_(false) {
}

void WebSocketSession::start(HttpRequest request) {
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& response) {
        response.set(http::field::server, SERVER_NAME);
    }));

    ws_.async_accept(request, beast::bind_front_handler(&WebSocketSession::on_accept, shared_from_this()));
}

void WebSocketSession::on_accept(beast::error_code ec) {
    if (ec) {
        LOG_WARN("WebSocket handshake for pair code {} failed: {}", code_, ec.message());
        closed_ = true;
        return;
    }

    auto result = hub_.connect(code_, role_name_, shared_from_this());
    if (!result) {
        LOG_INFO("Rejected {} connection to pair code {}: {}", role_name_, code_, result.message);
        return;
    }

    registered_ = true;
    do_read();
}

void WebSocketSession::do_read() {
    ws_.async_read(buffer_, beast::bind_front_handler(&WebSocketSession::on_read, shared_from_this()));
}

void WebSocketSession::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        if (ec != websocket::error::closed) {
            LOG_DEBUG("Pair code {} {} read ended: {}", code_, role_name_, ec.message());
        }
        finish();
        return;
    }

    auto text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());

    auto message = json::parse(text, nullptr, false);
    if (message.is_discarded()) {
        send(signaling::frames::error("Invalid JSON message"));
    } else if (role_) {
        auto result = hub_.relay(code_, *role_, message);
        if (!result) {
            LOG_DEBUG("Pair code {}: relay from {} not delivered: {}", code_, role_name_, result.message);
        }
    }

    do_read();
}

bool WebSocketSession::send(const json& frame) {
    if (closed_) {
        return false;
    }

    auto text = std::make_shared<std::string>(frame.dump());
    boost::asio::post(ws_.get_executor(), [self = shared_from_this(), text]() {
        if (self->closed_) {
            return;
        }
        self->write_queue_.push_back(std::move(*text));
        if (!self->write_in_progress_) {
            self->do_write();
        }
    });
    return true;
}

void WebSocketSession::close() {
    boost::asio::post(ws_.get_executor(), [self = shared_from_this()]() {
        self->close_after_flush_ = true;
        if (!self->write_in_progress_) {
            self->do_close();
        }
    });
}

void WebSocketSession::do_write() {
    if (write_queue_.empty()) {
        write_in_progress_ = false;
        if (close_after_flush_) {
            do_close();
        }
        return;
    }

    write_in_progress_ = true;
    ws_.text(true);
    ws_.async_write(boost::asio::buffer(write_queue_.front()),
        beast::bind_front_handler(&WebSocketSession::on_write, shared_from_this()));
}

void WebSocketSession::on_write(beast::error_code ec, std::size_t) {
    if (ec) {
        LOG_DEBUG("Pair code {} {} write failed: {}", code_, role_name_, ec.message());
        write_in_progress_ = false;
        write_queue_.clear();
        closed_ = true;
        return;
    }

    write_queue_.pop_front();
    do_write();
}

void WebSocketSession::do_close() {
    if (closed_.exchange(true)) {
        return;
    }

    ws_.async_close(websocket::close_code::normal, [self = shared_from_this()](beast::error_code ec) {
        if (ec) {
            LOG_DEBUG("Pair code {} {} close: {}", self->code_, self->role_name_, ec.message());
        }
    });
}

void WebSocketSession::finish() {
    closed_ = true;
    if (registered_ && role_) {
        registered_ = false;
        hub_.disconnect(code_, *role_, shared_from_this());
    }
}

}
