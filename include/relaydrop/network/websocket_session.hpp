#pragma once

#include "relaydrop/network/http_types.hpp"
#include "relaydrop/signaling/signaling_hub.hpp"
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <deque>
#include <memory>
#include <optional>
#include <string>

namespace relaydrop::network {

// Server side of /ws/{code}/{role}. Every frame is a JSON text message; writes are
// queued and run on the stream's executor, so send() may be called from any thread.
class WebSocketSession : public signaling::PeerChannel,
                         public std::enable_shared_from_this<WebSocketSession> {
public:
    WebSocketSession(beast::tcp_stream stream, signaling::SignalingHub& hub,
                     std::string code, std::string role);

    void start(HttpRequest request);

    bool send(const nlohmann::json& frame) override;
    void close() override;

private:
    beast::websocket::stream<beast::tcp_stream> ws_;
    signaling::SignalingHub& hub_;
    std::string code_;
    std::string role_name_;
    std::optional<signaling::PeerRole> role_;

    beast::flat_buffer buffer_;
    std::deque<std::string> write_queue_;
    bool write_in_progress_;
    bool close_after_flush_;
    bool registered_;
    std::atomic<bool> closed_;

    void on_accept(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes);
    void do_write();
    void on_write(beast::error_code ec, std::size_t bytes);
    void do_close();
    void finish();
};

}
