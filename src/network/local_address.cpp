#include "relaydrop/network/local_address.hpp"
#include "relaydrop/core/logger.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

namespace relaydrop::network {

using boost::asio::ip::udp;

std::string discover_local_address(const std::string& probe_host, unsigned short probe_port) {
    boost::asio::io_context io_context;
    udp::socket socket(io_context);

    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(probe_host, ec);
    if (!ec) {
        socket.open(address.is_v4() ? udp::v4() : udp::v6(), ec);
    }
    if (!ec) {
        socket.connect(udp::endpoint(address, probe_port), ec);
    }

    udp::endpoint local;
    if (!ec) {
        local = socket.local_endpoint(ec);
    }

    if (ec || local.address().is_unspecified()) {
        LOG_DEBUG("Local address discovery failed ({}), using loopback", ec ? ec.message() : "unspecified address");
        return "127.0.0.1";
    }
    return local.address().to_string();
}

}
