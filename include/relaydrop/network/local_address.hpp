#pragma once

#include <string>

namespace relaydrop::network {

// Address of the interface that routes to the outside world, found by connecting
// a UDP socket (no datagram is sent) and reading its local endpoint. Falls back to
// 127.0.0.1 when there is no route.
std::string discover_local_address(const std::string& probe_host = "8.8.8.8", unsigned short probe_port = 80);

}
