#pragma once

#include "relaydrop/network/http_server.hpp"
#include "relaydrop/storage/chunk_layout.hpp"
#include "relaydrop/storage/chunk_manager.hpp"
#include "relaydrop/storage/manifest.hpp"
#include <string>
#include <vector>

namespace relaydrop::network {

// Read-only endpoint that serves one manifest and slices its chunks on demand from
// the sender's local files:
//   GET /manifest
//   GET /chunk/{chunk_id}                    (global id; a folder is resolved through its layout)
//   GET /file/{file_index}/chunk/{chunk_id}  (id local to that file)
class LanServer {
public:
    static constexpr std::uint16_t DEFAULT_PORT = 9000;

    explicit LanServer(storage::Manifest manifest,
                       std::string host = "0.0.0.0",
                       std::uint16_t port = DEFAULT_PORT);
    ~LanServer();

    bool start();
    void stop();

    bool is_running() const { return server_.is_running(); }
    std::uint16_t port() const { return server_.port(); }

    // http://<discovered address>:<port>, for handing to the receiver.
    std::string advertised_url() const;

    const storage::Manifest& manifest() const { return manifest_; }

private:
    storage::Manifest manifest_;
    std::vector<storage::FileChunkRange> layout_;
    storage::ChunkManager chunks_;
    HttpServer server_;

    HttpResponse handle_manifest(const HttpRequest& request);
    HttpResponse handle_chunk(const HttpRequest& request, const RouteParams& params);
    HttpResponse handle_file_chunk(const HttpRequest& request, const RouteParams& params);

    HttpResponse serve(const HttpRequest& request, std::size_t file_index, std::uint64_t local_id);
    const storage::FileManifest& file_at(std::size_t file_index) const;
};

}
