#include "relaydrop/network/lan_server.hpp"
#include "relaydrop/core/logger.hpp"
#include "relaydrop/core/utils.hpp"
#include "relaydrop/network/local_address.hpp"

namespace relaydrop::network {

using core::ErrorCode;
using core::NotFoundReason;
using core::Result;
using core::utils::StringUtils;

LanServer::LanServer(storage::Manifest manifest, std::string host, std::uint16_t port)
    : manifest_(std::move(manifest))
    , layout_(storage::flatten_chunk_layout(manifest_))
    , chunks_(storage::chunk_size(manifest_))
    , server_("LAN server", std::move(host), port) {
    server_.route(http::verb::get, "/manifest",
        [this](const HttpRequest& req, const RouteParams&) { return handle_manifest(req); });
    server_.route(http::verb::get, "/chunk/{chunk_id}",
        [this](const HttpRequest& req, const RouteParams& p) { return handle_chunk(req, p); });
    server_.route(http::verb::get, "/file/{file_index}/chunk/{chunk_id}",
        [this](const HttpRequest& req, const RouteParams& p) { return handle_file_chunk(req, p); });
}

LanServer::~LanServer() {
    stop();
}

bool LanServer::start() {
    if (!server_.start()) {
        return false;
    }
    LOG_INFO("Serving {} on the LAN at {}", storage::display_name(manifest_), advertised_url());
    return true;
}

void LanServer::stop() {
    server_.stop();
}

std::string LanServer::advertised_url() const {
    return "http://" + discover_local_address() + ":" + std::to_string(server_.port());
}

const storage::FileManifest& LanServer::file_at(std::size_t file_index) const {
    if (const auto* folder = std::get_if<storage::FolderManifest>(&manifest_)) {
        return folder->files[file_index];
    }
    return std::get<storage::FileManifest>(manifest_);
}

HttpResponse LanServer::handle_manifest(const HttpRequest& request) {
    return json_response(request, http::status::ok, storage::to_json(manifest_));
}

HttpResponse LanServer::handle_chunk(const HttpRequest& request, const RouteParams& params) {
    auto chunk_id = StringUtils::parse_uint64(params.at("chunk_id"));
    if (!chunk_id) {
        return error_response(request, Result(ErrorCode::INVALID_INPUT, "Chunk id must be a non-negative integer"));
    }

    auto address = storage::locate_chunk(layout_, *chunk_id);
    if (!address) {
        return error_response(request, Result(ErrorCode::NOT_FOUND,
                                              "No chunk " + std::to_string(*chunk_id)));
    }
    return serve(request, address->file_index.value_or(0), address->local_id);
}

HttpResponse LanServer::handle_file_chunk(const HttpRequest& request, const RouteParams& params) {
    auto file_index = StringUtils::parse_uint64(params.at("file_index"));
    auto chunk_id = StringUtils::parse_uint64(params.at("chunk_id"));
    if (!file_index || !chunk_id) {
        return error_response(request, Result(ErrorCode::INVALID_INPUT, "File index and chunk id must be integers"));
    }
    if (*file_index >= layout_.size()) {
        return error_response(request, Result::not_found(NotFoundReason::FILE_MISSING,
                                                         "No file " + std::to_string(*file_index)));
    }
    if (*chunk_id >= layout_[*file_index].chunk_count) {
        return error_response(request, Result(ErrorCode::NOT_FOUND,
                                              "No chunk " + std::to_string(*chunk_id)));
    }
    return serve(request, static_cast<std::size_t>(*file_index), *chunk_id);
}

HttpResponse LanServer::serve(const HttpRequest& request, std::size_t file_index, std::uint64_t local_id) {
    const auto& file = file_at(file_index);

    std::vector<std::uint8_t> data;
    auto result = chunks_.read_chunk(file.file_path, local_id, data);
    if (!result) {
        LOG_ERROR("LAN read of chunk {} from {} failed: {}", local_id, file.file_path, result.message);
        return error_response(request, result);
    }
    return binary_response(request, data);
}

}
