#include "relaydrop/network/relay_service.hpp"
#include "relaydrop/core/logger.hpp"
#include "relaydrop/core/utils.hpp"
#include "relaydrop/core/version.hpp"

namespace relaydrop::network {

using core::ErrorCode;
using core::Result;
using core::utils::StringUtils;
using nlohmann::json;

namespace {

Result parse_chunk_id(const RouteParams& params, std::uint64_t& chunk_id) {
    auto it = params.find("chunk_id");
    auto parsed = it == params.end() ? std::nullopt : StringUtils::parse_uint64(it->second);
    if (!parsed) {
        return Result(ErrorCode::INVALID_INPUT, "Chunk id must be a non-negative integer");
    }
    chunk_id = *parsed;
    return Result();
}

}

RelayService::RelayService(storage::RelayStore& store, std::string host, std::uint16_t port,
                           std::chrono::minutes sweep_interval)
    : store_(store)
    , server_("Relay server", std::move(host), port)
    , sweep_timer_(server_.io_context())
    , sweep_interval_(sweep_interval) {
    register_routes();
}

RelayService::~RelayService() {
    stop();
}

bool RelayService::start() {
    auto result = store_.initialize();
    if (!result) {
        LOG_ERROR("Relay storage unavailable: {}", result.message);
        return false;
    }

    if (!server_.start()) {
        return false;
    }

    if (sweep_interval_.count() > 0) {
        boost::asio::post(server_.io_context(), [this]() { schedule_sweep(); });
    }
    return true;
}

void RelayService::stop() {
    server_.stop();
}

void RelayService::schedule_sweep() {
    sweep_timer_.expires_after(sweep_interval_);
    sweep_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !server_.is_running()) {
            return;
        }

        std::vector<std::string> removed;
        auto result = store_.sweep(removed);
        if (!result) {
            LOG_ERROR("Periodic sweep failed: {}", result.message);
        }
        schedule_sweep();
    });
}

void RelayService::register_routes() {
    using http::verb;

    server_.route(verb::post, "/transfer/create",
        [this](const HttpRequest& req, const RouteParams&) { return handle_create(req); });
    server_.route(verb::post, "/transfer/{transfer_id}/chunk/{chunk_id}",
        [this](const HttpRequest& req, const RouteParams& p) { return handle_upload(req, p); });
    server_.route(verb::get, "/transfer/{transfer_id}/chunk/{chunk_id}",
        [this](const HttpRequest& req, const RouteParams& p) { return handle_download(req, p); });
    server_.route(verb::get, "/transfer/{transfer_id}/manifest",
        [this](const HttpRequest& req, const RouteParams& p) { return handle_manifest(req, p); });
    server_.route(verb::get, "/transfer/{transfer_id}/status",
        [this](const HttpRequest& req, const RouteParams& p) { return handle_status(req, p); });
    server_.route(verb::delete_, "/transfer/{transfer_id}",
        [this](const HttpRequest& req, const RouteParams& p) { return handle_delete(req, p); });
    server_.route(verb::get, "/cleanup",
        [this](const HttpRequest& req, const RouteParams&) { return handle_cleanup(req); });
    server_.route(verb::get, "/",
        [this](const HttpRequest& req, const RouteParams&) { return handle_health(req); });
}

HttpResponse RelayService::fail(const HttpRequest& request, const Result& error) const {
    if (error.error == ErrorCode::NOT_FOUND) {
        LOG_DEBUG("{} {}: {}", std::string(request.method_string()), std::string(request.target()), error.message);
    } else {
        LOG_WARN("{} {} failed ({}): {}", std::string(request.method_string()), std::string(request.target()),
                 core::to_string(error.error), error.message);
    }
    return error_response(request, error);
}

HttpResponse RelayService::handle_create(const HttpRequest& request) {
    json body;
    auto result = parse_json_body(request.body(), body);
    if (!result) {
        return fail(request, result);
    }

    if (!body.contains("transfer_id") || !body["transfer_id"].is_string() || !body.contains("manifest")) {
        return fail(request, Result(ErrorCode::INVALID_INPUT, "Expected {transfer_id, manifest}"));
    }
    auto transfer_id = body["transfer_id"].get<std::string>();

    // The manifest may arrive as an object or as its serialized text.
    json manifest_json = body["manifest"];
    if (manifest_json.is_string()) {
        result = parse_json_body(manifest_json.get<std::string>(), manifest_json);
        if (!result) {
            return fail(request, result);
        }
    }

    storage::Manifest manifest;
    result = storage::from_json(manifest_json, manifest);
    if (!result) {
        return fail(request, result);
    }

    result = store_.create(transfer_id, manifest);
    if (!result) {
        return fail(request, result);
    }

    return json_response(request, http::status::ok, {
        {"status", "created"},
        {"transfer_id", transfer_id},
        {"total_chunks", storage::total_chunks(manifest)}
    });
}

HttpResponse RelayService::handle_upload(const HttpRequest& request, const RouteParams& params) {
    std::uint64_t chunk_id = 0;
    auto result = parse_chunk_id(params, chunk_id);
    if (!result) {
        return fail(request, result);
    }

    storage::StoredChunk stored;
    result = store_.put_chunk(params.at("transfer_id"), chunk_id, body_bytes(request.body()), stored);
    if (!result) {
        return fail(request, result);
    }

    return json_response(request, http::status::ok, {
        {"status", "uploaded"},
        {"chunk_id", chunk_id},
        {"hash", stored.hash},
        {"size", stored.size}
    });
}

HttpResponse RelayService::handle_download(const HttpRequest& request, const RouteParams& params) {
    std::uint64_t chunk_id = 0;
    auto result = parse_chunk_id(params, chunk_id);
    if (!result) {
        return fail(request, result);
    }

    std::vector<std::uint8_t> data;
    result = store_.get_chunk(params.at("transfer_id"), chunk_id, data);
    if (!result) {
        return fail(request, result);
    }
    return binary_response(request, data);
}

HttpResponse RelayService::handle_manifest(const HttpRequest& request, const RouteParams& params) {
    storage::Manifest manifest;
    auto result = store_.get_manifest(params.at("transfer_id"), manifest);
    if (!result) {
        return fail(request, result);
    }
    return json_response(request, http::status::ok, storage::to_json(manifest));
}

HttpResponse RelayService::handle_status(const HttpRequest& request, const RouteParams& params) {
    storage::RelayStatus status;
    auto result = store_.status(params.at("transfer_id"), status);
    if (!result) {
        return fail(request, result);
    }

    return json_response(request, http::status::ok, {
        {"transfer_id", status.transfer_id},
        {"total_chunks", status.total_chunks},
        {"uploaded_chunks", status.uploaded_chunks},
        {"progress", status.progress},
        {"available_chunks", status.available_chunks},
        {"complete", status.complete}
    });
}

HttpResponse RelayService::handle_delete(const HttpRequest& request, const RouteParams& params) {
    const auto& transfer_id = params.at("transfer_id");
    auto result = store_.remove(transfer_id);
    if (!result) {
        return fail(request, result);
    }
    return json_response(request, http::status::ok, {{"status", "deleted"}, {"transfer_id", transfer_id}});
}

HttpResponse RelayService::handle_cleanup(const HttpRequest& request) {
    std::vector<std::string> removed;
    auto result = store_.sweep(removed);
    if (!result) {
        return fail(request, result);
    }

    return json_response(request, http::status::ok, {
        {"status", "cleaned"},
        {"deleted_count", removed.size()},
        {"deleted_transfers", removed}
    });
}

HttpResponse RelayService::handle_health(const HttpRequest& request) {
    return json_response(request, http::status::ok, {
        {"service", "RelayDrop Relay Server"},
        {"status", "running"},
        {"version", core::VERSION}
    });
}

}
