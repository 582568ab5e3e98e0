#include "relaydrop/network/http_types.hpp"

namespace relaydrop::network {

using core::ErrorCode;
using core::NotFoundReason;
using core::Result;
using nlohmann::json;

HttpResponse json_response(const HttpRequest& request, http::status status, const json& body) {
    HttpResponse response{status, request.version()};
    response.set(http::field::server, SERVER_NAME);
    response.set(http::field::content_type, CONTENT_TYPE_JSON);
    response.keep_alive(request.keep_alive());
    response.body() = body.dump();
    response.prepare_payload();
    return response;
}

HttpResponse binary_response(const HttpRequest& request, const std::vector<std::uint8_t>& data) {
    HttpResponse response{http::status::ok, request.version()};
    response.set(http::field::server, SERVER_NAME);
    response.set(http::field::content_type, CONTENT_TYPE_BINARY);
    response.keep_alive(request.keep_alive());
    response.body().assign(reinterpret_cast<const char*>(data.data()), data.size());
    response.prepare_payload();
    return response;
}

http::status status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return http::status::ok;
        case ErrorCode::NOT_FOUND: return http::status::not_found;
        case ErrorCode::INVALID_INPUT:
        case ErrorCode::INVALID_PATH: return http::status::bad_request;
        case ErrorCode::HASH_MISMATCH: return http::status::conflict;
        default: return http::status::internal_server_error;
    }
}

json error_body(const Result& error) {
    json body = {
        {"error", core::to_string(error.error)},
        {"detail", error.message}
    };
    if (error.reason != NotFoundReason::NONE) {
        body["reason"] = core::to_string(error.reason);
    }
    return body;
}

HttpResponse error_response(const HttpRequest& request, const Result& error) {
    return json_response(request, status_for(error.error), error_body(error));
}

Result result_from_response(const HttpResponse& response) {
    auto status = response.result_int();
    if (status >= 200 && status < 300) {
        return Result();
    }

    std::string detail = "HTTP " + std::to_string(status);
    auto body = json::parse(response.body(), nullptr, false);
    if (body.is_object()) {
        detail = body.value("detail", detail);
        auto category = body.contains("error") && body["error"].is_string()
            ? core::error_code_from_string(body["error"].get<std::string>())
            : std::nullopt;
        if (category && *category != ErrorCode::SUCCESS) {
            auto reason = NotFoundReason::NONE;
            if (body.contains("reason") && body["reason"].is_string()) {
                reason = core::not_found_reason_from_string(body["reason"].get<std::string>());
            }
            return Result(*category, detail, reason);
        }
    }

    if (status == 404) {
        return Result(ErrorCode::NOT_FOUND, detail);
    }
    if (status == 400) {
        return Result(ErrorCode::INVALID_INPUT, detail);
    }
    return Result(ErrorCode::NETWORK_FAILURE, detail);
}

Result parse_json_body(const std::string& body, json& out) {
    try {
        out = json::parse(body);
    } catch (const json::parse_error& e) {
        return Result(ErrorCode::INVALID_INPUT, std::string("Malformed JSON: ") + e.what());
    }
    if (!out.is_object()) {
        return Result(ErrorCode::INVALID_INPUT, "Expected a JSON object");
    }
    return Result();
}

std::vector<std::uint8_t> body_bytes(const std::string& body) {
    return std::vector<std::uint8_t>(body.begin(), body.end());
}

}
