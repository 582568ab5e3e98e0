#pragma once

#include "relaydrop/core/result.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace relaydrop::network {

namespace beast = boost::beast;
namespace http = beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;
using RouteParams = std::map<std::string, std::string>;

constexpr const char* SERVER_NAME = "relaydrop";
constexpr const char* CONTENT_TYPE_JSON = "application/json";
constexpr const char* CONTENT_TYPE_BINARY = "application/octet-stream";

HttpResponse json_response(const HttpRequest& request, http::status status, const nlohmann::json& body);
HttpResponse binary_response(const HttpRequest& request, const std::vector<std::uint8_t>& data);

// {"error": category, "reason": not-found reason (when set), "detail": message}
nlohmann::json error_body(const core::Result& error);
HttpResponse error_response(const HttpRequest& request, const core::Result& error);
http::status status_for(core::ErrorCode code);

// Inverse of error_response. Bodies without a recognizable category fall back to
// the status code; 5xx and anything unrecognized become NETWORK_FAILURE.
core::Result result_from_response(const HttpResponse& response);

core::Result parse_json_body(const std::string& body, nlohmann::json& out);

std::vector<std::uint8_t> body_bytes(const std::string& body);

}
