#include "relaydrop/core/result.hpp"
#include <array>
#include <utility>

namespace relaydrop::core {

namespace {

constexpr std::array<std::pair<ErrorCode, const char*>, 9> kErrorNames{{
    {ErrorCode::SUCCESS, "success"},
    {ErrorCode::NOT_FOUND, "not_found"},
    {ErrorCode::INVALID_INPUT, "invalid_input"},
    {ErrorCode::INVALID_PATH, "invalid_path"},
    {ErrorCode::IO_FAILURE, "io_failure"},
    {ErrorCode::MANIFEST_CORRUPT, "manifest_corrupt"},
    {ErrorCode::HASH_MISMATCH, "hash_mismatch"},
    {ErrorCode::NETWORK_FAILURE, "network_failure"},
    {ErrorCode::EXHAUSTED, "exhausted"},
}};

constexpr std::array<std::pair<NotFoundReason, const char*>, 5> kReasonNames{{
    {NotFoundReason::NONE, ""},
    {NotFoundReason::TRANSFER_UNKNOWN, "transfer_unknown"},
    {NotFoundReason::CHUNK_PENDING, "chunk_pending"},
    {NotFoundReason::PAIR_CODE_UNKNOWN, "pair_code_unknown"},
    {NotFoundReason::FILE_MISSING, "file_missing"},
}};

}

const char* to_string(ErrorCode code) {
    for (const auto& [value, name] : kErrorNames) {
        if (value == code) {
            return name;
        }
    }
    return "unknown";
}

const char* to_string(NotFoundReason reason) {
    for (const auto& [value, name] : kReasonNames) {
        if (value == reason) {
            return name;
        }
    }
    return "";
}

std::optional<ErrorCode> error_code_from_string(const std::string& name) {
    for (const auto& [value, text] : kErrorNames) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

NotFoundReason not_found_reason_from_string(const std::string& name) {
    if (name.empty()) {
        return NotFoundReason::NONE;
    }
    for (const auto& [value, text] : kReasonNames) {
        if (name == text) {
            return value;
        }
    }
    return NotFoundReason::NONE;
}

}
