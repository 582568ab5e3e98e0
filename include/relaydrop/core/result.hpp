#pragma once

#include <optional>
#include <string>
#include <utility>

namespace relaydrop::core {

// Error categories shared by every module and carried over the wire by name.
enum class ErrorCode {
    SUCCESS = 0,
    NOT_FOUND,
    INVALID_INPUT,
    INVALID_PATH,
    IO_FAILURE,
    MANIFEST_CORRUPT,
    HASH_MISMATCH,
    NETWORK_FAILURE,
    EXHAUSTED
};

// Distinguishes NOT_FOUND cases where the caller's next step differs.
enum class NotFoundReason {
    NONE = 0,
    TRANSFER_UNKNOWN,
    CHUNK_PENDING,
    PAIR_CODE_UNKNOWN,
    FILE_MISSING
};

struct Result {
    ErrorCode error;
    std::string message;
    NotFoundReason reason;

    Result(ErrorCode err = ErrorCode::SUCCESS, std::string msg = "",
           NotFoundReason why = NotFoundReason::NONE)
        : error(err), message(std::move(msg)), reason(why) {}

    static Result not_found(NotFoundReason why, std::string msg) {
        return Result(ErrorCode::NOT_FOUND, std::move(msg), why);
    }

    bool success() const { return error == ErrorCode::SUCCESS; }
    operator bool() const { return success(); }

    // Transient failures: dropped connections and chunks the sender has not uploaded yet.
    bool is_retryable() const {
        return error == ErrorCode::NETWORK_FAILURE ||
               (error == ErrorCode::NOT_FOUND && reason == NotFoundReason::CHUNK_PENDING);
    }
};

const char* to_string(ErrorCode code);
const char* to_string(NotFoundReason reason);

std::optional<ErrorCode> error_code_from_string(const std::string& name);
NotFoundReason not_found_reason_from_string(const std::string& name);

}
