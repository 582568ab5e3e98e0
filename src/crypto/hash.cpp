#include "relaydrop/crypto/hash.hpp"
#include "relaydrop/core/logger.hpp"
#include <sodium.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace relaydrop::crypto {

using core::ErrorCode;
using core::Result;

struct Sha256Hasher::Impl {
    crypto_hash_sha256_state state;
};

Sha256Hasher::Sha256Hasher()
    : impl_(std::make_unique<Impl>())
    , initialized_(false) {
}

Sha256Hasher::~Sha256Hasher() = default;

Result Sha256Hasher::initialize() {
    if (crypto_hash_sha256_init(&impl_->state) != 0) {
        return Result(ErrorCode::IO_FAILURE, "Failed to initialize SHA-256 state");
    }

    initialized_ = true;
    return Result();
}

Result Sha256Hasher::update(std::span<const std::uint8_t> data) {
    if (!initialized_) {
        return Result(ErrorCode::INVALID_INPUT, "Hasher not initialized");
    }

    if (crypto_hash_sha256_update(&impl_->state, data.data(), data.size()) != 0) {
        return Result(ErrorCode::IO_FAILURE, "Failed to update hash");
    }

    return Result();
}

Result Sha256Hasher::finalize(std::span<std::uint8_t> output) {
    if (!initialized_) {
        return Result(ErrorCode::INVALID_INPUT, "Hasher not initialized");
    }

    if (output.size() < SHA256_DIGEST_SIZE) {
        return Result(ErrorCode::INVALID_INPUT, "Output buffer too small");
    }

    if (crypto_hash_sha256_final(&impl_->state, output.data()) != 0) {
        return Result(ErrorCode::IO_FAILURE, "Failed to finalize hash");
    }

    initialized_ = false; // Hasher is consumed
    return Result();
}

Sha256Digest Sha256Hasher::finalize() {
    Sha256Digest result;
    auto status = finalize(std::span(result));
    if (!status.success()) {
        throw std::runtime_error("Failed to finalize hash: " + status.message);
    }
    return result;
}

Sha256Digest Sha256Hasher::hash(std::span<const std::uint8_t> data) {
    Sha256Digest result;
    crypto_hash_sha256(result.data(), data.data(), data.size());
    return result;
}

Result Sha256Hasher::hash_file(const std::filesystem::path& file_path, Sha256Digest& output) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return Result(ErrorCode::IO_FAILURE, "Cannot open file for hashing: " + file_path.string());
    }

    Sha256Hasher hasher;
    auto result = hasher.initialize();
    if (!result.success()) {
        return result;
    }

    constexpr size_t buffer_size = 65536;
    std::vector<std::uint8_t> buffer(buffer_size);

    while (file.good()) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer_size);
        size_t bytes_read = static_cast<size_t>(file.gcount());

        if (bytes_read > 0) {
            result = hasher.update(std::span(buffer.data(), bytes_read));
            if (!result.success()) {
                return result;
            }
        }
    }

    if (file.bad()) {
        LOG_ERROR("Read error while hashing {}", file_path.string());
        return Result(ErrorCode::IO_FAILURE, "Read error while hashing: " + file_path.string());
    }

    return hasher.finalize(std::span(output));
}

namespace hash_utils {

std::string hash_to_hex(const Sha256Digest& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : hash) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::optional<Sha256Digest> hash_from_hex(const std::string& hex_string) {
    if (hex_string.length() != SHA256_DIGEST_SIZE * 2) {
        return std::nullopt;
    }

    Sha256Digest hash;
    size_t bin_len = 0;
    if (sodium_hex2bin(hash.data(), hash.size(), hex_string.data(), hex_string.size(),
                       nullptr, &bin_len, nullptr) != 0 || bin_len != hash.size()) {
        return std::nullopt;
    }

    return hash;
}

std::string hex_digest(std::span<const std::uint8_t> data) {
    return hash_to_hex(Sha256Hasher::hash(data));
}

std::string hex_digest(const std::vector<std::uint8_t>& data) {
    return hex_digest(std::span<const std::uint8_t>(data.data(), data.size()));
}

}

}
