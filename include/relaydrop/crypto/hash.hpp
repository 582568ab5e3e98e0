#pragma once

#include "relaydrop/core/result.hpp"
#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace relaydrop::crypto {

constexpr size_t SHA256_DIGEST_SIZE = 32;

using Sha256Digest = std::array<std::uint8_t, SHA256_DIGEST_SIZE>;

// Incremental SHA-256 over libsodium's crypto_hash_sha256 state.
class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    core::Result initialize();
    core::Result update(std::span<const std::uint8_t> data);
    core::Result finalize(std::span<std::uint8_t> output);
    Sha256Digest finalize();

    static Sha256Digest hash(std::span<const std::uint8_t> data);
    static core::Result hash_file(const std::filesystem::path& file_path, Sha256Digest& output);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool initialized_;
};

namespace hash_utils {

std::string hash_to_hex(const Sha256Digest& hash);
std::optional<Sha256Digest> hash_from_hex(const std::string& hex_string);

std::string hex_digest(std::span<const std::uint8_t> data);
std::string hex_digest(const std::vector<std::uint8_t>& data);

}

}
