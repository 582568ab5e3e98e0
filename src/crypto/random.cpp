#include "relaydrop/crypto/random.hpp"
#include "relaydrop/core/logger.hpp"
#include <sodium.h>
#include <array>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace relaydrop::crypto {

namespace {

std::once_flag init_flag;
bool init_ok = false;

void require_initialized() {
    if (!SecureRandom::initialize()) {
        throw std::runtime_error("libsodium could not be initialized");
    }
}

}

bool SecureRandom::initialize() {
    std::call_once(init_flag, []() {
        if (sodium_init() < 0) {
            LOG_CRITICAL("Failed to initialize libsodium");
            return;
        }
        init_ok = true;
        LOG_DEBUG("Cryptographic random number generator initialized");
    });
    return init_ok;
}

std::uint32_t SecureRandom::generate_uint32() {
    require_initialized();
    return randombytes_random();
}

std::uint32_t SecureRandom::generate_uniform(std::uint32_t upper_bound) {
    require_initialized();
    return randombytes_uniform(upper_bound);
}

std::vector<std::uint8_t> SecureRandom::generate_bytes(std::size_t count) {
    require_initialized();

    std::vector<std::uint8_t> bytes(count);
    randombytes_buf(bytes.data(), bytes.size());
    return bytes;
}

std::string SecureRandom::generate_digits(std::size_t digit_count) {
    require_initialized();

    std::string digits;
    digits.reserve(digit_count);
    for (std::size_t i = 0; i < digit_count; ++i) {
        digits.push_back(static_cast<char>('0' + randombytes_uniform(10)));
    }
    return digits;
}

std::string SecureRandom::generate_hex(std::size_t byte_count) {
    require_initialized();

    std::vector<unsigned char> bytes(byte_count);
    randombytes_buf(bytes.data(), bytes.size());

    std::string hex(byte_count * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    hex.pop_back();
    return hex;
}

std::string SecureRandom::generate_uuid() {
    require_initialized();

    std::array<unsigned char, 16> bytes;
    randombytes_buf(bytes.data(), bytes.size());
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

    std::array<char, 33> hex{};
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());

    std::string text(hex.data(), 32);
    return text.substr(0, 8) + "-" + text.substr(8, 4) + "-" + text.substr(12, 4) + "-" +
           text.substr(16, 4) + "-" + text.substr(20, 12);
}

}
