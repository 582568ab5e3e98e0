#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace relaydrop::crypto {

class SecureRandom {
public:
    // Initializes libsodium once per process; safe to call from any thread.
    static bool initialize();

    static std::uint32_t generate_uint32();
    static std::uint32_t generate_uniform(std::uint32_t upper_bound);

    static std::vector<std::uint8_t> generate_bytes(std::size_t count);

    // `digit_count` decimal digits, leading zeros allowed.
    static std::string generate_digits(std::size_t digit_count);

    // `byte_count` random bytes, hex encoded.
    static std::string generate_hex(std::size_t byte_count);

    // Random RFC 4122 version 4 identifier in canonical text form.
    static std::string generate_uuid();
};

}
