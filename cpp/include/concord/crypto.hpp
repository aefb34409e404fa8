#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace concord::crypto
{

    using Bytes = std::vector<uint8_t>;
    using SHA256Hash = std::array<uint8_t, 32>;

    /**
     * SHA-256 hashing
     */
    class SHA256
    {
    public:
        static SHA256Hash hash(const Bytes &data);

        static SHA256Hash hash(const std::string &data);

        /**
         * Convert hash to lowercase hex string
         */
        static std::string to_hex(const SHA256Hash &hash);
    };

    /**
     * Cryptographically secure random number generation
     */
    class SecureRandom
    {
    public:
        static Bytes generate_bytes(size_t n);

        /**
         * RFC 4122 version 4 UUID in canonical 8-4-4-4-12 form.
         * Used for decision and vote identifiers.
         */
        static std::string uuid_v4();
    };

} // namespace concord::crypto
