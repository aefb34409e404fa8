#include "concord/crypto.hpp"
#include <sodium.h>
#include <format>

namespace concord::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    SHA256Hash SHA256::hash(const Bytes &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(), data.data(), data.size());
        return output;
    }

    SHA256Hash SHA256::hash(const std::string &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(),
                           reinterpret_cast<const uint8_t *>(data.data()),
                           data.size());
        return output;
    }

    std::string SHA256::to_hex(const SHA256Hash &hash)
    {
        std::string hex(hash.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), hash.data(), hash.size());
        hex.pop_back();
        return hex;
    }

    Bytes SecureRandom::generate_bytes(size_t n)
    {
        Bytes buffer(n);
        randombytes_buf(buffer.data(), buffer.size());
        return buffer;
    }

    std::string SecureRandom::uuid_v4()
    {
        auto b = generate_bytes(16);
        b[6] = static_cast<uint8_t>((b[6] & 0x0f) | 0x40); // version 4
        b[8] = static_cast<uint8_t>((b[8] & 0x3f) | 0x80); // RFC 4122 variant

        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < b.size(); ++i)
        {
            if (i == 4 || i == 6 || i == 8 || i == 10)
                out += '-';
            out += std::format("{:02x}", b[i]);
        }
        return out;
    }

} // namespace concord::crypto
