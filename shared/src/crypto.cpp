#include "ferry/crypto.hpp"

#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace ferry::crypto
{

    namespace
    {

        void ensure_initialized_once()
        {
            static std::once_flag flag;
            std::call_once(flag, []
                           {
                if (sodium_init() < 0)
                {
                    throw std::runtime_error("libsodium could not be initialized");
                } });
        }

        const unsigned char *as_bytes(std::string_view data)
        {
            return reinterpret_cast<const unsigned char *>(data.data());
        }

    } // namespace

    Digest sha256(std::string_view data)
    {
        ensure_initialized_once();
        Digest digest{};
        if (crypto_hash_sha256(digest.data(), as_bytes(data), data.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256 failed");
        }
        return digest;
    }

    std::string sha256_hex(std::string_view data)
    {
        return to_hex(sha256(data));
    }

    Digest hmac_sha256(std::span<const unsigned char> key, std::string_view data)
    {
        ensure_initialized_once();
        crypto_auth_hmacsha256_state state;
        if (crypto_auth_hmacsha256_init(&state, key.data(), key.size()) != 0 ||
            crypto_auth_hmacsha256_update(&state, as_bytes(data), data.size()) != 0)
        {
            throw std::runtime_error("crypto_auth_hmacsha256 failed");
        }
        Digest digest{};
        if (crypto_auth_hmacsha256_final(&state, digest.data()) != 0)
        {
            throw std::runtime_error("crypto_auth_hmacsha256_final failed");
        }
        return digest;
    }

    std::string to_hex(std::span<const unsigned char> data)
    {
        static constexpr char kHexDigits[] = "0123456789abcdef";
        std::string result;
        result.resize(data.size() * 2);
        for (std::size_t i = 0; i < data.size(); ++i)
        {
            const auto byte = data[i];
            result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
            result[2 * i + 1] = kHexDigits[byte & 0x0F];
        }
        return result;
    }

} // namespace ferry::crypto
