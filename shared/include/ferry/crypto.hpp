/**
 * Ferry - SHA-256 and HMAC-SHA256 helpers built on libsodium.
 */
#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace ferry::crypto
{

    using Digest = std::array<unsigned char, 32>;

    Digest sha256(std::string_view data);

    std::string sha256_hex(std::string_view data);

    Digest hmac_sha256(std::span<const unsigned char> key, std::string_view data);

    std::string to_hex(std::span<const unsigned char> data);

} // namespace ferry::crypto
