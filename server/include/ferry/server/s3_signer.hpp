#pragma once

#include <chrono>
#include <map>
#include <string>
#include <string_view>

#include "ferry/crypto.hpp"

namespace ferry::server::s3
{

    inline constexpr std::string_view kUnsignedPayload = "UNSIGNED-PAYLOAD";
    inline constexpr std::string_view kEmptyPayloadHash =
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

    struct HttpRequest
    {
        std::string method;
        // Decoded path, e.g. "/bucket/key"
        std::string path;
        std::map<std::string, std::string> query;
        // Lower-case header names; every header present is signed.
        std::map<std::string, std::string> headers;

        std::string canonical_uri() const;
        std::string canonical_query() const;

        /// Request line plus headers, terminated by the blank line.
        std::string serialize_head() const;
    };

    /// RFC 3986 percent-encoding as required by Signature V4.
    std::string uri_encode(std::string_view value, bool encode_slash);

    /// 20130524T000000Z
    std::string amz_date(std::chrono::system_clock::time_point time);

    /// AWS Signature Version 4 for a single service/region pair.
    class SigV4Signer
    {
    public:
        SigV4Signer(std::string access_key, std::string secret_key, std::string region, std::string service = "s3");

        /// Adds x-amz-date, x-amz-content-sha256 and Authorization headers.
        /// payload_hash is the hex SHA-256 of the body or UNSIGNED-PAYLOAD.
        void sign(HttpRequest &request, std::string_view payload_hash, std::chrono::system_clock::time_point now,
                  std::string_view session_token = {}) const;

        ferry::crypto::Digest signing_key(std::string_view date) const;

        std::string canonical_request(const HttpRequest &request, std::string_view payload_hash) const;

        bool anonymous() const noexcept { return access_key_.empty(); }

    private:
        std::string access_key_;
        std::string secret_key_;
        std::string region_;
        std::string service_;
    };

} // namespace ferry::server::s3
