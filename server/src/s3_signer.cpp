#include "ferry/server/s3_signer.hpp"

#include <array>
#include <cctype>
#include <ctime>

namespace ferry::server::s3
{

    namespace
    {

        bool is_unreserved(unsigned char ch) noexcept
        {
            return std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~';
        }

        std::string trim(std::string_view value)
        {
            const auto begin = value.find_first_not_of(" \t");
            if (begin == std::string_view::npos)
            {
                return {};
            }
            const auto end = value.find_last_not_of(" \t");
            return std::string(value.substr(begin, end - begin + 1));
        }

        std::string signed_header_names(const HttpRequest &request)
        {
            std::string names;
            for (const auto &[name, value] : request.headers)
            {
                if (name == "authorization")
                {
                    continue;
                }
                if (!names.empty())
                {
                    names.push_back(';');
                }
                names.append(name);
            }
            return names;
        }

        std::span<const unsigned char> as_key(std::string_view value)
        {
            return {reinterpret_cast<const unsigned char *>(value.data()), value.size()};
        }

    } // namespace

    std::string uri_encode(std::string_view value, bool encode_slash)
    {
        static constexpr char kHexDigits[] = "0123456789ABCDEF";
        std::string encoded;
        encoded.reserve(value.size());
        for (const char ch : value)
        {
            const auto byte = static_cast<unsigned char>(ch);
            if (is_unreserved(byte) || (ch == '/' && !encode_slash))
            {
                encoded.push_back(ch);
                continue;
            }
            encoded.push_back('%');
            encoded.push_back(kHexDigits[(byte >> 4) & 0x0F]);
            encoded.push_back(kHexDigits[byte & 0x0F]);
        }
        return encoded;
    }

    std::string amz_date(std::chrono::system_clock::time_point time)
    {
        const auto seconds = std::chrono::system_clock::to_time_t(time);
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        std::array<char, 20> buffer{};
        const auto length = std::strftime(buffer.data(), buffer.size(), "%Y%m%dT%H%M%SZ", &utc);
        return std::string(buffer.data(), length);
    }

    std::string HttpRequest::canonical_uri() const
    {
        return path.empty() ? std::string("/") : uri_encode(path, false);
    }

    std::string HttpRequest::canonical_query() const
    {
        std::string joined;
        for (const auto &[key, value] : query)
        {
            if (!joined.empty())
            {
                joined.push_back('&');
            }
            joined.append(uri_encode(key, true));
            joined.push_back('=');
            joined.append(uri_encode(value, true));
        }
        return joined;
    }

    std::string HttpRequest::serialize_head() const
    {
        std::string head = method + " " + canonical_uri();
        const auto query_string = canonical_query();
        if (!query_string.empty())
        {
            head += "?" + query_string;
        }
        head += " HTTP/1.1\r\n";
        for (const auto &[name, value] : headers)
        {
            head += name + ": " + value + "\r\n";
        }
        head += "\r\n";
        return head;
    }

    SigV4Signer::SigV4Signer(std::string access_key, std::string secret_key, std::string region, std::string service)
        : access_key_(std::move(access_key)),
          secret_key_(std::move(secret_key)),
          region_(std::move(region)),
          service_(std::move(service)) {}

    void SigV4Signer::sign(HttpRequest &request, std::string_view payload_hash,
                           std::chrono::system_clock::time_point now, std::string_view session_token) const
    {
        const auto timestamp = amz_date(now);
        const auto date = timestamp.substr(0, 8);
        request.headers["x-amz-date"] = timestamp;
        request.headers["x-amz-content-sha256"] = std::string(payload_hash);
        if (!session_token.empty())
        {
            request.headers["x-amz-security-token"] = std::string(session_token);
        }
        if (anonymous())
        {
            return;
        }

        const auto scope = date + "/" + region_ + "/" + service_ + "/aws4_request";
        const auto string_to_sign = "AWS4-HMAC-SHA256\n" + timestamp + "\n" + scope + "\n" +
                                    ferry::crypto::sha256_hex(canonical_request(request, payload_hash));
        const auto key = signing_key(date);
        const auto signature = ferry::crypto::to_hex(ferry::crypto::hmac_sha256(key, string_to_sign));

        auto authorization = "AWS4-HMAC-SHA256 Credential=" + access_key_ + "/" + scope +
                             ", SignedHeaders=" + signed_header_names(request) + ", Signature=" + signature;
        request.headers["authorization"] = std::move(authorization);
    }

    ferry::crypto::Digest SigV4Signer::signing_key(std::string_view date) const
    {
        const auto secret = "AWS4" + secret_key_;
        const auto date_key = ferry::crypto::hmac_sha256(as_key(secret), date);
        const auto region_key = ferry::crypto::hmac_sha256(date_key, region_);
        const auto service_key = ferry::crypto::hmac_sha256(region_key, service_);
        return ferry::crypto::hmac_sha256(service_key, "aws4_request");
    }

    std::string SigV4Signer::canonical_request(const HttpRequest &request, std::string_view payload_hash) const
    {
        std::string canonical = request.method + "\n" + request.canonical_uri() + "\n" + request.canonical_query() + "\n";
        for (const auto &[name, value] : request.headers)
        {
            if (name == "authorization")
            {
                continue;
            }
            canonical += name + ":" + trim(value) + "\n";
        }
        canonical += "\n";
        canonical += signed_header_names(request);
        canonical += "\n";
        canonical.append(payload_hash);
        return canonical;
    }

} // namespace ferry::server::s3
