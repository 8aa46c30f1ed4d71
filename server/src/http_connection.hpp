#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/streambuf.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>

#include "ferry/server/s3_signer.hpp"

namespace ferry::server::http
{

    struct ResponseHead
    {
        int status{};
        std::string reason;
        // Lower-case header names.
        std::map<std::string, std::string> headers;

        std::optional<std::uint64_t> content_length() const;
        bool chunked() const;
        bool ok() const noexcept { return status >= 200 && status < 300; }
    };

    /// One blocking HTTP/1.1 exchange over a dedicated TCP connection.
    /// Transport failures surface as StorageError(BackendUnavailable).
    class HttpConnection
    {
    public:
        HttpConnection(const std::string &host, const std::string &port);

        void send_head(const s3::HttpRequest &request);
        void send_body(std::span<const std::uint8_t> data);

        ResponseHead read_head();

        /// Reads at most buffer.size() bytes of body. Returns 0 at end of stream.
        std::size_t read_some_body(std::span<std::uint8_t> buffer);

        /// Reads the complete body of a response with the given head.
        std::string read_body(const ResponseHead &head);

        void close() noexcept;

    private:
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        asio::streambuf inbound_;
        std::string host_;
    };

    /// Splits "host[:port]" (an optional http:// prefix is ignored).
    std::pair<std::string, std::string> split_endpoint(const std::string &endpoint);

} // namespace ferry::server::http
