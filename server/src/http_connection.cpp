#include "http_connection.hpp"

#include <asio/buffer.hpp>
#include <asio/buffers_iterator.hpp>
#include <asio/connect.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <system_error>

#include "ferry/server/storage.hpp"

namespace ferry::server::http
{

    namespace
    {

        [[noreturn]] void throw_transport_error(const std::string &context, const std::error_code &ec)
        {
            throw StorageError(ferry::ErrorCode::BackendUnavailable, context + ": " + ec.message());
        }

        std::string to_lower(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        std::string trim(const std::string &value)
        {
            const auto begin = value.find_first_not_of(" \t");
            if (begin == std::string::npos)
            {
                return {};
            }
            const auto end = value.find_last_not_of(" \t\r");
            return value.substr(begin, end - begin + 1);
        }

    } // namespace

    std::optional<std::uint64_t> ResponseHead::content_length() const
    {
        const auto it = headers.find("content-length");
        if (it == headers.end())
        {
            return std::nullopt;
        }
        std::uint64_t value = 0;
        const auto *const end = it->second.data() + it->second.size();
        const auto [ptr, ec] = std::from_chars(it->second.data(), end, value);
        if (ec != std::errc{} || ptr != end)
        {
            return std::nullopt;
        }
        return value;
    }

    bool ResponseHead::chunked() const
    {
        const auto it = headers.find("transfer-encoding");
        return it != headers.end() && to_lower(it->second).find("chunked") != std::string::npos;
    }

    std::pair<std::string, std::string> split_endpoint(const std::string &endpoint)
    {
        std::string rest = endpoint;
        constexpr std::string_view kScheme = "http://";
        if (rest.starts_with(kScheme))
        {
            rest = rest.substr(kScheme.size());
        }
        while (!rest.empty() && rest.back() == '/')
        {
            rest.pop_back();
        }
        const auto colon = rest.rfind(':');
        if (colon == std::string::npos)
        {
            return {rest, "80"};
        }
        return {rest.substr(0, colon), rest.substr(colon + 1)};
    }

    HttpConnection::HttpConnection(const std::string &host, const std::string &port)
        : socket_(io_context_), host_(host)
    {
        std::error_code ec;
        asio::ip::tcp::resolver resolver(io_context_);
        const auto endpoints = resolver.resolve(host, port, ec);
        if (ec)
        {
            throw_transport_error("Cannot resolve " + host, ec);
        }
        asio::connect(socket_, endpoints, ec);
        if (ec)
        {
            throw_transport_error("Cannot connect to " + host + ":" + port, ec);
        }
    }

    void HttpConnection::send_head(const s3::HttpRequest &request)
    {
        const auto head = request.serialize_head();
        std::error_code ec;
        asio::write(socket_, asio::buffer(head), ec);
        if (ec)
        {
            throw_transport_error("Request to " + host_ + " failed", ec);
        }
    }

    void HttpConnection::send_body(std::span<const std::uint8_t> data)
    {
        std::error_code ec;
        asio::write(socket_, asio::buffer(data.data(), data.size()), ec);
        if (ec)
        {
            throw_transport_error("Upload to " + host_ + " failed", ec);
        }
    }

    ResponseHead HttpConnection::read_head()
    {
        std::error_code ec;
        const auto length = asio::read_until(socket_, inbound_, "\r\n\r\n", ec);
        if (ec)
        {
            throw_transport_error("No response from " + host_, ec);
        }
        const auto begin = asio::buffers_begin(inbound_.data());
        const std::string raw(begin, begin + static_cast<std::ptrdiff_t>(length));
        inbound_.consume(length);

        ResponseHead head;
        std::size_t line_start = 0;
        bool status_line = true;
        while (line_start < raw.size())
        {
            auto line_end = raw.find("\r\n", line_start);
            if (line_end == std::string::npos)
            {
                line_end = raw.size();
            }
            const auto line = raw.substr(line_start, line_end - line_start);
            line_start = line_end + 2;
            if (line.empty())
            {
                break;
            }
            if (status_line)
            {
                status_line = false;
                // HTTP/1.1 200 OK
                const auto first_space = line.find(' ');
                if (first_space == std::string::npos || !line.starts_with("HTTP/"))
                {
                    throw StorageError(ferry::ErrorCode::BackendUnavailable, "Malformed response from " + host_);
                }
                const auto second_space = line.find(' ', first_space + 1);
                const auto code = line.substr(first_space + 1, second_space == std::string::npos
                                                                   ? std::string::npos
                                                                   : second_space - first_space - 1);
                const auto [ptr, parse_ec] = std::from_chars(code.data(), code.data() + code.size(), head.status);
                if (parse_ec != std::errc{})
                {
                    throw StorageError(ferry::ErrorCode::BackendUnavailable, "Malformed status from " + host_);
                }
                head.reason = second_space == std::string::npos ? std::string{} : line.substr(second_space + 1);
                continue;
            }
            const auto colon = line.find(':');
            if (colon == std::string::npos)
            {
                continue;
            }
            head.headers[to_lower(line.substr(0, colon))] = trim(line.substr(colon + 1));
        }
        return head;
    }

    std::size_t HttpConnection::read_some_body(std::span<std::uint8_t> buffer)
    {
        if (buffer.empty())
        {
            return 0;
        }
        if (inbound_.size() > 0)
        {
            const auto copied = asio::buffer_copy(asio::buffer(buffer.data(), buffer.size()), inbound_.data());
            inbound_.consume(copied);
            return copied;
        }
        std::error_code ec;
        const auto received = socket_.read_some(asio::buffer(buffer.data(), buffer.size()), ec);
        if (ec == asio::error::eof)
        {
            return received;
        }
        if (ec)
        {
            throw_transport_error("Download from " + host_ + " failed", ec);
        }
        return received;
    }

    std::string HttpConnection::read_body(const ResponseHead &head)
    {
        std::string body;
        std::array<std::uint8_t, 4096> chunk{};

        if (head.chunked())
        {
            for (;;)
            {
                std::error_code ec;
                const auto length = asio::read_until(socket_, inbound_, "\r\n", ec);
                if (ec)
                {
                    throw_transport_error("Truncated response from " + host_, ec);
                }
                const auto begin = asio::buffers_begin(inbound_.data());
                const std::string size_line(begin, begin + static_cast<std::ptrdiff_t>(length) - 2);
                inbound_.consume(length);

                std::uint64_t chunk_size = 0;
                const auto [ptr, parse_ec] =
                    std::from_chars(size_line.data(), size_line.data() + size_line.size(), chunk_size, 16);
                if (parse_ec != std::errc{})
                {
                    throw StorageError(ferry::ErrorCode::BackendUnavailable, "Malformed chunk from " + host_);
                }
                // Each chunk (and the final empty one) is followed by CRLF.
                std::uint64_t remaining = chunk_size + 2;
                while (remaining > 0)
                {
                    const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(chunk.size(), remaining));
                    const auto got = read_some_body(std::span<std::uint8_t>(chunk).first(want));
                    if (got == 0)
                    {
                        throw StorageError(ferry::ErrorCode::BackendUnavailable, "Truncated response from " + host_);
                    }
                    body.append(reinterpret_cast<const char *>(chunk.data()), got);
                    remaining -= got;
                }
                body.resize(body.size() - 2);
                if (chunk_size == 0)
                {
                    return body;
                }
            }
        }

        const auto expected = head.content_length();
        for (;;)
        {
            if (expected && body.size() >= *expected)
            {
                return body;
            }
            auto want = chunk.size();
            if (expected)
            {
                want = static_cast<std::size_t>(std::min<std::uint64_t>(want, *expected - body.size()));
            }
            const auto got = read_some_body(std::span<std::uint8_t>(chunk).first(want));
            if (got == 0)
            {
                if (expected)
                {
                    throw StorageError(ferry::ErrorCode::BackendUnavailable, "Truncated response from " + host_);
                }
                return body;
            }
            body.append(reinterpret_cast<const char *>(chunk.data()), got);
        }
    }

    void HttpConnection::close() noexcept
    {
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

} // namespace ferry::server::http
