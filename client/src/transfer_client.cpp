#include "ferry/client/transfer_client.hpp"

#include <asio/buffer.hpp>
#include <asio/connect.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <array>
#include <system_error>

#include "ferry/framing.hpp"

namespace ferry::client
{

    namespace
    {

        constexpr std::string_view kAcknowledgement = "OK";

        [[noreturn]] void throw_transport_error(const std::string &context, const std::error_code &ec)
        {
            throw ClientError(ferry::ErrorCode::ConnectionFault, context + ": " + ec.message());
        }

    } // namespace

    ClientError::ClientError(ferry::ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code) {}

    TransferClient::TransferClient() : socket_(io_context_) {}

    TransferClient::~TransferClient()
    {
        close();
    }

    void TransferClient::connect(const std::string &host, std::uint16_t port)
    {
        std::error_code ec;
        asio::ip::tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(host, std::to_string(port), ec);
        if (ec)
        {
            throw_transport_error("Cannot resolve " + host, ec);
        }
        asio::connect(socket_, results, ec);
        if (ec)
        {
            throw_transport_error("Cannot connect to " + host + ":" + std::to_string(port), ec);
        }
        inbound_.clear();
    }

    std::vector<std::string> TransferClient::list()
    {
        send(ferry::protocol::request_line(ferry::protocol::ListRequest{}));

        std::vector<std::string> rows;
        for (;;)
        {
            auto line = read_line();
            if (ferry::protocol::is_listing_terminator(line))
            {
                return rows;
            }
            if (rows.empty())
            {
                const auto response = ferry::protocol::parse_response(line);
                if (response.kind == ferry::protocol::ResponseKind::Error)
                {
                    raise_server_error(response);
                }
            }
            rows.push_back(std::move(line));
        }
    }

    std::uint64_t TransferClient::get(const std::string &name, std::ostream &out, const Progress &progress)
    {
        send(ferry::protocol::request_line(ferry::protocol::GetRequest{.name = name}));

        const auto response = read_response();
        if (response.kind == ferry::protocol::ResponseKind::Error)
        {
            raise_server_error(response);
        }
        const auto size = ferry::protocol::parse_size(response.detail);
        if (response.kind != ferry::protocol::ResponseKind::Ok || !size)
        {
            throw ClientError(ferry::ErrorCode::ProtocolError, "Invalid response from server: " + response.detail);
        }

        send(kAcknowledgement);

        std::array<std::uint8_t, ferry::protocol::kChunkSize> buffer{};
        std::uint64_t received = 0;
        while (received < *size)
        {
            const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), *size - received));
            const auto got = receive_some(std::span<std::uint8_t>(buffer).first(want));
            if (got == 0)
            {
                close();
                throw ClientError(ferry::ErrorCode::TransferIncomplete,
                                  "received " + std::to_string(received) + " of " + std::to_string(*size) +
                                      " bytes");
            }
            out.write(reinterpret_cast<const char *>(buffer.data()), static_cast<std::streamsize>(got));
            received += got;
            if (progress)
            {
                progress(received);
            }
        }
        return *size;
    }

    void TransferClient::put(const std::string &name, std::istream &in, std::uint64_t size, const Progress &progress)
    {
        send(ferry::protocol::request_line(ferry::protocol::PutRequest{.name = name, .size = size}));

        const auto accepted = read_response();
        if (accepted.kind != ferry::protocol::ResponseKind::Ok)
        {
            raise_server_error(accepted);
        }

        std::array<char, ferry::protocol::kChunkSize> buffer{};
        std::uint64_t sent = 0;
        while (sent < size)
        {
            const auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(buffer.size(), size - sent));
            in.read(buffer.data(), want);
            const auto got = in.gcount();
            if (got <= 0)
            {
                // The server still expects the rest of the announced bytes.
                close();
                throw ClientError(ferry::ErrorCode::TransferIncomplete,
                                  "local file ended after " + std::to_string(sent) + " of " + std::to_string(size) +
                                      " bytes");
            }
            send(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(buffer.data()),
                                               static_cast<std::size_t>(got)));
            sent += static_cast<std::uint64_t>(got);
            if (progress)
            {
                progress(sent);
            }
        }

        const auto stored = read_response();
        if (stored.kind == ferry::protocol::ResponseKind::Error)
        {
            raise_server_error(stored);
        }
        if (stored.kind != ferry::protocol::ResponseKind::Ok || ferry::protocol::parse_size(stored.detail) != size)
        {
            throw ClientError(ferry::ErrorCode::ProtocolError, "Invalid response from server: " + stored.detail);
        }
    }

    void TransferClient::close() noexcept
    {
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        inbound_.clear();
    }

    void TransferClient::send(std::string_view text)
    {
        send(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(text.data()), text.size()));
    }

    void TransferClient::send(std::span<const std::uint8_t> data)
    {
        if (!connected())
        {
            throw ClientError(ferry::ErrorCode::ConnectionFault, "Not connected");
        }
        std::error_code ec;
        asio::write(socket_, asio::buffer(data.data(), data.size()), ec);
        if (ec)
        {
            close();
            throw_transport_error("Send failed", ec);
        }
    }

    std::string TransferClient::read_line()
    {
        for (;;)
        {
            if (auto line = ferry::protocol::take_line(inbound_))
            {
                return *line;
            }
            std::array<std::uint8_t, ferry::protocol::kChunkSize> chunk{};
            std::error_code ec;
            const auto received = socket_.read_some(asio::buffer(chunk), ec);
            if (ec == asio::error::eof)
            {
                close();
                throw ClientError(ferry::ErrorCode::ConnectionFault, "Connection closed by server");
            }
            if (ec)
            {
                close();
                throw_transport_error("Receive failed", ec);
            }
            inbound_.insert(inbound_.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(received));
        }
    }

    ferry::protocol::Response TransferClient::read_response()
    {
        return ferry::protocol::parse_response(read_line());
    }

    std::size_t TransferClient::receive_some(std::span<std::uint8_t> buffer)
    {
        if (!inbound_.empty())
        {
            const auto count = std::min(buffer.size(), inbound_.size());
            std::copy_n(inbound_.begin(), count, buffer.begin());
            inbound_.erase(inbound_.begin(), inbound_.begin() + static_cast<std::ptrdiff_t>(count));
            return count;
        }
        std::error_code ec;
        const auto received = socket_.read_some(asio::buffer(buffer.data(), buffer.size()), ec);
        if (ec == asio::error::eof)
        {
            return 0;
        }
        if (ec)
        {
            close();
            throw_transport_error("Receive failed", ec);
        }
        return received;
    }

    void TransferClient::raise_server_error(const ferry::protocol::Response &response) const
    {
        const auto code = response.detail == ferry::protocol::kFileNotFound ? ferry::ErrorCode::NotFound
                                                                             : ferry::ErrorCode::ProtocolError;
        throw ClientError(code, response.detail);
    }

} // namespace ferry::client
