#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <cstdint>
#include <functional>
#include <istream>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "ferry/error_codes.hpp"
#include "ferry/protocol.hpp"

namespace ferry::client
{

    class ClientError : public std::runtime_error
    {
    public:
        ClientError(ferry::ErrorCode code, const std::string &message);

        ferry::ErrorCode code() const noexcept { return code_; }

    private:
        ferry::ErrorCode code_;
    };

    /// Blocking protocol client for one server connection. Server `ERR`
    /// replies and transport failures are raised as ClientError.
    class TransferClient
    {
    public:
        // Called with the number of payload bytes moved so far.
        using Progress = std::function<void(std::uint64_t)>;

        TransferClient();
        ~TransferClient();

        TransferClient(const TransferClient &) = delete;
        TransferClient &operator=(const TransferClient &) = delete;

        void connect(const std::string &host, std::uint16_t port);

        bool connected() const noexcept { return socket_.is_open(); }

        /// Listing rows as sent by the server, or a single "No files" row.
        std::vector<std::string> list();

        /// Streams the blob into out and returns its size. Throws
        /// ClientError(TransferIncomplete) if the connection drops midway;
        /// whatever arrived has already been written to out.
        std::uint64_t get(const std::string &name, std::ostream &out, const Progress &progress = {});

        /// Uploads exactly size bytes read from in.
        void put(const std::string &name, std::istream &in, std::uint64_t size, const Progress &progress = {});

        void close() noexcept;

    private:
        void send(std::string_view text);
        void send(std::span<const std::uint8_t> data);
        std::string read_line();
        ferry::protocol::Response read_response();
        // Returns the number of bytes placed in buffer; 0 at end of stream.
        std::size_t receive_some(std::span<std::uint8_t> buffer);

        [[noreturn]] void raise_server_error(const ferry::protocol::Response &response) const;

        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::vector<std::uint8_t> inbound_;
    };

} // namespace ferry::client
