#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "ferry/error_codes.hpp"

namespace ferry::server
{

    class ConnectionError : public std::runtime_error
    {
    public:
        ConnectionError(ferry::ErrorCode code, const std::string &message);

        ferry::ErrorCode code() const noexcept { return code_; }

    private:
        ferry::ErrorCode code_;
    };

    enum class ReadStatus : std::uint8_t
    {
        Ok,
        TimedOut,
        // Peer sent EOF or the connection was force-closed.
        Closed
    };

    /// Blocking facade over one accepted socket. Each connection runs its own
    /// io_context on the calling thread, so timed reads never interfere with
    /// other sessions. Only force_close() may be called from another thread.
    class Connection
    {
    public:
        Connection();
        ~Connection();

        Connection(const Connection &) = delete;
        Connection &operator=(const Connection &) = delete;

        asio::ip::tcp::socket &socket() noexcept { return socket_; }

        /// Caches the peer address once the socket is connected.
        void on_accepted();

        const std::string &remote_endpoint() const noexcept { return remote_; }

        /// Reads up to buffer.size() bytes, serving previously buffered bytes
        /// first. Throws ConnectionError(ConnectionFault) on socket errors.
        ReadStatus read_some(std::span<std::uint8_t> buffer, std::chrono::milliseconds timeout,
                             std::size_t &received);

        /// Reads one command of at most max_bytes. Bytes after the first
        /// newline stay buffered for the following reads.
        ReadStatus read_command(std::size_t max_bytes, std::chrono::milliseconds timeout, std::string &command);

        void write_all(std::span<const std::uint8_t> data);
        void write_all(std::string_view text);

        void close() noexcept;

        /// Thread-safe. Shuts both directions down and closes the socket,
        /// aborting any read or write in progress on the owning thread.
        void force_close() noexcept;

    private:
        // Runs handlers until done is set, or until the deadline passes.
        void run_until(const bool &done, std::optional<std::chrono::steady_clock::time_point> deadline);
        void shutdown_socket() noexcept;

        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::vector<std::uint8_t> pending_;
        std::atomic<bool> closed_{false};
        std::string remote_{"unknown"};
    };

} // namespace ferry::server
