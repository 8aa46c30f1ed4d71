#include "ferry/server/connection.hpp"

#include <asio/buffer.hpp>
#include <asio/post.hpp>
#include <asio/write.hpp>

#include <algorithm>

#include "ferry/framing.hpp"

namespace ferry::server
{

    ConnectionError::ConnectionError(ferry::ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code) {}

    Connection::Connection() : socket_(io_context_) {}

    Connection::~Connection()
    {
        close();
    }

    void Connection::on_accepted()
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (!ec)
        {
            remote_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        }
    }

    ReadStatus Connection::read_some(std::span<std::uint8_t> buffer, std::chrono::milliseconds timeout,
                                     std::size_t &received)
    {
        received = 0;
        if (!pending_.empty())
        {
            received = std::min(buffer.size(), pending_.size());
            std::copy_n(pending_.begin(), received, buffer.begin());
            pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(received));
            return ReadStatus::Ok;
        }
        if (closed_)
        {
            return ReadStatus::Closed;
        }

        bool done = false;
        std::error_code result;
        socket_.async_read_some(asio::buffer(buffer.data(), buffer.size()),
                                [&](const std::error_code &ec, std::size_t bytes)
                                {
                                    result = ec;
                                    received = bytes;
                                    done = true;
                                });
        run_until(done, std::chrono::steady_clock::now() + timeout);

        bool timed_out = false;
        if (!done)
        {
            timed_out = true;
            std::error_code ignored;
            socket_.cancel(ignored);
            run_until(done, std::nullopt);
        }

        if (!result)
        {
            return ReadStatus::Ok;
        }
        if (result == asio::error::eof || closed_)
        {
            return ReadStatus::Closed;
        }
        if (result == asio::error::operation_aborted && timed_out)
        {
            return ReadStatus::TimedOut;
        }
        throw ConnectionError(ferry::ErrorCode::ConnectionFault,
                              "Read from " + remote_ + " failed: " + result.message());
    }

    ReadStatus Connection::read_command(std::size_t max_bytes, std::chrono::milliseconds timeout,
                                        std::string &command)
    {
        std::vector<std::uint8_t> chunk(max_bytes);
        std::size_t received = 0;
        const auto status = read_some(chunk, timeout, received);
        if (status != ReadStatus::Ok)
        {
            return status;
        }
        auto split = ferry::protocol::split_command(std::span<const std::uint8_t>(chunk.data(), received));
        pending_.insert(pending_.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(split.bytes_consumed),
                        chunk.begin() + static_cast<std::ptrdiff_t>(received));
        command = std::move(split.command);
        return ReadStatus::Ok;
    }

    void Connection::write_all(std::span<const std::uint8_t> data)
    {
        if (data.empty())
        {
            return;
        }
        if (closed_)
        {
            throw ConnectionError(ferry::ErrorCode::ConnectionFault, "Connection to " + remote_ + " is closed");
        }

        bool done = false;
        std::error_code result;
        asio::async_write(socket_, asio::buffer(data.data(), data.size()),
                          [&](const std::error_code &ec, std::size_t /*bytes*/)
                          {
                              result = ec;
                              done = true;
                          });
        run_until(done, std::nullopt);

        if (result)
        {
            const auto reason = closed_ ? std::string("connection closed") : result.message();
            throw ConnectionError(ferry::ErrorCode::ConnectionFault, "Write to " + remote_ + " failed: " + reason);
        }
    }

    void Connection::write_all(std::string_view text)
    {
        write_all(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(text.data()), text.size()));
    }

    void Connection::close() noexcept
    {
        closed_ = true;
        shutdown_socket();
    }

    void Connection::force_close() noexcept
    {
        closed_ = true;
        asio::post(io_context_, [this]
                   { shutdown_socket(); });
    }

    void Connection::run_until(const bool &done, std::optional<std::chrono::steady_clock::time_point> deadline)
    {
        io_context_.restart();
        while (!done)
        {
            const auto handled = deadline ? io_context_.run_one_until(*deadline) : io_context_.run_one();
            if (handled == 0)
            {
                return;
            }
        }
    }

    void Connection::shutdown_socket() noexcept
    {
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

} // namespace ferry::server
