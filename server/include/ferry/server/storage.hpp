#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "ferry/error_codes.hpp"
#include "ferry/protocol.hpp"

namespace ferry::server
{

    struct ServerConfig;

    class StorageError : public std::runtime_error
    {
    public:
        StorageError(ferry::ErrorCode code, std::string message);

        ferry::ErrorCode code() const noexcept { return code_; }

    private:
        ferry::ErrorCode code_;
    };

    /// Forward-only view of one stored blob.
    class BlobReader
    {
    public:
        virtual ~BlobReader() = default;

        virtual std::uint64_t size() const noexcept = 0;

        /// Fills up to buffer.size() bytes and returns the count; 0 means the
        /// stream has ended. Throws StorageError on backend failures.
        virtual std::size_t read(std::span<std::uint8_t> buffer) = 0;
    };

    /// Sink for a blob that only becomes visible once commit() succeeds.
    /// Destroying an uncommitted writer discards everything written to it.
    class BlobWriter
    {
    public:
        virtual ~BlobWriter() = default;

        virtual void write(std::span<const std::uint8_t> data) = 0;

        /// Publishes the blob. Fails if the byte count differs from the size
        /// announced to open_for_write().
        virtual void commit() = 0;

        virtual void abort() noexcept = 0;
    };

    class StorageBackend
    {
    public:
        virtual ~StorageBackend() = default;

        virtual std::string_view kind() const noexcept = 0;

        virtual std::vector<ferry::protocol::BlobInfo> list() = 0;

        virtual std::unique_ptr<BlobReader> open_for_read(const std::string &name) = 0;

        virtual std::unique_ptr<BlobWriter> open_for_write(const std::string &name, std::uint64_t expected_size) = 0;
    };

    std::unique_ptr<StorageBackend> make_storage_backend(const ServerConfig &config);

} // namespace ferry::server
