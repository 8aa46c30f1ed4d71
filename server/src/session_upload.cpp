#include "ferry/server/session.hpp"

#include <algorithm>
#include <optional>
#include <vector>

#include <spdlog/spdlog.h>

namespace ferry::server
{

    void Session::handle_put(const ferry::protocol::PutRequest &request)
    {
        std::string name;
        std::unique_ptr<BlobWriter> writer;
        try
        {
            name = ferry::protocol::sanitize_name(request.name);
        }
        catch (const ferry::protocol::ProtocolError &ex)
        {
            send_error(ex.what());
            return;
        }
        try
        {
            writer = context_.storage.open_for_write(name, request.size);
        }
        catch (const StorageError &ex)
        {
            spdlog::warn("Cannot store {} for {}: {}", name, remote_endpoint(), ex.what());
            send_error(std::string("Upload failed: ") + ex.what());
            return;
        }

        state_ = SessionState::Uploading;
        send(ferry::protocol::format_ok());

        // After a backend failure the announced bytes are still consumed so the
        // next command starts on a clean boundary.
        std::optional<std::string> failure;
        std::vector<std::uint8_t> buffer(context_.chunk_size);
        std::uint64_t remaining = request.size;
        while (remaining > 0)
        {
            const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), remaining));
            std::size_t got = 0;
            const auto status =
                connection_->read_some(std::span<std::uint8_t>(buffer).first(want), context_.idle_timeout, got);
            if (status == ReadStatus::TimedOut)
            {
                if (shutting_down())
                {
                    throw ConnectionError(ferry::ErrorCode::TransferIncomplete,
                                          "Upload of " + name + " interrupted by shutdown");
                }
                continue;
            }
            if (status == ReadStatus::Closed)
            {
                throw ConnectionError(ferry::ErrorCode::TransferIncomplete,
                                      "Upload of " + name + " ended after " +
                                          std::to_string(request.size - remaining) + " of " +
                                          std::to_string(request.size) + " bytes");
            }
            remaining -= got;
            if (failure)
            {
                continue;
            }
            try
            {
                writer->write(std::span<const std::uint8_t>(buffer.data(), got));
            }
            catch (const StorageError &ex)
            {
                failure = ex.what();
                writer->abort();
            }
        }

        if (!failure)
        {
            try
            {
                writer->commit();
            }
            catch (const StorageError &ex)
            {
                failure = ex.what();
            }
        }
        if (failure)
        {
            spdlog::warn("Upload of {} from {} failed: {}", name, remote_endpoint(), *failure);
            send_error("Upload failed: " + *failure);
            return;
        }

        send(ferry::protocol::format_ok(request.size));
        emit_metric(context_.metrics, kMetricUploads, 1);
        spdlog::info("Stored {} ({} bytes) from {}", name, request.size, remote_endpoint());
    }

} // namespace ferry::server
