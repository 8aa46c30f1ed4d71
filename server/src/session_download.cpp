#include "ferry/server/session.hpp"

#include <algorithm>
#include <vector>

#include <spdlog/spdlog.h>

namespace ferry::server
{

    void Session::handle_get(const ferry::protocol::GetRequest &request)
    {
        std::string name;
        std::unique_ptr<BlobReader> reader;
        try
        {
            name = ferry::protocol::sanitize_name(request.name);
            reader = context_.storage.open_for_read(name);
        }
        catch (const ferry::protocol::ProtocolError &ex)
        {
            send_error(ex.what());
            return;
        }
        catch (const StorageError &ex)
        {
            if (ex.code() == ferry::ErrorCode::NotFound)
            {
                send_error(ferry::protocol::kFileNotFound);
            }
            else
            {
                spdlog::warn("Cannot open {} for {}: {}", name, remote_endpoint(), ex.what());
                send_error(ex.what());
            }
            return;
        }

        state_ = SessionState::Downloading;
        const auto size = reader->size();
        send(ferry::protocol::format_ok(size));
        if (!await_acknowledgement())
        {
            spdlog::info("{} went away before acknowledging {}", remote_endpoint(), name);
            return;
        }

        std::vector<std::uint8_t> buffer(context_.chunk_size);
        std::uint64_t remaining = size;
        while (remaining > 0)
        {
            const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), remaining));
            std::size_t got = 0;
            try
            {
                got = reader->read(std::span<std::uint8_t>(buffer).first(want));
            }
            catch (const StorageError &ex)
            {
                throw ConnectionError(ferry::ErrorCode::TransferIncomplete,
                                      "Reading " + name + " failed: " + ex.what());
            }
            if (got == 0)
            {
                throw ConnectionError(ferry::ErrorCode::TransferIncomplete,
                                      name + " ended after " + std::to_string(size - remaining) + " of " +
                                          std::to_string(size) + " bytes");
            }
            connection_->write_all(std::span<const std::uint8_t>(buffer.data(), got));
            remaining -= got;
        }

        emit_metric(context_.metrics, kMetricDownloads, 1);
        spdlog::info("Served {} ({} bytes) to {}", name, size, remote_endpoint());
    }

} // namespace ferry::server
