#include "ferry/server/session.hpp"

#include <spdlog/spdlog.h>

namespace ferry::server
{

    void Session::handle_list()
    {
        state_ = SessionState::Listing;
        std::vector<ferry::protocol::BlobInfo> blobs;
        try
        {
            blobs = context_.storage.list();
        }
        catch (const StorageError &ex)
        {
            spdlog::warn("Listing for {} failed: {}", remote_endpoint(), ex.what());
            send_error(ex.what());
            return;
        }
        send(ferry::protocol::format_listing(blobs));
    }

} // namespace ferry::server
