#include "ferry/server/storage.hpp"

#include <spdlog/spdlog.h>

#include "ferry/server/config.hpp"
#include "ferry/server/local_storage.hpp"
#include "ferry/server/object_storage.hpp"

namespace ferry::server
{

    StorageError::StorageError(ferry::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    std::unique_ptr<StorageBackend> make_storage_backend(const ServerConfig &config)
    {
        switch (config.storage)
        {
        case StorageKind::Local:
            spdlog::info("Using local storage at {}", config.root.string());
            return std::make_unique<LocalStorage>(config.root);
        case StorageKind::ObjectStore:
        {
            auto storage = std::make_unique<ObjectStorage>(config.object_store);
            spdlog::info("Using object storage bucket {} in {} via {}:{}", config.object_store.bucket,
                         config.object_store.region, storage->host(), storage->port());
            return storage;
        }
        }
        throw ConfigError("Unknown storage backend");
    }

} // namespace ferry::server
