#include "ferry/server/config.hpp"

#include <array>
#include <cstdlib>
#include <fstream>
#include <limits>

#include <nlohmann/json.hpp>

namespace ferry::server
{

    namespace
    {

        struct StorageKindMapping
        {
            StorageKind kind;
            std::string_view label;
        };

        constexpr std::array<StorageKindMapping, 2> kStorageKinds{{
            {StorageKind::Local, "local"},
            {StorageKind::ObjectStore, "s3"},
        }};

        std::optional<std::string> read_env(const char *name)
        {
            const char *value = std::getenv(name);
            if (value == nullptr || *value == '\0')
            {
                return std::nullopt;
            }
            return std::string(value);
        }

        std::uint16_t parse_port(const std::string &value)
        {
            try
            {
                std::size_t consumed = 0;
                const auto port = std::stoul(value, &consumed);
                if (consumed != value.size() || port > std::numeric_limits<std::uint16_t>::max())
                {
                    throw ConfigError("Invalid port: " + value);
                }
                return static_cast<std::uint16_t>(port);
            }
            catch (const std::logic_error &)
            {
                throw ConfigError("Invalid port: " + value);
            }
        }

        StorageKind parse_storage_kind(const std::string &value)
        {
            const auto kind = storage_kind_from_string(value);
            if (!kind)
            {
                throw ConfigError("Unknown storage backend: " + value);
            }
            return *kind;
        }

    } // namespace

    ConfigError::ConfigError(const std::string &message) : std::runtime_error(message) {}

    std::string_view to_string(StorageKind kind) noexcept
    {
        for (const auto &mapping : kStorageKinds)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<StorageKind> storage_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStorageKinds)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    void apply_config_file(ServerConfig &config, const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw ConfigError("Cannot open config file: " + path.string());
        }

        nlohmann::json json;
        try
        {
            in >> json;
            if (json.contains("address"))
            {
                config.address = json.at("address").get<std::string>();
            }
            if (json.contains("port"))
            {
                const auto port = json.at("port").get<std::uint32_t>();
                if (port > std::numeric_limits<std::uint16_t>::max())
                {
                    throw ConfigError("Invalid port in config file");
                }
                config.port = static_cast<std::uint16_t>(port);
            }
            if (json.contains("storage"))
            {
                config.storage = parse_storage_kind(json.at("storage").get<std::string>());
            }
            if (json.contains("root"))
            {
                config.root = json.at("root").get<std::string>();
            }
            if (json.contains("idle_timeout_seconds"))
            {
                const auto seconds = json.at("idle_timeout_seconds").get<std::uint64_t>();
                config.idle_timeout = idle_timeout_from_seconds(seconds);
            }
            if (json.contains("log_file"))
            {
                config.log_file = std::filesystem::path(json.at("log_file").get<std::string>());
            }
            if (json.contains("log_level"))
            {
                config.log_level = json.at("log_level").get<std::string>();
            }
            if (json.contains("s3"))
            {
                const auto &s3 = json.at("s3");
                config.object_store.bucket = s3.value("bucket", config.object_store.bucket);
                config.object_store.region = s3.value("region", config.object_store.region);
                config.object_store.endpoint = s3.value("endpoint", config.object_store.endpoint);
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ConfigError("Malformed config file " + path.string() + ": " + ex.what());
        }
    }

    void apply_environment(ServerConfig &config)
    {
        if (const auto port = read_env("FTP_PORT"))
        {
            config.port = parse_port(*port);
        }
        if (const auto root = read_env("FTP_ROOT"))
        {
            config.root = *root;
        }
        if (const auto bucket = read_env("S3_BUCKET"))
        {
            config.object_store.bucket = *bucket;
        }
        if (const auto endpoint = read_env("S3_ENDPOINT"))
        {
            config.object_store.endpoint = *endpoint;
        }
        if (const auto access_key = read_env("AWS_ACCESS_KEY_ID"))
        {
            config.object_store.access_key = *access_key;
        }
        if (const auto secret_key = read_env("AWS_SECRET_ACCESS_KEY"))
        {
            config.object_store.secret_key = *secret_key;
        }
        if (const auto token = read_env("AWS_SESSION_TOKEN"))
        {
            config.object_store.session_token = *token;
        }

        const auto region = read_env("AWS_REGION");
        if (region)
        {
            config.object_store.region = *region;
        }
        if (const auto storage = read_env("FTP_STORAGE"))
        {
            config.storage = parse_storage_kind(*storage);
        }
        else if (region)
        {
            config.storage = StorageKind::ObjectStore;
        }
    }

    std::chrono::milliseconds idle_timeout_from_seconds(std::uint64_t seconds)
    {
        if (seconds == 0 || seconds > static_cast<std::uint64_t>(kMaxIdleTimeout.count()))
        {
            throw ConfigError("Idle timeout must be between 1 and " + std::to_string(kMaxIdleTimeout.count()) +
                              " seconds");
        }
        return std::chrono::seconds(static_cast<std::int64_t>(seconds));
    }

    void validate(const ServerConfig &config)
    {
        if (config.idle_timeout.count() <= 0 || config.accept_timeout.count() <= 0)
        {
            throw ConfigError("Timeouts must be positive");
        }
        if (config.idle_timeout > kMaxIdleTimeout)
        {
            throw ConfigError("Idle timeout exceeds " + std::to_string(kMaxIdleTimeout.count()) + " seconds");
        }
        if (config.chunk_size == 0)
        {
            throw ConfigError("Chunk size must be positive");
        }
        switch (config.storage)
        {
        case StorageKind::Local:
            if (config.root.empty())
            {
                throw ConfigError("Local storage requires a root directory");
            }
            break;
        case StorageKind::ObjectStore:
            if (config.object_store.bucket.empty())
            {
                throw ConfigError("Object storage requires a bucket (S3_BUCKET)");
            }
            if (config.object_store.region.empty())
            {
                throw ConfigError("Object storage requires a region (AWS_REGION)");
            }
            break;
        }
    }

} // namespace ferry::server
