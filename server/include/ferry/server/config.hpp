#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ferry::server
{

    enum class StorageKind : std::uint8_t
    {
        Local,
        ObjectStore
    };

    std::string_view to_string(StorageKind kind) noexcept;
    std::optional<StorageKind> storage_kind_from_string(std::string_view value) noexcept;

    struct ObjectStorageConfig
    {
        std::string bucket;
        std::string region;
        // host[:port]; empty means s3.<region>.amazonaws.com
        std::string endpoint;
        std::string access_key;
        std::string secret_key;
        std::string session_token;
    };

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{5001};
        StorageKind storage{StorageKind::Local};
        std::filesystem::path root{"./uploads"};
        ObjectStorageConfig object_store;
        std::chrono::milliseconds idle_timeout{std::chrono::seconds{10}};
        std::chrono::milliseconds accept_timeout{std::chrono::seconds{1}};
        int backlog{128};
        std::size_t chunk_size{4096};
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};
    };

    inline constexpr std::chrono::seconds kMaxIdleTimeout{86400};

    class ConfigError : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string &message);
    };

    /// Throws ConfigError unless 0 < seconds <= kMaxIdleTimeout.
    std::chrono::milliseconds idle_timeout_from_seconds(std::uint64_t seconds);

    /// Overlays values from a JSON document onto config.
    void apply_config_file(ServerConfig &config, const std::filesystem::path &path);

    /// Overlays FTP_* / S3_* / AWS_* environment variables onto config.
    void apply_environment(ServerConfig &config);

    /// Throws ConfigError if the selected backend lacks required settings.
    void validate(const ServerConfig &config);

} // namespace ferry::server
