#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace ferry::client
{

    struct ClientConfig
    {
        std::string host;
        std::uint16_t port{};
        std::optional<std::filesystem::path> log_path;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace ferry::client
