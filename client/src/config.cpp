#include "ferry/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

#include "ferry/protocol.hpp"

namespace ferry::client
{

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error("Usage: ferry-client <server>:<port> [--log <file>]");
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        const auto colon_pos = endpoint.rfind(':');
        if (colon_pos == std::string::npos)
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = endpoint.substr(0, colon_pos);
        if (config.host.empty())
        {
            config.host = "localhost";
        }
        const auto port = ferry::protocol::parse_size(endpoint.substr(colon_pos + 1));
        if (!port || *port == 0 || *port > 65535)
        {
            throw std::runtime_error("Invalid port in " + endpoint);
        }
        config.port = static_cast<std::uint16_t>(*port);

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log requires a file path");
                }
                config.log_path = std::filesystem::path(argv[index++]);
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        return config;
    }

} // namespace ferry::client
