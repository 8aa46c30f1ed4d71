#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "ferry/protocol.hpp"
#include "ferry/server/config.hpp"
#include "ferry/server/server.hpp"
#include "ferry/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    using ferry::server::ConfigError;
    using ferry::server::ServerConfig;

    void print_usage(const char *program_name)
    {
        std::cout << "Ferry server " << ferry::version() << "\n"
                  << "Usage: " << program_name
                  << " [--port <PORT>] [--address <ADDRESS>] [--storage local|s3] [--root <DIR>]\n"
                     "       [--bucket <BUCKET>] [--region <REGION>] [--endpoint <HOST[:PORT]>]\n"
                     "       [--idle-timeout <seconds>] [--config <FILE>] [--log <FILE>] [--verbose]\n"
                     "Environment: FTP_PORT FTP_STORAGE FTP_ROOT S3_BUCKET S3_ENDPOINT AWS_REGION\n"
                     "             AWS_ACCESS_KEY_ID AWS_SECRET_ACCESS_KEY AWS_SESSION_TOKEN\n";
    }

    std::string read_option(int &index, int argc, char *argv[])
    {
        const std::string flag = argv[index];
        if (index + 1 >= argc)
        {
            throw ConfigError("Missing value for " + flag);
        }
        ++index;
        return std::string(argv[index]);
    }

    std::uint64_t read_number(const std::string &flag, const std::string &value)
    {
        const auto number = ferry::protocol::parse_size(value);
        if (!number)
        {
            throw ConfigError("Invalid value for " + flag + ": " + value);
        }
        return *number;
    }

    std::optional<std::filesystem::path> find_config_file(int argc, char *argv[])
    {
        for (int i = 1; i < argc; ++i)
        {
            if (std::string(argv[i]) == "--config")
            {
                return std::filesystem::path(read_option(i, argc, argv));
            }
        }
        return std::nullopt;
    }

    // Returns false if the process should exit successfully without serving.
    bool apply_arguments(ServerConfig &config, int argc, char *argv[])
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--port")
            {
                const auto port = read_number(arg, read_option(i, argc, argv));
                if (port > 65535)
                {
                    throw ConfigError("Invalid port: " + std::to_string(port));
                }
                config.port = static_cast<std::uint16_t>(port);
            }
            else if (arg == "--address")
            {
                config.address = read_option(i, argc, argv);
            }
            else if (arg == "--storage")
            {
                const auto value = read_option(i, argc, argv);
                const auto kind = ferry::server::storage_kind_from_string(value);
                if (!kind)
                {
                    throw ConfigError("Unknown storage backend: " + value);
                }
                config.storage = *kind;
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(read_option(i, argc, argv));
            }
            else if (arg == "--bucket")
            {
                config.object_store.bucket = read_option(i, argc, argv);
            }
            else if (arg == "--region")
            {
                config.object_store.region = read_option(i, argc, argv);
            }
            else if (arg == "--endpoint")
            {
                config.object_store.endpoint = read_option(i, argc, argv);
            }
            else if (arg == "--idle-timeout")
            {
                const auto seconds = read_number(arg, read_option(i, argc, argv));
                config.idle_timeout = ferry::server::idle_timeout_from_seconds(seconds);
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(read_option(i, argc, argv));
            }
            else if (arg == "--config")
            {
                // Already applied before the environment.
                read_option(i, argc, argv);
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.log_level = "debug";
            }
            else if (arg == "--help" || arg == "-h")
            {
                return false;
            }
            else
            {
                throw ConfigError("Unknown argument: " + arg);
            }
        }
        return true;
    }

    void setup_logging(const ServerConfig &config)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.log_level));
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

} // namespace

int main(int argc, char *argv[])
{
    using ferry::server::Server;

    ServerConfig config;
    try
    {
        if (const auto config_file = find_config_file(argc, argv))
        {
            ferry::server::apply_config_file(config, *config_file);
        }
        ferry::server::apply_environment(config);
        if (!apply_arguments(config, argc, argv))
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        ferry::server::validate(config);
    }
    catch (const ConfigError &ex)
    {
        std::cerr << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        setup_logging(config);
        spdlog::info("Starting Ferry server {} on {}:{}", ferry::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
