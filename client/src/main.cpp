#include <cstdlib>
#include <iostream>

#include "ferry/client/config.hpp"
#include "ferry/client/logger.hpp"
#include "ferry/client/session.hpp"

int main(int argc, char *argv[])
{
    using namespace ferry::client;

    try
    {
        const auto config = parse_arguments(argc, argv);
        Logger logger(config.log_path);
        ClientSession session(config, std::move(logger));
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
