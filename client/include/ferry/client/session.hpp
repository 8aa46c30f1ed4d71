#pragma once

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "ferry/client/config.hpp"
#include "ferry/client/logger.hpp"
#include "ferry/client/transfer_client.hpp"

namespace ferry::client
{

    /// Interactive `ftp> ` shell on top of TransferClient.
    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, Logger logger, std::istream &input = std::cin,
                      std::ostream &output = std::cout);

        int run();

    private:
        void connect();
        void interactive_shell();
        bool dispatch(const std::string &command, const std::vector<std::string> &args);
        void print_help();

        // Command handlers
        bool handle_list(const std::vector<std::string> &args);
        bool handle_get(const std::vector<std::string> &args);
        bool handle_put(const std::vector<std::string> &args);

        ClientConfig config_;
        Logger logger_;
        std::istream &input_;
        std::ostream &output_;
        TransferClient client_;
    };

} // namespace ferry::client
