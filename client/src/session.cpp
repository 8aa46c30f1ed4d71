#include "ferry/client/session.hpp"

#include <cctype>
#include <sstream>

namespace ferry::client
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::vector<std::string> split_tokens(const std::string &input)
        {
            std::vector<std::string> tokens;
            std::istringstream iss(input);
            std::string token;
            while (iss >> token)
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string to_lower(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            return value;
        }

    } // namespace

    ClientSession::ClientSession(ClientConfig config, Logger logger, std::istream &input, std::ostream &output)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          input_(input),
          output_(output) {}

    int ClientSession::run()
    {
        try
        {
            connect();
            interactive_shell();
        }
        catch (const std::exception &ex)
        {
            output_ << "ERROR: " << ex.what() << std::endl;
            logger_.log("error", "fatal: ", ex.what());
            return 1;
        }
        client_.close();
        return 0;
    }

    void ClientSession::connect()
    {
        client_.connect(config_.host, config_.port);
        logger_.log("info", "connected to ", config_.host, ':', config_.port);
        output_ << "Connected. Commands: ls, get <file>, put <file>, help, exit" << std::endl;
    }

    void ClientSession::interactive_shell()
    {
        while (true)
        {
            output_ << "ftp> " << std::flush;
            std::string line;
            if (!std::getline(input_, line))
            {
                output_ << std::endl;
                break;
            }
            line = trim(line);
            if (line.empty())
            {
                continue;
            }
            logger_.log("cmd", line);

            const auto tokens = split_tokens(line);
            const auto command = to_lower(tokens[0]);
            const std::vector<std::string> args(tokens.begin() + 1, tokens.end());

            if (command == "exit" || command == "quit")
            {
                break;
            }
            if (command == "help")
            {
                print_help();
                continue;
            }

            try
            {
                if (!dispatch(command, args))
                {
                    output_ << "Unknown command." << std::endl;
                }
            }
            catch (const ClientError &ex)
            {
                output_ << "ERR " << ex.what() << std::endl;
                logger_.log("error", "command failed (", ferry::to_string(ex.code()), "): ", ex.what());
                if (!ferry::is_recoverable(ex.code()) || !client_.connected())
                {
                    client_.close();
                    output_ << "Connection lost." << std::endl;
                    break;
                }
            }
            catch (const std::filesystem::filesystem_error &ex)
            {
                output_ << "ERROR: " << ex.what() << std::endl;
                logger_.log("error", "local file error: ", ex.what());
            }
        }
    }

    bool ClientSession::dispatch(const std::string &command, const std::vector<std::string> &args)
    {
        if (command == "ls")
        {
            return handle_list(args);
        }
        if (command == "get")
        {
            return handle_get(args);
        }
        if (command == "put")
        {
            return handle_put(args);
        }
        return false;
    }

    void ClientSession::print_help()
    {
        output_ << "Available commands:" << std::endl;
        output_ << "  ls                      List stored files" << std::endl;
        output_ << "  get <remote> [local]    Download a file" << std::endl;
        output_ << "  put <local>             Upload a file under its own name" << std::endl;
        output_ << "  help                    Show this help" << std::endl;
        output_ << "  exit | quit             Disconnect and exit" << std::endl;
    }

} // namespace ferry::client
