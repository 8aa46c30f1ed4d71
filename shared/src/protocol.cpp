#include "ferry/protocol.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ferry::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 3> kCommandMappings{{
            {Command::List, "ls"},
            {Command::Get, "get"},
            {Command::Put, "put"},
        }};

        bool iequals(std::string_view lhs, std::string_view rhs) noexcept
        {
            return lhs.size() == rhs.size() &&
                   std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b)
                              { return std::tolower(static_cast<unsigned char>(a)) ==
                                       std::tolower(static_cast<unsigned char>(b)); });
        }

        std::vector<std::string_view> split_tokens(std::string_view line)
        {
            std::vector<std::string_view> tokens;
            std::size_t pos = 0;
            while (pos < line.size())
            {
                while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos])))
                {
                    ++pos;
                }
                const auto begin = pos;
                while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos])))
                {
                    ++pos;
                }
                if (pos > begin)
                {
                    tokens.push_back(line.substr(begin, pos - begin));
                }
            }
            return tokens;
        }

        std::string join_tokens(const std::vector<std::string_view> &tokens, std::size_t first, std::size_t last)
        {
            std::string joined;
            for (std::size_t i = first; i < last; ++i)
            {
                if (!joined.empty())
                {
                    joined.push_back(' ');
                }
                joined.append(tokens[i]);
            }
            return joined;
        }

        template <typename... Ts>
        struct Overloaded : Ts...
        {
            using Ts::operator()...;
        };
        template <typename... Ts>
        Overloaded(Ts...) -> Overloaded<Ts...>;

    } // namespace

    ProtocolError::ProtocolError(const std::string &message) : std::runtime_error(message) {}

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (iequals(mapping.label, value))
            {
                return mapping.command;
            }
        }
        return std::nullopt;
    }

    TransferRequest parse_request(std::string_view line)
    {
        const auto tokens = split_tokens(line);
        if (tokens.empty())
        {
            throw ProtocolError("Unknown command");
        }
        const auto command = command_from_string(tokens.front());
        if (!command)
        {
            throw ProtocolError("Unknown command");
        }

        switch (*command)
        {
        case Command::List:
            return ListRequest{};
        case Command::Get:
            if (tokens.size() < 2)
            {
                throw ProtocolError("Invalid GET format");
            }
            return GetRequest{.name = join_tokens(tokens, 1, tokens.size())};
        case Command::Put:
        {
            if (tokens.size() < 3)
            {
                throw ProtocolError("Invalid PUT format");
            }
            const auto size = parse_size(tokens.back());
            if (!size)
            {
                throw ProtocolError("Invalid filesize");
            }
            return PutRequest{.name = join_tokens(tokens, 1, tokens.size() - 1), .size = *size};
        }
        }
        throw ProtocolError("Unknown command");
    }

    std::string to_string(const TransferRequest &request)
    {
        return std::visit(Overloaded{
                              [](const ListRequest &) -> std::string
                              { return "ls"; },
                              [](const GetRequest &get) -> std::string
                              { return "get " + get.name; },
                              [](const PutRequest &put) -> std::string
                              { return "put " + put.name + " (" + std::to_string(put.size) + " bytes)"; },
                          },
                          request);
    }

    std::string request_line(const TransferRequest &request)
    {
        return std::visit(Overloaded{
                              [](const ListRequest &) -> std::string
                              { return "ls\n"; },
                              [](const GetRequest &get) -> std::string
                              { return "get " + get.name + "\n"; },
                              [](const PutRequest &put) -> std::string
                              { return "put " + put.name + " " + std::to_string(put.size) + "\n"; },
                          },
                          request);
    }

    std::optional<std::uint64_t> parse_size(std::string_view token) noexcept
    {
        if (token.empty())
        {
            return std::nullopt;
        }
        std::uint64_t value = 0;
        const auto *const end = token.data() + token.size();
        const auto [ptr, ec] = std::from_chars(token.data(), end, value);
        if (ec != std::errc{} || ptr != end)
        {
            return std::nullopt;
        }
        return value;
    }

    std::string sanitize_name(std::string_view requested)
    {
        const auto separator = requested.find_last_of("/\\");
        auto name = separator == std::string_view::npos ? requested : requested.substr(separator + 1);
        while (!name.empty() && std::isspace(static_cast<unsigned char>(name.front())))
        {
            name.remove_prefix(1);
        }
        while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back())))
        {
            name.remove_suffix(1);
        }
        // Filesystem APIs stop at an embedded NUL, so control bytes never reach a backend.
        const auto has_control = std::any_of(name.begin(), name.end(), [](char c)
                                             { return std::iscntrl(static_cast<unsigned char>(c)) != 0; });
        if (name.empty() || name == "." || name == ".." || has_control)
        {
            throw ProtocolError("Invalid file name");
        }
        return std::string(name);
    }

    std::string format_timestamp(std::chrono::system_clock::time_point time)
    {
        const auto seconds = std::chrono::system_clock::to_time_t(time);
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        std::array<char, 32> buffer{};
        const auto length = std::strftime(buffer.data(), buffer.size(), "%Y-%m-%d %H:%M:%S", &utc);
        return std::string(buffer.data(), length);
    }

    std::string format_listing_row(const BlobInfo &blob)
    {
        std::ostringstream row;
        row << std::setw(12) << blob.size << ' ' << format_timestamp(blob.modified_at) << ' ' << blob.name;
        return row.str();
    }

    std::string format_listing(const std::vector<BlobInfo> &blobs)
    {
        std::string response;
        if (blobs.empty())
        {
            response.append(kNoFiles);
            response.push_back('\n');
        }
        for (const auto &blob : blobs)
        {
            response.append(format_listing_row(blob));
            response.push_back('\n');
        }
        response.push_back('\n');
        return response;
    }

    std::string format_ok()
    {
        return "OK\n";
    }

    std::string format_ok(std::uint64_t size)
    {
        return "OK " + std::to_string(size) + "\n";
    }

    std::string format_error(std::string_view message)
    {
        std::string line = "ERR ";
        for (const char ch : message)
        {
            line.push_back(ch == '\n' || ch == '\r' ? ' ' : ch);
        }
        line.push_back('\n');
        return line;
    }

    Response parse_response(std::string_view line)
    {
        if (line == "OK")
        {
            return {.kind = ResponseKind::Ok, .detail = ""};
        }
        if (line.starts_with("OK "))
        {
            return {.kind = ResponseKind::Ok, .detail = std::string(line.substr(3))};
        }
        if (line == "ERR")
        {
            return {.kind = ResponseKind::Error, .detail = ""};
        }
        if (line.starts_with("ERR "))
        {
            return {.kind = ResponseKind::Error, .detail = std::string(line.substr(4))};
        }
        return {.kind = ResponseKind::Data, .detail = std::string(line)};
    }

} // namespace ferry::protocol
