#include "ferry/framing.hpp"

#include <algorithm>

namespace ferry::protocol
{

    namespace
    {
        std::string strip_carriage_return(std::string line)
        {
            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }
            return line;
        }
    } // namespace

    CommandSplit split_command(std::span<const std::uint8_t> chunk)
    {
        const auto newline = std::find(chunk.begin(), chunk.end(), static_cast<std::uint8_t>('\n'));
        if (newline == chunk.end())
        {
            return {.command = std::string(chunk.begin(), chunk.end()), .bytes_consumed = chunk.size()};
        }
        const auto length = static_cast<std::size_t>(newline - chunk.begin());
        return {
            .command = strip_carriage_return(std::string(chunk.begin(), newline)),
            .bytes_consumed = length + 1,
        };
    }

    std::optional<std::string> take_line(std::vector<std::uint8_t> &buffer)
    {
        const auto newline = std::find(buffer.begin(), buffer.end(), static_cast<std::uint8_t>('\n'));
        if (newline == buffer.end())
        {
            return std::nullopt;
        }
        std::string line(buffer.begin(), newline);
        buffer.erase(buffer.begin(), newline + 1);
        return strip_carriage_return(std::move(line));
    }

} // namespace ferry::protocol
