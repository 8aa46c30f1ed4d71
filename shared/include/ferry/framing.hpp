/**
 * Ferry - Line framing helpers for the text protocol.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace ferry::protocol
{

    struct CommandSplit
    {
        std::string command;
        std::size_t bytes_consumed{};
    };

    /// Extracts a command from freshly received bytes. Commands may arrive with
    /// or without a trailing newline: text up to the first '\n' is the command
    /// and the rest is left for the caller, otherwise the whole chunk is the
    /// command. A '\r' before the newline is dropped.
    CommandSplit split_command(std::span<const std::uint8_t> chunk);

    /// Removes and returns the first complete '\n' terminated line from the
    /// buffer, without its terminator. Returns nullopt if no full line is
    /// buffered yet.
    std::optional<std::string> take_line(std::vector<std::uint8_t> &buffer);

} // namespace ferry::protocol
