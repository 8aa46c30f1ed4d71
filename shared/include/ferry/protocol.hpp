/**
 * Ferry - Text command protocol shared by the server and the client.
 *
 * Requests are whitespace separated tokens:
 *   ls
 *   get <name>
 *   put <name> <size>
 * Responses are newline terminated lines. A successful `ls` is a block of rows
 * closed by an empty line; `get`/`put` bodies are raw bytes whose length was
 * announced in the preceding `OK` line.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "ferry/error_codes.hpp"

namespace ferry::protocol
{

    inline constexpr std::size_t kChunkSize = 4096;
    inline constexpr std::string_view kNoFiles = "No files";
    inline constexpr std::string_view kFileNotFound = "File not found";

    enum class Command : std::uint8_t
    {
        List,
        Get,
        Put
    };

    std::string_view to_string(Command command) noexcept;

    // Case-insensitive.
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1,
        Data = 2
    };

    class ProtocolError : public std::runtime_error
    {
    public:
        explicit ProtocolError(const std::string &message);

        ErrorCode code() const noexcept { return ErrorCode::ProtocolError; }
    };

    struct ListRequest
    {
        bool operator==(const ListRequest &) const = default;
    };

    struct GetRequest
    {
        std::string name;

        bool operator==(const GetRequest &) const = default;
    };

    struct PutRequest
    {
        std::string name;
        std::uint64_t size{};

        bool operator==(const PutRequest &) const = default;
    };

    using TransferRequest = std::variant<ListRequest, GetRequest, PutRequest>;

    /// Parses one command line. Throws ProtocolError whose message is the
    /// reason sent back to the peer ("Unknown command", "Invalid GET format",
    /// "Invalid PUT format", "Invalid filesize").
    TransferRequest parse_request(std::string_view line);

    std::string to_string(const TransferRequest &request);

    /// Accepts only plain decimal digits that fit in 64 bits.
    std::optional<std::uint64_t> parse_size(std::string_view token) noexcept;

    /// Reduces a peer supplied name to its last path segment. Both '/' and '\\'
    /// count as separators. Throws ProtocolError when nothing usable remains.
    std::string sanitize_name(std::string_view requested);

    struct BlobInfo
    {
        std::string name;
        std::uint64_t size{};
        std::chrono::system_clock::time_point modified_at{};
    };

    std::string format_timestamp(std::chrono::system_clock::time_point time);

    /// "<size right-aligned to 12> <UTC timestamp> <name>"
    std::string format_listing_row(const BlobInfo &blob);

    /// Complete `ls` response including the terminating empty line.
    std::string format_listing(const std::vector<BlobInfo> &blobs);

    std::string format_ok();
    std::string format_ok(std::uint64_t size);
    std::string format_error(std::string_view message);

    struct Response
    {
        ResponseKind kind{ResponseKind::Data};
        std::string detail;
    };

    /// Classifies one response line (without its newline).
    Response parse_response(std::string_view line);

    inline bool is_listing_terminator(std::string_view line) noexcept
    {
        return line.empty();
    }

    std::string request_line(const TransferRequest &request);

} // namespace ferry::protocol
