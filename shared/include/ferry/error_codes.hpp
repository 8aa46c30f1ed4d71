/**
 * Ferry - Error taxonomy shared by the server and the client.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace ferry
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        ProtocolError = 1,
        NotFound = 2,
        BackendUnavailable = 3,
        TransferIncomplete = 4,
        ConnectionFault = 5,
        InternalError = 6
    };

    std::string_view to_string(ErrorCode code) noexcept;

    // Session keeps serving after these; the others end the connection.
    constexpr bool is_recoverable(ErrorCode code) noexcept
    {
        return code == ErrorCode::ProtocolError || code == ErrorCode::NotFound ||
               code == ErrorCode::BackendUnavailable;
    }

} // namespace ferry
