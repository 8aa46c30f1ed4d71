#include "ferry/error_codes.hpp"

#include <array>

namespace ferry
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 7> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::ProtocolError, "protocol_error"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::BackendUnavailable, "backend_unavailable"},
            {ErrorCode::TransferIncomplete, "transfer_incomplete"},
            {ErrorCode::ConnectionFault, "connection_fault"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

} // namespace ferry
