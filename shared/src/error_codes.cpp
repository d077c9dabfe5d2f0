#include "formupload/error_codes.hpp"

#include <array>

namespace formupload
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 10> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidConfig, "invalid_config"},
            {ErrorCode::StoreUnavailable, "store_unavailable"},
            {ErrorCode::StoreCorrupted, "store_corrupted"},
            {ErrorCode::ProtocolError, "protocol_error"},
            {ErrorCode::TransferFailed, "transfer_failed"},
            {ErrorCode::HttpStatus, "http_status"},
            {ErrorCode::MissingChunkData, "missing_chunk_data"},
            {ErrorCode::Superseded, "superseded"},
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

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

} // namespace formupload
