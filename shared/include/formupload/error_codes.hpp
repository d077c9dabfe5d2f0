/**
 * formupload - Error codes shared by the wire protocol and the upload engine.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace formupload
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidConfig = 1,
        StoreUnavailable = 2,
        StoreCorrupted = 3,
        ProtocolError = 4,
        TransferFailed = 5,
        HttpStatus = 6,
        MissingChunkData = 7,
        Superseded = 8,
        InternalError = 9
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace formupload
