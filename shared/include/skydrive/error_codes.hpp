/**
 * skydrive - Error codes shared by the HTTP layer, the upload core and the CLI.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace skydrive
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        NotFound = 1,
        AlreadyExists = 2,
        WrongType = 3,
        TransportError = 4,
        ProtocolError = 5,
        IntegrityError = 6,
        Interrupted = 7,
        ConfigError = 8,
        InvalidArgument = 9,
        LocalIoError = 10
    };

    std::string_view to_string(ErrorCode code) noexcept;

} // namespace skydrive
