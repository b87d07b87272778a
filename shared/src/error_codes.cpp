#include "skydrive/error_codes.hpp"

#include <array>

namespace skydrive
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 11> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::AlreadyExists, "already_exists"},
            {ErrorCode::WrongType, "wrong_type"},
            {ErrorCode::TransportError, "transport_error"},
            {ErrorCode::ProtocolError, "protocol_error"},
            {ErrorCode::IntegrityError, "integrity_error"},
            {ErrorCode::Interrupted, "interrupted"},
            {ErrorCode::ConfigError, "config_error"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::LocalIoError, "local_io_error"},
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

} // namespace skydrive
