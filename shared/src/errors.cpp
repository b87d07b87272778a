#include "skydrive/errors.hpp"

#include <sstream>
#include <utility>

#include "skydrive/url.hpp"

namespace skydrive
{

    namespace
    {

        std::string describe_path(std::string_view path, ItemType type)
        {
            std::ostringstream oss;
            if (type != ItemType::Unspecified)
            {
                if (path.empty())
                {
                    oss << "requested " << to_string(type);
                }
                else
                {
                    oss << to_string(type) << " '" << path << "'";
                }
            }
            else if (path.empty())
            {
                oss << "requested file or directory";
            }
            else
            {
                oss << "'" << path << "'";
            }
            return oss.str();
        }

    } // namespace

    std::string_view to_string(ItemType type) noexcept
    {
        switch (type)
        {
        case ItemType::File:
            return "file";
        case ItemType::Directory:
            return "directory";
        case ItemType::Unspecified:
            break;
        }
        return "item";
    }

    ApiError::ApiError(ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code) {}

    NotFoundError::NotFoundError(std::string path, ItemType type, std::optional<std::string> message)
        : ApiError(ErrorCode::NotFound,
                   message ? *message : describe_path(path, type) + " not found on the remote drive"),
          path_(std::move(path)),
          type_(type) {}

    AlreadyExistsError::AlreadyExistsError(std::string path, ItemType type, std::optional<std::string> url,
                                           std::optional<std::string> message)
        : ApiError(ErrorCode::AlreadyExists,
                   message ? *message
                           : describe_path(path, type) + " already exists " +
                                 (url ? "at " + *url : std::string("on the remote drive"))),
          path_(std::move(path)),
          type_(type),
          url_(std::move(url)) {}

    WrongTypeError::WrongTypeError(const std::string &message)
        : ApiError(ErrorCode::WrongType, message) {}

    TransportError::TransportError(const std::string &message)
        : ApiError(ErrorCode::TransportError, message) {}

    InterruptedError::InterruptedError(const std::string &message)
        : ApiError(ErrorCode::Interrupted, message) {}

    ConfigError::ConfigError(const std::string &message)
        : ApiError(ErrorCode::ConfigError, message) {}

    LocalIoError::LocalIoError(const std::string &message)
        : ApiError(ErrorCode::LocalIoError, message) {}

    IntegrityError::IntegrityError(const std::string &message, std::optional<std::filesystem::path> saved_session)
        : ApiError(ErrorCode::IntegrityError, message + saved_session_suffix(saved_session)),
          saved_session_(std::move(saved_session)) {}

    RequestError::RequestError(const http::HttpResponse &response, std::string_view request_desc)
        : ApiError(ErrorCode::ProtocolError, describe_failed_request(response, request_desc)),
          response_(response) {}

    RequestError::RequestError(const std::string &message, std::optional<http::HttpResponse> response)
        : ApiError(ErrorCode::ProtocolError, message),
          response_(std::move(response)) {}

    RequestError::RequestError(ErrorCode code, const std::string &message,
                               std::optional<http::HttpResponse> response)
        : ApiError(code, message),
          response_(std::move(response)) {}

    UploadError::UploadError(std::string path, const std::string &message,
                             std::optional<http::HttpResponse> response,
                             std::optional<std::filesystem::path> saved_session, ErrorCode code)
        : RequestError(code, message + saved_session_suffix(saved_session), std::move(response)),
          path_(std::move(path)),
          saved_session_(std::move(saved_session)) {}

    UploadError UploadError::from_response(std::string path, const http::HttpResponse &response,
                                           std::string_view request_desc,
                                           std::optional<std::filesystem::path> saved_session)
    {
        const auto message = "error occurred when trying to upload '" + path + "'; " +
                             describe_failed_request(response, request_desc);
        return UploadError(std::move(path), message, response, std::move(saved_session));
    }

    std::string describe_failed_request(const http::HttpResponse &response, std::string_view request_desc)
    {
        std::ostringstream oss;
        oss << "got HTTP " << response.status << " upon " << (request_desc.empty() ? "API request" : request_desc);
        if (!response.method.empty())
        {
            oss << " (" << response.method << ' ' << url::pop_query(response.url, "access_token") << ')';
        }
        oss << ": " << response.body << "; don't know what to do";
        return oss.str();
    }

    std::string saved_session_suffix(const std::optional<std::filesystem::path> &saved_session)
    {
        if (!saved_session)
        {
            return {};
        }
        return "; session saved to '" + saved_session->string() + "'";
    }

} // namespace skydrive
