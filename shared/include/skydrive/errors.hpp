/**
 * skydrive - Exception hierarchy for remote operations.
 *
 * Every exception derives from ApiError and carries an ErrorCode, so callers
 * that only need the category (the CLI summary line, the batch exit status)
 * can catch the base class.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "skydrive/error_codes.hpp"
#include "skydrive/http.hpp"

namespace skydrive
{

    enum class ItemType : std::uint8_t
    {
        Unspecified,
        File,
        Directory
    };

    std::string_view to_string(ItemType type) noexcept;

    class ApiError : public std::runtime_error
    {
    public:
        ApiError(ErrorCode code, const std::string &message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    class NotFoundError : public ApiError
    {
    public:
        explicit NotFoundError(std::string path, ItemType type = ItemType::Unspecified,
                               std::optional<std::string> message = std::nullopt);

        const std::string &path() const noexcept { return path_; }
        ItemType type() const noexcept { return type_; }

    private:
        std::string path_;
        ItemType type_;
    };

    class AlreadyExistsError : public ApiError
    {
    public:
        AlreadyExistsError(std::string path, ItemType type = ItemType::Unspecified,
                           std::optional<std::string> url = std::nullopt,
                           std::optional<std::string> message = std::nullopt);

        const std::string &path() const noexcept { return path_; }
        ItemType type() const noexcept { return type_; }
        const std::optional<std::string> &url() const noexcept { return url_; }

    private:
        std::string path_;
        ItemType type_;
        std::optional<std::string> url_;
    };

    class WrongTypeError : public ApiError
    {
    public:
        explicit WrongTypeError(const std::string &message);
    };

    class TransportError : public ApiError
    {
    public:
        explicit TransportError(const std::string &message);
    };

    class InterruptedError : public ApiError
    {
    public:
        explicit InterruptedError(const std::string &message = "interrupted by signal");
    };

    class ConfigError : public ApiError
    {
    public:
        explicit ConfigError(const std::string &message);
    };

    // Reading or writing a local file failed.
    class LocalIoError : public ApiError
    {
    public:
        explicit LocalIoError(const std::string &message);
    };

    // Size or hash verification failed. `saved_session` names the session
    // record still on disk when the check ends a resumable upload.
    class IntegrityError : public ApiError
    {
    public:
        explicit IntegrityError(const std::string &message,
                                std::optional<std::filesystem::path> saved_session = std::nullopt);

        const std::optional<std::filesystem::path> &saved_session() const noexcept { return saved_session_; }

    private:
        std::optional<std::filesystem::path> saved_session_;
    };

    // An HTTP exchange that ended with a status nobody knows how to handle.
    class RequestError : public ApiError
    {
    public:
        RequestError(const http::HttpResponse &response, std::string_view request_desc);

        RequestError(const std::string &message, std::optional<http::HttpResponse> response);

        const std::optional<http::HttpResponse> &response() const noexcept { return response_; }

    protected:
        RequestError(ErrorCode code, const std::string &message, std::optional<http::HttpResponse> response);

    private:
        std::optional<http::HttpResponse> response_;
    };

    class UploadError : public RequestError
    {
    public:
        UploadError(std::string path, const std::string &message,
                    std::optional<http::HttpResponse> response = std::nullopt,
                    std::optional<std::filesystem::path> saved_session = std::nullopt,
                    ErrorCode code = ErrorCode::ProtocolError);

        // "error occurred when trying to upload '<path>'; got HTTP <status> upon <desc> ..."
        static UploadError from_response(std::string path, const http::HttpResponse &response,
                                         std::string_view request_desc,
                                         std::optional<std::filesystem::path> saved_session = std::nullopt);

        const std::string &path() const noexcept { return path_; }
        const std::optional<std::filesystem::path> &saved_session() const noexcept { return saved_session_; }

    private:
        std::string path_;
        std::optional<std::filesystem::path> saved_session_;
    };

    std::string describe_failed_request(const http::HttpResponse &response, std::string_view request_desc);

    std::string saved_session_suffix(const std::optional<std::filesystem::path> &saved_session);

} // namespace skydrive
