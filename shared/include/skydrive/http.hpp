/**
 * skydrive - Blocking HTTP exchange abstraction and its libcurl implementation.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace skydrive::http
{

    using Header = std::pair<std::string, std::string>;

    // Fills up to `capacity` bytes and returns how many were written; 0 ends the body.
    using BodyReader = std::function<std::size_t(char *buffer, std::size_t capacity)>;

    using BodySink = std::function<void(std::string_view chunk)>;

    struct HttpRequest
    {
        std::string method{"GET"};
        std::string url;
        std::vector<Header> headers{};
        std::string body{};
        BodyReader body_reader{};
        std::uint64_t body_size{};
        BodySink body_sink{};
        std::chrono::milliseconds timeout{0};
    };

    struct HttpResponse
    {
        long status{};
        std::string body{};
        std::vector<Header> headers{};
        std::string method{};
        std::string url{};

        bool ok() const noexcept { return status >= 200 && status < 300; }

        std::optional<std::string> header(std::string_view name) const;

        // Returns a discarded value when the body is not valid JSON.
        nlohmann::json json() const;
    };

    std::string content_range(std::uint64_t start, std::uint64_t length, std::uint64_t total);

    class HttpTransport
    {
    public:
        virtual ~HttpTransport() = default;

        // Throws TransportError on network-level failure; HTTP error statuses are returned.
        virtual HttpResponse perform(const HttpRequest &request) = 0;
    };

    class CurlTransport : public HttpTransport
    {
    public:
        using AbortCheck = std::function<bool()>;

        CurlTransport();

        explicit CurlTransport(AbortCheck abort_check);

        HttpResponse perform(const HttpRequest &request) override;

    private:
        AbortCheck abort_check_;
    };

    void ensure_curl_init();

} // namespace skydrive::http
