#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "skydrive/client/config.hpp"
#include "skydrive/http.hpp"
#include "skydrive/protocol.hpp"

namespace skydrive::client
{

    // Sends requests on behalf of one account. URLs starting with '/' are
    // resolved against the API endpoint; only requests addressed to the API
    // endpoint carry the bearer token, pre-authenticated upload and download
    // URLs are sent as they are.
    class AuthenticatedClient
    {
    public:
        AuthenticatedClient(OAuthCredentials credentials, std::shared_ptr<http::HttpTransport> transport,
                            std::string api_endpoint = std::string(protocol::kApiEndpoint),
                            std::string token_endpoint = std::string(protocol::kTokenEndpoint));

        http::HttpResponse send(http::HttpRequest request);

        http::HttpResponse get(const std::string &url, std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

        http::HttpResponse post_json(const std::string &url, const nlohmann::json &body);

        // Forces a token refresh regardless of the cached expiry.
        void refresh_access_token();

        std::string resolve(const std::string &url) const;

        const std::string &api_endpoint() const noexcept { return api_endpoint_; }

    private:
        std::string access_token();
        void refresh_locked();

        OAuthCredentials credentials_;
        std::shared_ptr<http::HttpTransport> transport_;
        std::string api_endpoint_;
        std::string token_endpoint_;

        std::mutex mutex_;
        std::string access_token_;
        std::chrono::steady_clock::time_point expires_at_{};
    };

} // namespace skydrive::client
