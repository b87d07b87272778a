#include "skydrive/client/auth.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "skydrive/errors.hpp"
#include "skydrive/url.hpp"

namespace skydrive::client
{

    namespace
    {

        constexpr std::chrono::seconds kExpiryMargin{60};
        constexpr std::int64_t kDefaultTokenLifetime = 3600;

    } // namespace

    AuthenticatedClient::AuthenticatedClient(OAuthCredentials credentials,
                                             std::shared_ptr<http::HttpTransport> transport,
                                             std::string api_endpoint, std::string token_endpoint)
        : credentials_(std::move(credentials)),
          transport_(std::move(transport)),
          api_endpoint_(std::move(api_endpoint)),
          token_endpoint_(std::move(token_endpoint))
    {
        while (!api_endpoint_.empty() && api_endpoint_.back() == '/')
        {
            api_endpoint_.pop_back();
        }
    }

    std::string AuthenticatedClient::resolve(const std::string &url) const
    {
        if (!url.empty() && url.front() == '/')
        {
            return api_endpoint_ + url;
        }
        return url;
    }

    http::HttpResponse AuthenticatedClient::send(http::HttpRequest request)
    {
        request.url = resolve(request.url);
        if (request.url.rfind(api_endpoint_ + '/', 0) == 0)
        {
            request.headers.emplace_back("Authorization", "Bearer " + access_token());
        }
        return transport_->perform(request);
    }

    http::HttpResponse AuthenticatedClient::get(const std::string &url, std::chrono::milliseconds timeout)
    {
        http::HttpRequest request;
        request.method = "GET";
        request.url = url;
        request.timeout = timeout;
        return send(std::move(request));
    }

    http::HttpResponse AuthenticatedClient::post_json(const std::string &url, const nlohmann::json &body)
    {
        http::HttpRequest request;
        request.method = "POST";
        request.url = url;
        request.headers.emplace_back("Content-Type", "application/json");
        request.body = body.dump();
        return send(std::move(request));
    }

    void AuthenticatedClient::refresh_access_token()
    {
        std::lock_guard lock(mutex_);
        refresh_locked();
    }

    std::string AuthenticatedClient::access_token()
    {
        std::lock_guard lock(mutex_);
        if (access_token_.empty() || std::chrono::steady_clock::now() + kExpiryMargin >= expires_at_)
        {
            refresh_locked();
        }
        return access_token_;
    }

    void AuthenticatedClient::refresh_locked()
    {
        http::HttpRequest request;
        request.method = "POST";
        request.url = token_endpoint_;
        request.headers.emplace_back("Content-Type", "application/x-www-form-urlencoded");
        request.body = url::form_encode({
            {"client_id", credentials_.client_id},
            {"client_secret", credentials_.client_secret},
            {"refresh_token", credentials_.refresh_token},
            {"redirect_uri", credentials_.redirect_uri},
            {"grant_type", "refresh_token"},
        });

        const auto response = transport_->perform(request);
        if (response.status != 200)
        {
            throw RequestError(response, "access token refresh request");
        }
        const auto json = response.json();
        if (!json.is_object() || !json.contains("access_token") || !json.at("access_token").is_string())
        {
            throw RequestError("no 'access_token' in token response: " + response.body, response);
        }
        access_token_ = json.at("access_token").get<std::string>();
        std::int64_t lifetime = kDefaultTokenLifetime;
        if (json.contains("expires_in") && json.at("expires_in").is_number_integer())
        {
            lifetime = json.at("expires_in").get<std::int64_t>();
        }
        expires_at_ = std::chrono::steady_clock::now() + std::chrono::seconds(lifetime);
        spdlog::info("Refreshed access token, valid for {}s", lifetime);
    }

} // namespace skydrive::client
