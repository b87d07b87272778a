#include "skydrive/http.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <memory>
#include <mutex>
#include <sstream>

#include <curl/curl.h>

#include "skydrive/errors.hpp"
#include "skydrive/url.hpp"

namespace skydrive::http
{

    namespace
    {

        struct CurlHandleDeleter
        {
            void operator()(CURL *handle) const noexcept { curl_easy_cleanup(handle); }
        };

        struct CurlListDeleter
        {
            void operator()(curl_slist *list) const noexcept { curl_slist_free_all(list); }
        };

        using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;
        using CurlList = std::unique_ptr<curl_slist, CurlListDeleter>;

        struct TransferContext
        {
            const HttpRequest *request{};
            HttpResponse *response{};
            std::size_t upload_offset{};
            const CurlTransport::AbortCheck *abort_check{};
            std::exception_ptr failure{};
        };

        void append_header(CurlList &list, const std::string &line)
        {
            auto *head = curl_slist_append(list.get(), line.c_str());
            if (head == nullptr)
            {
                throw TransportError("curl_slist_append failed");
            }
            if (head != list.get())
            {
                list.release();
                list.reset(head);
            }
        }

        std::once_flag &curl_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        bool iequals(std::string_view lhs, std::string_view rhs)
        {
            return lhs.size() == rhs.size() &&
                   std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b)
                              { return std::tolower(static_cast<unsigned char>(a)) ==
                                       std::tolower(static_cast<unsigned char>(b)); });
        }

        std::string trim(std::string_view input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string_view::npos)
            {
                return {};
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return std::string(input.substr(begin, end - begin + 1));
        }

        std::size_t write_callback(char *ptr, std::size_t size, std::size_t nmemb, void *userdata)
        {
            auto *context = static_cast<TransferContext *>(userdata);
            const auto bytes = size * nmemb;
            try
            {
                if (context->request->body_sink && context->response->status >= 200 &&
                    context->response->status < 300)
                {
                    context->request->body_sink(std::string_view(ptr, bytes));
                }
                else
                {
                    context->response->body.append(ptr, bytes);
                }
            }
            catch (...)
            {
                context->failure = std::current_exception();
                return 0;
            }
            return bytes;
        }

        std::size_t read_callback(char *buffer, std::size_t size, std::size_t nitems, void *userdata)
        {
            auto *context = static_cast<TransferContext *>(userdata);
            const auto capacity = size * nitems;
            try
            {
                if (context->request->body_reader)
                {
                    return context->request->body_reader(buffer, capacity);
                }
                const auto &body = context->request->body;
                const auto remaining = body.size() - context->upload_offset;
                const auto count = std::min(capacity, remaining);
                std::copy_n(body.data() + context->upload_offset, count, buffer);
                context->upload_offset += count;
                return count;
            }
            catch (...)
            {
                context->failure = std::current_exception();
                return CURL_READFUNC_ABORT;
            }
        }

        std::size_t header_callback(char *buffer, std::size_t size, std::size_t nitems, void *userdata)
        {
            auto *context = static_cast<TransferContext *>(userdata);
            const auto bytes = size * nitems;
            const std::string_view line(buffer, bytes);
            if (line.rfind("HTTP/", 0) == 0)
            {
                // a new status line starts a new header block (redirects, 100-continue)
                context->response->headers.clear();
                std::istringstream iss{std::string(line)};
                std::string version;
                iss >> version >> context->response->status;
                return bytes;
            }
            const auto colon = line.find(':');
            if (colon != std::string_view::npos)
            {
                context->response->headers.emplace_back(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
            }
            return bytes;
        }

        int progress_callback(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
        {
            const auto *context = static_cast<TransferContext *>(clientp);
            if (context->abort_check && *context->abort_check && (*context->abort_check)())
            {
                return 1;
            }
            return 0;
        }

    } // namespace

    std::optional<std::string> HttpResponse::header(std::string_view name) const
    {
        for (const auto &[key, value] : headers)
        {
            if (iequals(key, name))
            {
                return value;
            }
        }
        return std::nullopt;
    }

    nlohmann::json HttpResponse::json() const
    {
        return nlohmann::json::parse(body, nullptr, false);
    }

    std::string content_range(std::uint64_t start, std::uint64_t length, std::uint64_t total)
    {
        std::ostringstream oss;
        oss << "bytes " << start << '-' << (start + length - 1) << '/' << total;
        return oss.str();
    }

    void ensure_curl_init()
    {
        std::call_once(curl_once_flag(), []()
                       {
            if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
            {
                throw std::runtime_error("libcurl initialization failed");
            } });
    }

    CurlTransport::CurlTransport() = default;

    CurlTransport::CurlTransport(AbortCheck abort_check)
        : abort_check_(std::move(abort_check)) {}

    HttpResponse CurlTransport::perform(const HttpRequest &request)
    {
        ensure_curl_init();

        CurlHandle handle(curl_easy_init());
        if (!handle)
        {
            throw TransportError("curl_easy_init failed");
        }
        CURL *curl = handle.get();

        HttpResponse response{};
        response.method = request.method;
        response.url = request.url;

        TransferContext context{};
        context.request = &request;
        context.response = &response;
        context.abort_check = &abort_check_;

        CurlList header_list;
        for (const auto &[name, value] : request.headers)
        {
            append_header(header_list, name + ": " + value);
        }

        char error_buffer[CURL_ERROR_SIZE] = {};
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &context);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &context);
        if (request.timeout.count() > 0)
        {
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
        }

        if (request.method == "GET")
        {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        }
        else if (request.method == "POST")
        {
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
        }
        else if (request.method == "PUT")
        {
            const auto size = request.body_reader ? request.body_size : request.body.size();
            curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &context);
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
            append_header(header_list, "Expect:");
        }
        else
        {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());

        const auto code = curl_easy_perform(curl);
        if (context.failure)
        {
            std::rethrow_exception(context.failure);
        }
        if (code == CURLE_ABORTED_BY_CALLBACK)
        {
            throw InterruptedError("transfer aborted: " + request.method + ' ' +
                                   url::pop_query(request.url, "access_token"));
        }
        if (code != CURLE_OK)
        {
            std::string detail = error_buffer[0] != '\0' ? std::string(error_buffer) : curl_easy_strerror(code);
            throw TransportError(request.method + ' ' + url::pop_query(request.url, "access_token") + ": " + detail);
        }

        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        response.status = status;
        return response;
    }

} // namespace skydrive::http
