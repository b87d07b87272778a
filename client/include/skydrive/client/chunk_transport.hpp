#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <string_view>

#include "skydrive/client/auth.hpp"
#include "skydrive/http.hpp"

namespace skydrive::client
{

    struct ByteRange
    {
        std::uint64_t start{};
        std::uint64_t length{};
        std::uint64_t total{};
    };

    // Exposes the window [start, start + length) of an open stream and
    // nothing beyond it.
    class FileSegment
    {
    public:
        FileSegment(std::istream &source, std::uint64_t start, std::uint64_t length);

        std::size_t read(char *buffer, std::size_t capacity);

        std::uint64_t size() const noexcept { return length_; }
        std::uint64_t remaining() const noexcept { return length_ - consumed_; }

    private:
        std::istream &source_;
        std::uint64_t start_;
        std::uint64_t length_;
        std::uint64_t consumed_{};
    };

    enum class PayloadMode : std::uint8_t
    {
        Buffered,
        Streaming
    };

    // Sends one byte range of the source to an upload session URL.
    // TransportError is retried up to `retries` times; HTTP statuses are
    // returned untouched for the caller to classify.
    class ChunkTransport
    {
    public:
        static constexpr std::size_t kDefaultRetries = 5;

        ChunkTransport(AuthenticatedClient &client, PayloadMode mode, std::size_t retries = kDefaultRetries);

        http::HttpResponse put(const std::string &url, const ByteRange &range, std::istream &source,
                               std::chrono::milliseconds timeout, std::string_view label);

    private:
        AuthenticatedClient &client_;
        PayloadMode mode_;
        std::size_t retries_;
    };

} // namespace skydrive::client
