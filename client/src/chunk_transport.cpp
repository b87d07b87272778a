#include "skydrive/client/chunk_transport.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "skydrive/errors.hpp"

namespace skydrive::client
{

    namespace
    {

        void seek(std::istream &source, std::uint64_t offset)
        {
            source.clear();
            source.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
            if (!source)
            {
                throw std::runtime_error("Unable to seek to offset " + std::to_string(offset));
            }
        }

    } // namespace

    FileSegment::FileSegment(std::istream &source, std::uint64_t start, std::uint64_t length)
        : source_(source), start_(start), length_(length)
    {
        seek(source_, start_);
    }

    std::size_t FileSegment::read(char *buffer, std::size_t capacity)
    {
        const auto count = static_cast<std::size_t>(std::min<std::uint64_t>(capacity, remaining()));
        if (count == 0)
        {
            return 0;
        }
        source_.read(buffer, static_cast<std::streamsize>(count));
        const auto got = static_cast<std::size_t>(source_.gcount());
        if (got != count)
        {
            throw std::runtime_error("Unexpected end of file at offset " + std::to_string(start_ + consumed_ + got));
        }
        consumed_ += got;
        return got;
    }

    ChunkTransport::ChunkTransport(AuthenticatedClient &client, PayloadMode mode, std::size_t retries)
        : client_(client), mode_(mode), retries_(retries) {}

    http::HttpResponse ChunkTransport::put(const std::string &url, const ByteRange &range, std::istream &source,
                                           std::chrono::milliseconds timeout, std::string_view label)
    {
        std::string buffer;
        if (mode_ == PayloadMode::Buffered)
        {
            buffer.resize(static_cast<std::size_t>(range.length));
            FileSegment segment(source, range.start, range.length);
            std::size_t filled = 0;
            while (filled < buffer.size())
            {
                filled += segment.read(buffer.data() + filled, buffer.size() - filled);
            }
        }

        const auto content_range = http::content_range(range.start, range.length, range.total);
        for (std::size_t attempt = 0;; ++attempt)
        {
            http::HttpRequest request;
            request.method = "PUT";
            request.url = url;
            request.timeout = timeout;
            request.headers.emplace_back("Content-Range", content_range);
            request.headers.emplace_back("Content-Type", "application/octet-stream");

            std::optional<FileSegment> segment;
            if (mode_ == PayloadMode::Buffered)
            {
                request.body = buffer;
            }
            else
            {
                segment.emplace(source, range.start, range.length);
                request.body_size = range.length;
                request.body_reader = [&segment](char *out, std::size_t capacity)
                { return segment->read(out, capacity); };
            }

            try
            {
                spdlog::info("{}: PUT {}", label, content_range);
                return client_.send(std::move(request));
            }
            catch (const TransportError &ex)
            {
                if (attempt >= retries_)
                {
                    spdlog::error("{}: giving up on {} after {} retries: {}", label, content_range, retries_,
                                  ex.what());
                    throw;
                }
                spdlog::warn("{}: {} failed ({}), retrying ({}/{})", label, content_range, ex.what(), attempt + 1,
                             retries_);
            }
        }
    }

} // namespace skydrive::client
