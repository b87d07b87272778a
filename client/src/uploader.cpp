#include "skydrive/client/uploader.hpp"

#include <algorithm>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "skydrive/client/chunk_transport.hpp"
#include "skydrive/client/session_store.hpp"
#include "skydrive/crypto.hpp"
#include "skydrive/errors.hpp"
#include "skydrive/url.hpp"

namespace skydrive::client
{

    namespace
    {

        std::ifstream open_local(const std::filesystem::path &path)
        {
            std::ifstream file(path, std::ios::binary);
            if (!file.is_open())
            {
                throw LocalIoError("Unable to open " + path.string());
            }
            return file;
        }

        protocol::DriveItem parse_created_item(const std::string &remote_path, const http::HttpResponse &response)
        {
            const auto json = response.json();
            if (!json.is_object())
            {
                throw UploadError(remote_path, "malformed created item for '" + remote_path + "': " + response.body,
                                  response);
            }
            try
            {
                return json.get<protocol::DriveItem>();
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw UploadError(remote_path,
                                  "malformed created item for '" + remote_path + "' (" + ex.what() +
                                      "): " + response.body,
                                  response);
            }
        }

        void verify_hash(const std::filesystem::path &local_path, const std::string &local_hash,
                         const std::string &remote_path, const protocol::DriveItem &item,
                         const std::optional<std::filesystem::path> &saved_session = std::nullopt)
        {
            if (!item.sha1_hash)
            {
                throw IntegrityError("file created response for '" + remote_path +
                                         "' has no key file.hashes.sha1Hash",
                                     saved_session);
            }
            spdlog::info("SHA-1 digest of remote file '{}': {}", remote_path, *item.sha1_hash);
            if (!crypto::digests_equal(local_hash, *item.sha1_hash))
            {
                const auto message = "SHA-1 digest mismatch: local '" + local_path.string() + "': " + local_hash +
                                     ", remote '" + remote_path + "': " + *item.sha1_hash;
                spdlog::error("{}", message);
                throw IntegrityError(message, saved_session);
            }
        }

    } // namespace

    std::uint64_t clamp_chunk_size(std::uint64_t requested) noexcept
    {
        const auto capped = std::min(requested, kMaxChunkSize);
        return std::max(capped / kChunkAlignment * kChunkAlignment, kChunkAlignment);
    }

    std::uint64_t clamp_simple_threshold(std::uint64_t requested) noexcept
    {
        return std::min(requested, kMaxSimpleThreshold);
    }

    UploadOptions normalize_options(UploadOptions options) noexcept
    {
        options.chunk_size = clamp_chunk_size(options.chunk_size);
        options.simple_threshold = clamp_simple_threshold(options.simple_threshold);
        return options;
    }

    Uploader::Uploader(DriveClient &drive, Waiter &waiter, std::filesystem::path data_directory)
        : drive_(drive), waiter_(waiter), data_directory_(std::move(data_directory)) {}

    protocol::DriveItem Uploader::upload(const std::string &directory, const std::filesystem::path &local_path,
                                         const UploadOptions &requested)
    {
        const auto options = normalize_options(requested);

        std::error_code ec;
        const auto status = std::filesystem::status(local_path, ec);
        if (!std::filesystem::exists(status))
        {
            throw NotFoundError(local_path.string(), ItemType::File, "'" + local_path.string() + "' does not exist");
        }
        if (std::filesystem::is_directory(status))
        {
            throw WrongTypeError("'" + local_path.string() + "' is a directory");
        }
        if (!std::filesystem::is_regular_file(status))
        {
            throw WrongTypeError("'" + local_path.string() + "' is not a regular file");
        }

        const auto remote_path = url::join_remote(url::normalize_remote(directory), local_path.filename().string());
        if (options.check_remote)
        {
            check_remote(remote_path, options);
        }

        const auto size = std::filesystem::file_size(local_path);
        if (size <= options.simple_threshold)
        {
            return simple_upload(remote_path, local_path, size, options);
        }
        return resumable_upload(remote_path, local_path, size, options);
    }

    void Uploader::check_remote(const std::string &remote_path, const UploadOptions &options)
    {
        protocol::DriveItem existing;
        try
        {
            existing = drive_.metadata(remote_path);
        }
        catch (const NotFoundError &)
        {
            return;
        }
        if (existing.is_folder)
        {
            throw WrongTypeError("'" + remote_path + "' already exists at '" + existing.web_url +
                                 "' and is a directory");
        }
        if (options.conflict == protocol::ConflictBehavior::Fail)
        {
            throw AlreadyExistsError(remote_path, ItemType::File, existing.web_url);
        }
        spdlog::info("{}: exists remotely, conflict behavior '{}'", remote_path, protocol::to_string(options.conflict));
    }

    protocol::DriveItem Uploader::simple_upload(const std::string &remote_path, const std::filesystem::path &local_path,
                                                std::uint64_t size, const UploadOptions &options)
    {
        auto file = open_local(local_path);
        FileSegment segment(file, 0, size);

        http::HttpRequest request;
        request.method = "PUT";
        request.url = url::drive_item_path(remote_path, "content") +
                      "?@name.conflictBehavior=" + std::string(protocol::to_string(options.conflict));
        request.headers.emplace_back("Content-Type", "application/octet-stream");
        request.timeout = options.timeout;
        request.body_size = size;
        request.body_reader = [&segment](char *buffer, std::size_t capacity)
        { return segment.read(buffer, capacity); };

        spdlog::info("{}: simple upload of {} bytes", remote_path, size);
        http::HttpResponse response;
        try
        {
            response = drive_.client().send(std::move(request));
        }
        catch (const TransportError &ex)
        {
            throw UploadError(remote_path, "error occurred when trying to upload '" + remote_path + "': " + ex.what(),
                              std::nullopt, std::nullopt, ErrorCode::TransportError);
        }
        if (!response.ok())
        {
            throw UploadError::from_response(remote_path, response, "simple upload request");
        }

        auto item = parse_created_item(remote_path, response);
        if (options.compare_hash)
        {
            verify_hash(local_path, crypto::sha1_file(local_path), remote_path, item);
        }
        spdlog::info("{}: uploaded", remote_path);
        return item;
    }

    protocol::DriveItem Uploader::resumable_upload(const std::string &remote_path,
                                                   const std::filesystem::path &local_path, std::uint64_t size,
                                                   const UploadOptions &options)
    {
        std::string local_hash;
        std::optional<SessionStore> store;
        if (options.compare_hash)
        {
            local_hash = crypto::sha1_file(local_path);
            spdlog::info("SHA-1 digest of local file '{}': {}", local_path.string(), local_hash);
            store.emplace(data_directory_, remote_path, local_hash);
        }

        auto file = open_local(local_path);
        ChunkTransport transport(drive_.client(), options.stream ? PayloadMode::Streaming : PayloadMode::Buffered);
        UploadSessionParams params{
            .remote_path = remote_path,
            .conflict = options.conflict,
            .chunk_size = options.chunk_size,
            .timeout = options.timeout,
            .backoff = options.backoff,
        };
        UploadSession session(drive_, transport, waiter_, std::move(params), store ? &*store : nullptr);
        auto item = session.run(file, size);

        if (options.compare_hash)
        {
            std::optional<std::filesystem::path> saved_session;
            std::error_code ec;
            if (store && std::filesystem::exists(store->path(), ec))
            {
                saved_session = store->path();
            }
            verify_hash(local_path, local_hash, remote_path, item, saved_session);
        }
        if (store)
        {
            store->discard();
        }
        spdlog::info("{}: uploaded", remote_path);
        return item;
    }

} // namespace skydrive::client
