#include "skydrive/client/upload_session.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "skydrive/errors.hpp"
#include "skydrive/url.hpp"

namespace skydrive::client
{

    namespace
    {

        constexpr std::string_view kFragmentCheckFailed = "fragmentRowCountCheckFailed";

        constexpr std::array<std::string_view, 5> kChunkResultLabels{
            "progress", "restart_session", "transient_retry", "anomalous_retry", "fatal"};

        constexpr std::array<std::string_view, 7> kPhaseLabels{
            "no_session", "session_active", "uploading", "awaiting_position", "restarting", "completed", "failed"};

        // Decodes `json` into T; wrongly typed fields become an UploadError instead of a json::type_error.
        template <typename T>
        T decode_body(const nlohmann::json &json, const http::HttpResponse &response, const std::string &path,
                      std::string_view what, const std::optional<std::filesystem::path> &saved_session)
        {
            try
            {
                return json.get<T>();
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw UploadError(path,
                                  "malformed " + std::string(what) + " for '" + path + "' (" + ex.what() +
                                      "): " + response.body,
                                  response, saved_session);
            }
        }

        bool is_fragment_check_failure(const http::HttpResponse &response)
        {
            const auto error = protocol::parse_service_error(response.json());
            return error && error->inner_code && *error->inner_code == kFragmentCheckFailed;
        }

    } // namespace

    std::string_view to_string(ChunkResult result) noexcept
    {
        const auto index = static_cast<std::size_t>(result);
        return index < kChunkResultLabels.size() ? kChunkResultLabels[index] : "unknown";
    }

    std::string_view to_string(UploadPhase phase) noexcept
    {
        const auto index = static_cast<std::size_t>(phase);
        return index < kPhaseLabels.size() ? kPhaseLabels[index] : "unknown";
    }

    ChunkResult classify_chunk_response(const http::HttpResponse &response)
    {
        const auto status = response.status;
        if (status == 200 || status == 201 || status == 202)
        {
            return ChunkResult::Progress;
        }
        if (status == 404)
        {
            return ChunkResult::RestartSession;
        }
        if (status == 401)
        {
            return ChunkResult::AnomalousRetry;
        }
        if (status == 416)
        {
            return is_fragment_check_failure(response) ? ChunkResult::AnomalousRetry : ChunkResult::TransientRetry;
        }
        if (status >= 500)
        {
            return ChunkResult::TransientRetry;
        }
        return ChunkResult::Fatal;
    }

    UploadSession::UploadSession(DriveClient &drive, ChunkTransport &transport, Waiter &waiter,
                                 UploadSessionParams params, SessionStore *store)
        : drive_(drive),
          transport_(transport),
          waiter_(waiter),
          params_(std::move(params)),
          store_(store)
    {
        if (params_.chunk_size == 0)
        {
            throw std::invalid_argument("chunk size must be positive");
        }
    }

    protocol::DriveItem UploadSession::run(std::istream &source, std::uint64_t total)
    {
        phase_ = UploadPhase::NoSession;
        state_ = TransferState{0, total, false};
        upload_url_.clear();
        try
        {
            return drive(source);
        }
        catch (const TransportError &ex)
        {
            enter(UploadPhase::Failed);
            throw UploadError(params_.remote_path,
                              "error occurred when trying to upload '" + params_.remote_path + "': " + ex.what(),
                              std::nullopt, saved_session(), ErrorCode::TransportError);
        }
        catch (const std::exception &)
        {
            enter(UploadPhase::Failed);
            throw;
        }
    }

    protocol::DriveItem UploadSession::drive(std::istream &source)
    {
        const auto &path = params_.remote_path;

        if (store_ != nullptr)
        {
            if (const auto saved = store_->load())
            {
                spdlog::info("{}: loaded unfinished session from {}", path, store_->path().string());
                upload_url_ = saved->upload_url;
                if (auto done = recover_position())
                {
                    return *done;
                }
            }
        }
        if (upload_url_.empty())
        {
            initiate();
            state_.position = 0;
        }

        std::optional<http::HttpResponse> last;
        while (state_.position < state_.total)
        {
            enter(UploadPhase::Uploading);
            const auto size = std::min(params_.chunk_size, state_.total - state_.position);
            auto response = transport_.put(upload_url_, ByteRange{state_.position, size, state_.total}, source,
                                           params_.timeout, path);
            const auto result = classify_chunk_response(response);

            switch (result)
            {
            case ChunkResult::Progress:
                state_.anomaly = false;
                state_.position += size;
                last = std::move(response);
                continue;
            case ChunkResult::RestartSession:
                spdlog::warn("{}: upload session vanished (HTTP 404), starting over", path);
                state_.anomaly = false;
                enter(UploadPhase::Restarting);
                initiate();
                state_.position = 0;
                last.reset();
                continue;
            case ChunkResult::AnomalousRetry:
                if (state_.anomaly)
                {
                    throw UploadError::from_response(path, response, "chunk upload request", saved_session());
                }
                spdlog::warn("{}: unexpected HTTP {} upon chunk upload, waiting before retry: {}", path,
                             response.status, response.body);
                state_.anomaly = true;
                waiter_.wait(params_.backoff.anomaly);
                break;
            case ChunkResult::TransientRetry:
                spdlog::warn("{}: HTTP {} upon chunk upload, retrying", path, response.status);
                state_.anomaly = false;
                break;
            case ChunkResult::Fatal:
                throw UploadError::from_response(path, response, "chunk upload request", saved_session());
            }

            waiter_.wait(response.status >= 500 ? params_.backoff.server_error : params_.backoff.client_error);
            last.reset();
            if (auto done = recover_position())
            {
                return *done;
            }
        }

        if (!last)
        {
            throw UploadError(path, "upload of '" + path + "' ended without a response from the server",
                              std::nullopt, saved_session());
        }
        if (last->status != 200 && last->status != 201)
        {
            throw UploadError(path,
                              "upload of '" + path + "' finished but got HTTP " + std::to_string(last->status) +
                                  " instead of a created item: " + last->body,
                              *last, saved_session());
        }
        const auto json = last->json();
        if (!json.is_object())
        {
            throw UploadError(path, "malformed created item for '" + path + "': " + last->body, *last,
                              saved_session());
        }
        auto item = decode_body<protocol::DriveItem>(json, *last, path, "created item", saved_session());
        enter(UploadPhase::Completed);
        return item;
    }

    void UploadSession::initiate()
    {
        const auto &path = params_.remote_path;
        const auto response = drive_.client().post_json(url::drive_item_path(path, "upload.createSession"),
                                                        protocol::create_session_body(params_.conflict));
        if (response.status == 404)
        {
            throw NotFoundError(url::remote_parent(path), ItemType::Directory);
        }
        if (response.status != 200)
        {
            throw UploadError::from_response(path, response, "upload session initiation request", saved_session());
        }

        const auto json = response.json();
        const auto info = json.is_object() ? decode_body<protocol::UploadSessionInfo>(json, response, path,
                                                                                      "upload session", saved_session())
                                           : protocol::UploadSessionInfo{};
        if (info.upload_url.empty())
        {
            throw UploadError(path,
                              "no 'uploadUrl' in response: " + response.body +
                                  "; cannot initiate upload session for '" + path + "'",
                              response, saved_session());
        }
        upload_url_ = url::pop_query(info.upload_url, "access_token");
        enter(UploadPhase::SessionActive);
        spdlog::info("{}: upload session created at {}", path, upload_url_);

        if (store_ != nullptr)
        {
            std::int64_t expires = 0;
            try
            {
                expires = protocol::parse_timestamp(info.expiration_date_time);
            }
            catch (const std::invalid_argument &ex)
            {
                throw UploadError(path, "cannot persist upload session for '" + path + "': " + ex.what(), response);
            }
            store_->save(upload_url_, expires);
        }
    }

    std::optional<protocol::DriveItem> UploadSession::recover_position()
    {
        const auto &path = params_.remote_path;
        enter(UploadPhase::AwaitingPosition);

        const auto response = drive_.client().get(upload_url_, params_.timeout);
        if (response.status != 200)
        {
            throw UploadError::from_response(path, response, "upload session status request", saved_session());
        }
        const auto json = response.json();
        if (!json.is_object())
        {
            throw UploadError(path, "malformed upload session status for '" + path + "': " + response.body, response,
                              saved_session());
        }
        const auto info =
            decode_body<protocol::UploadSessionInfo>(json, response, path, "upload session status", saved_session());
        const auto &ranges = info.next_expected_ranges;

        if (ranges.empty())
        {
            waiter_.wait(params_.backoff.completion_check);
            try
            {
                auto item = drive_.metadata(path);
                spdlog::info("{}: server reports no missing ranges and the item exists", path);
                enter(UploadPhase::Completed);
                return item;
            }
            catch (const NotFoundError &)
            {
                throw UploadError(path, "no missing ranges, but file still does not exist on the remote drive",
                                  response, saved_session());
            }
        }
        if (ranges.size() > 1)
        {
            throw UploadError(path, "got ranges " + json.at("nextExpectedRanges").dump() +
                                        "; multi-range upload not implemented",
                              response, saved_session());
        }

        const auto range = protocol::parse_expected_range(ranges.front());
        if (!range || range->start >= state_.total)
        {
            throw UploadError(path, "malformed expected range '" + ranges.front() + "' for a " +
                                        std::to_string(state_.total) + "-byte upload",
                              response, saved_session());
        }
        state_.position = range->start;
        spdlog::info("{}: resuming at byte {}", path, state_.position);
        return std::nullopt;
    }

    void UploadSession::enter(UploadPhase phase)
    {
        if (phase != phase_)
        {
            spdlog::debug("{}: {} -> {}", params_.remote_path, to_string(phase_), to_string(phase));
            phase_ = phase;
        }
    }

    std::optional<std::filesystem::path> UploadSession::saved_session() const
    {
        std::error_code ec;
        if (store_ == nullptr || !std::filesystem::exists(store_->path(), ec))
        {
            return std::nullopt;
        }
        return store_->path();
    }

} // namespace skydrive::client
