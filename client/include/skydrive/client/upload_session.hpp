#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

#include "skydrive/client/chunk_transport.hpp"
#include "skydrive/client/drive_client.hpp"
#include "skydrive/client/interrupt.hpp"
#include "skydrive/client/session_store.hpp"
#include "skydrive/http.hpp"
#include "skydrive/protocol.hpp"

namespace skydrive::client
{

    enum class ChunkResult : std::uint8_t
    {
        Progress,
        RestartSession,
        TransientRetry,
        AnomalousRetry,
        Fatal
    };

    std::string_view to_string(ChunkResult result) noexcept;

    // 200/201/202 -> Progress, 404 -> RestartSession, 401 and
    // 416 fragmentRowCountCheckFailed -> AnomalousRetry, other 416 and
    // 5xx -> TransientRetry, everything else -> Fatal.
    ChunkResult classify_chunk_response(const http::HttpResponse &response);

    enum class UploadPhase : std::uint8_t
    {
        NoSession,
        SessionActive,
        Uploading,
        AwaitingPosition,
        Restarting,
        Completed,
        Failed
    };

    std::string_view to_string(UploadPhase phase) noexcept;

    struct TransferState
    {
        std::uint64_t position{};
        std::uint64_t total{};
        bool anomaly{};
    };

    struct Backoff
    {
        std::chrono::seconds anomaly{30};
        std::chrono::seconds server_error{30};
        std::chrono::seconds client_error{3};
        std::chrono::seconds completion_check{30};
    };

    struct UploadSessionParams
    {
        std::string remote_path;
        protocol::ConflictBehavior conflict{protocol::ConflictBehavior::Fail};
        std::uint64_t chunk_size{};
        std::chrono::milliseconds timeout{0};
        Backoff backoff{};
    };

    // Drives one resumable upload from session creation (or a saved session)
    // to the created item. `store` is null when persistence is disabled.
    class UploadSession
    {
    public:
        UploadSession(DriveClient &drive, ChunkTransport &transport, Waiter &waiter, UploadSessionParams params,
                      SessionStore *store = nullptr);

        // Uploads `total` bytes read from `source` and returns the created item.
        protocol::DriveItem run(std::istream &source, std::uint64_t total);

        UploadPhase phase() const noexcept { return phase_; }
        const TransferState &state() const noexcept { return state_; }
        const std::string &upload_url() const noexcept { return upload_url_; }

    private:
        protocol::DriveItem drive(std::istream &source);
        void initiate();
        std::optional<protocol::DriveItem> recover_position();
        void enter(UploadPhase phase);
        std::optional<std::filesystem::path> saved_session() const;

        DriveClient &drive_;
        ChunkTransport &transport_;
        Waiter &waiter_;
        UploadSessionParams params_;
        SessionStore *store_;

        UploadPhase phase_{UploadPhase::NoSession};
        TransferState state_{};
        std::string upload_url_;
    };

} // namespace skydrive::client
