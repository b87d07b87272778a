#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "skydrive/client/drive_client.hpp"
#include "skydrive/client/interrupt.hpp"
#include "skydrive/client/upload_session.hpp"
#include "skydrive/protocol.hpp"

namespace skydrive::client
{

    inline constexpr std::uint64_t kMebibyte = 1024 * 1024;
    inline constexpr std::uint64_t kChunkAlignment = 320 * 1024;
    inline constexpr std::uint64_t kMaxChunkSize = 60 * kMebibyte;
    inline constexpr std::uint64_t kDefaultChunkSize = 10 * kMebibyte;
    inline constexpr std::uint64_t kMaxSimpleThreshold = 100 * kMebibyte;
    inline constexpr std::uint64_t kDefaultSimpleThreshold = 10 * kMebibyte;

    struct UploadOptions
    {
        protocol::ConflictBehavior conflict{protocol::ConflictBehavior::Fail};
        std::uint64_t simple_threshold{kDefaultSimpleThreshold};
        std::uint64_t chunk_size{kDefaultChunkSize};
        bool compare_hash{true};
        bool check_remote{true};
        bool stream{};
        std::chrono::milliseconds timeout{15000};
        Backoff backoff{};
    };

    // Caps at 60 MiB and rounds down to a multiple of 320 KiB, never below 320 KiB.
    std::uint64_t clamp_chunk_size(std::uint64_t requested) noexcept;

    // Files at or under the threshold go out in a single request; capped at 100 MiB.
    std::uint64_t clamp_simple_threshold(std::uint64_t requested) noexcept;

    UploadOptions normalize_options(UploadOptions options) noexcept;

    // Uploads one local file into a remote directory, picking the one-shot
    // or the resumable protocol by size, and verifies the created item.
    class Uploader
    {
    public:
        Uploader(DriveClient &drive, Waiter &waiter, std::filesystem::path data_directory);

        protocol::DriveItem upload(const std::string &directory, const std::filesystem::path &local_path,
                                   const UploadOptions &options);

    private:
        void check_remote(const std::string &remote_path, const UploadOptions &options);
        protocol::DriveItem simple_upload(const std::string &remote_path, const std::filesystem::path &local_path,
                                          std::uint64_t size, const UploadOptions &options);
        protocol::DriveItem resumable_upload(const std::string &remote_path, const std::filesystem::path &local_path,
                                             std::uint64_t size, const UploadOptions &options);

        DriveClient &drive_;
        Waiter &waiter_;
        std::filesystem::path data_directory_;
    };

} // namespace skydrive::client
