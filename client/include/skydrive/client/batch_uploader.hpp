#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "skydrive/client/uploader.hpp"
#include "skydrive/error_codes.hpp"

namespace skydrive::client
{

    struct UploadOutcome
    {
        std::filesystem::path local_path;
        bool success{};
        ErrorCode code{ErrorCode::Ok};
        std::string message;
    };

    // Runs one independent Uploader per file on a pool of worker threads.
    class BatchUploader
    {
    public:
        // Called once per file, serialized, as soon as that file finishes.
        using Callback = std::function<void(const UploadOutcome &)>;

        BatchUploader(DriveClient &drive, Waiter &waiter, std::filesystem::path data_directory, std::size_t jobs);

        // Outcomes are returned in input order.
        std::vector<UploadOutcome> run(const std::string &directory, const std::vector<std::filesystem::path> &files,
                                       const UploadOptions &options, const Callback &on_finished = {});

    private:
        DriveClient &drive_;
        Waiter &waiter_;
        std::filesystem::path data_directory_;
        std::size_t jobs_;
    };

    // "failed to upload '<path>': <kind>: <message>"
    std::string describe_failure(const UploadOutcome &outcome);

} // namespace skydrive::client
