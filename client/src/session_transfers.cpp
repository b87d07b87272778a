#include "skydrive/client/session.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <vector>

#include "skydrive/client/batch_uploader.hpp"

namespace skydrive::client
{

    UploadOptions ClientSession::upload_options(std::size_t jobs) const
    {
        UploadOptions options;
        options.conflict = config_.conflict;
        options.compare_hash = config_.compare_hash;
        options.check_remote = config_.check_remote;
        options.stream = config_.stream;
        if (config_.chunk_size)
        {
            options.chunk_size = *config_.chunk_size;
        }
        if (config_.simple_threshold)
        {
            options.simple_threshold = *config_.simple_threshold;
        }
        // one extra second per concurrent job
        const auto seconds = config_.base_segment_timeout + static_cast<double>(jobs);
        options.timeout = std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000.0));
        return normalize_options(options);
    }

    bool ClientSession::handle_upload(const std::vector<std::string> &args)
    {
        if (args.size() < 2)
        {
            std::cerr << "Usage: upload <directory> <file>..." << std::endl;
            return false;
        }
        const auto &directory = args[0];
        try
        {
            const auto target = drive_->metadata(directory);
            if (!target.is_folder)
            {
                std::cerr << "ERROR: '" << directory << "' is not a directory" << std::endl;
                return false;
            }
            std::cout << "preparing to upload to '" << directory << "'" << std::endl;
            std::cout << "directory URL: " << target.web_url << std::endl;
        }
        catch (const ApiError &ex)
        {
            print_error("cannot upload to '" + directory + "'", ex);
            return false;
        }

        const std::vector<std::filesystem::path> files(args.begin() + 1, args.end());
        const auto jobs = config_.jobs == 0 ? files.size() : std::min(config_.jobs, files.size());
        const auto options = upload_options(jobs);

        BatchUploader batch(*drive_, interrupts_, data_directory(), jobs);
        const auto outcomes = batch.run(directory, files, options, [this](const UploadOutcome &outcome)
                                        {
            if (outcome.success)
            {
                std::cout << "finished uploading '" << outcome.local_path.string() << "'" << std::endl;
                logger_.log("upload", outcome.local_path.string(), " done");
            }
            else
            {
                std::cerr << describe_failure(outcome) << std::endl;
                logger_.log("upload", describe_failure(outcome));
            } });

        return std::all_of(outcomes.begin(), outcomes.end(), [](const UploadOutcome &outcome)
                           { return outcome.success; });
    }

    bool ClientSession::handle_download(const std::vector<std::string> &args)
    {
        if (args.empty())
        {
            std::cerr << "Usage: download <remote>..." << std::endl;
            return false;
        }
        const auto local_directory = std::filesystem::current_path();
        bool success = true;
        for (const auto &path : args)
        {
            try
            {
                const auto local = drive_->download(path, local_directory, config_.compare_hash);
                std::cout << "finished downloading '" << path << "' to '" << local.string() << "'" << std::endl;
                logger_.log("download", path, " -> ", local.string());
            }
            catch (const InterruptedError &ex)
            {
                print_error("download of '" + path + "' interrupted", ex);
                return false;
            }
            catch (const ApiError &ex)
            {
                print_error("failed to download '" + path + "'", ex);
                success = false;
            }
        }
        return success;
    }

} // namespace skydrive::client
