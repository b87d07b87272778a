#include "skydrive/client/batch_uploader.hpp"

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>

#include <algorithm>
#include <mutex>

#include <spdlog/spdlog.h>

#include "skydrive/errors.hpp"

namespace skydrive::client
{

    BatchUploader::BatchUploader(DriveClient &drive, Waiter &waiter, std::filesystem::path data_directory,
                                 std::size_t jobs)
        : drive_(drive), waiter_(waiter), data_directory_(std::move(data_directory)), jobs_(jobs) {}

    std::vector<UploadOutcome> BatchUploader::run(const std::string &directory,
                                                  const std::vector<std::filesystem::path> &files,
                                                  const UploadOptions &options, const Callback &on_finished)
    {
        std::vector<UploadOutcome> outcomes(files.size());
        if (files.empty())
        {
            return outcomes;
        }

        const auto workers = jobs_ == 0 ? files.size() : std::min(jobs_, files.size());
        std::mutex report_mutex;
        asio::thread_pool pool(workers);
        spdlog::info("Uploading {} file(s) to '{}' with {} worker(s)", files.size(), directory, workers);

        for (std::size_t index = 0; index < files.size(); ++index)
        {
            asio::post(pool, [&, index]
                       {
                auto &outcome = outcomes[index];
                outcome.local_path = files[index];
                try
                {
                    Uploader uploader(drive_, waiter_, data_directory_);
                    uploader.upload(directory, files[index], options);
                    outcome.success = true;
                }
                catch (const ApiError &ex)
                {
                    outcome.code = ex.code();
                    outcome.message = ex.what();
                }
                catch (const std::exception &ex)
                {
                    outcome.code = ErrorCode::InvalidArgument;
                    outcome.message = ex.what();
                }
                if (!outcome.success)
                {
                    spdlog::error("{}", describe_failure(outcome));
                }
                if (on_finished)
                {
                    std::lock_guard lock(report_mutex);
                    on_finished(outcome);
                } });
        }
        pool.join();
        return outcomes;
    }

    std::string describe_failure(const UploadOutcome &outcome)
    {
        return "failed to upload '" + outcome.local_path.string() + "': " + std::string(to_string(outcome.code)) +
               ": " + outcome.message;
    }

} // namespace skydrive::client
