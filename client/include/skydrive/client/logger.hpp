#pragma once

#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace skydrive::client
{

    // Owns the process-wide spdlog logger. Library components log through the
    // spdlog default logger, which this class installs.
    class Logger
    {
    public:
        explicit Logger(const std::optional<std::filesystem::path> &path);

        static std::filesystem::path default_log_path();

        template <typename... Args>
        void log(const std::string &tag, Args &&...args)
        {
            if (!logger_)
            {
                return;
            }
            spdlog::fmt_lib::memory_buffer buf;
            (spdlog::fmt_lib::format_to(std::back_inserter(buf), "{}", std::forward<Args>(args)), ...);
            logger_->info("[{}] {}", tag,
                          std::string(buf.data(), buf.size()));
        }

        const std::optional<std::filesystem::path> &path() const noexcept { return path_; }

    private:
        std::shared_ptr<spdlog::logger> logger_;
        std::optional<std::filesystem::path> path_;
    };

} // namespace skydrive::client
