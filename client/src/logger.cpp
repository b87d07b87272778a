#include "skydrive/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <iostream>
#include <system_error>
#include <vector>

#include "skydrive/client/config.hpp"
#include "skydrive/errors.hpp"

namespace skydrive::client
{

    std::filesystem::path Logger::default_log_path()
    {
        return data_directory() / "skydrive.log";
    }

    Logger::Logger(const std::optional<std::filesystem::path> &path)
    {
        std::vector<spdlog::sink_ptr> sinks;
        try
        {
            path_ = path ? *path : default_log_path();
            const auto dir = path_->parent_path();
            if (!dir.empty() && !std::filesystem::exists(dir))
            {
                std::filesystem::create_directories(dir);
                std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                                             std::filesystem::perm_options::replace);
            }
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path_->string(), false));
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "warning: logging disabled: " << ex.what() << '\n';
            path_.reset();
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            std::cerr << "warning: logging disabled: " << ex.what() << '\n';
            path_.reset();
        }
        catch (const ConfigError &ex)
        {
            std::cerr << "warning: logging disabled: " << ex.what() << '\n';
            path_.reset();
        }
        if (sinks.empty())
        {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }
        logger_ = std::make_shared<spdlog::logger>("skydrive", sinks.begin(), sinks.end());
        logger_->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
        logger_->set_level(spdlog::level::info);
        logger_->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger_);
    }

} // namespace skydrive::client
