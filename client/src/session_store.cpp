#include "skydrive/client/session_store.hpp"

#include <chrono>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "skydrive/crypto.hpp"
#include "skydrive/errors.hpp"

namespace skydrive::client
{

    namespace
    {

        std::int64_t now_seconds()
        {
            return std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }

        void ensure_private_directory(const std::filesystem::path &dir)
        {
            if (std::filesystem::exists(dir))
            {
                return;
            }
            std::filesystem::create_directories(dir);
            std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::replace);
        }

    } // namespace

    SessionStore::SessionStore(const std::filesystem::path &data_directory, const std::string &remote_path,
                               const std::string &content_hash)
        : path_(locate(data_directory, remote_path, content_hash)) {}

    std::filesystem::path SessionStore::locate(const std::filesystem::path &data_directory,
                                               const std::string &remote_path, const std::string &content_hash)
    {
        const auto key = crypto::sha1_string(remote_path + "\n" + content_hash);
        return data_directory / "saved_sessions" / (key + ".json");
    }

    std::optional<SavedSession> SessionStore::load()
    {
        if (!std::filesystem::exists(path_))
        {
            return std::nullopt;
        }
        std::ifstream in(path_);
        if (!in.is_open())
        {
            return std::nullopt;
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        in.close();

        if (json.is_discarded() || !json.is_object() || !json.contains("upload_url") ||
            !json.at("upload_url").is_string() || !json.contains("expires") ||
            !json.at("expires").is_number_integer())
        {
            spdlog::warn("Discarding malformed saved session {}", path_.string());
            discard();
            return std::nullopt;
        }

        SavedSession session;
        session.upload_url = json.at("upload_url").get<std::string>();
        session.expires = json.at("expires").get<std::int64_t>();
        if (session.expires <= now_seconds())
        {
            spdlog::info("Saved session {} expired, discarding", path_.string());
            discard();
            return std::nullopt;
        }
        return session;
    }

    void SessionStore::save(const std::string &upload_url, std::int64_t expires)
    {
        const nlohmann::json json{{"upload_url", upload_url}, {"expires", expires}};
        auto temp_path = path_;
        temp_path += ".tmp";
        try
        {
            ensure_private_directory(path_.parent_path());
            // the record is private before the upload URL is written to it
            std::ofstream(temp_path, std::ios::trunc).close();
            std::filesystem::permissions(temp_path,
                                         std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                         std::filesystem::perm_options::replace);
            {
                std::ofstream out(temp_path, std::ios::trunc);
                if (!out.is_open())
                {
                    throw LocalIoError("Unable to write session file " + temp_path.string());
                }
                out << json.dump();
                if (!out)
                {
                    throw LocalIoError("Failed writing session file " + temp_path.string());
                }
            }
            std::filesystem::rename(temp_path, path_);
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            throw LocalIoError("Unable to save upload session to " + path_.string() + ": " + ex.what());
        }
        spdlog::info("Saved upload session to {}", path_.string());
    }

    void SessionStore::discard() noexcept
    {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        if (ec)
        {
            spdlog::warn("Unable to remove saved session {}: {}", path_.string(), ec.message());
        }
    }

} // namespace skydrive::client
