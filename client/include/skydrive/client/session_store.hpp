#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace skydrive::client
{

    struct SavedSession
    {
        std::string upload_url;
        std::int64_t expires{};
    };

    // One persisted resumable-upload session, addressed by the destination
    // path and the SHA-1 of the content being uploaded.
    class SessionStore
    {
    public:
        SessionStore(const std::filesystem::path &data_directory, const std::string &remote_path,
                     const std::string &content_hash);

        // <data_directory>/saved_sessions/<sha1("<remote_path>\n<content_hash>")>.json
        static std::filesystem::path locate(const std::filesystem::path &data_directory,
                                            const std::string &remote_path, const std::string &content_hash);

        // Expired or unreadable records are deleted and reported as absent.
        std::optional<SavedSession> load();

        void save(const std::string &upload_url, std::int64_t expires);

        void discard() noexcept;

        const std::filesystem::path &path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

} // namespace skydrive::client
