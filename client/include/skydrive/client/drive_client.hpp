#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "skydrive/client/auth.hpp"
#include "skydrive/errors.hpp"
#include "skydrive/protocol.hpp"

namespace skydrive::client
{

    struct Listing
    {
        ItemType type{ItemType::Unspecified};
        std::vector<protocol::DriveItem> items;
    };

    // Path-addressed operations on the remote drive. Remote paths are relative
    // to the drive root; "" and "/" both denote the root.
    class DriveClient
    {
    public:
        explicit DriveClient(AuthenticatedClient &client);

        protocol::DriveItem metadata(const std::string &path);

        bool exists(const std::string &path);

        std::string geturl(const std::string &path);

        // Follows @odata.nextLink until the listing is exhausted.
        std::vector<protocol::DriveItem> children(const std::string &path);

        // A directory lists its children; a file lists itself.
        Listing list(const std::string &path);

        // Creates `path` with its missing ancestors.
        protocol::DriveItem makedirs(const std::string &path, bool exist_ok);

        // Creates `path` inside an existing directory.
        protocol::DriveItem mkdir(const std::string &path);

        std::filesystem::path download(const std::string &path, const std::filesystem::path &local_directory,
                                       bool compare_hash);

        AuthenticatedClient &client() noexcept { return client_; }

    private:
        AuthenticatedClient &client_;
    };

} // namespace skydrive::client
