#include "skydrive/client/drive_client.hpp"

#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "skydrive/crypto.hpp"
#include "skydrive/url.hpp"

namespace skydrive::client
{

    namespace
    {

        protocol::DriveItem decode_item(const nlohmann::json &json, const http::HttpResponse &response,
                                        std::string_view request_desc)
        {
            try
            {
                return json.get<protocol::DriveItem>();
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw RequestError("malformed item in response to " + std::string(request_desc) + " (" + ex.what() +
                                       "): " + response.body,
                                   response);
            }
        }

        protocol::DriveItem parse_item(const http::HttpResponse &response, std::string_view request_desc)
        {
            const auto json = response.json();
            if (!json.is_object())
            {
                throw RequestError("malformed response to " + std::string(request_desc) + ": " + response.body,
                                   response);
            }
            return decode_item(json, response, request_desc);
        }

    } // namespace

    DriveClient::DriveClient(AuthenticatedClient &client)
        : client_(client) {}

    protocol::DriveItem DriveClient::metadata(const std::string &path)
    {
        const auto remote = url::normalize_remote(path);
        const auto response = client_.get(url::drive_item_path(remote));
        if (response.status == 404)
        {
            throw NotFoundError(remote);
        }
        if (response.status != 200)
        {
            throw RequestError(response, "metadata request for '" + remote + "'");
        }
        return parse_item(response, "metadata request");
    }

    bool DriveClient::exists(const std::string &path)
    {
        try
        {
            metadata(path);
            return true;
        }
        catch (const NotFoundError &)
        {
            return false;
        }
    }

    std::string DriveClient::geturl(const std::string &path)
    {
        return metadata(path).web_url;
    }

    std::vector<protocol::DriveItem> DriveClient::children(const std::string &path)
    {
        const auto remote = url::normalize_remote(path);
        spdlog::info("Requesting children of '{}'", remote);
        std::vector<protocol::DriveItem> items;
        std::string next = url::drive_item_path(remote, "children");
        while (!next.empty())
        {
            const auto response = client_.get(next);
            if (response.status == 404)
            {
                throw NotFoundError(remote);
            }
            if (response.status != 200)
            {
                throw RequestError(response, "children request for '" + remote + "'");
            }
            const auto json = response.json();
            if (!json.is_object() || !json.contains("value") || !json.at("value").is_array())
            {
                throw RequestError("malformed children listing for '" + remote + "': " + response.body, response);
            }
            for (const auto &entry : json.at("value"))
            {
                items.push_back(decode_item(entry, response, "children request"));
            }
            const auto link = json.find("@odata.nextLink");
            next = link != json.end() && link->is_string() ? link->get<std::string>() : std::string{};
        }
        return items;
    }

    Listing DriveClient::list(const std::string &path)
    {
        auto item = metadata(path);
        if (!item.is_folder)
        {
            Listing listing{ItemType::File, {}};
            listing.items.push_back(std::move(item));
            return listing;
        }
        return Listing{ItemType::Directory, children(path)};
    }

    protocol::DriveItem DriveClient::makedirs(const std::string &path, bool exist_ok)
    {
        const auto remote = url::normalize_remote(path);
        if (remote.empty())
        {
            if (exist_ok)
            {
                return metadata(remote);
            }
            throw AlreadyExistsError("", ItemType::Directory, std::nullopt, "the drive root always exists");
        }
        const auto response = client_.post_json(
            url::drive_item_path(url::remote_parent(remote), "children"),
            protocol::create_folder_body(url::remote_basename(remote), protocol::ConflictBehavior::Fail));

        switch (response.status)
        {
        case 201:
            spdlog::info("Created directory '{}'", remote);
            return parse_item(response, "directory creation request");
        case 409:
        {
            auto existing = metadata(remote);
            if (!existing.is_folder)
            {
                throw WrongTypeError("'" + remote + "' already exists at '" + existing.web_url +
                                     "' and is not a directory");
            }
            if (exist_ok)
            {
                return existing;
            }
            throw AlreadyExistsError(remote, ItemType::Directory, existing.web_url);
        }
        case 403:
            throw WrongTypeError("one of the intermediate paths of '" + remote + "' is not a directory");
        default:
            throw RequestError(response, "directory creation request for '" + remote + "'");
        }
    }

    protocol::DriveItem DriveClient::mkdir(const std::string &path)
    {
        const auto remote = url::normalize_remote(path);
        const auto parent = url::remote_parent(remote);
        const auto parent_item = metadata(parent);
        if (!parent_item.is_folder)
        {
            throw WrongTypeError("parent '" + parent + "' (located at '" + parent_item.web_url +
                                 "') is not a directory");
        }
        return makedirs(remote, false);
    }

    std::filesystem::path DriveClient::download(const std::string &path, const std::filesystem::path &local_directory,
                                                bool compare_hash)
    {
        const auto remote = url::normalize_remote(path);
        const auto item = metadata(remote);
        if (item.is_folder)
        {
            throw WrongTypeError("'" + remote + "' is a directory");
        }
        if (!item.download_url)
        {
            throw RequestError("no download URL in metadata of '" + remote + "'", std::nullopt);
        }

        const auto local_path = local_directory / item.name;
        if (std::filesystem::exists(local_path))
        {
            throw AlreadyExistsError(local_path.string(), ItemType::File, std::nullopt,
                                     "'" + local_path.string() + "' already exists locally");
        }
        auto part_path = local_path;
        part_path += ".part";

        std::ofstream out(part_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw std::runtime_error("Unable to open " + part_path.string() + " for writing");
        }

        std::uint64_t received = 0;
        http::HttpRequest request;
        request.method = "GET";
        request.url = *item.download_url;
        request.body_sink = [&](std::string_view chunk)
        {
            out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
            if (!out)
            {
                throw std::runtime_error("Failed writing " + part_path.string());
            }
            received += chunk.size();
        };
        spdlog::info("Downloading '{}' ({} bytes) to {}", remote, item.size, part_path.string());
        const auto response = client_.send(std::move(request));
        out.close();
        if (response.status != 200)
        {
            throw RequestError(response, "download request for '" + remote + "'");
        }

        if (received != item.size)
        {
            throw IntegrityError("download of '" + remote + "' appears corrupted: remote size " +
                                 std::to_string(item.size) + ", local size " + std::to_string(received));
        }
        if (compare_hash)
        {
            if (!item.sha1_hash)
            {
                throw IntegrityError("no SHA-1 hash in metadata of '" + remote + "'");
            }
            const auto local_hash = crypto::sha1_file(part_path);
            if (!crypto::digests_equal(*item.sha1_hash, local_hash))
            {
                throw IntegrityError("download of '" + remote + "' appears corrupted: remote SHA-1 " +
                                     *item.sha1_hash + ", local SHA-1 " + local_hash);
            }
        }
        std::filesystem::rename(part_path, local_path);
        spdlog::info("Downloaded '{}' to {}", remote, local_path.string());
        return local_path;
    }

} // namespace skydrive::client
