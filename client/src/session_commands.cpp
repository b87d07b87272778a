#include "skydrive/client/session.hpp"

#include <iostream>
#include <vector>

#include <nlohmann/json.hpp>

#include "skydrive/client/format.hpp"

namespace skydrive::client
{

    bool ClientSession::handle_list(const std::vector<std::string> &args)
    {
        if (args.size() > 1)
        {
            std::cerr << "Usage: ls <remote>" << std::endl;
            return false;
        }
        const std::string path = args.empty() ? std::string{} : args[0];
        try
        {
            const auto listing = drive_->list(path);
            for (const auto &line : format_listing(listing.items, config_.human_sizes, config_.long_format))
            {
                std::cout << line << std::endl;
            }
            return true;
        }
        catch (const ApiError &ex)
        {
            print_error("failed to list '" + path + "'", ex);
            return false;
        }
    }

    bool ClientSession::handle_geturl(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            std::cerr << "Usage: geturl <remote>" << std::endl;
            return false;
        }
        try
        {
            std::cout << drive_->geturl(args[0]) << std::endl;
            return true;
        }
        catch (const ApiError &ex)
        {
            print_error("failed to get URL for '" + args[0] + "'", ex);
            return false;
        }
    }

    bool ClientSession::handle_metadata(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            std::cerr << "Usage: metadata <remote>" << std::endl;
            return false;
        }
        try
        {
            const auto item = drive_->metadata(args[0]);
            std::cout << item.raw.dump(4) << std::endl;
            return true;
        }
        catch (const ApiError &ex)
        {
            print_error("failed to get metadata for '" + args[0] + "'", ex);
            return false;
        }
    }

    bool ClientSession::handle_mkdir(const std::vector<std::string> &args)
    {
        if (args.empty())
        {
            std::cerr << "Usage: mkdir [--parents] <remote>..." << std::endl;
            return false;
        }
        bool success = true;
        for (const auto &path : args)
        {
            try
            {
                const auto item = config_.parents ? drive_->makedirs(path, true) : drive_->mkdir(path);
                logger_.log("mkdir", path, " -> ", item.web_url);
            }
            catch (const ApiError &ex)
            {
                print_error("failed to create '" + path + "'", ex);
                success = false;
            }
        }
        return success;
    }

} // namespace skydrive::client
