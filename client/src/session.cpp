#include "skydrive/client/session.hpp"

#include <iostream>

#include "skydrive/error_codes.hpp"
#include "skydrive/http.hpp"

namespace skydrive::client
{

    ClientSession::ClientSession(ClientConfig config, Logger logger)
        : config_(std::move(config)),
          logger_(std::move(logger)) {}

    int ClientSession::run()
    {
        try
        {
            connect();
            return dispatch(config_.command, config_.arguments) ? 0 : 1;
        }
        catch (const ApiError &ex)
        {
            std::cerr << "ERROR: " << to_string(ex.code()) << ": " << ex.what() << std::endl;
            logger_.log("error", "fatal: ", ex.what());
            return 1;
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_.log("error", "fatal: ", ex.what());
            return 1;
        }
    }

    void ClientSession::connect()
    {
        const auto config_path = config_.config_path ? *config_.config_path : default_config_path();
        auto credentials = load_credentials(config_path);
        auto transport = std::make_shared<http::CurlTransport>([this]
                                                               { return interrupts_.interrupted(); });
        client_ = std::make_unique<AuthenticatedClient>(std::move(credentials), std::move(transport));
        drive_ = std::make_unique<DriveClient>(*client_);
        logger_.log("info", "loaded credentials from ", config_path.string());
    }

    bool ClientSession::dispatch(const std::string &command, const std::vector<std::string> &args)
    {
        logger_.log("command", command, " (", args.size(), " argument(s))");
        if (command == "ls" || command == "list")
        {
            return handle_list(args);
        }
        if (command == "geturl")
        {
            return handle_geturl(args);
        }
        if (command == "metadata")
        {
            return handle_metadata(args);
        }
        if (command == "mkdir")
        {
            return handle_mkdir(args);
        }
        if (command == "upload")
        {
            return handle_upload(args);
        }
        if (command == "download")
        {
            return handle_download(args);
        }
        if (command == "help")
        {
            print_help();
            return true;
        }
        std::cerr << "ERROR: unknown command '" << command << "'" << std::endl;
        print_help();
        return false;
    }

    void ClientSession::print_help() const
    {
        std::cout << usage();
    }

    void ClientSession::print_error(const std::string &context, const ApiError &error) const
    {
        std::cerr << context << ": " << to_string(error.code()) << ": " << error.what() << std::endl;
    }

} // namespace skydrive::client
