#pragma once

#include <memory>
#include <string>
#include <vector>

#include "skydrive/client/auth.hpp"
#include "skydrive/client/config.hpp"
#include "skydrive/client/drive_client.hpp"
#include "skydrive/client/interrupt.hpp"
#include "skydrive/client/logger.hpp"
#include "skydrive/client/uploader.hpp"
#include "skydrive/errors.hpp"

namespace skydrive::client
{

    // One CLI invocation: loads credentials, runs a single command and maps
    // failures to an exit status.
    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, Logger logger);

        int run();

    private:
        void connect();
        bool dispatch(const std::string &command, const std::vector<std::string> &args);

        bool handle_list(const std::vector<std::string> &args);
        bool handle_geturl(const std::vector<std::string> &args);
        bool handle_metadata(const std::vector<std::string> &args);
        bool handle_mkdir(const std::vector<std::string> &args);
        bool handle_upload(const std::vector<std::string> &args);
        bool handle_download(const std::vector<std::string> &args);

        UploadOptions upload_options(std::size_t jobs) const;
        void print_help() const;
        void print_error(const std::string &context, const ApiError &error) const;

        ClientConfig config_;
        Logger logger_;
        InterruptMonitor interrupts_;
        std::unique_ptr<AuthenticatedClient> client_;
        std::unique_ptr<DriveClient> drive_;
    };

} // namespace skydrive::client
