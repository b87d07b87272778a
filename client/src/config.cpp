#include "skydrive/client/config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "skydrive/errors.hpp"

namespace skydrive::client
{

    namespace
    {

        std::filesystem::path xdg_directory(const char *variable, const char *fallback)
        {
            if (const char *value = std::getenv(variable); value != nullptr && *value != '\0')
            {
                return std::filesystem::path(value);
            }
            if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0')
            {
                return std::filesystem::path(home) / fallback;
            }
            throw ConfigError(std::string("neither $") + variable + " nor $HOME is set");
        }

        const char *require_value(int argc, char *argv[], int &index, const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

        std::uint64_t parse_unsigned(const std::string &flag, const std::string &value)
        {
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
            {
                throw std::runtime_error(flag + " expects a non-negative integer, got '" + value + "'");
            }
            return std::stoull(value);
        }

        std::string require_string(const nlohmann::json &oauth, const char *key)
        {
            if (!oauth.contains(key) || !oauth.at(key).is_string() || oauth.at(key).get<std::string>().empty())
            {
                throw ConfigError(std::string("oauth.") + key + " missing from configuration");
            }
            return oauth.at(key).get<std::string>();
        }

    } // namespace

    std::string usage()
    {
        return "Usage: skydrive [options] <command> [arguments]\n"
               "Commands:\n"
               "  upload <directory> <file>...   upload files into a remote directory\n"
               "  download <remote>...           download files into the current directory\n"
               "  ls <remote>                    list a remote directory\n"
               "  geturl <remote>                print the web URL of a remote item\n"
               "  metadata <remote>              print the metadata of a remote item\n"
               "  mkdir <remote>...              create remote directories\n"
               "Options:\n"
               "  --config <file>                credentials file\n"
               "  --log <file>                   log file\n"
               "  --jobs <n>                     parallel uploads (0 = one per file, default 8)\n"
               "  --base-segment-timeout <s>     per-chunk timeout before the per-job allowance (default 15)\n"
               "  --chunk-size <bytes>           resumable upload chunk size\n"
               "  --simple-threshold <bytes>     largest file sent in a single request\n"
               "  --conflict fail|replace|rename what to do when the remote file exists\n"
               "  --stream                       stream chunks from disk instead of buffering\n"
               "  --no-check                     skip hash verification\n"
               "  --no-remote-check              skip the remote existence check before uploading\n"
               "  --parents                      mkdir: create intermediate directories, no error if existing\n"
               "  --bytes                        ls: print sizes in bytes\n"
               "  --short                        ls: print names only\n";
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;
        int index = 1;

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(argc, argv, index, arg));
            }
            else if (arg == "--config")
            {
                config.config_path = std::filesystem::path(require_value(argc, argv, index, arg));
            }
            else if (arg == "--jobs" || arg == "-j")
            {
                config.jobs = static_cast<std::size_t>(parse_unsigned(arg, require_value(argc, argv, index, arg)));
            }
            else if (arg == "--base-segment-timeout")
            {
                const std::string value = require_value(argc, argv, index, arg);
                std::size_t consumed = 0;
                double seconds = 0;
                try
                {
                    seconds = std::stod(value, &consumed);
                }
                catch (const std::exception &)
                {
                    consumed = 0;
                }
                if (consumed != value.size() || seconds <= 0)
                {
                    throw std::runtime_error(arg + " expects a positive number of seconds, got '" + value + "'");
                }
                config.base_segment_timeout = seconds;
            }
            else if (arg == "--chunk-size")
            {
                config.chunk_size = parse_unsigned(arg, require_value(argc, argv, index, arg));
            }
            else if (arg == "--simple-threshold")
            {
                config.simple_threshold = parse_unsigned(arg, require_value(argc, argv, index, arg));
            }
            else if (arg == "--conflict")
            {
                const std::string value = require_value(argc, argv, index, arg);
                const auto behavior = protocol::conflict_behavior_from_string(value);
                if (!behavior)
                {
                    throw std::runtime_error("--conflict expects fail, replace or rename, got '" + value + "'");
                }
                config.conflict = *behavior;
            }
            else if (arg == "--stream")
            {
                config.stream = true;
            }
            else if (arg == "--no-check")
            {
                config.compare_hash = false;
            }
            else if (arg == "--no-remote-check")
            {
                config.check_remote = false;
            }
            else if (arg == "--parents" || arg == "-p")
            {
                config.parents = true;
            }
            else if (arg == "--bytes" || arg == "-b")
            {
                config.human_sizes = false;
            }
            else if (arg == "--short" || arg == "-s")
            {
                config.long_format = false;
            }
            else if (arg.size() > 1 && arg.front() == '-')
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else if (config.command.empty())
            {
                config.command = arg;
            }
            else
            {
                config.arguments.push_back(arg);
            }
        }

        if (config.command.empty())
        {
            throw std::runtime_error(usage());
        }
        return config;
    }

    std::filesystem::path default_config_path()
    {
        return xdg_directory("XDG_CONFIG_HOME", ".config") / "skydrive" / "config.json";
    }

    std::filesystem::path data_directory()
    {
        return xdg_directory("XDG_DATA_HOME", ".local/share") / "skydrive";
    }

    OAuthCredentials load_credentials(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw ConfigError("cannot open configuration file '" + path.string() + "'");
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            throw ConfigError("configuration file '" + path.string() + "' is not a JSON object");
        }
        if (!json.contains("oauth") || !json.at("oauth").is_object())
        {
            throw ConfigError("'oauth' section missing from '" + path.string() + "'");
        }
        const auto &oauth = json.at("oauth");

        OAuthCredentials credentials;
        credentials.client_id = require_string(oauth, "client_id");
        credentials.client_secret = require_string(oauth, "client_secret");
        credentials.refresh_token = require_string(oauth, "refresh_token");
        if (oauth.contains("redirect_uri") && oauth.at("redirect_uri").is_string())
        {
            credentials.redirect_uri = oauth.at("redirect_uri").get<std::string>();
        }
        return credentials;
    }

} // namespace skydrive::client
