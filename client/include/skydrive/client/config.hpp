#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "skydrive/protocol.hpp"

namespace skydrive::client
{

    struct OAuthCredentials
    {
        std::string client_id;
        std::string client_secret;
        std::string refresh_token;
        std::string redirect_uri{"http://localhost:8000"};
    };

    struct ClientConfig
    {
        std::string command;
        std::vector<std::string> arguments;
        std::optional<std::filesystem::path> log_path;
        std::optional<std::filesystem::path> config_path;
        std::size_t jobs{8};
        double base_segment_timeout{15.0};
        bool stream{};
        bool compare_hash{true};
        bool check_remote{true};
        protocol::ConflictBehavior conflict{protocol::ConflictBehavior::Fail};
        std::optional<std::uint64_t> chunk_size;
        std::optional<std::uint64_t> simple_threshold;
        bool parents{};
        bool human_sizes{true};
        bool long_format{true};
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage();

    // $XDG_CONFIG_HOME/skydrive/config.json, falling back to ~/.config/skydrive/config.json.
    std::filesystem::path default_config_path();

    // $XDG_DATA_HOME/skydrive, falling back to ~/.local/share/skydrive; holds the log and saved sessions.
    std::filesystem::path data_directory();

    OAuthCredentials load_credentials(const std::filesystem::path &path);

} // namespace skydrive::client
