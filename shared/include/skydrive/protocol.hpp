/**
 * skydrive - Remote API schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace skydrive::protocol
{

    inline constexpr std::string_view kApiEndpoint = "https://api.onedrive.com/v1.0";
    inline constexpr std::string_view kTokenEndpoint = "https://login.live.com/oauth20_token.srf";

    enum class ConflictBehavior : std::uint8_t
    {
        Fail,
        Replace,
        Rename
    };

    std::string_view to_string(ConflictBehavior behavior) noexcept;
    std::optional<ConflictBehavior> conflict_behavior_from_string(std::string_view value) noexcept;

    struct DriveItem
    {
        std::string id;
        std::string name;
        std::uint64_t size{};
        std::string web_url;
        bool is_folder{};
        std::optional<std::uint64_t> child_count{};
        std::optional<std::string> sha1_hash{};
        std::optional<std::string> download_url{};
        nlohmann::json raw{nlohmann::json::object()};
    };

    void to_json(nlohmann::json &json, const DriveItem &item);
    void from_json(const nlohmann::json &json, DriveItem &item);

    struct UploadSessionInfo
    {
        std::string upload_url;
        std::string expiration_date_time;
        std::vector<std::string> next_expected_ranges{};
    };

    void to_json(nlohmann::json &json, const UploadSessionInfo &info);
    void from_json(const nlohmann::json &json, UploadSessionInfo &info);

    struct ExpectedRange
    {
        std::uint64_t start{};
        std::optional<std::uint64_t> end{};
    };

    // "1024-" or "0-4095"
    std::optional<ExpectedRange> parse_expected_range(std::string_view value) noexcept;

    struct ServiceError
    {
        std::string code;
        std::string message;
        std::optional<std::string> inner_code{};
    };

    std::optional<ServiceError> parse_service_error(const nlohmann::json &json);

    // ISO-8601 UTC timestamp ("2015-01-29T09:21:55.523Z", offsets allowed) to POSIX seconds.
    std::int64_t parse_timestamp(std::string_view value);

    std::string format_timestamp(std::int64_t posix_seconds);

    nlohmann::json create_session_body(ConflictBehavior behavior);

    nlohmann::json create_folder_body(std::string_view name, ConflictBehavior behavior);

} // namespace skydrive::protocol
