#include "skydrive/protocol.hpp"

#include <array>
#include <charconv>
#include <cstdio>
#include <stdexcept>

namespace skydrive::protocol
{

    namespace
    {

        struct ConflictBehaviorMapping
        {
            ConflictBehavior behavior;
            std::string_view label;
        };

        constexpr std::array<ConflictBehaviorMapping, 3> kConflictMappings{{
            {ConflictBehavior::Fail, "fail"},
            {ConflictBehavior::Replace, "replace"},
            {ConflictBehavior::Rename, "rename"},
        }};

        // Days since 1970-01-01 in the proleptic Gregorian calendar.
        constexpr std::int64_t days_from_civil(std::int64_t year, unsigned month, unsigned day) noexcept
        {
            year -= month <= 2 ? 1 : 0;
            const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
            const auto year_of_era = static_cast<unsigned>(year - era * 400);
            const unsigned day_of_year = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
            const unsigned day_of_era = year_of_era * 365 + year_of_era / 4 - year_of_era / 100 + day_of_year;
            return era * 146097 + static_cast<std::int64_t>(day_of_era) - 719468;
        }

        struct CivilDate
        {
            std::int64_t year;
            unsigned month;
            unsigned day;
        };

        constexpr CivilDate civil_from_days(std::int64_t days) noexcept
        {
            days += 719468;
            const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
            const auto day_of_era = static_cast<unsigned>(days - era * 146097);
            const unsigned year_of_era = (day_of_era - day_of_era / 1460 + day_of_era / 36524 - day_of_era / 146096) / 365;
            const unsigned day_of_year = day_of_era - (365 * year_of_era + year_of_era / 4 - year_of_era / 100);
            const unsigned mp = (5 * day_of_year + 2) / 153;
            const unsigned day = day_of_year - (153 * mp + 2) / 5 + 1;
            const unsigned month = mp < 10 ? mp + 3 : mp - 9;
            const std::int64_t year = static_cast<std::int64_t>(year_of_era) + era * 400 + (month <= 2 ? 1 : 0);
            return {year, month, day};
        }

        int read_digits(std::string_view value, std::size_t offset, std::size_t count)
        {
            if (offset + count > value.size())
            {
                throw std::invalid_argument("Truncated timestamp: " + std::string(value));
            }
            int result = 0;
            const auto *begin = value.data() + offset;
            const auto [ptr, ec] = std::from_chars(begin, begin + count, result);
            if (ec != std::errc{} || ptr != begin + count)
            {
                throw std::invalid_argument("Malformed timestamp: " + std::string(value));
            }
            return result;
        }

        void expect_char(std::string_view value, std::size_t offset, char expected)
        {
            if (offset >= value.size() || value[offset] != expected)
            {
                throw std::invalid_argument("Malformed timestamp: " + std::string(value));
            }
        }

    } // namespace

    std::string_view to_string(ConflictBehavior behavior) noexcept
    {
        for (const auto &mapping : kConflictMappings)
        {
            if (mapping.behavior == behavior)
            {
                return mapping.label;
            }
        }
        return "fail";
    }

    std::optional<ConflictBehavior> conflict_behavior_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kConflictMappings)
        {
            if (mapping.label == value)
            {
                return mapping.behavior;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const DriveItem &item)
    {
        json = item.raw.is_object() ? item.raw : nlohmann::json::object();
        json["id"] = item.id;
        json["name"] = item.name;
        json["size"] = item.size;
        json["webUrl"] = item.web_url;
        if (item.is_folder)
        {
            json["folder"] = nlohmann::json::object();
            if (item.child_count)
            {
                json["folder"]["childCount"] = *item.child_count;
            }
        }
        else
        {
            auto file = json.value("file", nlohmann::json::object());
            if (item.sha1_hash)
            {
                file["hashes"]["sha1Hash"] = *item.sha1_hash;
            }
            json["file"] = file;
        }
        if (item.download_url)
        {
            json["@content.downloadUrl"] = *item.download_url;
        }
    }

    void from_json(const nlohmann::json &json, DriveItem &item)
    {
        item.raw = json;
        item.id = json.value("id", std::string{});
        item.name = json.value("name", std::string{});
        item.size = json.value("size", 0ULL);
        item.web_url = json.value("webUrl", std::string{});
        item.is_folder = json.contains("folder");
        item.child_count.reset();
        if (item.is_folder && json.at("folder").contains("childCount"))
        {
            item.child_count = json.at("folder").at("childCount").get<std::uint64_t>();
        }
        item.sha1_hash.reset();
        if (json.contains("file"))
        {
            const auto &file = json.at("file");
            if (file.contains("hashes") && file.at("hashes").contains("sha1Hash"))
            {
                item.sha1_hash = file.at("hashes").at("sha1Hash").get<std::string>();
            }
        }
        item.download_url.reset();
        if (json.contains("@content.downloadUrl"))
        {
            item.download_url = json.at("@content.downloadUrl").get<std::string>();
        }
    }

    void to_json(nlohmann::json &json, const UploadSessionInfo &info)
    {
        json = {
            {"uploadUrl", info.upload_url},
            {"expirationDateTime", info.expiration_date_time},
            {"nextExpectedRanges", info.next_expected_ranges},
        };
    }

    void from_json(const nlohmann::json &json, UploadSessionInfo &info)
    {
        info.upload_url = json.value("uploadUrl", std::string{});
        info.expiration_date_time = json.value("expirationDateTime", std::string{});
        info.next_expected_ranges = json.value("nextExpectedRanges", std::vector<std::string>{});
    }

    std::optional<ExpectedRange> parse_expected_range(std::string_view value) noexcept
    {
        const auto dash = value.find('-');
        const auto start_text = value.substr(0, dash);
        ExpectedRange range{};
        const auto [start_ptr, start_ec] =
            std::from_chars(start_text.data(), start_text.data() + start_text.size(), range.start);
        if (start_text.empty() || start_ec != std::errc{} || start_ptr != start_text.data() + start_text.size())
        {
            return std::nullopt;
        }
        if (dash == std::string_view::npos || dash + 1 == value.size())
        {
            return range;
        }
        const auto end_text = value.substr(dash + 1);
        std::uint64_t end = 0;
        const auto [end_ptr, end_ec] = std::from_chars(end_text.data(), end_text.data() + end_text.size(), end);
        if (end_ec != std::errc{} || end_ptr != end_text.data() + end_text.size() || end < range.start)
        {
            return std::nullopt;
        }
        range.end = end;
        return range;
    }

    std::optional<ServiceError> parse_service_error(const nlohmann::json &json)
    {
        if (!json.is_object() || !json.contains("error") || !json.at("error").is_object())
        {
            return std::nullopt;
        }
        const auto &error = json.at("error");
        ServiceError result{};
        if (error.contains("code") && error.at("code").is_string())
        {
            result.code = error.at("code").get<std::string>();
        }
        if (error.contains("message") && error.at("message").is_string())
        {
            result.message = error.at("message").get<std::string>();
        }
        if (error.contains("innererror") && error.at("innererror").is_object())
        {
            const auto &inner = error.at("innererror");
            if (inner.contains("code") && inner.at("code").is_string())
            {
                result.inner_code = inner.at("code").get<std::string>();
            }
        }
        return result;
    }

    std::int64_t parse_timestamp(std::string_view value)
    {
        // YYYY-MM-DDTHH:MM:SS[.fraction][Z|+HH:MM|-HH:MM]
        const auto year = read_digits(value, 0, 4);
        expect_char(value, 4, '-');
        const auto month = read_digits(value, 5, 2);
        expect_char(value, 7, '-');
        const auto day = read_digits(value, 8, 2);
        if (value.size() <= 10 || (value[10] != 'T' && value[10] != 't' && value[10] != ' '))
        {
            throw std::invalid_argument("Malformed timestamp: " + std::string(value));
        }
        const auto hour = read_digits(value, 11, 2);
        expect_char(value, 13, ':');
        const auto minute = read_digits(value, 14, 2);
        expect_char(value, 16, ':');
        const auto second = read_digits(value, 17, 2);
        if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60)
        {
            throw std::invalid_argument("Timestamp out of range: " + std::string(value));
        }

        std::size_t offset = 19;
        if (offset < value.size() && value[offset] == '.')
        {
            ++offset;
            while (offset < value.size() && value[offset] >= '0' && value[offset] <= '9')
            {
                ++offset;
            }
        }

        std::int64_t zone_offset = 0;
        if (offset < value.size())
        {
            const char designator = value[offset];
            if (designator == 'Z' || designator == 'z')
            {
                ++offset;
            }
            else if (designator == '+' || designator == '-')
            {
                const auto zone_hours = read_digits(value, offset + 1, 2);
                expect_char(value, offset + 3, ':');
                const auto zone_minutes = read_digits(value, offset + 4, 2);
                zone_offset = (designator == '+' ? 1 : -1) * (zone_hours * 3600 + zone_minutes * 60);
                offset += 6;
            }
            if (offset != value.size())
            {
                throw std::invalid_argument("Malformed timestamp: " + std::string(value));
            }
        }

        const auto days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
        return days * 86400 + hour * 3600 + minute * 60 + second - zone_offset;
    }

    std::string format_timestamp(std::int64_t posix_seconds)
    {
        auto days = posix_seconds / 86400;
        auto remainder = posix_seconds % 86400;
        if (remainder < 0)
        {
            remainder += 86400;
            --days;
        }
        const auto date = civil_from_days(days);
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02lld:%02lld:%02lldZ",
                      static_cast<long long>(date.year), date.month, date.day,
                      static_cast<long long>(remainder / 3600), static_cast<long long>((remainder % 3600) / 60),
                      static_cast<long long>(remainder % 60));
        return buffer;
    }

    nlohmann::json create_session_body(ConflictBehavior behavior)
    {
        return {{"@name.conflictBehavior", to_string(behavior)}};
    }

    nlohmann::json create_folder_body(std::string_view name, ConflictBehavior behavior)
    {
        return {
            {"name", name},
            {"folder", nlohmann::json::object()},
            {"@name.conflictBehavior", to_string(behavior)},
        };
    }

} // namespace skydrive::protocol
