#include "skydrive/url.hpp"

#include <cctype>
#include <sstream>

namespace skydrive::url
{

    namespace
    {

        bool is_unreserved(unsigned char ch)
        {
            return std::isalnum(ch) != 0 || ch == '-' || ch == '_' || ch == '.' || ch == '~';
        }

        std::vector<std::string> split_segments(std::string_view path)
        {
            std::vector<std::string> segments;
            std::size_t start = 0;
            while (start <= path.size())
            {
                auto end = path.find('/', start);
                if (end == std::string_view::npos)
                {
                    end = path.size();
                }
                const auto segment = path.substr(start, end - start);
                if (segment == "..")
                {
                    if (!segments.empty())
                    {
                        segments.pop_back();
                    }
                }
                else if (!segment.empty() && segment != ".")
                {
                    segments.emplace_back(segment);
                }
                start = end + 1;
            }
            return segments;
        }

    } // namespace

    std::string pop_query(const std::string &url, std::string_view variable)
    {
        const auto fragment_pos = url.find('#');
        const std::string fragment = fragment_pos == std::string::npos ? std::string{} : url.substr(fragment_pos);
        const std::string without_fragment = url.substr(0, fragment_pos);

        const auto query_pos = without_fragment.find('?');
        if (query_pos == std::string::npos)
        {
            return url;
        }
        const std::string base = without_fragment.substr(0, query_pos);
        const std::string query = without_fragment.substr(query_pos + 1);

        std::string kept;
        std::size_t start = 0;
        while (start <= query.size())
        {
            auto end = query.find('&', start);
            if (end == std::string::npos)
            {
                end = query.size();
            }
            const auto pair = query.substr(start, end - start);
            const auto key = pair.substr(0, pair.find('='));
            if (!pair.empty() && key != variable)
            {
                if (!kept.empty())
                {
                    kept += '&';
                }
                kept += pair;
            }
            start = end + 1;
        }

        return kept.empty() ? base + fragment : base + "?" + kept + fragment;
    }

    std::string quote(std::string_view text, std::string_view safe)
    {
        static constexpr char kHexDigits[] = "0123456789ABCDEF";
        std::string result;
        result.reserve(text.size());
        for (const char ch : text)
        {
            const auto byte = static_cast<unsigned char>(ch);
            if (is_unreserved(byte) || safe.find(ch) != std::string_view::npos)
            {
                result += ch;
            }
            else
            {
                result += '%';
                result += kHexDigits[(byte >> 4) & 0x0F];
                result += kHexDigits[byte & 0x0F];
            }
        }
        return result;
    }

    std::string form_encode(const std::vector<std::pair<std::string, std::string>> &fields)
    {
        std::string result;
        for (const auto &[key, value] : fields)
        {
            if (!result.empty())
            {
                result += '&';
            }
            result += quote(key, "");
            result += '=';
            result += quote(value, "");
        }
        return result;
    }

    std::string normalize_remote(std::string_view path)
    {
        std::string result;
        for (const auto &segment : split_segments(path))
        {
            if (!result.empty())
            {
                result += '/';
            }
            result += segment;
        }
        return result;
    }

    std::string join_remote(std::string_view directory, std::string_view name)
    {
        std::string joined(directory);
        joined += '/';
        joined += name;
        return normalize_remote(joined);
    }

    std::string remote_parent(std::string_view path)
    {
        const auto normalized = normalize_remote(path);
        const auto slash = normalized.rfind('/');
        if (slash == std::string::npos)
        {
            return {};
        }
        return normalized.substr(0, slash);
    }

    std::string remote_basename(std::string_view path)
    {
        const auto normalized = normalize_remote(path);
        const auto slash = normalized.rfind('/');
        if (slash == std::string::npos)
        {
            return normalized;
        }
        return normalized.substr(slash + 1);
    }

    std::string drive_item_path(std::string_view remote_path, std::string_view action)
    {
        const auto normalized = normalize_remote(remote_path);
        std::ostringstream oss;
        if (normalized.empty())
        {
            oss << "/drive/root";
            if (!action.empty())
            {
                oss << '/' << action;
            }
            return oss.str();
        }
        oss << "/drive/root:/" << quote(normalized);
        if (!action.empty())
        {
            oss << ":/" << action;
        }
        return oss.str();
    }

} // namespace skydrive::url
