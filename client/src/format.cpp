#include "skydrive/client/format.hpp"

#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>

namespace skydrive::client
{

    std::string human_size(std::uint64_t bytes)
    {
        static constexpr std::array<const char *, 6> kPrefixes{"Ki", "Mi", "Gi", "Ti", "Pi", "Ei"};
        if (bytes < 1024)
        {
            return std::to_string(bytes);
        }
        auto value = static_cast<double>(bytes) / 1024.0;
        std::size_t prefix = 0;
        while (value >= 1024.0 && prefix + 1 < kPrefixes.size())
        {
            value /= 1024.0;
            ++prefix;
        }
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << value << kPrefixes[prefix];
        return oss.str();
    }

    std::vector<std::string> format_listing(const std::vector<protocol::DriveItem> &items, bool human_sizes,
                                            bool long_format)
    {
        std::vector<std::string> lines;
        lines.reserve(items.size());
        if (!long_format)
        {
            for (const auto &item : items)
            {
                lines.push_back(item.name);
            }
            return lines;
        }

        std::vector<std::array<std::string, 3>> columns;
        columns.reserve(items.size());
        std::array<std::size_t, 3> widths{};
        for (const auto &item : items)
        {
            std::array<std::string, 3> row{
                item.is_folder ? "d" : "-",
                item.child_count ? std::to_string(*item.child_count) : "-",
                human_sizes ? human_size(item.size) : std::to_string(item.size),
            };
            for (std::size_t i = 0; i < row.size(); ++i)
            {
                widths[i] = std::max(widths[i], row[i].size());
            }
            columns.push_back(std::move(row));
        }

        for (std::size_t index = 0; index < items.size(); ++index)
        {
            std::ostringstream oss;
            for (std::size_t i = 0; i < widths.size(); ++i)
            {
                oss << std::setw(static_cast<int>(widths[i])) << columns[index][i] << ' ';
            }
            oss << items[index].name;
            lines.push_back(oss.str());
        }
        return lines;
    }

} // namespace skydrive::client
