#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "skydrive/protocol.hpp"

namespace skydrive::client
{

    // IEC prefixes without a unit: 512 -> "512", 1536 -> "1.5Ki", 10485760 -> "10.0Mi".
    std::string human_size(std::uint64_t bytes);

    // Long format: type (d or -), child count (- for files), size, name, with
    // the first three columns right-aligned to a common width.
    std::vector<std::string> format_listing(const std::vector<protocol::DriveItem> &items, bool human_sizes,
                                            bool long_format);

} // namespace skydrive::client
