/**
 * skydrive - URL and remote path helpers.
 */
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace skydrive::url
{

    // Removes every occurrence of `variable` from the query string, keeping the other parameters verbatim.
    std::string pop_query(const std::string &url, std::string_view variable);

    // Percent-encodes everything except unreserved characters and the ones listed in `safe`.
    std::string quote(std::string_view text, std::string_view safe = "/");

    std::string form_encode(const std::vector<std::pair<std::string, std::string>> &fields);

    // "/a//b/./c/" -> "a/b/c"; the drive root is the empty string.
    std::string normalize_remote(std::string_view path);

    std::string join_remote(std::string_view directory, std::string_view name);

    std::string remote_parent(std::string_view path);

    std::string remote_basename(std::string_view path);

    // Path-addressed item URL relative to the API endpoint, e.g. "/drive/root:/a%20b:/children".
    std::string drive_item_path(std::string_view remote_path, std::string_view action = {});

} // namespace skydrive::url
