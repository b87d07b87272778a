/**
 * skydrive - SHA-1 digests used for content addressing and integrity checks.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <span>
#include <string>
#include <string_view>

namespace skydrive::crypto
{

    // All digests are lowercase hex.
    std::string sha1_bytes(std::span<const std::byte> data);

    std::string sha1_string(std::string_view text);

    std::string sha1_stream(std::istream &input);

    std::string sha1_file(const std::filesystem::path &path);

    bool digests_equal(std::string_view lhs, std::string_view rhs) noexcept;

} // namespace skydrive::crypto
