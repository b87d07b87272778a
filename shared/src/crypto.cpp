#include "skydrive/crypto.hpp"

#include <cctype>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

#include <openssl/evp.h>

namespace skydrive::crypto
{

    namespace
    {

        struct DigestContextDeleter
        {
            void operator()(EVP_MD_CTX *context) const noexcept { EVP_MD_CTX_free(context); }
        };

        using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        DigestContext make_sha1_context()
        {
            DigestContext context(EVP_MD_CTX_new());
            if (!context)
            {
                throw std::runtime_error("EVP_MD_CTX_new failed");
            }
            if (EVP_DigestInit_ex(context.get(), EVP_sha1(), nullptr) != 1)
            {
                throw std::runtime_error("EVP_DigestInit_ex failed");
            }
            return context;
        }

        void update(EVP_MD_CTX *context, const void *data, std::size_t size)
        {
            if (EVP_DigestUpdate(context, data, size) != 1)
            {
                throw std::runtime_error("EVP_DigestUpdate failed");
            }
        }

        std::string finish(EVP_MD_CTX *context)
        {
            std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
            unsigned int length = 0;
            if (EVP_DigestFinal_ex(context, digest.data(), &length) != 1)
            {
                throw std::runtime_error("EVP_DigestFinal_ex failed");
            }
            digest.resize(length);
            return to_hex(digest);
        }

    } // namespace

    std::string sha1_bytes(std::span<const std::byte> data)
    {
        auto context = make_sha1_context();
        update(context.get(), data.data(), data.size());
        return finish(context.get());
    }

    std::string sha1_string(std::string_view text)
    {
        return sha1_bytes(std::as_bytes(std::span(text.data(), text.size())));
    }

    std::string sha1_stream(std::istream &input)
    {
        auto context = make_sha1_context();
        std::vector<char> buffer(64 * 1024);
        while (input)
        {
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                update(context.get(), buffer.data(), read_count);
            }
        }
        if (input.bad())
        {
            throw std::runtime_error("Read error while hashing stream");
        }
        return finish(context.get());
    }

    std::string sha1_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return sha1_stream(file);
    }

    bool digests_equal(std::string_view lhs, std::string_view rhs) noexcept
    {
        if (lhs.size() != rhs.size())
        {
            return false;
        }
        for (std::size_t i = 0; i < lhs.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i])))
            {
                return false;
            }
        }
        return true;
    }

} // namespace skydrive::crypto
