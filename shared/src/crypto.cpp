#include "coursesync/crypto.hpp"

#include <array>
#include <fstream>
#include <mutex>
#include <span>
#include <stdexcept>

#include <sodium.h>

namespace coursesync::crypto
{

    namespace
    {

        constexpr std::size_t kReadBlock = 64 * 1024;

        void init_sodium_once()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           {
                if (sodium_init() < 0)
                {
                    throw std::runtime_error("libsodium initialization failed");
                } });
        }

        std::string hex_digest(std::span<const unsigned char> digest)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string hex;
            hex.reserve(digest.size() * 2);
            for (const auto byte : digest)
            {
                hex.push_back(kHexDigits[byte >> 4]);
                hex.push_back(kHexDigits[byte & 0x0F]);
            }
            return hex;
        }

        void check(int rc, const char *what)
        {
            if (rc != 0)
            {
                throw std::runtime_error(std::string(what) + " failed");
            }
        }

    } // namespace

    std::string hash_file(const std::filesystem::path &path)
    {
        init_sodium_once();

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }

        crypto_generichash_state state;
        check(crypto_generichash_init(&state, nullptr, 0, crypto_generichash_BYTES), "crypto_generichash_init");

        std::array<char, kReadBlock> block{};
        for (;;)
        {
            file.read(block.data(), static_cast<std::streamsize>(block.size()));
            const auto got = file.gcount();
            if (got > 0)
            {
                check(crypto_generichash_update(&state, reinterpret_cast<const unsigned char *>(block.data()),
                                                static_cast<unsigned long long>(got)),
                      "crypto_generichash_update");
            }
            if (!file)
            {
                break;
            }
        }
        if (file.bad())
        {
            throw std::runtime_error("Failed to read file for hashing: " + path.string());
        }

        std::array<unsigned char, crypto_generichash_BYTES> digest{};
        check(crypto_generichash_final(&state, digest.data(), digest.size()), "crypto_generichash_final");
        return hex_digest(digest);
    }

} // namespace coursesync::crypto
