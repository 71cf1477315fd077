#include "bytebeam/crypto.hpp"

#include <array>
#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace bytebeam::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::uint32_t random_below(std::uint32_t upper_bound)
    {
        if (upper_bound == 0)
        {
            throw std::invalid_argument("random_below requires a non-zero bound");
        }
        ensure_initialized_once();
        return randombytes_uniform(upper_bound);
    }

    std::string random_uuid()
    {
        ensure_initialized_once();
        std::array<unsigned char, 16> bytes{};
        randombytes_buf(bytes.data(), bytes.size());
        bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

        static constexpr char kHexDigits[] = "0123456789abcdef";
        std::string result;
        result.reserve(36);
        for (std::size_t i = 0; i < bytes.size(); ++i)
        {
            if (i == 4 || i == 6 || i == 8 || i == 10)
            {
                result.push_back('-');
            }
            result.push_back(kHexDigits[(bytes[i] >> 4) & 0x0F]);
            result.push_back(kHexDigits[bytes[i] & 0x0F]);
        }
        return result;
    }

    bool secrets_equal(std::string_view presented, std::string_view expected)
    {
        ensure_initialized_once();
        if (presented.size() != expected.size())
        {
            return false;
        }
        if (expected.empty())
        {
            return true;
        }
        return sodium_memcmp(presented.data(), expected.data(), expected.size()) == 0;
    }

} // namespace bytebeam::crypto
