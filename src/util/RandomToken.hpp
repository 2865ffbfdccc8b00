#pragma once

#include <random>
#include <string>
#include <cstdint>

namespace BulkBridge
{

    // 32 lowercase hex characters (128 random bits), safe for table and job ids.
    // Each thread owns its engine; no locking.
    inline std::string random_token()
    {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        static constexpr char HEX[] = "0123456789abcdef";

        std::string token;
        token.reserve(32);
        for (int half = 0; half < 2; ++half)
        {
            uint64_t bits = rng();
            for (int i = 0; i < 16; ++i)
            {
                token.push_back(HEX[bits & 0xF]);
                bits >>= 4;
            }
        }
        return token;
    }

} // namespace BulkBridge
