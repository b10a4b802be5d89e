#pragma once
#include <cstdint>
#include <vector>

namespace MkToken {

    // Source of cryptographically secure bytes
    class RandomBytes {
    public:
        virtual ~RandomBytes() = default;
        virtual std::vector<uint8_t> Get(std::size_t n) = 0;
    };

    class Clock {
    public:
        virtual ~Clock() = default;
        // seconds since the UNIX epoch
        virtual int64_t NowSeconds() = 0;
    };

    class OpenSSLRandomBytes : public RandomBytes {
    public:
        std::vector<uint8_t> Get(std::size_t n) override;
    };

    class SystemClock : public Clock {
    public:
        int64_t NowSeconds() override;
    };
}
