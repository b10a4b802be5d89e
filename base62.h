#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace MkToken::Base62 {
    // Preserves ASCII sorting order
    constexpr std::string_view alphabet = "0123456789"
                                          "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                                          "abcdefghijklmnopqrstuvwxyz";
    constexpr uint64_t radix = 62;

    std::string Encode(uint64_t value);
    // left padded with '0' up to width, throws OutOfRange if wider
    std::string EncodePadded(uint64_t value, std::size_t width);
    uint64_t Decode(std::string_view encoded);

    inline bool IsDigit(char c) {
        return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    constexpr uint64_t Power(unsigned exponent) {
        uint64_t r = 1;
        for (unsigned i = 0; i < exponent; i++) r *= radix;
        return r;
    }
}
