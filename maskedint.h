#pragma once
#include <cstdint>
#include <string>
#include <string_view>

#include "base62.h"

namespace MkToken {

    /*
     * Fixed width base62 encoding of a bounded positive integer.
     *
     * The value is shifted by `base` (62^3 - 1) so that the smallest value 1 already
     * needs `width` chars, then masked by adding the decoded 3-char shuffler.
     * With width 4:
     *   smallest '1000' = 238328 (62^3)
     *   largest  'zzzz' = 14776335, reached by MaxValue() with a 'zzz' shuffler
     * Masking avoids constant chars across tokens of the same value:
     *   shifted '1bve' becomes '2awd' with 'z0z', '1bwf' with '011'
     */
    class MaskedIntegerCodec {
        std::size_t width;

    public:
        static constexpr std::size_t shufflerLength = 3;
        static constexpr uint64_t base = Base62::Power(3) - 1;
        static constexpr uint64_t maxMask = Base62::Power(3) - 1; // 'zzz'

        explicit MaskedIntegerCodec(std::size_t w);

        std::size_t GetWidth() const { return width; }
        uint64_t MaxValue() const { return Base62::Power(static_cast<unsigned>(width)) - 1 - maxMask - base; }

        std::string Encode(uint64_t value, std::string_view shuffler) const;
        uint64_t Decode(std::string_view encoded, std::string_view shuffler) const;

        // throws InvalidEncoding unless shuffler is 3 base62 chars
        static uint64_t DecodeShuffler(std::string_view shuffler);
    };
}
