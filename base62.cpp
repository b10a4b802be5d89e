#include <algorithm>
#include <limits>
#include <fmt/format.h>

#include "base62.h"
#include "errors.h"

static int DigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
    if (c >= 'a' && c <= 'z') return c - 'a' + 36;
    return -1;
}

std::string MkToken::Base62::Encode(uint64_t value) {
    if (value == 0) return std::string(1, alphabet[0]);

    std::string encoded;
    while (value > 0) {
        encoded.push_back(alphabet[value % radix]);
        value /= radix;
    }
    std::reverse(encoded.begin(), encoded.end());
    return encoded;
}

std::string MkToken::Base62::EncodePadded(uint64_t value, std::size_t width) {
    auto encoded = Encode(value);
    if (encoded.length() > width) {
        throw OutOfRange(fmt::format("{} does not fit in {} base62 chars", value, width));
    }
    return std::string(width - encoded.length(), alphabet[0]) + encoded;
}

uint64_t MkToken::Base62::Decode(std::string_view encoded) {
    if (encoded.empty()) throw InvalidEncoding("Cannot decode an empty base62 string");

    constexpr auto maxValue = std::numeric_limits<uint64_t>::max();
    uint64_t value = 0;
    for (char c : encoded) {
        auto digit = DigitValue(c);
        if (digit < 0) {
            throw InvalidEncoding(fmt::format("Invalid base62 char in '{}'", encoded));
        }
        if (value > (maxValue - static_cast<uint64_t>(digit)) / radix) {
            throw InvalidEncoding(fmt::format("Base62 value '{}' overflows 64 bits", encoded));
        }
        value = value * radix + static_cast<uint64_t>(digit);
    }
    return value;
}
