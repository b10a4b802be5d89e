#include <fmt/format.h>

#include "errors.h"
#include "maskedint.h"

using MkToken::MaskedIntegerCodec;

MaskedIntegerCodec::MaskedIntegerCodec(std::size_t w) : width(w) {
    // 62^10 is the last power below 2^64
    if (width <= shufflerLength || width > 10) {
        throw OutOfRange(fmt::format("Masked integer width {} should be in [4-10]", width));
    }
}

uint64_t MaskedIntegerCodec::DecodeShuffler(std::string_view shuffler) {
    if (shuffler.length() != shufflerLength) {
        throw InvalidEncoding(fmt::format("Shuffler '{}' should have {} chars", shuffler, shufflerLength));
    }
    return Base62::Decode(shuffler);
}

std::string MaskedIntegerCodec::Encode(uint64_t value, std::string_view shuffler) const {
    if (value < 1 || value > MaxValue()) {
        throw OutOfRange(fmt::format("Expect a number in [1-{}] range, got {}", MaxValue(), value));
    }
    return Base62::Encode(value + base + DecodeShuffler(shuffler));
}

uint64_t MaskedIntegerCodec::Decode(std::string_view encoded, std::string_view shuffler) const {
    if (encoded.length() != width) {
        throw OutOfRange(fmt::format("Masked value '{}' should have {} chars", encoded, width));
    }
    auto shifted = static_cast<int64_t>(Base62::Decode(encoded));
    auto value = shifted - static_cast<int64_t>(base + DecodeShuffler(shuffler));
    if (value <= 0 || static_cast<uint64_t>(value) > MaxValue()) {
        throw OutOfRange(fmt::format("Invalid value {} decoded from '{}' with '{}' shuffler", value, encoded, shuffler));
    }
    return static_cast<uint64_t>(value);
}
