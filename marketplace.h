#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "config.h"
#include "maskedint.h"

namespace MkToken {

    constexpr std::size_t encodedMarketplaceIdLength = 4;
    constexpr std::size_t marketplacePartLength = encodedMarketplaceIdLength + 1; // including zone
    // max 'z000' to allow masking up to '0zzz'
    constexpr uint64_t maxMarketplaceId = Base62::Power(4) - 1 - MaskedIntegerCodec::maxMask - MaskedIntegerCodec::base;

    const MaskedIntegerCodec &MarketplaceIdCodec();

    // decimal string without sign, spaces or leading zeros, in [1-maxMarketplaceId]
    std::optional<uint64_t> ParseMarketplaceId(std::string_view marketplaceId);
    inline bool IsValidMarketplaceId(std::string_view marketplaceId) {
        return ParseMarketplaceId(marketplaceId).has_value();
    }
    inline bool IsValidMarketplaceId(int64_t marketplaceId) {
        return marketplaceId >= 1 && static_cast<uint64_t>(marketplaceId) <= maxMarketplaceId;
    }

    // uppercase zone flags the live environment
    char FormatZone(const std::string &env, char zone);
    bool IsLiveZone(char zone);

    // throws InvalidMarketplaceId
    std::string EncodeMarketplaceId(std::string_view marketplaceId, std::string_view shuffler);

    // block is zone + encoded id, or the encoded id only when requireZone is false.
    // throws DecodeError
    std::string ExtractMarketplaceId(std::string_view block, std::string_view shuffler,
                                     const Config &config = Config::Default(), bool requireZone = true);

    // uniform pick in [1-maxMarketplaceId], not meant for secrets
    std::string RandomMarketplaceId();
}
