#include <cctype>
#include <charconv>
#include <random>
#include <fmt/format.h>

#include "errors.h"
#include "marketplace.h"

const MkToken::MaskedIntegerCodec &MkToken::MarketplaceIdCodec() {
    static const MaskedIntegerCodec codec(encodedMarketplaceIdLength);
    return codec;
}

std::optional<uint64_t> MkToken::ParseMarketplaceId(std::string_view marketplaceId) {
    uint64_t value = 0;
    auto first = marketplaceId.data();
    auto last = first + marketplaceId.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    // rejects '03' like values not matching their own integer
    if (std::to_string(value) != marketplaceId) return std::nullopt;
    if (value < 1 || value > maxMarketplaceId) return std::nullopt;
    return value;
}

char MkToken::FormatZone(const std::string &env, char zone) {
    auto z = static_cast<unsigned char>(zone);
    return static_cast<char>(env == "live" ? std::toupper(z) : z);
}

bool MkToken::IsLiveZone(char zone) {
    auto z = static_cast<unsigned char>(zone);
    return z == std::toupper(z);
}

std::string MkToken::EncodeMarketplaceId(std::string_view marketplaceId, std::string_view shuffler) {
    auto value = ParseMarketplaceId(marketplaceId);
    if (!value) {
        throw InvalidMarketplaceId(fmt::format("Expect marketplaceId to be a number in [1-{}] range, got '{}'",
                                               maxMarketplaceId, marketplaceId));
    }
    return MarketplaceIdCodec().Encode(*value, shuffler);
}

std::string MkToken::ExtractMarketplaceId(std::string_view block, std::string_view shuffler,
                                          const Config &config, bool requireZone) {
    auto expectedLength = requireZone ? marketplacePartLength : encodedMarketplaceIdLength;
    if (block.length() != expectedLength) {
        throw DecodeError(fmt::format("Can't extract marketplaceId from '{}': {} chars expected", block, expectedLength));
    }
    if (requireZone) {
        if (!config.HasZone(block[0])) {
            throw DecodeError(fmt::format("Can't extract marketplaceId from '{}' in [{}] zones", block, config.ZoneList()));
        }
        block.remove_prefix(1);
    }

    try {
        return std::to_string(MarketplaceIdCodec().Decode(block, shuffler));
    } catch (const Error &e) {
        throw DecodeError(fmt::format("Can't extract marketplaceId from '{}' with '{}' shuffler: {}",
                                      block, shuffler, e.what()));
    }
}

std::string MkToken::RandomMarketplaceId() {
    thread_local std::random_device rd;
    thread_local std::mt19937 gen(rd());
    std::uniform_int_distribution<uint64_t> r(1, maxMarketplaceId);
    return std::to_string(r(gen));
}
