#include <algorithm>
#include <fmt/format.h>

#include "base62.h"
#include "errors.h"
#include "marketplace.h"
#include "objectid.h"

using MkToken::ObjectIdData;
using MkToken::ObjectIdFormat;

static constexpr auto shufflerLength = MkToken::MaskedIntegerCodec::shufflerLength;

// shuffler + '0' mask
static uint64_t TimestampMask(std::string_view shuffler) {
    return MkToken::MaskedIntegerCodec::DecodeShuffler(shuffler) * MkToken::Base62::radix;
}

int ObjectIdFormat::GetRandomCharsNeeded(std::size_t baseStringLength) {
    return static_cast<int>(objectIdLength) - static_cast<int>(baseStringLength + marketplacePartLength + timestampLength);
}

std::string ObjectIdFormat::Generate(const ObjectIdRequest &request) const {
    if (!request.prefix.empty()) {
        if (request.separator.empty() || request.prefix.find(request.separator) != std::string::npos) {
            throw InvalidPrefix(fmt::format("Prefix '{}' must not contain separator '{}'",
                                            request.prefix, request.separator));
        }
    }

    auto baseString = request.prefix.empty() ? std::string() : request.prefix + request.separator;
    // base64 random chars take 4/3 of their bytes
    if (3 * objectIdLength <= 4 * (baseString.length() + marketplacePartLength)) {
        throw LengthError(fmt::format("Length should be high enough to pad '{}' with random characters", baseString));
    }
    auto randomCharsNeeded = GetRandomCharsNeeded(baseString.length());
    if (randomCharsNeeded < static_cast<int>(shufflerLength)) {
        throw LengthError(fmt::format("No room left for a {} chars shuffler after '{}'", shufflerLength, baseString));
    }

    auto zone = request.zone.value_or(config.defaultZone);
    if (std::find(config.zones.begin(), config.zones.end(), zone) == config.zones.end()) {
        throw InvalidOption(fmt::format("Zone '{}' is not in [{}]", zone, config.ZoneList()));
    }
    if (!IsValidMarketplaceId(request.marketplaceId)) {
        throw InvalidMarketplaceId(fmt::format("Expect marketplaceId to be a number in [1-{}] range, got '{}'",
                                               maxMarketplaceId, request.marketplaceId));
    }

    auto randomChars = random.GetRandomString(randomCharsNeeded);
    auto shuffler = randomChars.substr(randomChars.length() - shufflerLength);
    auto encodedMarketplaceId = EncodeMarketplaceId(request.marketplaceId, shuffler);

    auto now = clock.NowSeconds();
    if (now < 0) throw OutOfRange(fmt::format("Clock returned a time before epoch: {}", now));
    auto encodedSecondsSinceEpoch = Base62::EncodePadded(static_cast<uint64_t>(now) + TimestampMask(shuffler),
                                                         timestampLength);

    return baseString +                                                   // AB
           randomChars.substr(0, randomChars.length() - shufflerLength) + // C
           FormatZone(request.env, zone) +                                // D
           encodedMarketplaceId +                                         // E
           encodedSecondsSinceEpoch +                                     // F
           shuffler;                                                      // G
}

ObjectIdData ObjectIdFormat::ExtractData(std::string_view objectId, std::string_view separator) const {
    if (objectId.length() != objectIdLength) {
        throw DecodeError(fmt::format("Object id '{}' should have {} chars", objectId, objectIdLength));
    }

    ObjectIdData data;
    std::size_t baseStringLength = 0;
    auto pos = separator.empty() ? std::string_view::npos : objectId.find(separator);
    if (pos != std::string_view::npos) {
        data.object = std::string(objectId.substr(0, pos));
        baseStringLength = pos + separator.length();
    }

    auto randomCharsLength = GetRandomCharsNeeded(baseStringLength) - static_cast<int>(shufflerLength);
    if (randomCharsLength < 0) {
        throw DecodeError(fmt::format("Object id '{}' has no room for random chars", objectId));
    }
    auto marketplacePart = objectId.substr(baseStringLength + static_cast<std::size_t>(randomCharsLength),
                                           marketplacePartLength);
    auto shuffler = objectId.substr(objectIdLength - shufflerLength);

    data.marketplaceId = ExtractMarketplaceId(marketplacePart, shuffler, config);
    data.zone = marketplacePart[0];
    data.isLive = IsLiveZone(data.zone);

    auto encodedTimestamp = objectId.substr(objectIdLength - shufflerLength - timestampLength, timestampLength);
    try {
        auto decoded = static_cast<int64_t>(Base62::Decode(encodedTimestamp));
        data.timestamp = decoded - static_cast<int64_t>(TimestampMask(shuffler));
    } catch (const Error &e) {
        throw DecodeError(fmt::format("Can't extract timestamp from '{}': {}", objectId, e.what()));
    }
    if (data.timestamp < 0) {
        throw DecodeError(fmt::format("Object id '{}' has a timestamp before epoch", objectId));
    }
    return data;
}
