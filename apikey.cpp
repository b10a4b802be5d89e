#include <algorithm>
#include <cctype>
#include <vector>
#include <boost/algorithm/string/split.hpp>
#include <fmt/format.h>

#include "apikey.h"
#include "errors.h"
#include "logger.h"
#include "marketplace.h"

using MkToken::ApiKeyFormat;
using MkToken::ParsedKey;

static bool IsAsciiAlnum(char c) {
    return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

std::string ApiKeyFormat::ValidateKeyType(std::string_view type, const ApiKeyLayout &layout) {
    if (type.empty()) throw InvalidType("ApiKey type is expected to be a non empty string");

    if (type.length() <= layout.builtInTypeMaxLength) {
        auto &list = layout.builtInTypes;
        if (std::find(list.begin(), list.end(), type) == list.end()) {
            throw InvalidType(fmt::format("Invalid ApiKey type '{}'", type));
        }
        return std::string(type);
    }

    if (type.length() < layout.customTypeMinLength || type.length() > layout.customTypeMaxLength
        || !std::all_of(type.begin(), type.end(), IsAsciiAlnum)) {
        throw InvalidType(fmt::format("Custom ApiKey type must match [a-zA-Z0-9]{{{},{}}}, got '{}'",
                                      layout.customTypeMinLength, layout.customTypeMaxLength, type));
    }
    return std::string(type);
}

std::string ApiKeyFormat::CanonicalKeyType(std::string_view type) {
    if (type == "sk") return "seck";
    if (type == "pk") return "pubk";
    if (type == "ck") return "cntk";
    return std::string(type);
}

std::string ApiKeyFormat::Generate(const ApiKeyRequest &request) const {
    const auto &layout = currentApiKeyLayout;
    auto type = ValidateKeyType(request.type, layout);

    if (!IsValidMarketplaceId(request.marketplaceId)) {
        throw InvalidMarketplaceId(fmt::format("Marketplace id is expected to be a string integer in [1-{}], got '{}'",
                                               maxMarketplaceId, request.marketplaceId));
    }
    if (request.env.empty() || request.env.find(apiKeySeparator) != std::string::npos) {
        throw InvalidEnvironment(fmt::format("Environment '{}' is expected to be a non empty string without '{}'",
                                             request.env, apiKeySeparator));
    }
    auto zone = request.zone.value_or(config.defaultZone);
    if (std::find(config.zones.begin(), config.zones.end(), zone) == config.zones.end()) {
        throw InvalidOption(fmt::format("Zone '{}' is not in [{}]", zone, config.ZoneList()));
    }

    auto baseString = fmt::format("{}{}{}{}", type, apiKeySeparator, request.env, apiKeySeparator);

    // the shuffler is the last random chars, after the marketplace part
    auto randomString = random.GetRandomString(static_cast<int>(layout.payloadLength - marketplacePartLength));
    auto shuffler = randomString.substr(randomString.length() - MaskedIntegerCodec::shufflerLength);
    auto marketplaceString = FormatZone(request.env, zone) + EncodeMarketplaceId(request.marketplaceId, shuffler);

    auto breakIndex = layout.marketplacePartIndex;
    return baseString +
           randomString.substr(0, breakIndex) +
           marketplaceString +
           randomString.substr(breakIndex);
}

ParsedKey ApiKeyFormat::ParseWithLayout(std::string_view type, std::string_view env, std::string_view payload,
                                        const ApiKeyLayout &layout) const noexcept {
    ParsedKey parsed;
    parsed.layout = &layout;
    if (!env.empty()) parsed.env = std::string(env);

    auto zone = payload[layout.marketplacePartIndex];
    if (config.HasZone(zone)) parsed.zone = static_cast<char>(std::tolower(static_cast<unsigned char>(zone)));

    try {
        parsed.type = CanonicalKeyType(ValidateKeyType(type, layout));
    } catch (const InvalidType &) {
    }
    try {
        auto shuffler = payload.substr(payload.length() - MaskedIntegerCodec::shufflerLength);
        parsed.marketplaceId = ExtractMarketplaceId(payload.substr(layout.marketplacePartIndex, marketplacePartLength),
                                                    shuffler, config);
    } catch (const DecodeError &) {
    }

    parsed.hasValidFormat = parsed.type && parsed.env && parsed.marketplaceId && parsed.zone;
    return parsed;
}

ParsedKey ApiKeyFormat::Parse(std::string_view key) const noexcept {
    std::string input(key);
    std::vector<std::string> parts;
    boost::algorithm::split(parts, input, [](char c) { return c == apiKeySeparator; });
    if (parts.size() != 3) return {};

    std::optional<ParsedKey> firstAttempt;
    for (const auto &layout : apiKeyLayouts) {
        if (parts[2].length() != layout.payloadLength) continue;

        auto parsed = ParseWithLayout(parts[0], parts[1], parts[2], layout);
        if (parsed.hasValidFormat) {
            if (&layout != &currentApiKeyLayout) {
                Logger::logMessage(spdlog::level::debug,
                                   fmt::format("Parsed {} api key of type {}", layout.name, *parsed.type));
            }
            return parsed;
        }
        if (!firstAttempt) firstAttempt = parsed;
    }
    if (firstAttempt) return *firstAttempt;

    // no layout has this payload length
    ParsedKey parsed;
    try {
        parsed.type = CanonicalKeyType(ValidateKeyType(parts[0]));
    } catch (const InvalidType &) {
    }
    if (!parts[1].empty()) parsed.env = parts[1];
    return parsed;
}

std::optional<std::string> ApiKeyFormat::GetBaseKey(std::string_view key) const noexcept {
    auto parsed = Parse(key);
    if (!parsed.hasValidFormat) return std::nullopt;
    return fmt::format("{}{}{}{}", *parsed.type, apiKeySeparator, *parsed.env, apiKeySeparator);
}
