#pragma once
#include <array>
#include <optional>
#include <string>
#include <string_view>

#include "config.h"
#include "randomsource.h"

namespace MkToken {

    // Field positions of one generation of API keys. The payload follows 'type_env_'.
    struct ApiKeyLayout {
        std::string_view name;
        std::size_t payloadLength;
        std::size_t marketplacePartIndex;       // from the start of the payload
        std::array<std::string_view, 3> builtInTypes;
        std::size_t builtInTypeMaxLength;
        std::size_t customTypeMinLength;
        std::size_t customTypeMaxLength;
    };

    // Newest first, parsing tries them in this order.
    // Both generations share one type vocabulary, only payload length and offset differ.
    inline constexpr std::array<ApiKeyLayout, 2> apiKeyLayouts {{
        {"current", 32, 20, {"sk", "pk", "ck"}, 2, 3, 10},
        {"legacy-v1", 24, 12, {"sk", "pk", "ck"}, 2, 3, 10},
    }};
    inline constexpr const ApiKeyLayout &currentApiKeyLayout = apiKeyLayouts[0];

    constexpr char apiKeySeparator = '_';

    struct ApiKeyRequest {
        std::string type;       // 'sk', 'pk', 'ck' or custom [a-zA-Z0-9]{3,10}
        std::string env;        // 'live' or 'test' usually
        std::string marketplaceId;
        std::optional<char> zone; // Config::defaultZone if not set
    };

    struct ParsedKey {
        std::optional<std::string> type;
        std::optional<std::string> env;
        std::optional<std::string> marketplaceId;
        std::optional<char> zone;
        bool hasValidFormat {false};
        const ApiKeyLayout *layout {nullptr};
    };

    class ApiKeyFormat {
        const Config &config;
        RandomSource &random;

        ParsedKey ParseWithLayout(std::string_view type, std::string_view env, std::string_view payload,
                                  const ApiKeyLayout &layout) const noexcept;

    public:
        ApiKeyFormat(const Config &c, RandomSource &r) : config(c), random(r) {}

        std::string Generate(const ApiKeyRequest &request) const;

        // Never throws, forged or garbled keys only get hasValidFormat == false.
        // Structural decoding is the only guarantee: a mutated key may still
        // decode to another valid marketplaceId.
        ParsedKey Parse(std::string_view key) const noexcept;

        // 'type_env_' as written in the key, if the key has a valid format
        std::optional<std::string> GetBaseKey(std::string_view key) const noexcept;

        // throws InvalidType
        static std::string ValidateKeyType(std::string_view type, const ApiKeyLayout &layout = currentApiKeyLayout);
        // built-in short types map to their long form: 'sk' -> 'seck', 'pk' -> 'pubk', 'ck' -> 'cntk'
        static std::string CanonicalKeyType(std::string_view type);
    };
}
