#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "capabilities.h"
#include "config.h"
#include "randomsource.h"

namespace MkToken {

    struct ObjectIdRequest {
        std::string prefix;
        std::string separator {"_"};
        std::string marketplaceId;
        std::string env {"test"};
        std::optional<char> zone; // Config::defaultZone if not set
    };

    struct ObjectIdData {
        std::string object;
        std::string marketplaceId;
        char zone {0};
        bool isLive {false};
        int64_t timestamp {0};  // seconds since epoch at generation
    };

    /*
     * 24-char object ids made of 7 parts:
     *
     * - A: prefix, preferably 3 or 4 chars ('ast', 'usr')
     * - B: separator
     * - C: random base62 chars, fewer when the prefix is longer
     * - D: zone, uppercase if env is 'live'
     * - E: 4 chars of marketplaceId masked with G
     * - F: 6 chars of UNIX timestamp masked with G + '0'
     *   (62^6 - 1 seconds from epoch is 3769-12-05)
     * - G: 3 random chars used as shuffler
     *
     * ast _ 2l7fQp s 1I3a 1gJYz2 I3a
     * A   B C      D E    F      G
     *
     * Ids sort by env + marketplaceId + approximate creation date once C is skipped.
     * Uniqueness is not guaranteed, collisions are unlikely for the same object
     * type and marketplace within the same second.
     */
    class ObjectIdFormat {
        const Config &config;
        RandomSource &random;
        Clock &clock;

    public:
        static constexpr std::size_t objectIdLength = 24;
        static constexpr std::size_t timestampLength = 6;

        ObjectIdFormat(const Config &c, RandomSource &r, Clock &k) : config(c), random(r), clock(k) {}

        std::string Generate(const ObjectIdRequest &request) const;

        // throws DecodeError, wrap it when a non throwing call is needed
        ObjectIdData ExtractData(std::string_view objectId, std::string_view separator = "_") const;

        // includes the trailing shuffler chars
        static int GetRandomCharsNeeded(std::size_t baseStringLength);
    };
}
