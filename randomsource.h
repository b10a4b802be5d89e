#pragma once
#include <functional>
#include <optional>
#include <regex>
#include <string>

#include "capabilities.h"

namespace MkToken {

    struct RandomStringOptions {
        std::string prefix;
        std::string separator {"_"};
        // bans some chars from output, replacement must keep the length unchanged
        std::optional<std::regex> replacePattern;
        std::function<std::string(const std::smatch &)> replacement;
    };

    enum class PadPosition {
        Right,
        Left,
    };

    // Random strings made of base64 chars, '+' and '/' replaced by '0'.
    class RandomSource {
        RandomBytes &bytes;

    public:
        explicit RandomSource(RandomBytes &b) : bytes(b) {}

        std::string GetRandomString(int length, const RandomStringOptions &options = {});
        std::string PadWithRandomChars(const std::string &base, int length,
                                       PadPosition position = PadPosition::Right,
                                       const RandomStringOptions &options = {});

        static std::regex GetRandomStringRegex(int length = 1, const std::string &prefix = "",
                                               const std::string &separator = "_");
        static int GetCharsNeededAfterPrefix(int length, const std::string &prefix, const std::string &separator) {
            return prefix.empty() ? length : length - static_cast<int>(prefix.length() + separator.length());
        }
    };
}
