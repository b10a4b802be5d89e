#include <algorithm>
#include <iterator>
#include <fmt/format.h>

#include "base64.h"
#include "errors.h"
#include "logger.h"
#include "randomsource.h"

using MkToken::RandomSource;

static std::string EscapeForRegex(const std::string &s) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string escaped;
    for (char c : s) {
        if (special.find(c) != std::string::npos) escaped.push_back('\\');
        escaped.push_back(c);
    }
    return escaped;
}

static std::string ReplaceAll(const std::string &src, const std::regex &pattern,
                              const std::function<std::string(const std::smatch &)> &fn) {
    std::string result;
    auto last = src.cbegin();
    for (std::sregex_iterator it(src.begin(), src.end(), pattern), end; it != end; ++it) {
        const auto &m = *it;
        result.append(last, m[0].first);
        result.append(fn(m));
        last = m[0].second;
    }
    result.append(last, src.cend());
    return result;
}

std::string RandomSource::GetRandomString(int length, const RandomStringOptions &options) {
    if (options.replacePattern.has_value() != static_cast<bool>(options.replacement)) {
        throw InvalidOption("Both of replacePattern and replacement options expected");
    }

    auto charsNeeded = GetCharsNeededAfterPrefix(length, options.prefix, options.separator);
    std::string prefix = options.prefix.empty() ? "" : options.prefix + options.separator;
    if (charsNeeded <= 0) return prefix;

    std::vector<uint8_t> randomBytes;
    try {
        randomBytes = bytes.Get(static_cast<std::size_t>((charsNeeded * 3 + 3) / 4));
    } catch (const RandomSourceError &) {
        throw;
    } catch (const std::exception &e) {
        Logger::logMessage(spdlog::level::err, fmt::format("Random byte source failed: {}", e.what()));
        throw RandomSourceError(fmt::format("Error when generating random bytes: {}", e.what()));
    }

    auto encoded = Base64::Encode(randomBytes);
    if (encoded.length() < static_cast<std::size_t>(charsNeeded)) {
        throw RandomSourceError(fmt::format("Random byte source returned {} bytes, not enough for {} chars",
                                            randomBytes.size(), charsNeeded));
    }
    encoded.resize(static_cast<std::size_t>(charsNeeded));
    std::replace(encoded.begin(), encoded.end(), '+', '0');
    std::replace(encoded.begin(), encoded.end(), '/', '0');

    if (options.replacePattern) encoded = ReplaceAll(encoded, *options.replacePattern, options.replacement);

    return prefix + encoded;
}

std::string RandomSource::PadWithRandomChars(const std::string &base, int length, PadPosition position,
                                             const RandomStringOptions &options) {
    auto randomString = GetRandomString(length - static_cast<int>(base.length()), options);
    return position == PadPosition::Left ? randomString + base : base + randomString;
}

std::regex RandomSource::GetRandomStringRegex(int length, const std::string &prefix, const std::string &separator) {
    auto charsNeeded = std::max(0, GetCharsNeededAfterPrefix(length, prefix, separator));
    auto escapedBase = EscapeForRegex(prefix.empty() ? "" : prefix + separator);
    return std::regex(fmt::format("^{}[a-zA-Z0-9]{{{}}}$", escapedBase, charsNeeded));
}
