#include <algorithm>
#include <regex>
#include <vector>
#include <gtest/gtest.h>

#include "errors.h"
#include "randomsource.h"
#include "testcapabilities.h"

using namespace MkToken;

class RandomSourceTest : public ::testing::Test {
protected:
    OpenSSLRandomBytes bytes;
    RandomSource random {bytes};
};

TEST_F(RandomSourceTest, GeneratesStringOfGivenLength) {
    auto randomString = random.GetRandomString(10);
    EXPECT_EQ(randomString.length(), 10u);
    EXPECT_TRUE(std::regex_match(randomString, RandomSource::GetRandomStringRegex(10)));
}

TEST_F(RandomSourceTest, PadsWithRandomChars) {
    EXPECT_EQ(random.PadWithRandomChars("123", 10).length(), 10u);
    EXPECT_EQ(random.PadWithRandomChars("123", 10).substr(0, 3), "123");
    EXPECT_EQ(random.PadWithRandomChars("123", 10, PadPosition::Left).substr(7), "123");
    EXPECT_EQ(random.PadWithRandomChars("123", 2), "123");
}

TEST_F(RandomSourceTest, PrependsPrefixWithDefaultSeparator) {
    auto randomString = random.GetRandomString(16, {.prefix = "TEST"});
    EXPECT_TRUE(std::regex_match(randomString, std::regex("^TEST_[a-zA-Z0-9]{11}$")));
    EXPECT_TRUE(std::regex_match(randomString, RandomSource::GetRandomStringRegex(16, "TEST")));
}

TEST_F(RandomSourceTest, PrependsPrefixWithCustomSeparator) {
    auto randomString = random.GetRandomString(16, {.prefix = "TesT", .separator = "@"});
    auto specialRandomString = random.GetRandomString(16, {.prefix = "+00/", .separator = "+"});

    EXPECT_TRUE(std::regex_match(randomString, std::regex("^TesT@[a-zA-Z0-9]{11}$")));
    EXPECT_TRUE(std::regex_match(randomString, RandomSource::GetRandomStringRegex(16, "TesT", "@")));
    EXPECT_TRUE(std::regex_match(specialRandomString, std::regex(R"(^\+00/\+[a-zA-Z0-9]{11}$)")));
    EXPECT_TRUE(std::regex_match(specialRandomString, RandomSource::GetRandomStringRegex(16, "+00/", "+")));
}

TEST(RandomSourceFramingTest, ReturnsPrefixWhenLengthIsTooLow) {
    MkTokenTest::PatternBytes bytes;
    RandomSource random(bytes);
    RandomStringOptions options {.prefix = "9Char", .separator = "LONG"};

    EXPECT_TRUE(std::regex_match(random.GetRandomString(11, options), std::regex("^9CharLONG[a-zA-Z0-9]{2}$")));
    EXPECT_EQ(bytes.calls, 1u);
    EXPECT_EQ(random.GetRandomString(9, options), "9CharLONG");
    EXPECT_EQ(random.GetRandomString(5, options), "9CharLONG");
    EXPECT_EQ(random.GetRandomString(0), "");
    EXPECT_EQ(bytes.calls, 1u);
    EXPECT_TRUE(std::regex_match("9CharLONG", RandomSource::GetRandomStringRegex(5, "9Char", "LONG")));
}

TEST(RandomSourceFramingTest, RequestsThreeQuartersOfCharsInBytes) {
    MkTokenTest::PatternBytes bytes;
    RandomSource random(bytes);
    random.GetRandomString(27);
    EXPECT_EQ(bytes.lastRequested, 21u);
    random.GetRandomString(1);
    EXPECT_EQ(bytes.lastRequested, 1u);
    random.GetRandomString(8);
    EXPECT_EQ(bytes.lastRequested, 6u);
}

TEST(RandomSourceFramingTest, ReplacesNonAlphanumericBase64Chars) {
    // 0xfb 0xff 0xbf is '+/+/' in base64
    MkTokenTest::PatternBytes bytes({0xfb, 0xff, 0xbf});
    RandomSource random(bytes);
    EXPECT_EQ(random.GetRandomString(8), "00000000");
}

TEST_F(RandomSourceTest, GeneratesFiguresAndRandomlyCasedLettersOnly) {
    auto re = RandomSource::GetRandomStringRegex(32);
    std::vector<std::string> strings;
    for (int i = 0; i < 1000; i++) strings.push_back(random.GetRandomString(32));

    EXPECT_TRUE(std::all_of(strings.begin(), strings.end(), [&](const auto &s) { return std::regex_match(s, re); }));
    std::sort(strings.begin(), strings.end());
    EXPECT_EQ(std::adjacent_find(strings.begin(), strings.end()), strings.end());
}

TEST_F(RandomSourceTest, SubstitutesMatchesWithReplacement) {
    // non-digit chars become their ASCII code % 9, 'a' (97) -> '7'
    RandomStringOptions options;
    options.replacePattern = std::regex("[^\\d]");
    options.replacement = [](const std::smatch &m) { return std::to_string(m.str()[0] % 9); };

    auto re = RandomSource::GetRandomStringRegex(8);
    for (int i = 0; i < 1000; i++) {
        auto s = random.GetRandomString(8, options);
        EXPECT_TRUE(std::regex_match(s, re)) << s;
        EXPECT_TRUE(std::regex_match(s, std::regex("^\\d+$"))) << s;
    }
}

TEST_F(RandomSourceTest, SubstitutionSkipsPrefix) {
    RandomStringOptions options;
    options.prefix = "abc";
    options.replacePattern = std::regex("[^\\d]");
    options.replacement = [](const std::smatch &) { return std::string("1"); };
    EXPECT_TRUE(std::regex_match(random.GetRandomString(10, options), std::regex("^abc_\\d{6}$")));
}

TEST_F(RandomSourceTest, RequiresBothSubstitutionOptions) {
    RandomStringOptions onlyPattern;
    onlyPattern.replacePattern = std::regex("a");
    EXPECT_THROW(random.GetRandomString(8, onlyPattern), InvalidOption);

    RandomStringOptions onlyReplacement;
    onlyReplacement.replacement = [](const std::smatch &) { return std::string("0"); };
    EXPECT_THROW(random.GetRandomString(8, onlyReplacement), InvalidOption);
}

TEST(RandomSourceFailureTest, ReportsByteSourceFailures) {
    MkTokenTest::FailingBytes failing;
    RandomSource random(failing);
    EXPECT_THROW(random.GetRandomString(8), RandomSourceError);
    EXPECT_EQ(random.GetRandomString(3, {.prefix = "ab"}), "ab_");

    MkTokenTest::ShortBytes shortBytes;
    RandomSource shortRandom(shortBytes);
    EXPECT_THROW(shortRandom.GetRandomString(32), RandomSourceError);
}
