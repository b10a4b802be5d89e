#include <random>
#include <gtest/gtest.h>

#include "base62.h"
#include "errors.h"

using namespace MkToken;

TEST(Base62Test, EncodesWithOrderedAlphabet) {
    EXPECT_EQ(Base62::Encode(0), "0");
    EXPECT_EQ(Base62::Encode(9), "9");
    EXPECT_EQ(Base62::Encode(10), "A");
    EXPECT_EQ(Base62::Encode(36), "a");
    EXPECT_EQ(Base62::Encode(61), "z");
    EXPECT_EQ(Base62::Encode(62), "10");
    EXPECT_EQ(Base62::Encode(Base62::Power(3)), "1000");
}

TEST(Base62Test, DecodesKnownValues) {
    EXPECT_EQ(Base62::Decode("zzz"), 238327u);
    EXPECT_EQ(Base62::Decode("1bve"), 384130u);
    EXPECT_EQ(Base62::Decode("000z"), 61u);
}

TEST(Base62Test, RoundTrips) {
    std::mt19937_64 gen(42);
    std::uniform_int_distribution<uint64_t> r(0, Base62::Power(6));
    for (int i = 0; i < 1000; i++) {
        auto n = r(gen);
        EXPECT_EQ(Base62::Decode(Base62::Encode(n)), n);
    }
    EXPECT_EQ(Base62::Decode(Base62::Encode(UINT64_MAX)), UINT64_MAX);
}

TEST(Base62Test, PreservesIntegerOrder) {
    std::mt19937_64 gen(7);
    std::uniform_int_distribution<uint64_t> r(0, Base62::Power(6) - 1);
    for (int i = 0; i < 1000; i++) {
        auto a = r(gen), b = r(gen);
        if (a == b) continue;
        if (a > b) std::swap(a, b);
        EXPECT_LT(Base62::EncodePadded(a, 6), Base62::EncodePadded(b, 6));
    }
    EXPECT_LT(Base62::Encode(238328), Base62::Encode(238329));
}

TEST(Base62Test, PadsToWidth) {
    EXPECT_EQ(Base62::EncodePadded(5, 3), "005");
    EXPECT_EQ(Base62::Decode(Base62::EncodePadded(5, 3)), 5u);
    EXPECT_EQ(Base62::EncodePadded(Base62::Power(3) - 1, 3), "zzz");
    EXPECT_THROW(Base62::EncodePadded(Base62::Power(3), 3), OutOfRange);
}

TEST(Base62Test, RejectsInvalidEncodings) {
    EXPECT_THROW(Base62::Decode(""), InvalidEncoding);
    EXPECT_THROW(Base62::Decode("ab-"), InvalidEncoding);
    EXPECT_THROW(Base62::Decode("a b"), InvalidEncoding);
    EXPECT_THROW(Base62::Decode("zzzzzzzzzzzz"), InvalidEncoding);
}
