#include <gtest/gtest.h>

#include "adapters/secondary/OpenSslTokenGenerator.hpp"

#include <set>

using bridge::adapters::secondary::OpenSslTokenGenerator;

TEST(OpenSslTokenGeneratorTest, Generates64HexChars) {
    OpenSslTokenGenerator generator;

    auto token = generator.generate();

    EXPECT_EQ(token.size(), 64u);
    EXPECT_EQ(token.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(OpenSslTokenGeneratorTest, TokensAreUnique) {
    OpenSslTokenGenerator generator;
    std::set<std::string> seen;

    for (int i = 0; i < 1000; ++i) {
        seen.insert(generator.generate());
    }

    EXPECT_EQ(seen.size(), 1000u);
}
