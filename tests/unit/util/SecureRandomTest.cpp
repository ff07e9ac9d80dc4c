/**
 * @file SecureRandomTest.cpp
 * @brief Unit tests for SecureRandom
 */

#include "util/SecureRandom.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <vector>

TEST(SecureRandomTest, Fill_ProducesDifferentBuffers) {
    std::vector<uint8_t> first(4'096);
    std::vector<uint8_t> second(4'096);

    ASSERT_TRUE(util::SecureRandom::fill(first));
    ASSERT_TRUE(util::SecureRandom::fill(second));

    EXPECT_NE(first, second);
}

TEST(SecureRandomTest, Fill_EmptyBufferSucceeds) {
    std::vector<uint8_t> empty;
    EXPECT_TRUE(util::SecureRandom::fill(empty));
}

TEST(SecureRandomTest, Fill_IsNotConstant) {
    std::vector<uint8_t> data(65'536, 0);
    ASSERT_TRUE(util::SecureRandom::fill(data));

    const std::set<uint8_t> distinct(data.begin(), data.end());
    EXPECT_GT(distinct.size(), 200U);
}

TEST(SecureRandomTest, Uniform_StaysBelowBound) {
    for (int i = 0; i < 1'000; ++i) {
        auto value = util::SecureRandom::uniform(7);
        ASSERT_TRUE(value);
        EXPECT_LT(*value, 7U);
    }
}

TEST(SecureRandomTest, Uniform_ZeroBoundIsError) {
    auto value = util::SecureRandom::uniform(0);
    ASSERT_FALSE(value);
    EXPECT_EQ(value.error().code, EINVAL);
}

TEST(SecureRandomTest, Token_UsesAlphabetAndLength) {
    auto token = util::SecureRandom::token(16);
    ASSERT_TRUE(token);
    EXPECT_EQ(token->size(), 16U);
    EXPECT_TRUE(std::all_of(token->begin(), token->end(), [](char c) {
        return util::SecureRandom::LOWER_ALNUM.find(c) != std::string_view::npos;
    }));
}

TEST(SecureRandomTest, Token_EmptyAlphabetIsError) {
    EXPECT_FALSE(util::SecureRandom::token(4, ""));
}
