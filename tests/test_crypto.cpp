#include <gtest/gtest.h>
#include "slotguard/crypto.hpp"
#include "slotguard/types.hpp"

using namespace slotguard;

TEST(keccak256, empty_input)
{
    auto hash = crypto::Keccak256::hash(std::string_view{});
    EXPECT_EQ(word::to_hex(hash), "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

TEST(keccak256, abc)
{
    auto hash = crypto::Keccak256::hash(std::string_view{"abc"});
    EXPECT_EQ(word::to_hex(hash), "0x4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST(keccak256, overloads_agree)
{
    const std::string text = "eip1967.proxy.implementation";
    Bytes bytes(text.begin(), text.end());

    auto a = crypto::Keccak256::hash(text);
    auto b = crypto::Keccak256::hash(bytes);
    auto c = crypto::Keccak256::hash(bytes.data(), bytes.size());
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, c);
}

TEST(keccak256, rate_boundary)
{
    // Inputs around one 136-byte block must all hash differently
    std::string rate_minus_one(crypto::Keccak256::RATE - 1, 'a');
    std::string rate(crypto::Keccak256::RATE, 'a');
    std::string rate_plus_one(crypto::Keccak256::RATE + 1, 'a');

    auto h1 = crypto::Keccak256::hash(rate_minus_one);
    auto h2 = crypto::Keccak256::hash(rate);
    auto h3 = crypto::Keccak256::hash(rate_plus_one);
    EXPECT_NE(h1, h2);
    EXPECT_NE(h2, h3);
    EXPECT_NE(h1, h3);
    EXPECT_EQ(h2, crypto::Keccak256::hash(rate));
}
