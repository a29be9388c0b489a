#include <gtest/gtest.h>
#include "slotguard/abi.hpp"

using namespace slotguard;

namespace {

std::string selector_hex(const std::string& signature)
{
    auto sel = slotguard::abi::selector(signature);
    Word w{};
    std::copy(sel.begin(), sel.end(), w.end() - 4);
    return word::to_hex(w).substr(2 + 56);
}

}  // namespace

TEST(abi, known_selectors)
{
    EXPECT_EQ(selector_hex("transfer(address,uint256)"), "a9059cbb");
    EXPECT_EQ(selector_hex("balanceOf(address)"), "70a08231");
    EXPECT_EQ(selector_hex("upgradeToAndCall(address,bytes)"), "4f1ef286");
    EXPECT_EQ(selector_hex("proxiableUUID()"), "52d1902d");
}

TEST(abi, selector_of_short_calldata)
{
    EXPECT_FALSE(slotguard::abi::selector_of(Bytes{0x01, 0x02, 0x03}).has_value());
    EXPECT_EQ(slotguard::abi::selector_of(slotguard::abi::Encoder("getValue()").build()), slotguard::abi::selector("getValue()"));
}

TEST(abi, static_arguments)
{
    const auto addr = Address::from_uint64(0xBEEF);
    const auto calldata = slotguard::abi::Encoder("f(address,uint256,bool)").address(addr).uint(42).boolean(true).build();
    ASSERT_EQ(calldata.size(), 4u + 3 * 32);

    slotguard::abi::Decoder args(calldata);
    EXPECT_EQ(args.word_count(), 3u);
    EXPECT_EQ(args.address(0), addr);
    EXPECT_EQ(args.uint64(1), 42u);
    EXPECT_EQ(args.boolean(2), true);
    EXPECT_FALSE(args.word(3).has_value());
}

TEST(abi, dynamic_bytes_layout)
{
    const auto addr = Address::from_uint64(7);
    const Bytes payload{0xde, 0xad, 0xbe, 0xef, 0x01};
    const auto calldata = slotguard::abi::Encoder("upgradeToAndCall(address,bytes)").address(addr).bytes(payload).build();

    // head: address, offset 0x40; tail: length, data padded to one word
    ASSERT_EQ(calldata.size(), 4u + 4 * 32);
    slotguard::abi::Decoder args(calldata);
    EXPECT_EQ(args.uint64(1), 64u);
    EXPECT_EQ(args.uint64(2), payload.size());
    EXPECT_EQ(args.address(0), addr);
    EXPECT_EQ(args.bytes(1), payload);
}

TEST(abi, empty_bytes)
{
    const auto calldata = slotguard::abi::Encoder().address(Address::from_uint64(1)).bytes({}).build();
    ASSERT_EQ(calldata.size(), 3u * 32);

    slotguard::abi::Decoder args(calldata, 0);
    auto data = args.bytes(1);
    ASSERT_TRUE(data.has_value());
    EXPECT_TRUE(data->empty());
}

TEST(abi, address_with_dirty_upper_bytes_is_rejected)
{
    Word dirty = Address::from_uint64(1).to_word();
    dirty[0] = 0xff;
    const auto calldata = slotguard::abi::Encoder("initialize(address)").word(dirty).build();

    slotguard::abi::Decoder args(calldata);
    EXPECT_TRUE(args.word(0).has_value());
    EXPECT_FALSE(args.address(0).has_value());
}

TEST(abi, non_boolean_word_is_rejected)
{
    const auto calldata = slotguard::abi::Encoder("f(bool)").uint(2).build();
    slotguard::abi::Decoder args(calldata);
    EXPECT_FALSE(args.boolean(0).has_value());
}

TEST(abi, malformed_bytes_offset)
{
    // Offset points past the end of calldata
    auto calldata = slotguard::abi::Encoder("f(bytes)").uint(0x1000).build();
    slotguard::abi::Decoder args(calldata);
    EXPECT_FALSE(args.bytes(0).has_value());

    // Length larger than the remaining data
    calldata = slotguard::abi::Encoder("f(bytes)").uint(32).uint(1000).build();
    slotguard::abi::Decoder truncated(calldata);
    EXPECT_FALSE(truncated.bytes(0).has_value());
}

TEST(abi, return_word)
{
    const auto value = word::from_uint64(143);
    EXPECT_EQ(slotguard::abi::decode_word(slotguard::abi::encode_word(value)), value);
    EXPECT_FALSE(slotguard::abi::decode_word(Bytes(31, 0)).has_value());
    EXPECT_FALSE(slotguard::abi::decode_word(Bytes{}).has_value());
}
