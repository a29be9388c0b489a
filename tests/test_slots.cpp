#include <gtest/gtest.h>
#include <set>
#include "slotguard/slots.hpp"

using namespace slotguard;

TEST(slots, eip1967_implementation_slot)
{
    EXPECT_EQ(word::to_hex(slots::implementation()),
        "0x360894a13ba1a3210667c828492db98dca3e2076cc3735a920a3ca505d382bbc");
}

TEST(slots, eip1967_admin_slot)
{
    EXPECT_EQ(word::to_hex(slots::admin()),
        "0xb53127684a568b3173ae13b9f8a6016e243e63b6e8ee1178d6a717850b5d6103");
}

TEST(slots, erc7201_initializable_slot)
{
    EXPECT_EQ(word::to_hex(slots::initializable()),
        "0xf0c57e16840df040f15088dc2f81fe391c3923bec73e23a9662efc9c229c6a00");
}

TEST(slots, reserved_is_hash_minus_one)
{
    const std::string ns = "example.namespace";
    auto hash = crypto::Keccak256::hash(ns);
    EXPECT_EQ(word::add(slots::reserved(ns), word::from_uint64(1)), hash);
    EXPECT_EQ(slots::reserved(ns), slots::reserved(ns));
    EXPECT_NE(slots::reserved(ns), slots::reserved("example.namespace2"));
}

TEST(slots, namespaced_clears_low_byte)
{
    auto slot = slots::namespaced("some.app.storage");
    EXPECT_EQ(slot[31], 0);
    EXPECT_NE(slot, slots::reserved("some.app.storage"));
}

TEST(slots, sequential_enumeration_never_hits_reserved)
{
    constexpr uint64_t field_count = 100000;
    const auto& control = slots::ControlLayout::standard();
    std::set<StorageSlot> reserved;
    for (const auto& [name, slot] : control.named()) {
        reserved.insert(slot);
    }
    ASSERT_EQ(reserved.size(), 3u);

    for (uint64_t i = 0; i < field_count; ++i) {
        ASSERT_EQ(reserved.count(slots::sequential(i)), 0u) << "index " << i;
    }
    EXPECT_TRUE(slots::find_conflicts(control, UINT64_MAX).empty());
}

TEST(slots, sequential_is_big_endian_index)
{
    auto slot = slots::sequential(0x0102);
    EXPECT_EQ(slot[31], 0x02);
    EXPECT_EQ(slot[30], 0x01);
    EXPECT_TRUE(word::is_zero(slots::sequential(0)));
}

TEST(slots, naive_layout_conflicts)
{
    auto naive = slots::ControlLayout::naive();
    EXPECT_TRUE(slots::reachable_by_sequential(naive.implementation, 1));
    EXPECT_FALSE(slots::reachable_by_sequential(naive.admin, 1));
    EXPECT_TRUE(slots::reachable_by_sequential(naive.admin, 2));

    auto conflicts = slots::find_conflicts(naive, 2);
    ASSERT_EQ(conflicts.size(), 2u);
    EXPECT_EQ(conflicts[0].control, "implementation");
    EXPECT_EQ(conflicts[0].index, 0u);
    EXPECT_EQ(conflicts[1].control, "admin");
    EXPECT_EQ(conflicts[1].index, 1u);

    EXPECT_EQ(slots::find_conflicts(naive, 1).size(), 1u);
    EXPECT_TRUE(slots::find_conflicts(naive, 0).empty());
}

TEST(slots, custom_namespaces)
{
    auto control = slots::ControlLayout::from_namespaces("my.impl", "my.admin");
    EXPECT_EQ(control.implementation, slots::reserved("my.impl"));
    EXPECT_EQ(control.admin, slots::reserved("my.admin"));
    EXPECT_EQ(control.initialization, slots::initializable());
    EXPECT_NE(control.implementation, slots::implementation());
}
