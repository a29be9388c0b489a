#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "test_helpers.hpp"

using namespace slotguard;
using namespace slotguard::test;

namespace {

// ERC-1967 proxy over a UUPS CounterV1, owned by OWNER
class uups_upgrade : public ::testing::Test {
protected:
    void SetUp() override
    {
        v1 = deploy(runtime, std::make_shared<contracts::CounterV1>());
        v2 = deploy(runtime, std::make_shared<contracts::CounterV2>());
        auto deployed = runtime.deploy_proxy(DEPLOYER, v1, initialize_call(OWNER));
        ASSERT_TRUE(deployed.success) << deployed.message;
        instance = *deployed.created_address;
        ASSERT_TRUE(runtime.call(USER, instance, set_value_call(10)).success);
    }

    Address implementation() { return runtime.introspect(instance)->implementation; }

    Runtime runtime{quiet_config()};
    Address v1;
    Address v2;
    Address instance;
};

// Transparent proxy administered by ADMIN
class transparent_upgrade : public ::testing::Test {
protected:
    void SetUp() override
    {
        v1 = deploy(runtime, std::make_shared<contracts::CounterV1>());
        v2 = deploy(runtime, std::make_shared<contracts::CounterV2>());

        auto options = runtime.default_proxy_options(proxy::ProxyKind::Transparent);
        options.admin = ADMIN;
        auto deployed = runtime.deploy_proxy(DEPLOYER, v1, initialize_call(OWNER), options);
        ASSERT_TRUE(deployed.success) << deployed.message;
        instance = *deployed.created_address;
    }

    Runtime runtime{quiet_config()};
    Address v1;
    Address v2;
    Address instance;
};

}  // namespace

TEST_F(uups_upgrade, owner_upgrades)
{
    auto result = runtime.upgrade(OWNER, instance, v2, {});
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(implementation(), v2);
    EXPECT_EQ(call_uint(runtime, USER, instance, "version()"), 2u);
    EXPECT_EQ(call_uint(runtime, USER, instance, "getValue()"), 10u);

    ASSERT_FALSE(result.logs.empty());
    EXPECT_EQ(result.logs[0].topics.at(0), proxy::upgraded_event());
    EXPECT_EQ(result.logs[0].topics.at(1), v2.to_word());
}

TEST_F(uups_upgrade, non_owner_is_rejected)
{
    auto result = runtime.upgrade(ATTACKER, instance, v2, {});
    EXPECT_EQ(result.error, Error::Unauthorized);
    EXPECT_EQ(implementation(), v1);
}

TEST_F(uups_upgrade, target_without_code)
{
    auto result = runtime.upgrade(OWNER, instance, Address::from_uint64(0x5555), {});
    EXPECT_EQ(result.error, Error::InvalidImplementation);
    EXPECT_EQ(implementation(), v1);
}

TEST_F(uups_upgrade, target_without_upgrade_entry_point)
{
    // Would leave the proxy frozen
    auto store = deploy(runtime, std::make_shared<contracts::SlotZeroStore>());
    auto result = runtime.upgrade(OWNER, instance, store, {});
    EXPECT_EQ(result.error, Error::InvalidImplementation);
    EXPECT_EQ(implementation(), v1);
}

TEST_F(uups_upgrade, failed_post_upgrade_call_is_atomic)
{
    const auto before = runtime.host().store_of(instance)->entries();

    auto result = runtime.upgrade(OWNER, instance, v2, reinitialize_call(7, 100));
    EXPECT_EQ(result.error, Error::InvalidReinitializationEpoch);
    EXPECT_TRUE(result.logs.empty());
    EXPECT_EQ(implementation(), v1);
    EXPECT_EQ(runtime.host().store_of(instance)->entries(), before);
}

TEST_F(uups_upgrade, upgrade_with_reinitialization)
{
    auto result = runtime.upgrade(OWNER, instance, v2, reinitialize_call(2, 5));
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(call_uint(runtime, USER, instance, "getNewVar()"), 5u);
    EXPECT_EQ(call_uint(runtime, USER, instance, "getTotal()"), 15u);

    // Epoch 2 is spent
    auto again = runtime.call(OWNER, instance, reinitialize_call(2, 6));
    EXPECT_EQ(again.error, Error::InvalidReinitializationEpoch);
}

TEST_F(uups_upgrade, direct_call_on_implementation_is_rejected)
{
    auto calldata = slotguard::abi::Encoder(proxy::UPGRADE_TO_AND_CALL).address(v2).bytes({}).build();
    auto result = runtime.call(OWNER, v1, calldata);
    EXPECT_EQ(result.error, Error::Unauthorized);
}

namespace {

class counting_policy : public proxy::UpgradePolicy {
public:
    ExecutionResult authorize(execution::CallContext&, const Address&) const override
    {
        ++calls;
        return ExecutionResult::ok();
    }

    mutable int calls{0};
};

class open_upgradeable : public contracts::Contract {
public:
    explicit open_upgradeable(std::shared_ptr<counting_policy> policy)
      : Contract("OpenUpgradeable", layout::StorageLayout("OpenUpgradeable", {}))
    {
        enable_uups(std::move(policy));
    }
};

}  // namespace

TEST(uups, upgrade_is_authorized_once)
{
    Runtime runtime(quiet_config());
    auto policy = std::make_shared<counting_policy>();
    auto first = deploy(runtime, std::make_shared<open_upgradeable>(policy));
    auto second = deploy(runtime, std::make_shared<open_upgradeable>(policy));

    auto deployed = runtime.deploy_proxy(DEPLOYER, first, {});
    ASSERT_TRUE(deployed.success) << deployed.message;

    auto result = runtime.upgrade(USER, *deployed.created_address, second, {});
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(policy->calls, 1);
    EXPECT_EQ(runtime.introspect(*deployed.created_address)->implementation, second);
}

TEST(uups, introspect_while_upgrading)
{
    Runtime runtime(quiet_config(LayoutPolicy::Enforce));
    auto v2 = deploy(runtime, std::make_shared<contracts::CounterV2>());
    auto v2b = deploy(runtime, std::make_shared<contracts::CounterV2>());
    auto deployed = runtime.deploy_proxy(DEPLOYER, v2, initialize_call(OWNER));
    ASSERT_TRUE(deployed.success) << deployed.message;
    auto instance = *deployed.created_address;

    constexpr int rounds = 200;
    std::atomic<int> failures{0};
    std::thread writer([&] {
        for (int i = 0; i < rounds; ++i) {
            if (!runtime.upgrade(OWNER, instance, i % 2 == 0 ? v2b : v2, {}).success) ++failures;
            if (!runtime.call(USER, instance, calldata("increment()")).success) ++failures;
        }
    });

    int unexpected = 0;
    for (int i = 0; i < rounds; ++i) {
        auto record = runtime.introspect(instance);
        if (!record || (record->implementation != v2 && record->implementation != v2b)) ++unexpected;
    }
    writer.join();

    EXPECT_EQ(unexpected, 0);
    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(call_uint(runtime, USER, instance, "getValue()"), static_cast<uint64_t>(rounds));
    EXPECT_EQ(runtime.introspect(instance)->implementation, v2);
}

TEST_F(uups_upgrade, proxiable_uuid)
{
    auto direct = runtime.call(USER, v2, calldata(proxy::PROXIABLE_UUID));
    ASSERT_TRUE(direct.success);
    EXPECT_EQ(slotguard::abi::decode_word(direct.return_data), slots::implementation());

    auto delegated = runtime.call(USER, instance, calldata(proxy::PROXIABLE_UUID));
    EXPECT_EQ(delegated.error, Error::Unauthorized);
}

TEST_F(uups_upgrade, ownership_survives_upgrade)
{
    ASSERT_TRUE(runtime.upgrade(OWNER, instance, v2, {}).success);
    EXPECT_EQ(call_address(runtime, USER, instance, "owner()"), OWNER);

    // And V2 can upgrade onward
    auto v2b = deploy(runtime, std::make_shared<contracts::CounterV2>());
    ASSERT_TRUE(runtime.upgrade(OWNER, instance, v2b, {}).success);
    EXPECT_EQ(implementation(), v2b);
}

TEST_F(transparent_upgrade, admin_upgrades)
{
    auto result = runtime.upgrade(ADMIN, instance, v2, reinitialize_call(2, 1));
    ASSERT_TRUE(result.success) << result.message;

    auto record = runtime.introspect(instance);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->implementation, v2);
    EXPECT_EQ(record->admin, ADMIN);
    EXPECT_EQ(call_uint(runtime, USER, instance, "getNewVar()"), 1u);
}

TEST_F(transparent_upgrade, non_admin_is_rejected)
{
    // Forwarded to the implementation, where the owner check fails
    auto result = runtime.upgrade(ATTACKER, instance, v2, {});
    EXPECT_EQ(result.error, Error::Unauthorized);
    EXPECT_EQ(runtime.introspect(instance)->implementation, v1);
}

TEST(transparent_proxy, non_admin_upgrade_over_plain_implementation)
{
    Runtime runtime(quiet_config());
    auto store = deploy(runtime, std::make_shared<contracts::SlotZeroStore>());
    auto target = deploy(runtime, std::make_shared<contracts::SlotZeroStore>());

    auto options = runtime.default_proxy_options(proxy::ProxyKind::Transparent);
    options.admin = ADMIN;
    auto deployed = runtime.deploy_proxy(DEPLOYER, store, {}, options);
    ASSERT_TRUE(deployed.success) << deployed.message;
    auto instance = *deployed.created_address;

    auto result = runtime.upgrade(ATTACKER, instance, target, {});
    EXPECT_EQ(result.error, Error::Unauthorized);
    EXPECT_EQ(runtime.introspect(instance)->implementation, store);

    auto change = slotguard::abi::Encoder(proxy::CHANGE_ADMIN).address(ATTACKER).build();
    EXPECT_EQ(runtime.call(ATTACKER, instance, change).error, Error::Unauthorized);
    EXPECT_EQ(runtime.introspect(instance)->admin, ADMIN);

    // Other unknown methods keep their own error
    EXPECT_EQ(runtime.call(ATTACKER, instance, calldata("getValue()")).error, Error::UnknownMethod);
}

TEST_F(transparent_upgrade, admin_cannot_reach_implementation)
{
    auto result = runtime.call(ADMIN, instance, calldata("getValue()"));
    EXPECT_EQ(result.error, Error::AdminFallbackDenied);

    EXPECT_EQ(call_uint(runtime, USER, instance, "getValue()"), 0u);
}

TEST_F(transparent_upgrade, change_admin)
{
    auto data = slotguard::abi::Encoder(proxy::CHANGE_ADMIN).address(USER).build();
    EXPECT_EQ(runtime.call(ATTACKER, instance, data).error, Error::Unauthorized);

    auto result = runtime.call(ADMIN, instance, data);
    ASSERT_TRUE(result.success) << result.message;
    ASSERT_EQ(result.logs.size(), 1u);
    EXPECT_EQ(result.logs[0].topics.at(0), proxy::admin_changed_event());
    EXPECT_EQ(runtime.introspect(instance)->admin, USER);

    // The old admin is now an ordinary caller
    EXPECT_EQ(call_uint(runtime, ADMIN, instance, "getValue()"), 0u);
    EXPECT_EQ(runtime.upgrade(ADMIN, instance, v2, {}).error, Error::Unauthorized);
}

TEST_F(transparent_upgrade, zero_admin_is_rejected)
{
    auto data = slotguard::abi::Encoder(proxy::CHANGE_ADMIN).address(Address{}).build();
    EXPECT_EQ(runtime.call(ADMIN, instance, data).error, Error::InvalidArguments);
    EXPECT_EQ(runtime.introspect(instance)->admin, ADMIN);
}

TEST(layout_policy, enforce_blocks_incompatible_upgrade)
{
    Runtime runtime(quiet_config(LayoutPolicy::Enforce));
    auto v1 = deploy(runtime, std::make_shared<contracts::CounterV1>());
    auto store = deploy(runtime, std::make_shared<contracts::SlotZeroStore>());

    auto options = runtime.default_proxy_options(proxy::ProxyKind::Transparent);
    options.admin = ADMIN;
    auto deployed = runtime.deploy_proxy(DEPLOYER, v1, initialize_call(OWNER), options);
    ASSERT_TRUE(deployed.success) << deployed.message;
    auto instance = *deployed.created_address;

    auto report = runtime.validate_upgrade(instance, store);
    EXPECT_FALSE(report.compatible());
    EXPECT_TRUE(report.has(layout::IssueKind::FieldRetyped));
    EXPECT_TRUE(report.has(layout::IssueKind::FieldRemoved));

    auto result = runtime.upgrade(ADMIN, instance, store, {});
    EXPECT_EQ(result.error, Error::StorageCollision);
    EXPECT_EQ(runtime.introspect(instance)->implementation, v1);
}

TEST(layout_policy, enforce_allows_append_only_upgrade)
{
    Runtime runtime(quiet_config(LayoutPolicy::Enforce));
    auto v1 = deploy(runtime, std::make_shared<contracts::CounterV1>());
    auto v2 = deploy(runtime, std::make_shared<contracts::CounterV2>());
    auto deployed = runtime.deploy_proxy(DEPLOYER, v1, initialize_call(OWNER));
    ASSERT_TRUE(deployed.success) << deployed.message;

    EXPECT_TRUE(runtime.validate_upgrade(*deployed.created_address, v2).issues.empty());
    EXPECT_TRUE(runtime.upgrade(OWNER, *deployed.created_address, v2, {}).success);
}
