#pragma once

#include "slotguard/contract.hpp"

namespace slotguard {
namespace contracts {

struct CounterOptions {
    // Lock the instance's own initializer at construction
    bool lock_on_construct{true};
};

/**
 * @brief Upgradeable counter, version 1
 *
 * Layout: owner (address), value (uint256). UUPS upgrades are authorized
 * by the owner field.
 */
class CounterV1 : public Contract {
public:
    explicit CounterV1(CounterOptions options = {});

    static const layout::StorageLayout& storage_layout();

protected:
    CounterV1(std::string name, layout::StorageLayout layout, CounterOptions options);

    ExecutionResult on_construct(execution::CallContext& ctx, const Bytes& args) override;

private:
    void register_methods();

    CounterOptions options_;
};

/**
 * @brief Counter version 2: appends newVar and a versioned reinitializer
 */
class CounterV2 : public CounterV1 {
public:
    explicit CounterV2(CounterOptions options = {});

    static const layout::StorageLayout& storage_layout();

private:
    void register_methods();
};

/**
 * @brief Stores one uint256 at slot 0; no initializer, no upgrade hooks
 */
class SlotZeroStore : public Contract {
public:
    SlotZeroStore();

    static const layout::StorageLayout& storage_layout();
};

} // namespace contracts
} // namespace slotguard
