#pragma once

#include <string>
#include "slotguard/execution.hpp"
#include "slotguard/layout.hpp"
#include "slotguard/slots.hpp"

namespace slotguard {
namespace proxy {

/**
 * @brief Decides who may repoint a proxy
 *
 * Runs inside the proxy's storage context, so policies read control slots
 * or implementation fields of the proxy, never of the implementation.
 */
class UpgradePolicy {
public:
    virtual ~UpgradePolicy() = default;
    virtual ExecutionResult authorize(execution::CallContext& ctx,
                                      const Address& new_implementation) const = 0;
};

/**
 * @brief caller == address stored in the admin control slot
 */
class AdminPolicy : public UpgradePolicy {
public:
    explicit AdminPolicy(const StorageSlot& admin_slot = slots::admin());
    ExecutionResult authorize(execution::CallContext& ctx,
                              const Address& new_implementation) const override;

private:
    StorageSlot admin_slot_;
};

/**
 * @brief caller == an address field of the implementation's own layout
 *
 * Self-authorizing upgrades: the implementation decides, through its own
 * owner field, who may replace it.
 */
class OwnerFieldPolicy : public UpgradePolicy {
public:
    OwnerFieldPolicy(const layout::StorageLayout& layout, std::string field);
    ExecutionResult authorize(execution::CallContext& ctx,
                              const Address& new_implementation) const override;

private:
    const layout::StorageLayout& layout_;
    std::string field_;
};

/**
 * @brief Authorize, repoint, then optionally run `data` on the new code
 *
 * All or nothing: when the follow-up delegated call fails, the failure is
 * returned verbatim and the enclosing call's rollback restores the old
 * implementation pointer.
 */
ExecutionResult upgrade_to_and_call(execution::CallContext& ctx,
                                    const UpgradePolicy& policy,
                                    const StorageSlot& implementation_slot,
                                    const Address& new_implementation,
                                    const Bytes& data);

// Repoint and call, for callers that have already authorized the upgrade
ExecutionResult apply_upgrade(execution::CallContext& ctx,
                              const StorageSlot& implementation_slot,
                              const Address& new_implementation,
                              const Bytes& data);

// Event topics
const Hash256& upgraded_event();       // Upgraded(address)
const Hash256& admin_changed_event();  // AdminChanged(address,address)

// Method signatures shared by proxies and UUPS implementations
constexpr const char* UPGRADE_TO_AND_CALL = "upgradeToAndCall(address,bytes)";
constexpr const char* CHANGE_ADMIN = "changeAdmin(address)";
constexpr const char* PROXIABLE_UUID = "proxiableUUID()";

} // namespace proxy
} // namespace slotguard
