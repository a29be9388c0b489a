#include "slotguard/upgrade.hpp"
#include "slotguard/log.hpp"

namespace slotguard {
namespace proxy {

const Hash256& upgraded_event() {
    static const Hash256 topic = crypto::Keccak256::hash("Upgraded(address)");
    return topic;
}

const Hash256& admin_changed_event() {
    static const Hash256 topic = crypto::Keccak256::hash("AdminChanged(address,address)");
    return topic;
}

// ============================================================================
// Policies
// ============================================================================

AdminPolicy::AdminPolicy(const StorageSlot& admin_slot) : admin_slot_(admin_slot) {}

ExecutionResult AdminPolicy::authorize(execution::CallContext& ctx,
                                       const Address& /*new_implementation*/) const {
    auto admin = Address::from_word(ctx.store().read(admin_slot_));
    if (admin.is_zero() || ctx.caller() != admin) {
        return ExecutionResult::fail(Error::Unauthorized,
                                     ctx.caller().to_hex() + " is not the proxy admin");
    }
    return ExecutionResult::ok();
}

OwnerFieldPolicy::OwnerFieldPolicy(const layout::StorageLayout& layout, std::string field)
    : layout_(layout), field_(std::move(field)) {}

ExecutionResult OwnerFieldPolicy::authorize(execution::CallContext& ctx,
                                            const Address& /*new_implementation*/) const {
    layout::StorageView view(ctx.store(), layout_);
    auto owner = view.get_address(field_);
    if (owner.is_zero() || ctx.caller() != owner) {
        return ExecutionResult::fail(Error::Unauthorized,
                                     ctx.caller().to_hex() + " is not the " + field_);
    }
    return ExecutionResult::ok();
}

// ============================================================================
// Upgrade
// ============================================================================

ExecutionResult upgrade_to_and_call(execution::CallContext& ctx,
                                    const UpgradePolicy& policy,
                                    const StorageSlot& implementation_slot,
                                    const Address& new_implementation,
                                    const Bytes& data) {
    auto auth = policy.authorize(ctx, new_implementation);
    if (!auth.success) {
        return auth;
    }
    return apply_upgrade(ctx, implementation_slot, new_implementation, data);
}

ExecutionResult apply_upgrade(execution::CallContext& ctx,
                              const StorageSlot& implementation_slot,
                              const Address& new_implementation,
                              const Bytes& data) {
    if (!ctx.has_code(new_implementation)) {
        return ExecutionResult::fail(Error::InvalidImplementation,
                                     new_implementation.to_hex() + " has no executable code");
    }

    auto previous = Address::from_word(ctx.store().read(implementation_slot));
    ctx.store().write(implementation_slot, new_implementation.to_word());
    ctx.emit({upgraded_event(), new_implementation.to_word()});

    if (!data.empty()) {
        auto result = ctx.delegate_call(new_implementation, data);
        if (!result.success) {
            log::warn("UPGRADE", "Post-upgrade call on " + new_implementation.to_hex() +
                      " failed: " + error_name(result.error));
            return result;
        }
    }

    log::info("UPGRADE", ctx.self().to_hex() + ": " + previous.to_hex() + " -> " +
              new_implementation.to_hex());
    return ExecutionResult::ok();
}

} // namespace proxy
} // namespace slotguard
