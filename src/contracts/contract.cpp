#include "slotguard/contract.hpp"
#include "slotguard/slots.hpp"

namespace slotguard {
namespace contracts {

Contract::Contract(std::string name, layout::StorageLayout layout)
    : name_(std::move(name)), layout_(std::move(layout)) {}

void Contract::register_method(const std::string& signature, Method method) {
    methods_[abi::selector(signature)] = std::move(method);
}

bool Contract::has_method(const std::string& signature) const {
    return methods_.count(abi::selector(signature)) > 0;
}

ExecutionResult Contract::construct(execution::CallContext& ctx, const Bytes& args) {
    return on_construct(ctx, args);
}

ExecutionResult Contract::on_construct(execution::CallContext& /*ctx*/, const Bytes& /*args*/) {
    return ExecutionResult::ok();
}

ExecutionResult Contract::execute(execution::CallContext& ctx) {
    auto sel = abi::selector_of(ctx.data());
    if (!sel) {
        return ExecutionResult::fail(Error::UnknownMethod, name_ + ": calldata has no selector");
    }

    auto it = methods_.find(*sel);
    if (it == methods_.end()) {
        return ExecutionResult::fail(Error::UnknownMethod, name_ + ": no matching method");
    }

    abi::Decoder args(ctx.data());
    return it->second(ctx, args);
}

layout::StorageView Contract::view(execution::CallContext& ctx) const {
    return layout::StorageView(ctx.store(), layout_);
}

// ============================================================================
// UUPS entry points
// ============================================================================

void Contract::enable_uups(std::shared_ptr<proxy::UpgradePolicy> policy) {
    upgrade_policy_ = std::move(policy);

    register_method(proxy::UPGRADE_TO_AND_CALL,
        [this](execution::CallContext& ctx, const abi::Decoder& args) {
            return uups_upgrade(ctx, args);
        });
    register_method(proxy::PROXIABLE_UUID,
        [this](execution::CallContext& ctx, const abi::Decoder&) {
            return proxiable_uuid(ctx);
        });
}

ExecutionResult Contract::uups_upgrade(execution::CallContext& ctx, const abi::Decoder& args) {
    // Only through a proxy that currently points at this code
    auto active = Address::from_word(ctx.store().read(slots::implementation()));
    if (!ctx.delegated() || active != ctx.code_address()) {
        return ExecutionResult::fail(Error::Unauthorized,
                                     "upgradeToAndCall must be called through an active proxy");
    }

    auto new_implementation = args.address(0);
    auto data = args.bytes(1);
    if (!new_implementation || !data) {
        return ExecutionResult::fail(Error::InvalidArguments,
                                     "expected (address implementation, bytes data)");
    }

    auto auth = upgrade_policy_->authorize(ctx, *new_implementation);
    if (!auth.success) {
        return auth;
    }

    // The new code must itself be upgradeable, or the proxy would be frozen
    if (ctx.has_code(*new_implementation)) {
        auto uuid = ctx.call(*new_implementation, abi::Encoder(proxy::PROXIABLE_UUID).build());
        auto slot = uuid.success ? abi::decode_word(uuid.return_data) : std::nullopt;
        if (!slot || *slot != slots::implementation()) {
            return ExecutionResult::fail(Error::InvalidImplementation,
                                         new_implementation->to_hex() + " is not UUPS upgradeable");
        }
    }

    return proxy::apply_upgrade(ctx, slots::implementation(), *new_implementation, *data);
}

ExecutionResult Contract::proxiable_uuid(execution::CallContext& ctx) {
    if (ctx.delegated()) {
        return ExecutionResult::fail(Error::Unauthorized,
                                     "proxiableUUID must not be called through delegation");
    }
    return ExecutionResult::ok(abi::encode_word(slots::implementation()));
}

} // namespace contracts
} // namespace slotguard
