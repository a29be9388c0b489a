#include "slotguard/proxy.hpp"
#include "slotguard/abi.hpp"
#include "slotguard/log.hpp"

namespace slotguard {
namespace proxy {

ProxyCode::ProxyCode(ProxyOptions options)
    : options_(std::move(options)),
      name_(options_.kind == ProxyKind::Transparent ? "TransparentProxy" : "ERC1967Proxy"),
      admin_policy_(options_.control.admin) {}

Bytes constructor_args(const Address& implementation, const Bytes& init_data) {
    return abi::Encoder().address(implementation).bytes(init_data).build();
}

ExecutionResult ProxyCode::construct(execution::CallContext& ctx, const Bytes& args) {
    abi::Decoder decoder(args, 0);
    auto implementation = decoder.address(0);
    auto init_data = decoder.bytes(1);
    if (!implementation || !init_data) {
        return ExecutionResult::fail(Error::InvalidArguments,
                                     "expected (address implementation, bytes init_data)");
    }

    if (!ctx.has_code(*implementation)) {
        return ExecutionResult::fail(Error::InvalidImplementation,
                                     implementation->to_hex() + " has no executable code");
    }

    ctx.store().write(options_.control.implementation, implementation->to_word());
    ctx.emit({upgraded_event(), implementation->to_word()});

    if (options_.kind == ProxyKind::Transparent) {
        set_admin(ctx, options_.admin.value_or(ctx.caller()));
    }

    if (!init_data->empty()) {
        auto result = ctx.delegate_call(*implementation, *init_data);
        if (!result.success) {
            return result;
        }
    }

    log::info("PROXY", name_ + " at " + ctx.self().to_hex() + " -> " + implementation->to_hex());
    return ExecutionResult::ok();
}

ExecutionResult ProxyCode::execute(execution::CallContext& ctx) {
    if (options_.kind != ProxyKind::Transparent) {
        return forward(ctx);
    }

    auto admin = Address::from_word(ctx.store().read(options_.control.admin));
    if (ctx.caller() == admin) {
        return admin_call(ctx);
    }

    // Admin methods go through to implementations with their own upgrade entry point;
    // anywhere else a non-admin caller is refused
    auto result = forward(ctx);
    auto sel = abi::selector_of(ctx.data());
    if (result.error == Error::UnknownMethod &&
        (sel == abi::selector(UPGRADE_TO_AND_CALL) || sel == abi::selector(CHANGE_ADMIN))) {
        return ExecutionResult::fail(Error::Unauthorized,
                                     ctx.caller().to_hex() + " is not the proxy admin");
    }
    return result;
}

ExecutionResult ProxyCode::forward(execution::CallContext& ctx) {
    auto implementation = Address::from_word(ctx.store().read(options_.control.implementation));
    return ctx.delegate_call(implementation, ctx.data());
}

ExecutionResult ProxyCode::admin_call(execution::CallContext& ctx) {
    auto sel = abi::selector_of(ctx.data());
    abi::Decoder decoder(ctx.data());

    if (sel == abi::selector(UPGRADE_TO_AND_CALL)) {
        auto implementation = decoder.address(0);
        auto data = decoder.bytes(1);
        if (!implementation || !data) {
            return ExecutionResult::fail(Error::InvalidArguments,
                                         "expected (address implementation, bytes data)");
        }
        return upgrade_to_and_call(ctx, admin_policy_, options_.control.implementation,
                                   *implementation, *data);
    }

    if (sel == abi::selector(CHANGE_ADMIN)) {
        auto admin = decoder.address(0);
        if (!admin || admin->is_zero()) {
            return ExecutionResult::fail(Error::InvalidArguments, "new admin must be non-zero");
        }
        set_admin(ctx, *admin);
        return ExecutionResult::ok();
    }

    return ExecutionResult::fail(Error::AdminFallbackDenied,
                                 "admin cannot call through to the implementation");
}

void ProxyCode::set_admin(execution::CallContext& ctx, const Address& admin) {
    auto previous = ctx.store().read(options_.control.admin);
    ctx.store().write(options_.control.admin, admin.to_word());

    Bytes data(previous.begin(), previous.end());
    auto next = admin.to_word();
    data.insert(data.end(), next.begin(), next.end());
    ctx.emit({admin_changed_event()}, data);
}

ProxyRecord ProxyCode::record(const storage::Store& store) const {
    return ProxyRecord{
        Address::from_word(store.read(options_.control.implementation)),
        Address::from_word(store.read(options_.control.admin)),
    };
}

std::optional<ProxyRecord> introspect(const execution::Host& host, const Address& proxy) {
    auto lock = host.lock();
    auto code = std::dynamic_pointer_cast<ProxyCode>(host.code_at(proxy));
    const auto* store = host.store_of(proxy);
    if (!code || !store) {
        return std::nullopt;
    }
    return code->record(*store);
}

} // namespace proxy
} // namespace slotguard
